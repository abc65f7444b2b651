#pragma once

#include <canvas_model/color.hpp>
#include <canvas_model/types.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace canvas_model {

// Fields every node kind carries; flattened into the node object on the wire.
struct GenericNode {
    NodeId id;
    Location location;
    Dimensions dimensions;
    std::optional<Color> color;

    bool operator==(const GenericNode&) const = default;
};

class TextNode {
public:
    explicit TextNode(GenericNode generic, std::string text);

    const GenericNode& generic() const { return generic_; }
    const std::string& text() const { return text_; }

    bool operator==(const TextNode&) const = default;

private:
    GenericNode generic_;
    std::string text_;
};

class FileNode {
public:
    explicit FileNode(GenericNode generic, std::filesystem::path file,
        std::optional<std::string> subpath = std::nullopt);

    const GenericNode& generic() const { return generic_; }
    const std::filesystem::path& file() const { return file_; }
    // Anchor or range inside the file, e.g. "#Heading".
    const std::optional<std::string>& subpath() const { return subpath_; }

    bool operator==(const FileNode&) const = default;

private:
    GenericNode generic_;
    std::filesystem::path file_;
    std::optional<std::string> subpath_;
};

class LinkNode {
public:
    explicit LinkNode(GenericNode generic, std::string url);

    const GenericNode& generic() const { return generic_; }
    const std::string& url() const { return url_; }

    bool operator==(const LinkNode&) const = default;

private:
    GenericNode generic_;
    std::string url_;
};

class GroupNode {
public:
    explicit GroupNode(GenericNode generic,
        std::optional<std::string> label = std::nullopt,
        std::optional<std::filesystem::path> background = std::nullopt,
        std::optional<BackgroundStyle> background_style = std::nullopt);

    const GenericNode& generic() const { return generic_; }
    const std::optional<std::string>& label() const { return label_; }
    const std::optional<std::filesystem::path>& background() const { return background_; }
    std::optional<BackgroundStyle> background_style() const { return background_style_; }

    bool operator==(const GroupNode&) const = default;

private:
    GenericNode generic_;
    std::optional<std::string> label_;
    std::optional<std::filesystem::path> background_;
    std::optional<BackgroundStyle> background_style_;
};

// Order matches the alternatives of Node::Variant.
enum class NodeKind { Text, File, Link, Group };

const char* to_string(NodeKind kind);

class Node {
public:
    using Variant = std::variant<TextNode, FileNode, LinkNode, GroupNode>;

    Node(TextNode node) : value_(std::move(node)) {}
    Node(FileNode node) : value_(std::move(node)) {}
    Node(LinkNode node) : value_(std::move(node)) {}
    Node(GroupNode node) : value_(std::move(node)) {}

    NodeKind kind() const { return static_cast<NodeKind>(value_.index()); }

    const GenericNode& generic() const;
    const NodeId& id() const { return generic().id; }
    const Location& location() const { return generic().location; }
    const Dimensions& dimensions() const { return generic().dimensions; }
    const std::optional<Color>& color() const { return generic().color; }

    template <typename T>
    const T* get_if() const { return std::get_if<T>(&value_); }

    // Throws std::bad_variant_access when the node is of another kind.
    template <typename T>
    const T& as() const { return std::get<T>(value_); }

    const Variant& value() const { return value_; }

    bool operator==(const Node&) const = default;

private:
    Variant value_;
};

} // namespace canvas_model
