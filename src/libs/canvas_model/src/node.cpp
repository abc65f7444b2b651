#include <canvas_model/node.hpp>
#include <utility>

namespace canvas_model {

TextNode::TextNode(GenericNode generic, std::string text)
    : generic_(std::move(generic)), text_(std::move(text))
{
}

FileNode::FileNode(GenericNode generic, std::filesystem::path file, std::optional<std::string> subpath)
    : generic_(std::move(generic)), file_(std::move(file)), subpath_(std::move(subpath))
{
}

LinkNode::LinkNode(GenericNode generic, std::string url)
    : generic_(std::move(generic)), url_(std::move(url))
{
}

GroupNode::GroupNode(GenericNode generic,
    std::optional<std::string> label,
    std::optional<std::filesystem::path> background,
    std::optional<BackgroundStyle> background_style)
    : generic_(std::move(generic))
    , label_(std::move(label))
    , background_(std::move(background))
    , background_style_(background_style)
{
}

const char* to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Text: return "text";
    case NodeKind::File: return "file";
    case NodeKind::Link: return "link";
    case NodeKind::Group: return "group";
    }
    return "unknown";
}

const GenericNode& Node::generic() const {
    return std::visit([](const auto& node) -> const GenericNode& { return node.generic(); }, value_);
}

} // namespace canvas_model
