#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace canvas_model {

// Wire values 1..6, in this order.
enum class PresetColor {
    Red = 1,
    Orange = 2,
    Yellow = 3,
    Green = 4,
    Cyan = 5,
    Purple = 6,
};

std::optional<PresetColor> preset_color_from_int(std::int64_t value);
int preset_color_to_int(PresetColor color);

class HexColor {
public:
    constexpr HexColor() = default;
    constexpr HexColor(std::uint8_t r, std::uint8_t g, std::uint8_t b) : r_(r), g_(g), b_(b) {}

    static constexpr HexColor rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) { return HexColor(r, g, b); }
    static constexpr HexColor white() { return HexColor(255, 255, 255); }
    static constexpr HexColor black() { return HexColor(0, 0, 0); }

    // Accepts exactly "#RRGGBB" (either case).
    static std::optional<HexColor> parse(std::string_view text);

    // Uppercase "#RRGGBB".
    std::string to_string() const;

    std::uint8_t red() const { return r_; }
    std::uint8_t green() const { return g_; }
    std::uint8_t blue() const { return b_; }

    bool operator==(const HexColor&) const = default;

private:
    std::uint8_t r_ = 0;
    std::uint8_t g_ = 0;
    std::uint8_t b_ = 0;
};

// Either a preset or an arbitrary RGB value; the held alternative is kept on re-encode.
using Color = std::variant<PresetColor, HexColor>;

inline Color default_color() { return HexColor::white(); }

} // namespace canvas_model
