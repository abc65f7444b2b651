#include <canvas_model/color.hpp>
#include <array>

namespace canvas_model {

namespace {

const char hex_digits[] = "0123456789ABCDEF";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<PresetColor> preset_color_from_int(std::int64_t value) {
    if (value < static_cast<int>(PresetColor::Red) || value > static_cast<int>(PresetColor::Purple))
        return std::nullopt;
    return static_cast<PresetColor>(value);
}

int preset_color_to_int(PresetColor color) {
    return static_cast<int>(color);
}

std::optional<HexColor> HexColor::parse(std::string_view text) {
    if (text.size() != 7 || text[0] != '#') return std::nullopt;

    std::array<std::uint8_t, 3> channels{};
    for (std::size_t i = 0; i < channels.size(); ++i) {
        const int hi = hex_value(text[1 + i * 2]);
        const int lo = hex_value(text[2 + i * 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return HexColor(channels[0], channels[1], channels[2]);
}

std::string HexColor::to_string() const {
    std::string out(7, '#');
    const std::uint8_t channels[] = { r_, g_, b_ };
    for (std::size_t i = 0; i < 3; ++i) {
        out[1 + i * 2] = hex_digits[channels[i] >> 4];
        out[2 + i * 2] = hex_digits[channels[i] & 0x0F];
    }
    return out;
}

} // namespace canvas_model
