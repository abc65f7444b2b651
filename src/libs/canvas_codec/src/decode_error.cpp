#include <canvas_codec/decode_error.hpp>
#include <utility>

namespace canvas_codec {

namespace {

std::string format_message(const std::string& where, const std::string& message) {
    if (where.empty()) return message;
    return where + ": " + message;
}

} // namespace

DecodeError::DecodeError(std::string where, const std::string& message)
    : std::runtime_error(format_message(where, message))
    , where_(std::move(where))
    , message_(message)
{
}

} // namespace canvas_codec
