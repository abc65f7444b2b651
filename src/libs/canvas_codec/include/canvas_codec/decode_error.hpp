#pragma once

#include <stdexcept>
#include <string>

namespace canvas_codec {

// Raised for malformed JSON and for any schema violation. where() is a JSON
// pointer to the offending value ("" for the document itself).
class DecodeError : public std::runtime_error {
public:
    DecodeError(std::string where, const std::string& message);

    const std::string& where() const noexcept { return where_; }
    const std::string& message() const noexcept { return message_; }

private:
    std::string where_;
    std::string message_;
};

} // namespace canvas_codec
