// error.cpp - error codes and exception types

#include "bencode/error.hpp"
#include <utility>

namespace bencode {

auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::end_of_stream:          return "end_of_stream";
        case error_code::invalid_lead_byte:      return "invalid_lead_byte";
        case error_code::malformed_length:       return "malformed_length";
        case error_code::malformed_integer:      return "malformed_integer";
        case error_code::truncated_input:        return "truncated_input";
        case error_code::unterminated_container: return "unterminated_container";
        case error_code::non_string_key:         return "non_string_key";
        case error_code::duplicate_key:          return "duplicate_key";
        case error_code::limit_exceeded:         return "limit_exceeded";
        case error_code::type_mismatch:          return "type_mismatch";
        case error_code::integer_overflow:       return "integer_overflow";
        case error_code::negative_to_unsigned:   return "negative_to_unsigned";
        case error_code::unsupported_shape:      return "unsupported_shape";
        case error_code::invalid_destination:    return "invalid_destination";
        case error_code::unknown_field:          return "unknown_field";
    }
    return "unknown";
}

auto from_string(std::type_identity<error_code>, const std::string& s) -> error_code {
    if (s == "end_of_stream")          return error_code::end_of_stream;
    if (s == "invalid_lead_byte")      return error_code::invalid_lead_byte;
    if (s == "malformed_length")       return error_code::malformed_length;
    if (s == "malformed_integer")      return error_code::malformed_integer;
    if (s == "truncated_input")        return error_code::truncated_input;
    if (s == "unterminated_container") return error_code::unterminated_container;
    if (s == "non_string_key")         return error_code::non_string_key;
    if (s == "duplicate_key")          return error_code::duplicate_key;
    if (s == "limit_exceeded")         return error_code::limit_exceeded;
    if (s == "type_mismatch")          return error_code::type_mismatch;
    if (s == "integer_overflow")       return error_code::integer_overflow;
    if (s == "negative_to_unsigned")   return error_code::negative_to_unsigned;
    if (s == "unsupported_shape")      return error_code::unsupported_shape;
    if (s == "invalid_destination")    return error_code::invalid_destination;
    if (s == "unknown_field")          return error_code::unknown_field;
    throw std::runtime_error("bencode: unknown error code: " + s);
}

auto is_structural(error_code code) -> bool {
    switch (code) {
        case error_code::end_of_stream:
        case error_code::invalid_lead_byte:
        case error_code::malformed_length:
        case error_code::malformed_integer:
        case error_code::truncated_input:
        case error_code::unterminated_container:
        case error_code::non_string_key:
        case error_code::duplicate_key:
        case error_code::limit_exceeded:
            return true;
        default:
            return false;
    }
}

error::error(error_code code, const std::string& message)
    : std::runtime_error("bencode: " + message)
    , code_(code)
{
}

decode_error::decode_error(error_code code, const std::string& message, std::uint64_t offset)
    : error(code, message + " (at byte " + std::to_string(offset) + ")")
    , offset_(offset)
{
}

coerce_error::coerce_error(error_code code, std::string detail, std::string path)
    : error(code, path.empty() ? detail : detail + " at " + path)
    , detail_(std::move(detail))
    , path_(std::move(path))
{
}

auto coerce_error::within(const std::string& segment) const -> coerce_error {
    return coerce_error(code(), detail_, segment + path_);
}

} // namespace bencode
