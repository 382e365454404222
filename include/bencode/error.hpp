#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace bencode {

// =============================================================================
// Error codes
// =============================================================================
//
// Two families: structural errors raised while reading bytes, and coercion
// errors raised while filling a destination from a decoded value_t. A code
// never moves from one family to the other.
//
// =============================================================================

enum class error_code {
    // Structural
    end_of_stream,
    invalid_lead_byte,
    malformed_length,
    malformed_integer,
    truncated_input,
    unterminated_container,
    non_string_key,
    duplicate_key,
    limit_exceeded,

    // Coercion
    type_mismatch,
    integer_overflow,
    negative_to_unsigned,
    unsupported_shape,
    invalid_destination,
    unknown_field,
};

auto to_string(error_code code) -> const char*;
auto from_string(std::type_identity<error_code>, const std::string& s) -> error_code;
auto is_structural(error_code code) -> bool;

// =============================================================================
// Exceptions
// =============================================================================

class error : public std::runtime_error {
public:
    error(error_code code, const std::string& message);

    auto code() const noexcept -> error_code { return code_; }

private:
    error_code code_;
};

// Raised by reader_t. The stream position afterwards is unspecified.
class decode_error : public error {
public:
    decode_error(error_code code, const std::string& message, std::uint64_t offset);

    auto offset() const noexcept -> std::uint64_t { return offset_; }

private:
    std::uint64_t offset_;
};

// Raised by coerce(). Slots written before the failing one stay written.
class coerce_error : public error {
public:
    coerce_error(error_code code, std::string detail, std::string path = {});

    auto path() const -> const std::string& { return path_; }
    auto detail() const -> const std::string& { return detail_; }

    // Same error, reported one level further out: `segment` is prepended to
    // the path (".name" for a structure field, "[3]" for a list element).
    auto within(const std::string& segment) const -> coerce_error;

private:
    std::string detail_;
    std::string path_;
};

} // namespace bencode
