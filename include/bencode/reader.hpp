#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include "error.hpp"
#include "options.hpp"
#include "value.hpp"

namespace bencode {

// =============================================================================
// reader_t - byte stream to value_t
// =============================================================================
//
// Reads exactly one complete value per call and leaves the stream positioned
// on the first byte after it, so repeated calls walk a concatenation of
// values. The destination is only assigned once the whole value has parsed.
//
// Errors are thrown as decode_error. After an error the stream position is
// unspecified and the reader should not be used again.
//
// =============================================================================

class reader_t {
public:
    explicit reader_t(std::istream& stream, decode_options_t options = {});

    // Returns false when the stream is exhausted before the first byte of a
    // value. End of stream anywhere inside a value is an error.
    auto read(value_t& value) -> bool;

    // Bytes consumed since construction.
    auto offset() const -> std::uint64_t { return offset_; }

    auto options() const -> const decode_options_t& { return options_; }

private:
    std::istream& is_;
    decode_options_t options_;
    std::uint64_t offset_ = 0;
    std::uint32_t depth_ = 0;

    auto peek() -> int;
    auto get() -> int;

    auto parse_value() -> value_t;
    auto parse_string() -> std::string;
    auto parse_integer() -> std::int64_t;
    auto parse_list() -> list_t;
    auto parse_dict() -> dict_t;

    void enter_container();
    void leave_container() { --depth_; }

    [[noreturn]] void fail(error_code code, const std::string& message) const;
};

} // namespace bencode
