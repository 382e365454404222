// reader.cpp - structural decoding of bencode byte streams

#include "bencode/reader.hpp"
#include "bencode/format.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <limits>
#include <utility>

namespace bencode {

namespace {

constexpr auto eof = std::char_traits<char>::eof();

// Payload bytes are pulled in bounded chunks so that a length prefix larger
// than the remaining input fails as truncated_input instead of allocating
// the declared size up front.
constexpr std::uint64_t string_chunk_size = 64 * 1024;

auto describe_byte(int c) -> std::string {
    if (c >= 0x20 && c < 0x7f) {
        return std::string("'") + static_cast<char>(c) + "'";
    }
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", static_cast<unsigned>(c) & 0xffu);
    return buf;
}

auto is_canonical_integer(const std::string& body) -> bool {
    if (body == "-0") return false;
    auto digits = body[0] == wire_format::MINUS ? body.substr(1) : body;
    return digits.size() == 1 || digits[0] != '0';
}

} // namespace

reader_t::reader_t(std::istream& stream, decode_options_t options)
    : is_(stream)
    , options_(options)
{
}

auto reader_t::read(value_t& value) -> bool {
    if (peek() == eof) {
        return false;
    }
    depth_ = 0;
    value = parse_value();
    return true;
}

auto reader_t::peek() -> int {
    return is_.peek();
}

auto reader_t::get() -> int {
    auto c = is_.get();
    if (c != eof) {
        ++offset_;
    }
    return c;
}

void reader_t::fail(error_code code, const std::string& message) const {
    throw decode_error(code, message, offset_);
}

void reader_t::enter_container() {
    ++depth_;
    if (options_.max_depth != 0 && depth_ > options_.max_depth) {
        fail(error_code::limit_exceeded,
             "nesting depth exceeds limit of " + std::to_string(options_.max_depth));
    }
}

auto reader_t::parse_value() -> value_t {
    auto c = peek();
    if (c == eof) {
        fail(error_code::unterminated_container, "unexpected end of input inside container");
    }
    if (wire_format::is_string_lead(c)) {
        return value_t{parse_string()};
    }
    switch (c) {
        case wire_format::INTEGER_BEGIN: return value_t{parse_integer()};
        case wire_format::LIST_BEGIN:    return value_t{parse_list()};
        case wire_format::DICT_BEGIN:    return value_t{parse_dict()};
        default: break;
    }
    fail(error_code::invalid_lead_byte, "invalid lead byte " + describe_byte(c));
}

auto reader_t::parse_string() -> std::string {
    constexpr auto max_length = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    auto length = std::uint64_t{0};
    auto digits = std::size_t{0};

    while (true) {
        auto c = get();
        if (c == eof) {
            fail(error_code::malformed_length, "missing ':' after string length");
        }
        if (c == wire_format::LENGTH_SEPARATOR) {
            break;
        }
        if (!wire_format::is_digit(c)) {
            fail(error_code::malformed_length, "invalid character " + describe_byte(c) + " in string length");
        }
        auto d = static_cast<std::uint64_t>(c - '0');
        if (length > (max_length - d) / 10) {
            fail(error_code::malformed_length, "string length out of range");
        }
        length = length * 10 + d;
        ++digits;
    }
    if (digits == 0) {
        fail(error_code::malformed_length, "empty string length");
    }
    if (options_.max_string_length != 0 && length > options_.max_string_length) {
        fail(error_code::limit_exceeded,
             "string length " + std::to_string(length) +
             " exceeds limit of " + std::to_string(options_.max_string_length));
    }

    auto contents = std::string{};
    while (contents.size() < length) {
        auto n = std::min<std::uint64_t>(string_chunk_size, length - contents.size());
        auto pos = contents.size();
        contents.resize(pos + n);
        is_.read(contents.data() + pos, static_cast<std::streamsize>(n));
        auto got = static_cast<std::uint64_t>(is_.gcount());
        offset_ += got;
        if (got != n) {
            fail(error_code::truncated_input,
                 "string declares " + std::to_string(length) + " bytes but only " +
                 std::to_string(pos + got) + " remain");
        }
    }
    return contents;
}

auto reader_t::parse_integer() -> std::int64_t {
    get(); // 'i'

    auto body = std::string{};
    while (true) {
        auto c = get();
        if (c == eof) {
            fail(error_code::malformed_integer, "missing 'e' after integer");
        }
        if (c == wire_format::END) {
            break;
        }
        if (!wire_format::is_digit(c) && !(c == wire_format::MINUS && body.empty())) {
            fail(error_code::malformed_integer, "invalid character " + describe_byte(c) + " in integer");
        }
        body += static_cast<char>(c);
    }
    if (body.empty() || body == "-") {
        fail(error_code::malformed_integer, "integer has no digits");
    }
    if (options_.canonical_integers && !is_canonical_integer(body)) {
        fail(error_code::malformed_integer, "non-canonical integer '" + body + "'");
    }

    auto value = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), value);
    if (ec == std::errc::result_out_of_range) {
        fail(error_code::malformed_integer, "integer '" + body + "' out of 64-bit range");
    }
    if (ec != std::errc{} || ptr != body.data() + body.size()) {
        fail(error_code::malformed_integer, "invalid integer '" + body + "'");
    }
    return value;
}

auto reader_t::parse_list() -> list_t {
    get(); // 'l'
    enter_container();

    auto list = list_t{};
    while (true) {
        auto c = peek();
        if (c == eof) {
            fail(error_code::unterminated_container, "list is missing its terminating 'e'");
        }
        if (c == wire_format::END) {
            get();
            break;
        }
        list.push_back(parse_value());
    }
    leave_container();
    return list;
}

auto reader_t::parse_dict() -> dict_t {
    get(); // 'd'
    enter_container();

    auto dict = dict_t{};
    while (true) {
        auto c = peek();
        if (c == eof) {
            fail(error_code::unterminated_container, "dictionary is missing its terminating 'e'");
        }
        if (c == wire_format::END) {
            get();
            break;
        }
        if (!wire_format::is_string_lead(c)) {
            fail(error_code::non_string_key,
                 "dictionary key must be a string, found lead byte " + describe_byte(c));
        }
        auto key = parse_string();
        auto item = parse_value();
        if (options_.reject_duplicate_keys && dict.contains(key)) {
            fail(error_code::duplicate_key, "duplicate dictionary key \"" + key + "\"");
        }
        dict.insert_or_assign(std::move(key), std::move(item));
    }
    leave_container();
    return dict;
}

} // namespace bencode
