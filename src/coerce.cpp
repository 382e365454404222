// coerce.cpp - non-template coercion overloads

#include "bencode/coerce.hpp"

namespace bencode {

namespace detail {

constexpr std::size_t max_shown_length = 40;

// describe() output truncated to max_shown_length bytes
auto shown(const value_t& value) -> std::string {
    auto text = describe(value);
    if (text.size() > max_shown_length) {
        text.resize(max_shown_length - 3);
        text += "...";
    }
    return text;
}

auto mismatch(const value_t& value, const std::string& shape) -> coerce_error {
    return coerce_error(error_code::type_mismatch,
        std::string("cannot coerce ") + to_string(value.kind()) + " " + shown(value) +
        " into " + shape);
}

auto field_segment(const char* key) -> std::string {
    return std::string(".") + key;
}

auto index_segment(std::size_t index) -> std::string {
    return "[" + std::to_string(index) + "]";
}

auto key_segment(const std::string& key) -> std::string {
    return "[\"" + key + "\"]";
}

} // namespace detail

void coerce(const value_t& value, std::string& dest) {
    if (!value.is_string()) {
        throw detail::mismatch(value, "string");
    }
    dest = value.as_string();
}

void coerce(const value_t& value, dynamic_t& dest) {
    if (!dest.empty() && dest.kind() != value.kind()) {
        throw coerce_error(error_code::type_mismatch,
            std::string("cannot coerce ") + to_string(value.kind()) + " " +
            detail::shown(value) + " into dynamic slot holding " + to_string(dest.kind()));
    }
    dest = dynamic_t::from(value);
}

void coerce(const value_t& value, value_t& dest) {
    dest = value;
}

} // namespace bencode
