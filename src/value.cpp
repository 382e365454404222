// value.cpp - generic value tree helpers

#include "bencode/value.hpp"
#include <cstdio>

namespace bencode {

auto to_string(kind_t kind) -> const char* {
    switch (kind) {
        case kind_t::string:  return "string";
        case kind_t::integer: return "integer";
        case kind_t::list:    return "list";
        case kind_t::dict:    return "dictionary";
    }
    return "unknown";
}

auto value_t::find(const std::string& key) const -> const value_t* {
    if (!is_dict()) {
        return nullptr;
    }
    const auto& d = as_dict();
    auto it = d.find(key);
    return it == d.end() ? nullptr : &it->second;
}

auto value_t::size() const -> std::size_t {
    switch (kind()) {
        case kind_t::string:  return as_string().size();
        case kind_t::integer: return 1;
        case kind_t::list:    return as_list().size();
        case kind_t::dict:    return as_dict().size();
    }
    return 0;
}

namespace {

void append_quoted(std::string& out, const std::string& bytes) {
    out += '"';
    for (unsigned char c : bytes) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c < 0x20 || c >= 0x7f) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            out += buf;
        } else {
            out += static_cast<char>(c);
        }
    }
    out += '"';
}

void append(std::string& out, const value_t& value) {
    switch (value.kind()) {
        case kind_t::string:
            append_quoted(out, value.as_string());
            break;
        case kind_t::integer:
            out += std::to_string(value.as_integer());
            break;
        case kind_t::list: {
            out += '[';
            auto first = true;
            for (const auto& item : value.as_list()) {
                if (!first) out += ", ";
                append(out, item);
                first = false;
            }
            out += ']';
            break;
        }
        case kind_t::dict: {
            out += '{';
            auto first = true;
            for (const auto& [key, item] : value.as_dict()) {
                if (!first) out += ", ";
                append_quoted(out, key);
                out += ": ";
                append(out, item);
                first = false;
            }
            out += '}';
            break;
        }
    }
}

} // namespace

auto describe(const value_t& value) -> std::string {
    auto out = std::string{};
    append(out, value);
    return out;
}

} // namespace bencode
