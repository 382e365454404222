#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bencode {

// =============================================================================
// value_t - the untyped tree produced by reader_t
// =============================================================================
//
// Exactly the four kinds the wire format distinguishes. Strings are raw
// bytes held in std::string (binary safe, explicit length). Dictionaries are
// keyed by byte strings; std::map keeps them in the same lexicographic order
// the wire format uses, but nothing depends on that order.
//
// =============================================================================

enum class kind_t {
    string,
    integer,
    list,
    dict,
};

auto to_string(kind_t kind) -> const char*;

struct value_t;

using list_t = std::vector<value_t>;
using dict_t = std::map<std::string, value_t>;

struct value_t {
    using storage_t = std::variant<std::string, std::int64_t, list_t, dict_t>;

    storage_t data;

    value_t() = default;
    value_t(std::string s) : data(std::move(s)) {}

    // String literals only, so that 0 and nullptr are never taken for strings.
    // Embedded NUL bytes are kept.
    template <std::size_t N>
    value_t(const char (&s)[N]) : data(std::string(s, N - 1)) {}

    // Signed integers widen to int64; bool and char are rejected.
    template <std::signed_integral I>
        requires (!std::same_as<I, char>)
    value_t(I i) : data(static_cast<std::int64_t>(i)) {}
    value_t(bool) = delete;

    value_t(list_t l) : data(std::move(l)) {}
    value_t(dict_t d) : data(std::move(d)) {}

    auto kind() const -> kind_t { return static_cast<kind_t>(data.index()); }

    auto is_string() const -> bool { return kind() == kind_t::string; }
    auto is_integer() const -> bool { return kind() == kind_t::integer; }
    auto is_list() const -> bool { return kind() == kind_t::list; }
    auto is_dict() const -> bool { return kind() == kind_t::dict; }

    // Accessors throw std::bad_variant_access on the wrong kind.
    auto as_string() const -> const std::string& { return std::get<std::string>(data); }
    auto as_integer() const -> std::int64_t { return std::get<std::int64_t>(data); }
    auto as_list() const -> const list_t& { return std::get<list_t>(data); }
    auto as_dict() const -> const dict_t& { return std::get<dict_t>(data); }
    auto as_list() -> list_t& { return std::get<list_t>(data); }
    auto as_dict() -> dict_t& { return std::get<dict_t>(data); }

    // Entry lookup on a dictionary; nullptr when absent or not a dictionary.
    auto find(const std::string& key) const -> const value_t*;

    // Element count for lists and dictionaries, byte count for strings.
    auto size() const -> std::size_t;

    friend auto operator==(const value_t& a, const value_t& b) -> bool {
        return a.data == b.data;
    }
};

// Debug rendering: strings quoted with non-printable bytes escaped as \xNN.
auto describe(const value_t& value) -> std::string;

} // namespace bencode
