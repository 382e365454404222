#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "value.hpp"

namespace bencode {

// =============================================================================
// dynamic_t - open destination slot
// =============================================================================
//
// Holds nothing, or one of the four natural representations of a value_t:
// a string, a 64-bit integer, a list of dynamic_t, or a string-keyed map of
// dynamic_t. Coercing into an empty slot stores the incoming value as is.
// Coercing into a slot that already holds something only succeeds when the
// incoming kind matches the held kind, so a second decode cannot silently
// change what the slot contains.
//
// =============================================================================

struct dynamic_t {
    using list_type = std::vector<dynamic_t>;
    using map_type = std::map<std::string, dynamic_t>;
    using storage_t = std::variant<std::monostate, std::string, std::int64_t, list_type, map_type>;

    storage_t data;

    dynamic_t() = default;
    dynamic_t(std::string s) : data(std::move(s)) {}

    // String literals only, so that 0 and nullptr are never taken for strings.
    // Embedded NUL bytes are kept.
    template <std::size_t N>
    dynamic_t(const char (&s)[N]) : data(std::string(s, N - 1)) {}

    // Signed integers widen to int64; bool and char are rejected.
    template <std::signed_integral I>
        requires (!std::same_as<I, char>)
    dynamic_t(I i) : data(static_cast<std::int64_t>(i)) {}
    dynamic_t(bool) = delete;

    dynamic_t(list_type l) : data(std::move(l)) {}
    dynamic_t(map_type m) : data(std::move(m)) {}

    // Element-wise conversion of a decoded tree.
    static auto from(const value_t& value) -> dynamic_t;

    auto empty() const -> bool { return data.index() == 0; }

    // Kind of the held value; only meaningful when !empty().
    auto kind() const -> kind_t { return static_cast<kind_t>(data.index() - 1); }

    auto is_string() const -> bool { return !empty() && kind() == kind_t::string; }
    auto is_integer() const -> bool { return !empty() && kind() == kind_t::integer; }
    auto is_list() const -> bool { return !empty() && kind() == kind_t::list; }
    auto is_map() const -> bool { return !empty() && kind() == kind_t::dict; }

    auto as_string() const -> const std::string& { return std::get<std::string>(data); }
    auto as_integer() const -> std::int64_t { return std::get<std::int64_t>(data); }
    auto as_list() const -> const list_type& { return std::get<list_type>(data); }
    auto as_map() const -> const map_type& { return std::get<map_type>(data); }

    void reset() { data = std::monostate{}; }

    friend auto operator==(const dynamic_t& a, const dynamic_t& b) -> bool {
        return a.data == b.data;
    }
};

} // namespace bencode
