#pragma once

// Coercion of decoded value_t trees into typed destinations.
//
// One overload of coerce() per destination shape. Dispatch is resolved at
// compile time from the destination type; the wire kind of the incoming value
// is checked at run time against what the shape accepts.

#include <array>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dynamic.hpp"
#include "error.hpp"
#include "fields.hpp"
#include "value.hpp"

namespace bencode {

// ============================================================================
// Shape concepts
// ============================================================================

template <typename T>
concept CharacterType =
    std::same_as<std::remove_cv_t<T>, char> ||
    std::same_as<std::remove_cv_t<T>, wchar_t> ||
    std::same_as<std::remove_cv_t<T>, char8_t> ||
    std::same_as<std::remove_cv_t<T>, char16_t> ||
    std::same_as<std::remove_cv_t<T>, char32_t>;

template <typename T>
concept SignedInteger = std::is_integral_v<T> && std::is_signed_v<T> &&
    !std::same_as<T, bool> && !CharacterType<T>;

template <typename T>
concept UnsignedInteger = std::is_integral_v<T> && std::is_unsigned_v<T> &&
    !std::same_as<T, bool> && !CharacterType<T>;

// Arithmetic types the format has no representation for: bool, character
// types and floating point.
template <typename T>
concept UnsupportedScalar = std::is_arithmetic_v<T> &&
    !SignedInteger<T> && !UnsignedInteger<T>;

// ============================================================================
// Error helpers
// ============================================================================

namespace detail {

auto mismatch(const value_t& value, const std::string& shape) -> coerce_error;
auto shown(const value_t& value) -> std::string;
auto field_segment(const char* key) -> std::string;
auto index_segment(std::size_t index) -> std::string;
auto key_segment(const std::string& key) -> std::string;

template <typename T>
auto shape_name() -> std::string {
    if constexpr (std::same_as<T, bool>) {
        return "bool";
    } else if constexpr (CharacterType<T>) {
        return "character";
    } else if constexpr (std::is_floating_point_v<T>) {
        return "float" + std::to_string(sizeof(T) * 8);
    } else if constexpr (SignedInteger<T>) {
        return "int" + std::to_string(sizeof(T) * 8);
    } else {
        return "uint" + std::to_string(sizeof(T) * 8);
    }
}

} // namespace detail

// ============================================================================
// Coerce declarations
// ============================================================================

// Nil-aware entry point: a null value leaves the destination untouched.
template <typename T>
void coerce(const value_t* value, T& dest);

void coerce(const value_t& value, std::string& dest);

template <SignedInteger T>
void coerce(const value_t& value, T& dest);

template <UnsignedInteger T>
void coerce(const value_t& value, T& dest);

template <UnsupportedScalar T>
void coerce(const value_t& value, T& dest);

template <typename T>
void coerce(const value_t& value, std::vector<T>& dest);

template <typename T, std::size_t N>
void coerce(const value_t& value, std::array<T, N>& dest);

template <typename T>
void coerce(const value_t& value, std::map<std::string, T>& dest);

template <typename T>
void coerce(const value_t& value, std::unordered_map<std::string, T>& dest);

template <typename T>
    requires HasFields<T>
void coerce(const value_t& value, T& dest);

template <typename T>
void coerce(const value_t& value, std::optional<T>& dest);

template <typename T>
void coerce(const value_t& value, std::unique_ptr<T>& dest);

template <typename T>
void coerce(const value_t& value, std::shared_ptr<T>& dest);

void coerce(const value_t& value, dynamic_t& dest);

// Raw capture: the subtree is copied unchanged.
void coerce(const value_t& value, value_t& dest);

// ============================================================================
// Coerce implementations
// ============================================================================

template <typename T>
void coerce(const value_t* value, T& dest) {
    if (value == nullptr) {
        return;
    }
    coerce(*value, dest);
}

// Integers are range checked against the destination width, never truncated.
template <SignedInteger T>
void coerce(const value_t& value, T& dest) {
    if (!value.is_integer()) {
        throw detail::mismatch(value, detail::shape_name<T>());
    }
    auto i = value.as_integer();
    if (!std::in_range<T>(i)) {
        throw coerce_error(error_code::integer_overflow,
            "value " + std::to_string(i) + " overflows " + detail::shape_name<T>());
    }
    dest = static_cast<T>(i);
}

template <UnsignedInteger T>
void coerce(const value_t& value, T& dest) {
    if (!value.is_integer()) {
        throw detail::mismatch(value, detail::shape_name<T>());
    }
    auto i = value.as_integer();
    if (i < 0) {
        throw coerce_error(error_code::negative_to_unsigned,
            "negative value " + std::to_string(i) + " into " + detail::shape_name<T>());
    }
    if (!std::in_range<T>(i)) {
        throw coerce_error(error_code::integer_overflow,
            "value " + std::to_string(i) + " overflows " + detail::shape_name<T>());
    }
    dest = static_cast<T>(i);
}

template <UnsupportedScalar T>
void coerce(const value_t&, T&) {
    throw coerce_error(error_code::unsupported_shape,
        "unsupported destination type " + detail::shape_name<T>());
}

// std::vector<T> - replaced by a same-length vector once every element has
// been coerced
template <typename T>
void coerce(const value_t& value, std::vector<T>& dest) {
    if (!value.is_list()) {
        throw detail::mismatch(value, "list");
    }
    const auto& items = value.as_list();
    auto result = std::vector<T>(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        try {
            coerce(items[i], result[i]);
        } catch (const coerce_error& e) {
            throw e.within(detail::index_segment(i));
        }
    }
    dest = std::move(result);
}

// std::array<T, N> - the list must have exactly N elements
template <typename T, std::size_t N>
void coerce(const value_t& value, std::array<T, N>& dest) {
    if (!value.is_list()) {
        throw detail::mismatch(value, "array");
    }
    const auto& items = value.as_list();
    if (items.size() != N) {
        throw coerce_error(error_code::type_mismatch,
            "cannot coerce list of " + std::to_string(items.size()) +
            " elements into array of " + std::to_string(N));
    }
    for (std::size_t i = 0; i < N; ++i) {
        try {
            coerce(items[i], dest[i]);
        } catch (const coerce_error& e) {
            throw e.within(detail::index_segment(i));
        }
    }
}

namespace detail {

// Existing entries are kept; incoming keys overwrite.
template <typename Map>
void coerce_map(const value_t& value, Map& dest) {
    if (!value.is_dict()) {
        throw mismatch(value, "map");
    }
    for (const auto& [key, item] : value.as_dict()) {
        auto slot = typename Map::mapped_type{};
        try {
            coerce(item, slot);
        } catch (const coerce_error& e) {
            throw e.within(key_segment(key));
        }
        dest.insert_or_assign(key, std::move(slot));
    }
}

template <typename T>
void coerce_field(const value_t& dict, const char* key, T& member) {
    try {
        coerce(dict.find(key), member);
    } catch (const coerce_error& e) {
        throw e.within(field_segment(key));
    }
}

} // namespace detail

template <typename T>
void coerce(const value_t& value, std::map<std::string, T>& dest) {
    detail::coerce_map(value, dest);
}

template <typename T>
void coerce(const value_t& value, std::unordered_map<std::string, T>& dest) {
    detail::coerce_map(value, dest);
}

// Compound types with fields(). Keys missing from the dictionary leave their
// member as it was; keys with no bound member are ignored.
template <typename T>
    requires HasFields<T>
void coerce(const value_t& value, T& dest) {
    if (!value.is_dict()) {
        throw detail::mismatch(value, "struct");
    }
    std::apply([&value](auto&&... f) {
        (detail::coerce_field(value, f.first, f.second), ...);
    }, fields(dest));
}

// Indirections are allocated when empty, then the pointee is coerced
template <typename T>
void coerce(const value_t& value, std::optional<T>& dest) {
    if (!dest) {
        dest.emplace();
    }
    coerce(value, *dest);
}

template <typename T>
void coerce(const value_t& value, std::unique_ptr<T>& dest) {
    if (!dest) {
        dest = std::make_unique<T>();
    }
    coerce(value, *dest);
}

template <typename T>
void coerce(const value_t& value, std::shared_ptr<T>& dest) {
    if (!dest) {
        dest = std::make_shared<T>();
    }
    coerce(value, *dest);
}

// ============================================================================
// Config field setter by path
// ============================================================================
//
// set() walks a dot-separated key path through fields() bindings and assigns
// the text at the end of it. Failures are coerce_error with the path walked so
// far, exactly as coerce() reports them:
//
//   unknown_field        no binding matches a path segment
//   invalid_destination  the path continues past a member that has no fields()
//   type_mismatch        the text does not parse as the member's type
//   integer_overflow     (and the other coercion codes) from coerce() itself
//
// ============================================================================

namespace detail {

// The text is turned into the value_t it would have decoded to, so that
// set() applies the same range checks as coercion.
template <typename T>
void assign_text(T& target, const std::string& text) {
    if constexpr (std::same_as<T, std::string>) {
        coerce(value_t{text}, target);
    } else if constexpr (SignedInteger<T> || UnsignedInteger<T>) {
        auto i = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), i);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            throw coerce_error(error_code::type_mismatch,
                "cannot parse '" + text + "' as " + shape_name<T>());
        }
        coerce(value_t{i}, target);
    } else {
        throw coerce_error(error_code::unsupported_shape, "member cannot be set from text");
    }
}

template <typename T>
void set_path(T& target, std::string_view path, const std::string& text);

// Applies the rest of the path to the bound member when the binding's key
// matches; returns whether it did.
template <typename Binding>
auto set_binding(const Binding& binding, std::string_view key, std::string_view rest,
                 const std::string& text) -> bool {
    if (key != binding.first) {
        return false;
    }
    try {
        set_path(binding.second, rest, text);
    } catch (const coerce_error& e) {
        throw e.within(field_segment(binding.first));
    }
    return true;
}

template <typename T>
void set_path(T& target, std::string_view path, const std::string& text) {
    if (path.empty()) {
        assign_text(target, text);
        return;
    }
    if constexpr (HasFields<T>) {
        auto dot = path.find('.');
        auto key = path.substr(0, dot);
        auto rest = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

        auto matched = std::apply([&](const auto&... binding) {
            return (set_binding(binding, key, rest, text) || ...);
        }, fields(target));

        if (!matched) {
            throw coerce_error(error_code::unknown_field,
                "no field named '" + std::string(key) + "'");
        }
    } else {
        throw coerce_error(error_code::invalid_destination,
            "cannot descend into '" + std::string(path) + "': member has no fields");
    }
}

} // namespace detail

/**
 * Set a bound field by dot-separated key path.
 *
 * Example:
 *   set(options, "max_depth", "64");
 *   set(meta, "info.piece length", "262144");
 */
template <HasFields T>
void set(T& obj, const std::string& path, const std::string& value) {
    detail::set_path(obj, path, value);
}

} // namespace bencode
