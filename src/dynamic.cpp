// dynamic.cpp - conversion of decoded trees into dynamic slots

#include "bencode/dynamic.hpp"
#include <utility>

namespace bencode {

auto dynamic_t::from(const value_t& value) -> dynamic_t {
    switch (value.kind()) {
        case kind_t::string:
            return dynamic_t{value.as_string()};
        case kind_t::integer:
            return dynamic_t{value.as_integer()};
        case kind_t::list: {
            auto list = list_type{};
            list.reserve(value.as_list().size());
            for (const auto& item : value.as_list()) {
                list.push_back(from(item));
            }
            return dynamic_t{std::move(list)};
        }
        case kind_t::dict: {
            auto map = map_type{};
            for (const auto& [key, item] : value.as_dict()) {
                map.emplace(key, from(item));
            }
            return dynamic_t{std::move(map)};
        }
    }
    return dynamic_t{};
}

} // namespace bencode
