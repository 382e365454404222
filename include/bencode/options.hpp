#pragma once

#include <cstdint>
#include <tuple>
#include "fields.hpp"

namespace bencode {

// =============================================================================
// decode_options_t - reader limits and strictness
// =============================================================================
//
// The defaults are fully permissive: unbounded nesting and string length,
// last-write-wins on duplicate dictionary keys, and non-canonical integers
// ("i007e", "i-0e") accepted. Each knob tightens one of those.
//
// The struct binds its own fields, so it can be read from bencode with
// unmarshal() or overridden by name with set().
//
// =============================================================================

struct decode_options_t {
    std::uint32_t max_depth = 0;          // 0 = unbounded
    std::uint64_t max_string_length = 0;  // 0 = unbounded
    int reject_duplicate_keys = 0;
    int canonical_integers = 0;
};

inline auto fields(decode_options_t& o) {
    return std::make_tuple(
        BENCODE_FIELD(o, max_depth),
        BENCODE_FIELD(o, max_string_length),
        BENCODE_FIELD(o, reject_duplicate_keys),
        BENCODE_FIELD(o, canonical_integers)
    );
}

} // namespace bencode
