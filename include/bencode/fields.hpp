#pragma once

// Field-to-key binding for structure destinations.
//
// A structure takes part in coercion by providing an ADL free function
// fields(T&) that returns a tuple of bindings. Each binding names the
// dictionary key a member is filled from. Members left out of the tuple are
// never touched.
//
//   struct torrent_t {
//       std::string announce;
//       std::int64_t piece_length = 0;
//   };
//
//   auto fields(torrent_t& t) {
//       return std::make_tuple(
//           BENCODE_FIELD(t, announce),                      // key "announce"
//           bencode::field("piece length", t.piece_length)   // explicit key
//       );
//   }

#include <tuple>
#include <utility>

namespace bencode {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template <typename T>
constexpr auto field(const char* key, T& value) {
    return std::pair<const char*, T&>{key, value};
}

// ============================================================================
// HasFields concept - requires ADL free function fields(t)
// ============================================================================

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

} // namespace bencode

// Bind a member under its own name.
#define BENCODE_FIELD(object, member) ::bencode::field(#member, (object).member)
