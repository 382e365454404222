#pragma once

// ============================================================================
// bencode - C++20 decoding of bencoded data into typed values
// ============================================================================
//
// Two stages:
// - reader_t turns a byte stream into an untyped value_t tree
// - coerce() fills a typed destination from that tree
//
// decoder_t and unmarshal() run both stages back to back.
//
// Basic usage:
//
//   #include "bencode/bencode.hpp"
//
//   struct peer_t {
//       std::string ip;
//       std::uint16_t port = 0;
//   };
//
//   // ADL free function binding members to dictionary keys
//   auto fields(peer_t& p) {
//       return std::make_tuple(
//           bencode::field("ip", p.ip),
//           bencode::field("port", p.port)
//       );
//   }
//
//   auto peer = peer_t{};
//   bencode::unmarshal("d2:ip9:127.0.0.14:porti6881ee", peer);
//
//   // Stream of concatenated values
//   auto is = std::istringstream("i1ei2e4:spam");
//   auto decoder = bencode::decoder_t{is};
//   auto value = bencode::dynamic_t{};
//   while (decoder.decode(value)) {
//       value.reset();
//   }
//
// ============================================================================

#include "coerce.hpp"
#include "decoder.hpp"
#include "dynamic.hpp"
#include "error.hpp"
#include "fields.hpp"
#include "format.hpp"
#include "options.hpp"
#include "reader.hpp"
#include "value.hpp"
