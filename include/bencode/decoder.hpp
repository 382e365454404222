#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include "coerce.hpp"
#include "error.hpp"
#include "options.hpp"
#include "reader.hpp"
#include "value.hpp"

namespace bencode {

// =============================================================================
// decoder_t - stream decoder: reader_t followed by coerce()
// =============================================================================
//
//   auto is = std::ifstream("file.torrent", std::ios::binary);
//   auto decoder = bencode::decoder_t{is};
//   auto meta = metainfo_t{};
//   decoder.decode(meta);
//
// decode() returns false once the stream is exhausted between values.
// Structural failures throw decode_error, coercion failures throw
// coerce_error; neither is retried.
//
// =============================================================================

class decoder_t {
public:
    explicit decoder_t(std::istream& stream, decode_options_t options = {});

    // Non-copyable, non-movable (may own its log file)
    decoder_t(const decoder_t&) = delete;
    decoder_t& operator=(const decoder_t&) = delete;
    decoder_t(decoder_t&&) = delete;
    decoder_t& operator=(decoder_t&&) = delete;

    template <typename T>
    auto decode(T& dest) -> bool;

    // A null destination is rejected before any byte is read.
    template <typename T>
    auto decode(T* dest) -> bool;

    // Next value as an untyped tree.
    auto next(value_t& value) -> bool;

    auto offset() const -> std::uint64_t { return reader_.offset(); }
    auto count() const -> std::uint64_t { return count_; }

    // Diagnostic log, one line per decoded value or failure.
    void set_log_stream(std::ostream& os);
    // Throws std::runtime_error if the file cannot be opened; the previous
    // log target is then dropped.
    void set_log_file(const std::string& filename);

private:
    reader_t reader_;
    std::uint64_t count_ = 0;
    std::ostream* log_stream_ = nullptr;
    std::optional<std::ofstream> log_file_;

    void log(const std::string& message);
};

template <typename T>
auto decoder_t::decode(T& dest) -> bool {
    auto value = value_t{};
    if (!next(value)) {
        return false;
    }
    try {
        coerce(value, dest);
    } catch (const coerce_error& e) {
        log(std::string("  error: ") + e.what());
        throw;
    }
    return true;
}

template <typename T>
auto decoder_t::decode(T* dest) -> bool {
    if (dest == nullptr) {
        throw coerce_error(error_code::invalid_destination, "destination is null");
    }
    return decode(*dest);
}

// =============================================================================
// One-shot helpers
// =============================================================================

// Decodes the first value in `data` into `dest`; trailing bytes are ignored.
// Empty input throws decode_error with error_code::end_of_stream.
template <typename T>
void unmarshal(std::string_view data, T& dest, decode_options_t options = {}) {
    auto stream = std::istringstream{std::string{data}};
    auto decoder = decoder_t{stream, options};
    if (!decoder.decode(dest)) {
        throw decode_error(error_code::end_of_stream, "no value in input", 0);
    }
}

template <typename T>
void unmarshal(std::string_view data, T* dest, decode_options_t options = {}) {
    if (dest == nullptr) {
        throw coerce_error(error_code::invalid_destination, "destination is null");
    }
    unmarshal(data, *dest, options);
}

// Decodes the first value in `data` without coercion.
auto parse(std::string_view data, decode_options_t options = {}) -> value_t;

} // namespace bencode
