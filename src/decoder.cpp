// decoder.cpp - stream decoder and one-shot parsing

#include "bencode/decoder.hpp"
#include <stdexcept>

namespace bencode {

decoder_t::decoder_t(std::istream& stream, decode_options_t options)
    : reader_(stream, options)
{
}

auto decoder_t::next(value_t& value) -> bool {
    try {
        if (!reader_.read(value)) {
            log("end of stream after " + std::to_string(count_) + " values");
            return false;
        }
    } catch (const decode_error& e) {
        log(std::string("  error: ") + e.what());
        throw;
    }
    ++count_;
    log("value " + std::to_string(count_) + ": " + to_string(value.kind()) +
        ", ends at byte " + std::to_string(reader_.offset()));
    return true;
}

void decoder_t::set_log_stream(std::ostream& os) {
    log_file_.reset();
    log_stream_ = &os;
}

void decoder_t::set_log_file(const std::string& filename) {
    log_file_.emplace(filename);
    if (!*log_file_) {
        log_file_.reset();
        log_stream_ = nullptr;
        throw std::runtime_error("bencode: failed to open log file " + filename);
    }
    log_stream_ = &*log_file_;
}

void decoder_t::log(const std::string& message) {
    if (log_stream_) {
        *log_stream_ << message << "\n";
        log_stream_->flush();
    }
}

auto parse(std::string_view data, decode_options_t options) -> value_t {
    auto stream = std::istringstream{std::string{data}};
    auto reader = reader_t{stream, options};
    auto value = value_t{};
    if (!reader.read(value)) {
        throw decode_error(error_code::end_of_stream, "no value in input", 0);
    }
    return value;
}

} // namespace bencode
