#include <cassert>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "bencode/bencode.hpp"

using namespace bencode;

// =============================================================================
// Test structures
// =============================================================================

struct foo_count_t {
    std::string foo;
    int count = 0;
};

auto fields(foo_count_t& f) {
    return std::make_tuple(field("foo", f.foo), field("count", f.count));
}

struct file_t {
    std::int64_t length = 0;
    std::vector<std::string> path;
};

auto fields(file_t& f) {
    return std::make_tuple(BENCODE_FIELD(f, length), BENCODE_FIELD(f, path));
}

struct info_t {
    std::string name;
    std::int64_t piece_length = 0;
    std::string pieces;
    std::optional<std::int64_t> length;
    std::vector<file_t> files;
};

auto fields(info_t& i) {
    return std::make_tuple(
        field("name", i.name),
        field("piece length", i.piece_length),
        field("pieces", i.pieces),
        field("length", i.length),
        field("files", i.files)
    );
}

struct metainfo_t {
    std::string announce;
    std::vector<std::vector<std::string>> announce_list;
    std::uint32_t creation_date = 0;
    info_t info;
    value_t raw_info;
};

auto fields(metainfo_t& m) {
    return std::make_tuple(
        field("announce", m.announce),
        field("announce-list", m.announce_list),
        field("creation date", m.creation_date),
        field("info", m.info),
        field("info", m.raw_info)
    );
}

// =============================================================================
// Helpers
// =============================================================================

template <typename T>
auto unmarshal_code(std::string_view input, T& dest, decode_options_t options = {}) -> error_code {
    try {
        unmarshal(input, dest, options);
    } catch (const error& e) {
        return e.code();
    }
    assert(false && "expected bencode::error");
    return error_code::end_of_stream;
}

auto read_file(const std::string& filename) -> std::string {
    auto file = std::ifstream(filename);
    auto ss = std::stringstream{};
    ss << file.rdbuf();
    return ss.str();
}

auto contains(const std::string& haystack, const std::string& needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

// =============================================================================
// unmarshal
// =============================================================================

void test_unmarshal_string() {
    std::cout << "Testing unmarshal string... ";

    auto s = std::string{};
    unmarshal("4:spam", s);
    assert(s == "spam");

    std::cout << "PASSED\n";
}

void test_unmarshal_struct() {
    std::cout << "Testing unmarshal struct... ";

    auto f = foo_count_t{};
    unmarshal("d3:foo3:bar5:counti42ee", f);
    assert(f.foo == "bar");
    assert(f.count == 42);

    std::cout << "PASSED\n";
}

void test_unmarshal_list() {
    std::cout << "Testing unmarshal list... ";

    auto v = std::vector<int>{};
    unmarshal("li1ei2ei3ee", v);
    assert((v == std::vector<int>{1, 2, 3}));

    std::cout << "PASSED\n";
}

void test_unmarshal_structural_failures() {
    std::cout << "Testing unmarshal structural failures... ";

    auto i = std::int64_t{};
    assert(unmarshal_code("i42", i) == error_code::malformed_integer);

    auto d = dynamic_t{};
    assert(unmarshal_code("di1e3:fooee", d) == error_code::non_string_key);
    assert(d.empty());

    std::cout << "PASSED\n";
}

void test_unmarshal_trailing_bytes() {
    std::cout << "Testing unmarshal ignores trailing bytes... ";

    auto i = int{};
    unmarshal("i7egarbage", i);
    assert(i == 7);

    auto s = std::string{};
    unmarshal("2:okxyz", s);
    assert(s == "ok");

    std::cout << "PASSED\n";
}

void test_unmarshal_empty_input() {
    std::cout << "Testing unmarshal empty input... ";

    auto s = std::string{"kept"};
    auto threw = false;
    try {
        unmarshal("", s);
    } catch (const decode_error& e) {
        threw = e.code() == error_code::end_of_stream && e.offset() == 0;
    }
    assert(threw);
    assert(s == "kept");

    std::cout << "PASSED\n";
}

void test_unmarshal_null_destination() {
    std::cout << "Testing unmarshal null destination... ";

    foo_count_t* nothing = nullptr;
    auto threw = false;
    try {
        unmarshal("d3:foo3:bare", nothing);
    } catch (const coerce_error& e) {
        threw = e.code() == error_code::invalid_destination;
    }
    assert(threw);

    auto f = foo_count_t{};
    unmarshal("d3:foo3:bare", &f);
    assert(f.foo == "bar");

    std::cout << "PASSED\n";
}

void test_unmarshal_dynamic() {
    std::cout << "Testing unmarshal dynamic... ";

    auto d = dynamic_t{};
    unmarshal("d4:listli1e1:ae3:numi-5ee", d);
    assert(d.is_map());
    const auto& m = d.as_map();
    assert(m.at("num").as_integer() == -5);
    assert(m.at("list").as_list().size() == 2);
    assert(m.at("list").as_list()[1].as_string() == "a");

    std::cout << "PASSED\n";
}

void test_unmarshal_metainfo() {
    std::cout << "Testing unmarshal torrent metainfo... ";

    auto input = std::string(
        "d"
        "8:announce"        "23:http://tracker/announce"
        "13:announce-list"  "ll23:http://tracker/announceel14:udp://backup:1ee"
        "13:creation date"  "i1700000000e"
        "4:info"            "d"
            "5:filesl"
                "d6:lengthi100e4:pathl3:dir5:a.binee"
                "d6:lengthi23e4:pathl5:b.txtee"
            "e"
            "4:name"         "7:payload"
            "12:piece length" "i262144e"
            "6:pieces"       "20:"
        "e"
        "e");
    input.insert(input.find("20:") + 3, std::string(20, '\xab'));

    auto meta = metainfo_t{};
    unmarshal(input, meta);

    assert(meta.announce == "http://tracker/announce");
    assert(meta.announce_list.size() == 2);
    assert(meta.announce_list[1][0] == "udp://backup:1");
    assert(meta.creation_date == 1700000000u);
    assert(meta.info.name == "payload");
    assert(meta.info.piece_length == 262144);
    assert(meta.info.pieces == std::string(20, '\xab'));
    assert(!meta.info.length.has_value());
    assert(meta.info.files.size() == 2);
    assert(meta.info.files[0].length == 100);
    assert((meta.info.files[0].path == std::vector<std::string>{"dir", "a.bin"}));
    assert(meta.raw_info.is_dict());
    assert(meta.raw_info.find("piece length")->as_integer() == 262144);

    std::cout << "PASSED\n";
}

void test_unmarshal_coercion_failure() {
    std::cout << "Testing unmarshal coercion failure... ";

    auto meta = metainfo_t{};
    auto threw = false;
    try {
        unmarshal("d13:creation datei-1ee", meta);
    } catch (const coerce_error& e) {
        threw = e.code() == error_code::negative_to_unsigned &&
                e.path() == ".creation date";
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_error_families() {
    std::cout << "Testing error families are distinct... ";

    auto i = int{};

    auto structural = false;
    try {
        unmarshal("x", i);
    } catch (const coerce_error&) {
        structural = false;
    } catch (const decode_error& e) {
        structural = is_structural(e.code());
    }
    assert(structural);

    auto coercion = false;
    try {
        unmarshal("1:x", i);
    } catch (const decode_error&) {
        coercion = false;
    } catch (const coerce_error& e) {
        coercion = !is_structural(e.code());
    }
    assert(coercion);

    std::cout << "PASSED\n";
}

void test_error_code_names() {
    std::cout << "Testing error code names... ";

    const error_code codes[] = {
        error_code::end_of_stream,
        error_code::invalid_lead_byte,
        error_code::malformed_length,
        error_code::malformed_integer,
        error_code::truncated_input,
        error_code::unterminated_container,
        error_code::non_string_key,
        error_code::duplicate_key,
        error_code::limit_exceeded,
        error_code::type_mismatch,
        error_code::integer_overflow,
        error_code::negative_to_unsigned,
        error_code::unsupported_shape,
        error_code::invalid_destination,
        error_code::unknown_field,
    };

    auto structural = 0;
    for (auto code : codes) {
        assert(from_string(std::type_identity<error_code>{}, to_string(code)) == code);
        if (is_structural(code)) {
            ++structural;
        }
    }
    assert(structural == 9);
    assert(std::string(to_string(error_code::non_string_key)) == "non_string_key");

    auto threw = false;
    try {
        from_string(std::type_identity<error_code>{}, "no_such_code");
    } catch (const std::runtime_error& e) {
        threw = contains(e.what(), "no_such_code");
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// =============================================================================
// decoder_t
// =============================================================================

void test_decoder_sequential() {
    std::cout << "Testing sequential decode... ";

    auto is = std::istringstream{"i1ei2e4:spam"};
    auto decoder = decoder_t{is};

    auto a = int{};
    auto b = int{};
    auto c = std::string{};
    assert(decoder.decode(a) && a == 1);
    assert(decoder.offset() == 3);
    assert(decoder.decode(b) && b == 2);
    assert(decoder.decode(c) && c == "spam");
    assert(decoder.count() == 3);

    auto extra = std::string{"same"};
    assert(!decoder.decode(extra));
    assert(extra == "same");
    assert(!decoder.decode(extra));
    assert(decoder.count() == 3);

    std::cout << "PASSED\n";
}

void test_decoder_next() {
    std::cout << "Testing next() without coercion... ";

    auto is = std::istringstream{"li1eed1:ai2ee"};
    auto decoder = decoder_t{is};

    auto value = value_t{};
    assert(decoder.next(value) && value.is_list());
    assert(decoder.next(value) && value.is_dict());
    assert(value.find("a")->as_integer() == 2);
    assert(!decoder.next(value));

    std::cout << "PASSED\n";
}

void test_decoder_null_destination() {
    std::cout << "Testing decode into null destination... ";

    auto is = std::istringstream{"i1e"};
    auto decoder = decoder_t{is};

    int* nothing = nullptr;
    auto threw = false;
    try {
        decoder.decode(nothing);
    } catch (const coerce_error& e) {
        threw = e.code() == error_code::invalid_destination;
    }
    assert(threw);
    assert(decoder.offset() == 0);

    auto i = int{};
    assert(decoder.decode(&i) && i == 1);

    std::cout << "PASSED\n";
}

void test_decoder_log_stream() {
    std::cout << "Testing decoder log stream... ";

    auto is = std::istringstream{"i1e4:spamli1ee"};
    auto log = std::ostringstream{};
    auto decoder = decoder_t{is};
    decoder.set_log_stream(log);

    auto d = dynamic_t{};
    while (decoder.decode(d)) {
        d.reset();
    }

    auto text = log.str();
    assert(contains(text, "value 1: integer, ends at byte 3\n"));
    assert(contains(text, "value 2: string, ends at byte 9\n"));
    assert(contains(text, "value 3: list, ends at byte 14\n"));
    assert(contains(text, "end of stream after 3 values\n"));

    std::cout << "PASSED\n";
}

void test_decoder_log_errors() {
    std::cout << "Testing decoder logs failures... ";

    auto log = std::ostringstream{};

    auto bad_wire = std::istringstream{"i1ex"};
    auto first = decoder_t{bad_wire};
    first.set_log_stream(log);
    auto i = int{};
    assert(first.decode(i));
    auto threw = false;
    try {
        first.decode(i);
    } catch (const decode_error& e) {
        threw = e.code() == error_code::invalid_lead_byte;
    }
    assert(threw);

    auto bad_shape = std::istringstream{"4:spam"};
    auto second = decoder_t{bad_shape};
    second.set_log_stream(log);
    threw = false;
    try {
        second.decode(i);
    } catch (const coerce_error& e) {
        threw = e.code() == error_code::type_mismatch;
    }
    assert(threw);

    auto text = log.str();
    assert(contains(text, "  error: bencode: "));
    assert(contains(text, "(at byte 3)"));
    assert(contains(text, "value 1: string, ends at byte 6\n"));

    std::cout << "PASSED\n";
}

void test_decoder_log_file() {
    std::cout << "Testing decoder log file... ";

    const auto filename = std::string("test_decoder_log.txt");
    {
        auto is = std::istringstream{"i5e"};
        auto decoder = decoder_t{is};
        decoder.set_log_file(filename);
        auto i = int{};
        assert(decoder.decode(i) && i == 5);
        assert(!decoder.decode(i));
    }

    auto text = read_file(filename);
    assert(contains(text, "value 1: integer, ends at byte 3\n"));
    assert(contains(text, "end of stream after 1 values\n"));
    std::remove(filename.c_str());

    std::cout << "PASSED\n";
}

void test_decoder_log_file_unopenable() {
    std::cout << "Testing decoder log file that cannot be opened... ";

    auto is = std::istringstream{"i5e"};
    auto log = std::ostringstream{};
    auto decoder = decoder_t{is};
    decoder.set_log_stream(log);

    auto threw = false;
    try {
        decoder.set_log_file("no_such_directory_for_bencode_logs/decoder.log");
    } catch (const std::runtime_error& e) {
        threw = contains(e.what(), "failed to open log file");
    }
    assert(threw);

    // Decoding still works, with logging switched off.
    auto i = int{};
    assert(decoder.decode(i) && i == 5);
    assert(log.str().empty());

    std::cout << "PASSED\n";
}

// =============================================================================
// Options
// =============================================================================

void test_options_from_bencode() {
    std::cout << "Testing options loaded by unmarshal... ";

    auto options = decode_options_t{};
    unmarshal("d9:max_depthi2e21:reject_duplicate_keysi1ee", options);
    assert(options.max_depth == 2);
    assert(options.reject_duplicate_keys == 1);
    assert(options.max_string_length == 0);

    auto v = std::vector<std::vector<int>>{};
    unmarshal("lli1eee", v, options);
    assert(v.size() == 1);
    assert(unmarshal_code("llli1eeee", v, options) == error_code::limit_exceeded);

    auto d = dynamic_t{};
    assert(unmarshal_code("d1:ai1e1:ai2ee", d, options) == error_code::duplicate_key);

    std::cout << "PASSED\n";
}

void test_options_from_set() {
    std::cout << "Testing options set by path... ";

    auto options = decode_options_t{};
    set(options, "max_string_length", "4");
    set(options, "canonical_integers", "1");

    auto s = std::string{};
    unmarshal("4:spam", s, options);
    assert(s == "spam");
    assert(unmarshal_code("5:spams", s, options) == error_code::limit_exceeded);

    auto i = int{};
    assert(unmarshal_code("i007e", i, options) == error_code::malformed_integer);
    assert(unmarshal_code("i-0e", i, options) == error_code::malformed_integer);
    unmarshal("i-7e", i, options);
    assert(i == -7);

    std::cout << "PASSED\n";
}

void test_options_on_decoder() {
    std::cout << "Testing options on a stream decoder... ";

    auto options = decode_options_t{};
    options.max_depth = 1;

    auto is = std::istringstream{"li1eelli1eee"};
    auto decoder = decoder_t{is, options};
    auto v = std::vector<int>{};
    assert(decoder.decode(v) && v.size() == 1);

    auto threw = false;
    try {
        decoder.decode(v);
    } catch (const decode_error& e) {
        threw = e.code() == error_code::limit_exceeded;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== unmarshal ===\n\n";

    test_unmarshal_string();
    test_unmarshal_struct();
    test_unmarshal_list();
    test_unmarshal_structural_failures();
    test_unmarshal_trailing_bytes();
    test_unmarshal_empty_input();
    test_unmarshal_null_destination();
    test_unmarshal_dynamic();
    test_unmarshal_metainfo();
    test_unmarshal_coercion_failure();
    test_error_families();
    test_error_code_names();

    std::cout << "\n=== decoder_t ===\n\n";

    test_decoder_sequential();
    test_decoder_next();
    test_decoder_null_destination();
    test_decoder_log_stream();
    test_decoder_log_errors();
    test_decoder_log_file();
    test_decoder_log_file_unopenable();

    std::cout << "\n=== Options ===\n\n";

    test_options_from_bencode();
    test_options_from_set();
    test_options_on_decoder();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
