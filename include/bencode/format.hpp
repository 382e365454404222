#pragma once

// Wire format constants for bencode.
//
//   String      <decimal length>:<raw bytes>
//   Integer     i<decimal, optional leading '-'>e
//   List        l<value>*e
//   Dictionary  d(<string><value>)*e

namespace bencode {

namespace wire_format {

constexpr char INTEGER_BEGIN    = 'i';
constexpr char LIST_BEGIN       = 'l';
constexpr char DICT_BEGIN       = 'd';
constexpr char END              = 'e';
constexpr char LENGTH_SEPARATOR = ':';
constexpr char MINUS            = '-';

constexpr auto is_digit(int c) -> bool {
    return c >= '0' && c <= '9';
}

// A string's lead byte is the first digit of its length prefix.
constexpr auto is_string_lead(int c) -> bool {
    return is_digit(c);
}

} // namespace wire_format

} // namespace bencode
