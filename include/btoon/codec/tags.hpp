#pragma once

#include <cstdint>

namespace btoon::codec::tags {

// Tag byte table. These values are the wire format: every conforming encoder
// and decoder must agree on them bit for bit.

inline constexpr uint8_t NIL = 0xc0;
inline constexpr uint8_t BOOL_FALSE = 0xc2;
inline constexpr uint8_t BOOL_TRUE = 0xc3;

inline constexpr uint8_t BIN8 = 0xc4;
inline constexpr uint8_t BIN16 = 0xc5;

inline constexpr uint8_t FLOAT32 = 0xca;
inline constexpr uint8_t FLOAT64 = 0xcb;

inline constexpr uint8_t INT32 = 0xd2;
inline constexpr uint8_t INT64 = 0xd3;

inline constexpr uint8_t STR8 = 0xd9;
inline constexpr uint8_t STR16 = 0xda;
inline constexpr uint8_t STR32 = 0xdb;

inline constexpr uint8_t ARRAY16 = 0xdc;
inline constexpr uint8_t ARRAY32 = 0xdd;
inline constexpr uint8_t MAP16 = 0xde;
inline constexpr uint8_t MAP32 = 0xdf;

// Compact forms carry their value or size in the tag itself.
inline constexpr uint8_t FIXMAP = 0x80;        // 1000xxxx
inline constexpr uint8_t FIXARRAY = 0x90;      // 1001xxxx
inline constexpr uint8_t FIXSTR = 0xa0;        // 101xxxxx
inline constexpr uint8_t NEGATIVE_FIXINT = 0xe0;  // 111xxxxx

inline constexpr int64_t POSITIVE_FIXINT_MAX = 127;
inline constexpr int64_t NEGATIVE_FIXINT_MIN = -32;

inline constexpr uint32_t FIXSTR_MAX = 31;
inline constexpr uint32_t FIXARRAY_MAX = 15;
inline constexpr uint32_t FIXMAP_MAX = 15;
inline constexpr uint32_t UINT8_LENGTH_MAX = 0xff;
inline constexpr uint32_t UINT16_LENGTH_MAX = 0xffff;

constexpr bool is_positive_fixint(uint8_t tag) { return (tag & 0x80) == 0; }
constexpr bool is_negative_fixint(uint8_t tag) { return (tag & 0xe0) == 0xe0; }
constexpr bool is_fixstr(uint8_t tag) { return (tag & 0xe0) == FIXSTR; }
constexpr bool is_fixarray(uint8_t tag) { return (tag & 0xf0) == FIXARRAY; }
constexpr bool is_fixmap(uint8_t tag) { return (tag & 0xf0) == FIXMAP; }

constexpr bool fits_fixint(int64_t n) {
    return n >= NEGATIVE_FIXINT_MIN && n <= POSITIVE_FIXINT_MAX;
}

// True for every tag the decoder accepts.
constexpr bool is_known(uint8_t tag) {
    if (is_positive_fixint(tag) || is_negative_fixint(tag) || is_fixstr(tag) ||
        is_fixarray(tag) || is_fixmap(tag)) {
        return true;
    }
    switch (tag) {
        case NIL:
        case BOOL_FALSE:
        case BOOL_TRUE:
        case BIN8:
        case BIN16:
        case FLOAT32:
        case FLOAT64:
        case INT32:
        case INT64:
        case STR8:
        case STR16:
        case STR32:
        case ARRAY16:
        case ARRAY32:
        case MAP16:
        case MAP32:
            return true;
        default:
            return false;
    }
}

}  // namespace btoon::codec::tags
