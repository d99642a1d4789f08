#include "btoon/codec/encoder.hpp"

#include <bit>
#include <cmath>
#include <limits>
#include <string>

#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/tags.hpp"

namespace btoon::codec {

namespace {

void put_u8(std::vector<uint8_t>& out, uint8_t v) { out.push_back(v); }

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    put_u32(out, static_cast<uint32_t>(v >> 32));
    put_u32(out, static_cast<uint32_t>(v));
}

void check_length(std::size_t length, const char* what) {
    if (length > std::numeric_limits<uint32_t>::max()) {
        throw UnsupportedValueException(std::string(what) + " length " +
                                        std::to_string(length) +
                                        " does not fit 32 bits");
    }
}

bool exact_in_single(double d) {
    return std::isnan(d) || static_cast<double>(static_cast<float>(d)) == d;
}

}  // namespace

Encoder::Encoder(EncodeOptions options) : options_(std::move(options)) {}

std::vector<uint8_t> Encoder::encode(const Value& value) const {
    std::vector<uint8_t> out;
    write_value(value, out, 0);
    return out;
}

void Encoder::encode_to(const Value& value, std::vector<uint8_t>& out) const {
    const auto original_size = out.size();
    try {
        write_value(value, out, 0);
    } catch (const CodecException&) {
        out.resize(original_size);
        throw;
    }
}

void Encoder::write_value(const Value& value, std::vector<uint8_t>& out,
                          std::size_t depth) const {
    switch (value.kind()) {
        case Value::Kind::Nil:
            put_u8(out, tags::NIL);
            return;
        case Value::Kind::Bool:
            put_u8(out, value.as_bool() ? tags::BOOL_TRUE : tags::BOOL_FALSE);
            return;
        case Value::Kind::Int:
            write_integer(value.as_int(), out);
            return;
        case Value::Kind::Float:
            write_float(value.as_float(), out);
            return;
        case Value::Kind::Text:
            write_text(value.as_text(), out);
            return;
        case Value::Kind::Bytes:
            write_bytes(value.as_bytes(), out);
            return;
        case Value::Kind::List:
        case Value::Kind::Map:
            if (options_.max_depth != 0 && depth >= options_.max_depth) {
                throw UnsupportedValueException(
                    "value nests deeper than " +
                    std::to_string(options_.max_depth));
            }
            if (value.is_list()) {
                write_list(value.as_list(), out, depth + 1);
            } else {
                write_map(value.as_map(), out, depth + 1);
            }
            return;
    }
    throw UnsupportedValueException("unhandled value kind");
}

void Encoder::write_integer(int64_t n, std::vector<uint8_t>& out) const {
    if (n >= 0 && n <= tags::POSITIVE_FIXINT_MAX) {
        put_u8(out, static_cast<uint8_t>(n));
    } else if (n >= tags::NEGATIVE_FIXINT_MIN && n < 0) {
        put_u8(out, static_cast<uint8_t>(tags::NEGATIVE_FIXINT | (n & 0x1f)));
    } else if (options_.integer_format == IntegerFormat::Int64 &&
               (n < std::numeric_limits<int32_t>::min() ||
                n > std::numeric_limits<int32_t>::max())) {
        put_u8(out, tags::INT64);
        put_u64(out, static_cast<uint64_t>(n));
    } else {
        // Values beyond the int32 range keep their low 32 bits.
        put_u8(out, tags::INT32);
        put_u32(out, static_cast<uint32_t>(n));
    }
}

void Encoder::write_float(double d, std::vector<uint8_t>& out) const {
    bool single = options_.float_format == FloatFormat::Float32 ||
                  (options_.float_format == FloatFormat::Adaptive &&
                   exact_in_single(d));
    if (single) {
        put_u8(out, tags::FLOAT32);
        put_u32(out, std::bit_cast<uint32_t>(static_cast<float>(d)));
    } else {
        put_u8(out, tags::FLOAT64);
        put_u64(out, std::bit_cast<uint64_t>(d));
    }
}

void Encoder::write_text(const std::string& text,
                         std::vector<uint8_t>& out) const {
    const auto length = text.size();
    check_length(length, "text");
    if (length <= tags::FIXSTR_MAX) {
        put_u8(out, static_cast<uint8_t>(tags::FIXSTR | length));
    } else if (length <= tags::UINT8_LENGTH_MAX) {
        put_u8(out, tags::STR8);
        put_u8(out, static_cast<uint8_t>(length));
    } else if (length <= tags::UINT16_LENGTH_MAX) {
        put_u8(out, tags::STR16);
        put_u16(out, static_cast<uint16_t>(length));
    } else {
        put_u8(out, tags::STR32);
        put_u32(out, static_cast<uint32_t>(length));
    }
    out.insert(out.end(), text.begin(), text.end());
}

void Encoder::write_bytes(const Value::Bytes& bytes,
                          std::vector<uint8_t>& out) const {
    const auto length = bytes.size();
    // The tag table has no 32-bit bytes class.
    if (length > tags::UINT16_LENGTH_MAX) {
        throw UnsupportedValueException("bytes length " +
                                        std::to_string(length) +
                                        " exceeds 65535");
    }
    if (length <= tags::UINT8_LENGTH_MAX) {
        put_u8(out, tags::BIN8);
        put_u8(out, static_cast<uint8_t>(length));
    } else {
        put_u8(out, tags::BIN16);
        put_u16(out, static_cast<uint16_t>(length));
    }
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void Encoder::write_list(const Value::List& list, std::vector<uint8_t>& out,
                         std::size_t depth) const {
    const auto count = list.size();
    check_length(count, "list");
    if (count <= tags::FIXARRAY_MAX) {
        put_u8(out, static_cast<uint8_t>(tags::FIXARRAY | count));
    } else if (count <= tags::UINT16_LENGTH_MAX) {
        put_u8(out, tags::ARRAY16);
        put_u16(out, static_cast<uint16_t>(count));
    } else {
        put_u8(out, tags::ARRAY32);
        put_u32(out, static_cast<uint32_t>(count));
    }

    for (const auto& item : list) {
        write_value(item, out, depth);
    }
}

void Encoder::write_map(const Value::Map& map, std::vector<uint8_t>& out,
                        std::size_t depth) const {
    const auto count = map.size();
    check_length(count, "map");
    if (count <= tags::FIXMAP_MAX) {
        put_u8(out, static_cast<uint8_t>(tags::FIXMAP | count));
    } else if (count <= tags::UINT16_LENGTH_MAX) {
        put_u8(out, tags::MAP16);
        put_u16(out, static_cast<uint16_t>(count));
    } else {
        put_u8(out, tags::MAP32);
        put_u32(out, static_cast<uint32_t>(count));
    }

    for (const auto& [key, item] : map) {
        write_value(key, out, depth);
        write_value(item, out, depth);
    }
}

}  // namespace btoon::codec
