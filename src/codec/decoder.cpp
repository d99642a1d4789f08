#include "btoon/codec/decoder.hpp"

#include <bit>
#include <string>

#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/tags.hpp"

namespace btoon::codec {

// Read position over the input. Advances monotonically and never reads past
// the end of the span.
class Decoder::Cursor {
public:
    explicit Cursor(std::span<const uint8_t> data) : data_(data) {}

    std::size_t offset() const { return offset_; }
    std::size_t remaining() const { return data_.size() - offset_; }

    void require(std::size_t n) const {
        if (n > remaining()) {
            throw TruncatedInputException(offset_, n, remaining());
        }
    }

    uint8_t u8() {
        require(1);
        return data_[offset_++];
    }

    uint16_t u16() {
        require(2);
        uint16_t v = static_cast<uint16_t>((data_[offset_] << 8) |
                                           data_[offset_ + 1]);
        offset_ += 2;
        return v;
    }

    uint32_t u32() {
        require(4);
        uint32_t v = (static_cast<uint32_t>(data_[offset_]) << 24) |
                     (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[offset_ + 3]);
        offset_ += 4;
        return v;
    }

    uint64_t u64() {
        require(8);
        uint64_t high = u32();
        uint64_t low = u32();
        return (high << 32) | low;
    }

    std::span<const uint8_t> take(std::size_t n) {
        require(n);
        auto bytes = data_.subspan(offset_, n);
        offset_ += n;
        return bytes;
    }

private:
    std::span<const uint8_t> data_;
    std::size_t offset_ = 0;
};

namespace {

Value make_text(std::span<const uint8_t> bytes) {
    return Value(std::string(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size()));
}

Value make_bytes(std::span<const uint8_t> bytes) {
    return Value(Value::Bytes(bytes.begin(), bytes.end()));
}

}  // namespace

Decoder::Decoder(DecodeOptions options) : options_(options) {}

Value Decoder::decode(std::span<const uint8_t> data) const {
    std::size_t consumed = 0;
    return decode_prefix(data, consumed);
}

Value Decoder::decode_prefix(std::span<const uint8_t> data,
                             std::size_t& consumed) const {
    Cursor cursor(data);
    Value value = read_value(cursor, 0);
    consumed = cursor.offset();
    return value;
}

Value Decoder::read_value(Cursor& cursor, std::size_t depth) const {
    const std::size_t tag_offset = cursor.offset();
    const uint8_t tag = cursor.u8();

    if (tags::is_positive_fixint(tag)) {
        return Value(static_cast<int64_t>(tag));
    }
    if (tags::is_negative_fixint(tag)) {
        return Value(static_cast<int64_t>(tag) - 256);
    }
    if (tags::is_fixstr(tag)) {
        return make_text(cursor.take(tag & 0x1f));
    }
    if (tags::is_fixarray(tag)) {
        return read_list(cursor, tag & 0x0f, depth);
    }
    if (tags::is_fixmap(tag)) {
        return read_map(cursor, tag & 0x0f, depth);
    }

    switch (tag) {
        case tags::NIL:
            return Value();
        case tags::BOOL_FALSE:
            return Value(false);
        case tags::BOOL_TRUE:
            return Value(true);
        case tags::BIN8:
            return make_bytes(cursor.take(cursor.u8()));
        case tags::BIN16:
            return make_bytes(cursor.take(cursor.u16()));
        case tags::FLOAT32:
            return Value(static_cast<double>(std::bit_cast<float>(cursor.u32())));
        case tags::FLOAT64:
            return Value(std::bit_cast<double>(cursor.u64()));
        case tags::INT32:
            return Value(static_cast<int64_t>(
                static_cast<int32_t>(cursor.u32())));
        case tags::INT64:
            return Value(static_cast<int64_t>(cursor.u64()));
        case tags::STR8:
            return make_text(cursor.take(cursor.u8()));
        case tags::STR16:
            return make_text(cursor.take(cursor.u16()));
        case tags::STR32:
            return make_text(cursor.take(cursor.u32()));
        case tags::ARRAY16:
            return read_list(cursor, cursor.u16(), depth);
        case tags::ARRAY32:
            return read_list(cursor, cursor.u32(), depth);
        case tags::MAP16:
            return read_map(cursor, cursor.u16(), depth);
        case tags::MAP32:
            return read_map(cursor, cursor.u32(), depth);
        default:
            throw UnknownTagException(tag, tag_offset);
    }
}

void Decoder::enter_container(const Cursor& cursor, std::size_t depth) const {
    if (options_.max_depth != 0 && depth >= options_.max_depth) {
        throw DepthExceededException(options_.max_depth, cursor.offset());
    }
}

Value Decoder::read_list(Cursor& cursor, uint32_t count,
                         std::size_t depth) const {
    enter_container(cursor, depth);
    // Every element takes at least one byte.
    cursor.require(count);

    Value::List list;
    list.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        list.push_back(read_value(cursor, depth + 1));
    }
    return Value(std::move(list));
}

Value Decoder::read_map(Cursor& cursor, uint32_t count,
                        std::size_t depth) const {
    enter_container(cursor, depth);
    // Every pair takes at least two bytes.
    cursor.require(static_cast<std::size_t>(count) * 2);

    Value::Map map;
    map.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Value key = read_value(cursor, depth + 1);
        Value item = read_value(cursor, depth + 1);
        map.emplace_back(std::move(key), std::move(item));
    }
    return Value(std::move(map));
}

}  // namespace btoon::codec
