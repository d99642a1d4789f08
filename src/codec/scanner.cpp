#include "btoon/codec/scanner.hpp"

#include <vector>

#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/tags.hpp"

namespace btoon::codec {

namespace {

class Walker {
public:
    Walker(std::span<const uint8_t> data, std::size_t offset,
           std::size_t max_depth)
        : data_(data), pos_(offset), max_depth_(max_depth) {}

    std::size_t position() const { return pos_; }

    void require(std::size_t n) const {
        const std::size_t available = pos_ <= data_.size()
                                          ? data_.size() - pos_
                                          : 0;
        if (n > available) {
            throw TruncatedInputException(pos_, n, available);
        }
    }

    uint32_t length(std::size_t width) {
        require(width);
        uint32_t v = 0;
        for (std::size_t i = 0; i < width; ++i) {
            v = (v << 8) | data_[pos_ + i];
        }
        pos_ += width;
        return v;
    }

    // Every child value takes at least one byte.
    uint64_t children(uint64_t n) {
        require(n);
        return n;
    }

    // Same check and offset as Decoder::enter_container: after the header,
    // before the children are bounds-checked.
    uint64_t container(uint64_t n, std::size_t depth) {
        if (max_depth_ != 0 && depth >= max_depth_) {
            throw DepthExceededException(max_depth_, pos_);
        }
        opened_ = true;
        return children(n);
    }

    void skip(std::size_t n) {
        require(n);
        pos_ += n;
    }

    // Consumes one tag and its scalar payload; returns the number of child
    // values that follow it. `opened()` tells whether the tag was a list or
    // map, empty ones included.
    uint64_t step(std::size_t depth) {
        opened_ = false;
        const std::size_t tag_offset = pos_;
        require(1);
        const uint8_t tag = data_[pos_++];

        if (tags::is_positive_fixint(tag) || tags::is_negative_fixint(tag)) {
            return 0;
        }
        if (tags::is_fixstr(tag)) {
            skip(tag & 0x1f);
            return 0;
        }
        if (tags::is_fixarray(tag)) {
            return container(tag & 0x0f, depth);
        }
        if (tags::is_fixmap(tag)) {
            return container(2ull * (tag & 0x0f), depth);
        }

        switch (tag) {
            case tags::NIL:
            case tags::BOOL_FALSE:
            case tags::BOOL_TRUE:
                return 0;
            case tags::BIN8:
            case tags::STR8:
                skip(length(1));
                return 0;
            case tags::BIN16:
            case tags::STR16:
                skip(length(2));
                return 0;
            case tags::STR32:
                skip(length(4));
                return 0;
            case tags::FLOAT32:
            case tags::INT32:
                skip(4);
                return 0;
            case tags::FLOAT64:
            case tags::INT64:
                skip(8);
                return 0;
            case tags::ARRAY16:
                return container(length(2), depth);
            case tags::ARRAY32:
                return container(length(4), depth);
            case tags::MAP16:
                return container(2ull * length(2), depth);
            case tags::MAP32:
                return container(2ull * length(4), depth);
            default:
                throw UnknownTagException(tag, tag_offset);
        }
    }

    bool opened() const { return opened_; }

private:
    std::span<const uint8_t> data_;
    std::size_t pos_;
    std::size_t max_depth_;
    bool opened_ = false;
};

}  // namespace

std::size_t measure(std::span<const uint8_t> data, std::size_t offset,
                    std::size_t max_depth) {
    Walker walker(data, offset, max_depth);
    // Children still expected by each open container; the bottom entry is the
    // top-level value. The depth of the next value is size() - 1.
    std::vector<uint64_t> pending{1};
    while (!pending.empty()) {
        if (pending.back() == 0) {
            pending.pop_back();
            continue;
        }
        --pending.back();
        const uint64_t children = walker.step(pending.size() - 1);
        if (walker.opened()) {
            pending.push_back(children);
        }
    }
    return walker.position() - offset;
}

bool is_well_formed(std::span<const uint8_t> data) {
    try {
        measure(data);
        return true;
    } catch (const CodecException&) {
        return false;
    }
}

}  // namespace btoon::codec
