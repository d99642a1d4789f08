#pragma once

#include <cstdint>
#include <span>

#include "btoon/codec/codec_options.hpp"
#include "btoon/codec/value.hpp"

namespace btoon::codec {

/**
 * @brief Reference decoder
 *
 * Reads one value from the start of a buffer. Every read is checked against
 * the buffer length; running off the end raises TruncatedInputException and
 * a tag outside the table raises UnknownTagException. Nothing is returned on
 * failure.
 */
class Decoder {
public:
    explicit Decoder(DecodeOptions options = {});

    // Decodes the value at offset 0. Bytes after it are ignored.
    Value decode(std::span<const uint8_t> data) const;

    // As decode(), also reporting how many bytes the value occupied.
    Value decode_prefix(std::span<const uint8_t> data,
                        std::size_t& consumed) const;

    const DecodeOptions& options() const { return options_; }

private:
    class Cursor;

    Value read_value(Cursor& cursor, std::size_t depth) const;
    Value read_list(Cursor& cursor, uint32_t count, std::size_t depth) const;
    Value read_map(Cursor& cursor, uint32_t count, std::size_t depth) const;
    void enter_container(const Cursor& cursor, std::size_t depth) const;

    DecodeOptions options_;
};

}  // namespace btoon::codec
