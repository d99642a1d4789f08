#pragma once

#include <cstdint>
#include <vector>

#include "btoon/codec/codec_options.hpp"
#include "btoon/codec/value.hpp"

namespace btoon::codec {

/**
 * @brief Reference encoder
 *
 * Walks a Value depth-first and writes one tag byte per node, choosing the
 * smallest size class that holds each length. Stateless apart from its
 * options, so one instance may be shared by concurrent callers.
 */
class Encoder {
public:
    explicit Encoder(EncodeOptions options = {});

    /**
     * @brief Encode a value into a new buffer
     * @throws UnsupportedValueException when a length does not fit 32 bits or
     *         the value nests deeper than max_depth
     */
    std::vector<uint8_t> encode(const Value& value) const;

    // Appends the encoding of `value` to `out`. On failure `out` is restored
    // to its original size.
    void encode_to(const Value& value, std::vector<uint8_t>& out) const;

    const EncodeOptions& options() const { return options_; }

private:
    void write_value(const Value& value, std::vector<uint8_t>& out,
                     std::size_t depth) const;
    void write_integer(int64_t n, std::vector<uint8_t>& out) const;
    void write_float(double d, std::vector<uint8_t>& out) const;
    void write_text(const std::string& text, std::vector<uint8_t>& out) const;
    void write_bytes(const Value::Bytes& bytes,
                     std::vector<uint8_t>& out) const;
    void write_list(const Value::List& list, std::vector<uint8_t>& out,
                    std::size_t depth) const;
    void write_map(const Value::Map& map, std::vector<uint8_t>& out,
                   std::size_t depth) const;

    EncodeOptions options_;
};

}  // namespace btoon::codec
