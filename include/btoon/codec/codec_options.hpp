#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace btoon::codec {

// How Float values are written.
enum class FloatFormat {
    Float32,   // always 0xca, lossy for doubles (default wire format)
    Float64,   // always 0xcb
    Adaptive   // 0xca when exact in single precision, else 0xcb
};

// How Int values outside the inline fixint ranges are written.
enum class IntegerFormat {
    Int32,  // always 0xd2, truncating to 32 bits (default wire format)
    Int64   // 0xd2 when the value fits 32 bits, else 0xd3
};

struct EncodeOptions {
    // Accepted for compatibility; the codec writes uncompressed output.
    bool compress = false;
    std::string algorithm = "zlib";
    int level = 6;
    bool auto_tabular = true;

    FloatFormat float_format = FloatFormat::Float32;
    IntegerFormat integer_format = IntegerFormat::Int32;

    // Maximum container nesting, 0 for no limit.
    std::size_t max_depth = 0;
};

struct DecodeOptions {
    // Accepted for compatibility; input is read as-is.
    bool decompress = false;

    // Maximum container nesting, 0 for no limit.
    std::size_t max_depth = 0;
};

FloatFormat float_format_from_string(const std::string& name);
std::string to_string(FloatFormat format);
IntegerFormat integer_format_from_string(const std::string& name);
std::string to_string(IntegerFormat format);

}  // namespace btoon::codec
