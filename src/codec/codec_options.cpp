#include "btoon/codec/codec_options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace btoon::codec {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return text;
}

}  // namespace

FloatFormat float_format_from_string(const std::string& name) {
    auto value = lower(name);
    if (value == "float32" || value == "single") return FloatFormat::Float32;
    if (value == "float64" || value == "double") return FloatFormat::Float64;
    if (value == "adaptive") return FloatFormat::Adaptive;
    throw std::invalid_argument("Invalid float format: " + name);
}

std::string to_string(FloatFormat format) {
    switch (format) {
        case FloatFormat::Float32:
            return "float32";
        case FloatFormat::Float64:
            return "float64";
        case FloatFormat::Adaptive:
            return "adaptive";
    }
    return "unknown";
}

IntegerFormat integer_format_from_string(const std::string& name) {
    auto value = lower(name);
    if (value == "int32") return IntegerFormat::Int32;
    if (value == "int64") return IntegerFormat::Int64;
    throw std::invalid_argument("Invalid integer format: " + name);
}

std::string to_string(IntegerFormat format) {
    switch (format) {
        case IntegerFormat::Int32:
            return "int32";
        case IntegerFormat::Int64:
            return "int64";
    }
    return "unknown";
}

}  // namespace btoon::codec
