#include "btoon/codec/codec_error.hpp"

#include <cstdio>

namespace btoon::codec {

namespace {

std::string hex_byte(uint8_t byte) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%02x", byte);
    return buffer;
}

}  // namespace

const char* error_name(CodecError error) {
    switch (error) {
        case CodecError::UnknownTag:
            return "UnknownTag";
        case CodecError::TruncatedInput:
            return "TruncatedInput";
        case CodecError::UnsupportedValue:
            return "UnsupportedValue";
        case CodecError::DepthExceeded:
            return "DepthExceeded";
        case CodecError::BackendUnavailable:
            return "BackendUnavailable";
    }
    return "Unknown";
}

UnknownTagException::UnknownTagException(uint8_t tag, std::size_t offset)
    : CodecException(CodecError::UnknownTag,
                     "unknown type byte " + hex_byte(tag) + " at offset " +
                         std::to_string(offset),
                     offset),
      tag_(tag) {}

TruncatedInputException::TruncatedInputException(std::size_t offset,
                                                 std::size_t needed,
                                                 std::size_t available)
    : CodecException(CodecError::TruncatedInput,
                     "need " + std::to_string(needed) + " bytes at offset " +
                         std::to_string(offset) + ", " +
                         std::to_string(available) + " available",
                     offset) {}

}  // namespace btoon::codec
