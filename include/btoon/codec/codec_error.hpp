#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace btoon::codec {

enum class CodecError {
    UnknownTag,
    TruncatedInput,
    UnsupportedValue,
    DepthExceeded,
    BackendUnavailable
};

const char* error_name(CodecError error);

// Base of every codec failure. Codec failures abort the whole call: no
// partial value or partial buffer is ever returned.
class CodecException : public std::runtime_error {
public:
    CodecException(CodecError code, const std::string& message,
                   std::size_t offset = 0)
        : std::runtime_error(std::string("Codec error (") + error_name(code) +
                             "): " + message),
          code_(code),
          offset_(offset) {}

    CodecError code() const { return code_; }

    // Byte offset where decoding stopped; 0 for encode-side errors.
    std::size_t offset() const { return offset_; }

private:
    CodecError code_;
    std::size_t offset_;
};

class UnknownTagException : public CodecException {
public:
    UnknownTagException(uint8_t tag, std::size_t offset);

    uint8_t tag() const { return tag_; }

private:
    uint8_t tag_;
};

class TruncatedInputException : public CodecException {
public:
    TruncatedInputException(std::size_t offset, std::size_t needed,
                            std::size_t available);
};

class UnsupportedValueException : public CodecException {
public:
    explicit UnsupportedValueException(const std::string& message)
        : CodecException(CodecError::UnsupportedValue, message) {}
};

class DepthExceededException : public CodecException {
public:
    DepthExceededException(std::size_t max_depth, std::size_t offset)
        : CodecException(CodecError::DepthExceeded,
                         "nesting deeper than " + std::to_string(max_depth),
                         offset) {}
};

// Raised while acquiring the accelerated service; never escapes the backend
// selector.
class BackendUnavailableException : public CodecException {
public:
    explicit BackendUnavailableException(const std::string& message)
        : CodecException(CodecError::BackendUnavailable, message) {}
};

}  // namespace btoon::codec
