#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "btoon/codec/codec_options.hpp"
#include "btoon/codec/value.hpp"

namespace btoon::backend {

// Implementation of encode/decode. Every backend produces and accepts the
// same bytes for the same value and options.
class ICodecBackend {
public:
    virtual ~ICodecBackend() = default;

    virtual std::vector<uint8_t> encode(
        const codec::Value& value, const codec::EncodeOptions& options) = 0;
    virtual codec::Value decode(std::span<const uint8_t> data,
                                const codec::DecodeOptions& options) = 0;

    virtual std::string get_name() const = 0;
    virtual bool is_accelerated() const = 0;
};

// Always-available in-process implementation.
class ReferenceBackend : public ICodecBackend {
public:
    std::vector<uint8_t> encode(const codec::Value& value,
                                const codec::EncodeOptions& options) override;
    codec::Value decode(std::span<const uint8_t> data,
                        const codec::DecodeOptions& options) override;

    std::string get_name() const override { return "reference"; }
    bool is_accelerated() const override { return false; }
};

std::unique_ptr<ReferenceBackend> create_reference_backend();

}  // namespace btoon::backend
