#include "btoon/backend/codec_backend.hpp"

#include "btoon/codec/decoder.hpp"
#include "btoon/codec/encoder.hpp"

namespace btoon::backend {

std::vector<uint8_t> ReferenceBackend::encode(
    const codec::Value& value, const codec::EncodeOptions& options) {
    return codec::Encoder(options).encode(value);
}

codec::Value ReferenceBackend::decode(std::span<const uint8_t> data,
                                      const codec::DecodeOptions& options) {
    return codec::Decoder(options).decode(data);
}

std::unique_ptr<ReferenceBackend> create_reference_backend() {
    return std::make_unique<ReferenceBackend>();
}

}  // namespace btoon::backend
