#pragma once

#include <memory>

#include "btoon/backend/accelerated_service.hpp"
#include "btoon/backend/codec_backend.hpp"

namespace btoon::backend {

/**
 * @brief Backend that delegates to an external accelerated service
 *
 * Values cross the service boundary in transfer form, which is the tag
 * format itself written without loss (floats as 0xcb, integers up to 0xd3).
 * The service applies the wire policy selected by the options, so the bytes
 * it returns are identical to what ReferenceBackend produces.
 */
class AcceleratedBackend : public ICodecBackend {
public:
    explicit AcceleratedBackend(std::unique_ptr<AcceleratedService> service);

    std::vector<uint8_t> encode(const codec::Value& value,
                                const codec::EncodeOptions& options) override;
    codec::Value decode(std::span<const uint8_t> data,
                        const codec::DecodeOptions& options) override;

    std::string get_name() const override;
    bool is_accelerated() const override { return true; }

    // Service flags selecting the wire policy for `options`.
    static uint32_t flags_for(const codec::EncodeOptions& options);

    // Options producing the transfer form.
    static codec::EncodeOptions transfer_options(std::size_t max_depth = 0);

private:
    void raise_for_status(const ServiceResult& result,
                          std::span<const uint8_t> input,
                          const char* operation) const;

    std::unique_ptr<AcceleratedService> service_;
};

}  // namespace btoon::backend
