#include "btoon/backend/accelerated_backend.hpp"

#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/decoder.hpp"
#include "btoon/codec/encoder.hpp"
#include "btoon/codec/scanner.hpp"
#include "btoon/log/logger.hpp"

namespace btoon::backend {

AcceleratedBackend::AcceleratedBackend(
    std::unique_ptr<AcceleratedService> service)
    : service_(std::move(service)) {
    if (!service_) {
        throw std::invalid_argument("AcceleratedBackend requires a service");
    }
}

std::string AcceleratedBackend::get_name() const {
    return "accelerated:" + service_->name();
}

uint32_t AcceleratedBackend::flags_for(const codec::EncodeOptions& options) {
    uint32_t flags = 0;
    switch (options.float_format) {
        case codec::FloatFormat::Float32:
            break;
        case codec::FloatFormat::Float64:
            flags |= BTOON_FLAG_FLOAT64;
            break;
        case codec::FloatFormat::Adaptive:
            flags |= BTOON_FLAG_FLOAT_ADAPTIVE;
            break;
    }
    if (options.integer_format == codec::IntegerFormat::Int64) {
        flags |= BTOON_FLAG_INT64;
    }
    return flags;
}

codec::EncodeOptions AcceleratedBackend::transfer_options(
    std::size_t max_depth) {
    codec::EncodeOptions options;
    options.float_format = codec::FloatFormat::Float64;
    options.integer_format = codec::IntegerFormat::Int64;
    options.max_depth = max_depth;
    return options;
}

std::vector<uint8_t> AcceleratedBackend::encode(
    const codec::Value& value, const codec::EncodeOptions& options) {
    // Depth and length limits are enforced here, before the service sees
    // anything.
    const auto transfer =
        codec::Encoder(transfer_options(options.max_depth)).encode(value);

    ServiceBuffer input(*service_, transfer.data(), transfer.size());
    ServiceResult result(
        *service_,
        service_->encode(input.data(), input.size(), flags_for(options)));
    raise_for_status(result, transfer, "encode");
    return result.copy_bytes();
}

codec::Value AcceleratedBackend::decode(std::span<const uint8_t> data,
                                        const codec::DecodeOptions& options) {
    // The depth limit is checked here, on the wire bytes, so it fails at the
    // same offset as the reference decoder and the service never sees input
    // nested past the limit.
    codec::measure(data, 0, options.max_depth);

    std::vector<uint8_t> transfer;
    {
        ServiceBuffer input(*service_, data.data(), data.size());
        ServiceResult result(*service_,
                             service_->decode(input.data(), input.size(), 0));
        raise_for_status(result, data, "decode");
        transfer = result.copy_bytes();
    }
    return codec::Decoder(options).decode(transfer);
}

void AcceleratedBackend::raise_for_status(const ServiceResult& result,
                                          std::span<const uint8_t> input,
                                          const char* operation) const {
    const int status = result.status();
    if (status == BTOON_STATUS_OK) {
        return;
    }

    const std::size_t offset = result.error_offset();
    BTOON_LOG_DEBUG << service_->name() << " " << operation
                    << " failed with status " << status << " at offset "
                    << offset;

    switch (status) {
        case BTOON_STATUS_UNKNOWN_TAG:
            throw codec::UnknownTagException(
                offset < input.size() ? input[offset] : 0, offset);
        case BTOON_STATUS_TRUNCATED_INPUT: {
            const std::size_t available =
                offset < input.size() ? input.size() - offset : 0;
            throw codec::TruncatedInputException(offset, available + 1,
                                                 available);
        }
        case BTOON_STATUS_UNSUPPORTED_VALUE:
            throw codec::UnsupportedValueException(
                service_->name() + " rejected the value");
        default:
            throw std::runtime_error(service_->name() + " " + operation +
                                     " failed with status " +
                                     std::to_string(status));
    }
}

}  // namespace btoon::backend
