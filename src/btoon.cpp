#include "btoon/btoon.hpp"

#include <mutex>

#include "btoon/backend/backend_selector.hpp"

namespace btoon {

namespace {

struct DefaultOptions {
    std::mutex mutex;
    EncodeOptions encode;
    DecodeOptions decode;
};

DefaultOptions& default_options() {
    static DefaultOptions options;
    return options;
}

}  // namespace

bool initialize(const CodecConfig& config) {
    {
        auto& defaults = default_options();
        std::lock_guard<std::mutex> lock(defaults.mutex);
        defaults.encode = config.encode_options();
        defaults.decode = config.decode_options();
    }
    return backend::BackendSelector::instance().configure(
        config.backend_settings());
}

std::vector<uint8_t> encode(const Value& value) {
    return encode(value, default_encode_options());
}

std::vector<uint8_t> encode(const Value& value, const EncodeOptions& options) {
    return backend::BackendSelector::instance().backend().encode(value,
                                                                 options);
}

Value decode(std::span<const uint8_t> data) {
    return decode(data, default_decode_options());
}

Value decode(std::span<const uint8_t> data, const DecodeOptions& options) {
    return backend::BackendSelector::instance().backend().decode(data,
                                                                 options);
}

EncodeOptions default_encode_options() {
    auto& defaults = default_options();
    std::lock_guard<std::mutex> lock(defaults.mutex);
    return defaults.encode;
}

DecodeOptions default_decode_options() {
    auto& defaults = default_options();
    std::lock_guard<std::mutex> lock(defaults.mutex);
    return defaults.decode;
}

bool has_accelerated() {
    return backend::BackendSelector::instance().accelerated();
}

std::string backend_name() {
    return backend::BackendSelector::instance().backend().get_name();
}

}  // namespace btoon
