#include "btoon/backend/backend_selector.hpp"

#include "btoon/backend/accelerated_backend.hpp"
#include "btoon/backend/shared_library_service.hpp"
#include "btoon/codec/codec_error.hpp"
#include "btoon/log/logger.hpp"

namespace btoon::backend {

BackendSelector& BackendSelector::instance() {
    static BackendSelector selector([](const BackendSettings& settings) {
        return load_shared_library_service(settings.library);
    });
    return selector;
}

BackendSelector::BackendSelector(ServiceFactory factory)
    : factory_(std::move(factory)) {}

bool BackendSelector::configure(const BackendSettings& settings) {
    std::lock_guard<std::mutex> lock(settings_mutex_);
    if (resolved()) {
        BTOON_LOG_WARN << "Codec backend already selected ("
                       << backend_->get_name()
                       << "), ignoring new backend settings";
        return false;
    }
    settings_ = settings;
    return true;
}

ICodecBackend& BackendSelector::backend() {
    std::call_once(once_, [this] { resolve(); });
    return *backend_;
}

void BackendSelector::resolve() {
    std::lock_guard<std::mutex> lock(settings_mutex_);

    if (!settings_.accelerated) {
        BTOON_LOG_INFO << "Accelerated codec disabled by configuration, "
                          "using reference codec";
    } else if (!factory_) {
        BTOON_LOG_INFO << "No accelerated codec service configured, using "
                          "reference codec";
    } else {
        try {
            auto service = factory_(settings_);
            if (!service) {
                throw codec::BackendUnavailableException(
                    "service factory returned nothing");
            }
            backend_ = std::make_unique<AcceleratedBackend>(std::move(service));
            BTOON_LOG_INFO << "Using accelerated codec backend: "
                           << backend_->get_name();
        } catch (const std::exception& e) {
            BTOON_LOG_INFO << "Accelerated codec unavailable, falling back to "
                              "reference codec: "
                           << e.what();
        }
    }

    if (!backend_) {
        backend_ = create_reference_backend();
    }
    resolved_.store(true, std::memory_order_release);
}

}  // namespace btoon::backend
