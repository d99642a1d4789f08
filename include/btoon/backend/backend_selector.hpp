#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "btoon/backend/accelerated_service.hpp"
#include "btoon/backend/codec_backend.hpp"

namespace btoon::backend {

struct BackendSettings {
    bool accelerated = true;
    std::string library = "btoon_msgpack_backend";
};

using ServiceFactory = std::function<std::unique_ptr<AcceleratedService>(
    const BackendSettings& settings)>;

/**
 * @brief Chooses the backend used by encode/decode
 *
 * The first call to backend() tries to acquire the accelerated service once.
 * If that fails the reference backend is used for the lifetime of the
 * selector. The choice never changes after it is made, and reading it needs
 * no locking.
 */
class BackendSelector {
public:
    // Process-wide selector that loads the service from a shared library.
    static BackendSelector& instance();

    explicit BackendSelector(ServiceFactory factory);

    BackendSelector(const BackendSelector&) = delete;
    BackendSelector& operator=(const BackendSelector&) = delete;

    /**
     * @brief Set acquisition settings
     * @return false if the backend was already chosen; the settings are
     *         then ignored
     */
    bool configure(const BackendSettings& settings);

    ICodecBackend& backend();

    bool accelerated() { return backend().is_accelerated(); }
    bool resolved() const { return resolved_.load(std::memory_order_acquire); }

private:
    void resolve();

    ServiceFactory factory_;
    std::mutex settings_mutex_;
    BackendSettings settings_;

    std::once_flag once_;
    std::unique_ptr<ICodecBackend> backend_;
    std::atomic<bool> resolved_{false};
};

}  // namespace btoon::backend
