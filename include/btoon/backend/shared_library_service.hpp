#pragma once

#include <boost/dll/shared_library.hpp>
#include <memory>
#include <string>

#include "btoon/backend/accelerated_service.hpp"

namespace btoon::backend {

/**
 * @brief Accelerated service exported by a shared library
 *
 * The library must export every function declared in service_abi.h and
 * report BTOON_ABI_VERSION.
 */
class SharedLibraryService : public AcceleratedService {
public:
    /**
     * @brief Load the service library
     * @param library Path to the library, or a bare name such as
     *        "btoon_msgpack_backend" which is decorated to the platform file
     *        name and looked up in the system search path
     * @throws codec::BackendUnavailableException if the library cannot be
     *         loaded, lacks a symbol or reports another ABI version
     */
    explicit SharedLibraryService(const std::string& library);

    std::string name() const override { return name_; }

    uint8_t* allocate(std::size_t size) override;
    void release(uint8_t* buffer) override;

    btoon_result* encode(const uint8_t* buffer, std::size_t size,
                         uint32_t flags) override;
    btoon_result* decode(const uint8_t* buffer, std::size_t size,
                         uint32_t flags) override;

    int result_status(const btoon_result* result) override;
    std::size_t result_size(const btoon_result* result) override;
    const uint8_t* result_data(const btoon_result* result) override;
    std::size_t result_error_offset(const btoon_result* result) override;
    void release_result(btoon_result* result) override;

private:
    template <typename Signature>
    Signature* resolve(const char* symbol);

    boost::dll::shared_library library_;
    std::string name_;

    decltype(&btoon_malloc) malloc_ = nullptr;
    decltype(&btoon_free) free_ = nullptr;
    decltype(&btoon_encode) encode_ = nullptr;
    decltype(&btoon_decode) decode_ = nullptr;
    decltype(&btoon_result_status) result_status_ = nullptr;
    decltype(&btoon_result_size) result_size_ = nullptr;
    decltype(&btoon_result_data) result_data_ = nullptr;
    decltype(&btoon_result_error_offset) result_error_offset_ = nullptr;
    decltype(&btoon_result_free) result_free_ = nullptr;
};

std::unique_ptr<AcceleratedService> load_shared_library_service(
    const std::string& library);

}  // namespace btoon::backend
