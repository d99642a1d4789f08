#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "btoon/backend/service_abi.h"

namespace btoon::backend {

/**
 * @brief External accelerated codec service
 *
 * Mirrors the C interface in service_abi.h. The service owns every buffer
 * and result it hands out; callers must give each one back exactly once.
 */
class AcceleratedService {
public:
    virtual ~AcceleratedService() = default;

    virtual std::string name() const = 0;

    virtual uint8_t* allocate(std::size_t size) = 0;
    virtual void release(uint8_t* buffer) = 0;

    virtual btoon_result* encode(const uint8_t* buffer, std::size_t size,
                                 uint32_t flags) = 0;
    virtual btoon_result* decode(const uint8_t* buffer, std::size_t size,
                                 uint32_t flags) = 0;

    virtual int result_status(const btoon_result* result) = 0;
    virtual std::size_t result_size(const btoon_result* result) = 0;
    virtual const uint8_t* result_data(const btoon_result* result) = 0;
    virtual std::size_t result_error_offset(const btoon_result* result) = 0;
    virtual void release_result(btoon_result* result) = 0;
};

// Input buffer allocated inside the service, released on scope exit.
class ServiceBuffer {
public:
    ServiceBuffer(AcceleratedService& service, const uint8_t* data,
                  std::size_t size);
    ~ServiceBuffer();

    ServiceBuffer(const ServiceBuffer&) = delete;
    ServiceBuffer& operator=(const ServiceBuffer&) = delete;

    const uint8_t* data() const { return buffer_; }
    std::size_t size() const { return size_; }

private:
    AcceleratedService& service_;
    uint8_t* buffer_;
    std::size_t size_;
};

// Result handle returned by the service, released on scope exit.
class ServiceResult {
public:
    ServiceResult(AcceleratedService& service, btoon_result* result);
    ~ServiceResult();

    ServiceResult(const ServiceResult&) = delete;
    ServiceResult& operator=(const ServiceResult&) = delete;

    int status() const;
    std::size_t error_offset() const;

    // Copies exactly result_size() bytes out of the service.
    std::vector<uint8_t> copy_bytes() const;

private:
    AcceleratedService& service_;
    btoon_result* result_;
};

}  // namespace btoon::backend
