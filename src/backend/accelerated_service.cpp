#include "btoon/backend/accelerated_service.hpp"

#include <cstring>
#include <new>
#include <stdexcept>

namespace btoon::backend {

ServiceBuffer::ServiceBuffer(AcceleratedService& service, const uint8_t* data,
                             std::size_t size)
    : service_(service), buffer_(nullptr), size_(size) {
    // Zero-length input still gets a distinct allocation.
    buffer_ = service_.allocate(size == 0 ? 1 : size);
    if (buffer_ == nullptr) {
        throw std::bad_alloc();
    }
    if (size > 0) {
        std::memcpy(buffer_, data, size);
    }
}

ServiceBuffer::~ServiceBuffer() { service_.release(buffer_); }

ServiceResult::ServiceResult(AcceleratedService& service, btoon_result* result)
    : service_(service), result_(result) {
    if (result_ == nullptr) {
        throw std::runtime_error(service_.name() + " returned no result");
    }
}

ServiceResult::~ServiceResult() { service_.release_result(result_); }

int ServiceResult::status() const { return service_.result_status(result_); }

std::size_t ServiceResult::error_offset() const {
    return service_.result_error_offset(result_);
}

std::vector<uint8_t> ServiceResult::copy_bytes() const {
    const std::size_t size = service_.result_size(result_);
    const uint8_t* data = service_.result_data(result_);
    if (size == 0) {
        return {};
    }
    return std::vector<uint8_t>(data, data + size);
}

}  // namespace btoon::backend
