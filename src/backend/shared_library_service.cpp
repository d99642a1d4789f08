#include "btoon/backend/shared_library_service.hpp"

#include <boost/dll/shared_library_load_mode.hpp>

#include "btoon/codec/codec_error.hpp"
#include "btoon/log/logger.hpp"

namespace btoon::backend {

namespace {

bool is_bare_name(const std::string& library) {
    return library.find('/') == std::string::npos &&
           library.find('\\') == std::string::npos &&
           library.find('.') == std::string::npos;
}

}  // namespace

template <typename Signature>
Signature* SharedLibraryService::resolve(const char* symbol) {
    if (!library_.has(symbol)) {
        throw codec::BackendUnavailableException(
            name_ + " does not export " + symbol);
    }
    return &library_.get<Signature>(symbol);
}

SharedLibraryService::SharedLibraryService(const std::string& library)
    : name_(library) {
    try {
        if (is_bare_name(library)) {
            library_.load(library,
                          boost::dll::load_mode::append_decorations |
                              boost::dll::load_mode::search_system_folders);
        } else {
            library_.load(boost::dll::fs::path(library));
        }
    } catch (const std::exception& e) {
        throw codec::BackendUnavailableException("cannot load " + library +
                                                 ": " + e.what());
    }

    auto abi_version = resolve<decltype(btoon_abi_version)>("btoon_abi_version");
    if (abi_version() != BTOON_ABI_VERSION) {
        throw codec::BackendUnavailableException(
            library + " implements ABI version " +
            std::to_string(abi_version()) + ", expected " +
            std::to_string(BTOON_ABI_VERSION));
    }

    malloc_ = resolve<decltype(btoon_malloc)>("btoon_malloc");
    free_ = resolve<decltype(btoon_free)>("btoon_free");
    encode_ = resolve<decltype(btoon_encode)>("btoon_encode");
    decode_ = resolve<decltype(btoon_decode)>("btoon_decode");
    result_status_ =
        resolve<decltype(btoon_result_status)>("btoon_result_status");
    result_size_ = resolve<decltype(btoon_result_size)>("btoon_result_size");
    result_data_ = resolve<decltype(btoon_result_data)>("btoon_result_data");
    result_error_offset_ = resolve<decltype(btoon_result_error_offset)>(
        "btoon_result_error_offset");
    result_free_ = resolve<decltype(btoon_result_free)>("btoon_result_free");

    BTOON_LOG_DEBUG << "Loaded accelerated service library: "
                    << library_.location().string();
}

uint8_t* SharedLibraryService::allocate(std::size_t size) {
    return malloc_(size);
}

void SharedLibraryService::release(uint8_t* buffer) { free_(buffer); }

btoon_result* SharedLibraryService::encode(const uint8_t* buffer,
                                           std::size_t size, uint32_t flags) {
    return encode_(buffer, size, flags);
}

btoon_result* SharedLibraryService::decode(const uint8_t* buffer,
                                           std::size_t size, uint32_t flags) {
    return decode_(buffer, size, flags);
}

int SharedLibraryService::result_status(const btoon_result* result) {
    return result_status_(result);
}

std::size_t SharedLibraryService::result_size(const btoon_result* result) {
    return result_size_(result);
}

const uint8_t* SharedLibraryService::result_data(const btoon_result* result) {
    return result_data_(result);
}

std::size_t SharedLibraryService::result_error_offset(
    const btoon_result* result) {
    return result_error_offset_(result);
}

void SharedLibraryService::release_result(btoon_result* result) {
    result_free_(result);
}

std::unique_ptr<AcceleratedService> load_shared_library_service(
    const std::string& library) {
    return std::make_unique<SharedLibraryService>(library);
}

}  // namespace btoon::backend
