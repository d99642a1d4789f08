#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <msgpack.hpp>
#include <new>
#include <span>
#include <vector>

#include "btoon/backend/service_abi.h"
#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/scanner.hpp"
#include "btoon/codec/tags.hpp"

/**
 * @brief Accelerated codec service built on msgpack-c
 *
 * The tag format is a subset of MessagePack, so msgpack-c can parse it and
 * its packer can write it once the size classes are pinned down. Tags are
 * validated with the codec scanner first because msgpack-c accepts more
 * than the format allows.
 */

struct btoon_result {
    int status = BTOON_STATUS_OK;
    size_t error_offset = 0;
    msgpack::sbuffer buffer;
};

namespace {

namespace codec = btoon::codec;

class Repacker {
public:
    Repacker(msgpack::sbuffer& buffer, uint32_t flags)
        : packer_(buffer), flags_(flags) {}

    // Walks with an explicit stack so nesting depth never touches the call
    // stack.
    void pack(const msgpack::object& root) {
        // Objects still to write; the next one is on top.
        std::vector<const msgpack::object*> pending{&root};
        while (!pending.empty()) {
            const msgpack::object& object = *pending.back();
            pending.pop_back();
            switch (object.type) {
                case msgpack::type::NIL:
                    packer_.pack_nil();
                    break;
                case msgpack::type::BOOLEAN:
                    if (object.via.boolean) {
                        packer_.pack_true();
                    } else {
                        packer_.pack_false();
                    }
                    break;
                case msgpack::type::POSITIVE_INTEGER:
                    pack_integer(static_cast<int64_t>(object.via.u64));
                    break;
                case msgpack::type::NEGATIVE_INTEGER:
                    pack_integer(object.via.i64);
                    break;
                case msgpack::type::FLOAT32:
                case msgpack::type::FLOAT64:
                    pack_float(object.via.f64);
                    break;
                case msgpack::type::STR:
                    packer_.pack_str(object.via.str.size);
                    packer_.pack_str_body(object.via.str.ptr,
                                          object.via.str.size);
                    break;
                case msgpack::type::BIN:
                    packer_.pack_bin(object.via.bin.size);
                    packer_.pack_bin_body(object.via.bin.ptr,
                                          object.via.bin.size);
                    break;
                case msgpack::type::ARRAY:
                    packer_.pack_array(object.via.array.size);
                    for (uint32_t i = object.via.array.size; i > 0; --i) {
                        pending.push_back(&object.via.array.ptr[i - 1]);
                    }
                    break;
                case msgpack::type::MAP:
                    packer_.pack_map(object.via.map.size);
                    for (uint32_t i = object.via.map.size; i > 0; --i) {
                        pending.push_back(&object.via.map.ptr[i - 1].val);
                        pending.push_back(&object.via.map.ptr[i - 1].key);
                    }
                    break;
                default:
                    throw codec::UnsupportedValueException(
                        "msgpack extension values have no tag in this format");
            }
        }
    }

private:
    void pack_integer(int64_t n) {
        if (codec::tags::fits_fixint(n)) {
            // pack_int8 emits a fixint for -32..127
            packer_.pack_int8(static_cast<int8_t>(n));
        } else if ((flags_ & BTOON_FLAG_INT64) &&
                   (n < INT32_MIN || n > INT32_MAX)) {
            packer_.pack_fix_int64(n);
        } else {
            packer_.pack_fix_int32(static_cast<int32_t>(n));
        }
    }

    void pack_float(double d) {
        if (flags_ & BTOON_FLAG_FLOAT64) {
            packer_.pack_double(d);
        } else if (flags_ & BTOON_FLAG_FLOAT_ADAPTIVE) {
            const float narrow = static_cast<float>(d);
            if (std::isnan(d) || static_cast<double>(narrow) == d) {
                packer_.pack_float(narrow);
            } else {
                packer_.pack_double(d);
            }
        } else {
            packer_.pack_float(static_cast<float>(d));
        }
    }

    msgpack::packer<msgpack::sbuffer> packer_;
    uint32_t flags_;
};

btoon_result* transcode(const uint8_t* buffer, size_t size, uint32_t flags) {
    auto result = std::make_unique<btoon_result>();
    try {
        const std::span<const uint8_t> input(buffer, size);
        const size_t length = codec::measure(input);
        msgpack::object_handle handle = msgpack::unpack(
            reinterpret_cast<const char*>(buffer), length);
        Repacker(result->buffer, flags).pack(handle.get());
    } catch (const codec::CodecException& e) {
        switch (e.code()) {
            case codec::CodecError::UnknownTag:
                result->status = BTOON_STATUS_UNKNOWN_TAG;
                break;
            case codec::CodecError::TruncatedInput:
                result->status = BTOON_STATUS_TRUNCATED_INPUT;
                break;
            default:
                result->status = BTOON_STATUS_UNSUPPORTED_VALUE;
                break;
        }
        result->error_offset = e.offset();
        result->buffer.clear();
    } catch (const msgpack::insufficient_bytes&) {
        result->status = BTOON_STATUS_TRUNCATED_INPUT;
        result->error_offset = size;
        result->buffer.clear();
    } catch (const std::exception&) {
        result->status = BTOON_STATUS_INTERNAL_ERROR;
        result->buffer.clear();
    }
    return result.release();
}

}  // namespace

extern "C" {

uint32_t btoon_abi_version(void) { return BTOON_ABI_VERSION; }

uint8_t* btoon_malloc(size_t size) {
    return static_cast<uint8_t*>(std::malloc(size));
}

void btoon_free(uint8_t* buffer) { std::free(buffer); }

btoon_result* btoon_encode(const uint8_t* buffer, size_t size, uint32_t flags) {
    try {
        return transcode(buffer, size, flags);
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

// Decode output is always transfer form; flags are reserved.
btoon_result* btoon_decode(const uint8_t* buffer, size_t size, uint32_t) {
    try {
        return transcode(buffer, size, BTOON_FLAG_FLOAT64 | BTOON_FLAG_INT64);
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

int btoon_result_status(const btoon_result* result) { return result->status; }

size_t btoon_result_size(const btoon_result* result) {
    return result->buffer.size();
}

const uint8_t* btoon_result_data(const btoon_result* result) {
    return reinterpret_cast<const uint8_t*>(result->buffer.data());
}

size_t btoon_result_error_offset(const btoon_result* result) {
    return result->error_offset;
}

void btoon_result_free(btoon_result* result) { delete result; }

}  // extern "C"
