#ifndef BTOON_BACKEND_SERVICE_ABI_H
#define BTOON_BACKEND_SERVICE_ABI_H

/*
 * C interface exported by an accelerated codec service library.
 *
 * Encode takes a value in transfer form (the tag format with floats as 0xcb
 * and integers up to 0xd3) and returns the wire encoding selected by the
 * flags. Decode takes wire bytes and returns the value in transfer form.
 * Input buffers come from btoon_malloc and are released with btoon_free;
 * results are released with btoon_result_free.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define BTOON_ABI_VERSION 1u

#define BTOON_FLAG_FLOAT64 0x01u
#define BTOON_FLAG_FLOAT_ADAPTIVE 0x02u
#define BTOON_FLAG_INT64 0x04u

enum btoon_status {
    BTOON_STATUS_OK = 0,
    BTOON_STATUS_UNKNOWN_TAG = 1,
    BTOON_STATUS_TRUNCATED_INPUT = 2,
    BTOON_STATUS_UNSUPPORTED_VALUE = 3,
    BTOON_STATUS_INTERNAL_ERROR = 4
};

typedef struct btoon_result btoon_result;

uint32_t btoon_abi_version(void);

uint8_t* btoon_malloc(size_t size);
void btoon_free(uint8_t* buffer);

btoon_result* btoon_encode(const uint8_t* buffer, size_t size, uint32_t flags);
btoon_result* btoon_decode(const uint8_t* buffer, size_t size, uint32_t flags);

int btoon_result_status(const btoon_result* result);
size_t btoon_result_size(const btoon_result* result);
const uint8_t* btoon_result_data(const btoon_result* result);
size_t btoon_result_error_offset(const btoon_result* result);
void btoon_result_free(btoon_result* result);

#ifdef __cplusplus
}
#endif

#endif /* BTOON_BACKEND_SERVICE_ABI_H */
