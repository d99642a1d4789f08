#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/codec_options.hpp"
#include "btoon/codec/value.hpp"
#include "btoon/codec_config.hpp"

namespace btoon {

inline constexpr const char* VERSION = "0.0.1";

using codec::DecodeOptions;
using codec::EncodeOptions;
using codec::Value;

/**
 * @brief Apply `config` to the process-wide codec
 *
 * The encode and decode sections become the defaults of the option-less
 * encode()/decode() overloads; calling again (for instance from a reload
 * subscriber) replaces them. The backend section only has an effect before
 * the first encode/decode.
 *
 * @return false if the backend had already been chosen
 */
bool initialize(const CodecConfig& config);

// Encode with the options set by initialize() (library defaults before it).
std::vector<uint8_t> encode(const Value& value);

std::vector<uint8_t> encode(const Value& value, const EncodeOptions& options);

// Decode with the options set by initialize() (library defaults before it).
Value decode(std::span<const uint8_t> data);

Value decode(std::span<const uint8_t> data, const DecodeOptions& options);

EncodeOptions default_encode_options();
DecodeOptions default_decode_options();

// Whether the accelerated service backs encode/decode in this process.
bool has_accelerated();

std::string backend_name();

}  // namespace btoon
