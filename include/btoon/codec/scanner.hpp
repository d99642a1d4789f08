#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace btoon::codec {

/**
 * @brief Measure the encoded value starting at `offset`
 *
 * Walks tags and length prefixes without building a Value, so nesting depth
 * does not consume stack. A nonzero `max_depth` applies the same limit as
 * DecodeOptions::max_depth.
 *
 * @return Number of bytes the value occupies
 * @throws UnknownTagException, TruncatedInputException and
 *         DepthExceededException exactly where the Decoder would
 */
std::size_t measure(std::span<const uint8_t> data, std::size_t offset = 0,
                    std::size_t max_depth = 0);

// True when `data` starts with one complete, well-formed value.
bool is_well_formed(std::span<const uint8_t> data);

}  // namespace btoon::codec
