/**
 * ClawBridge - Splitting of long agent replies into frame-sized pieces.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace clawbridge
{

    inline constexpr std::size_t kDefaultTextChunkLimit = 8000;

    // Splits on byte boundaries of at most `limit` bytes, never inside a UTF-8 sequence.
    // Text that already fits is returned as a single chunk, including the empty string.
    std::vector<std::string> chunk_text(std::string_view text, std::size_t limit = kDefaultTextChunkLimit);

} // namespace clawbridge
