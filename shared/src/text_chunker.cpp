#include "clawbridge/text_chunker.hpp"

#include <algorithm>
#include <stdexcept>

namespace clawbridge
{

    namespace
    {
        bool is_continuation_byte(char ch)
        {
            return (static_cast<unsigned char>(ch) & 0xC0u) == 0x80u;
        }
    } // namespace

    std::vector<std::string> chunk_text(std::string_view text, std::size_t limit)
    {
        if (limit == 0)
        {
            throw std::invalid_argument("chunk limit must be positive");
        }
        if (text.size() <= limit)
        {
            return {std::string(text)};
        }

        std::vector<std::string> chunks;
        std::size_t offset = 0;
        while (offset < text.size())
        {
            std::size_t end = std::min(offset + limit, text.size());
            if (end < text.size())
            {
                std::size_t boundary = end;
                while (boundary > offset && is_continuation_byte(text[boundary]))
                {
                    --boundary;
                }
                // A limit smaller than one code point falls back to a hard split.
                if (boundary > offset)
                {
                    end = boundary;
                }
            }
            chunks.emplace_back(text.substr(offset, end - offset));
            offset = end;
        }
        return chunks;
    }

} // namespace clawbridge
