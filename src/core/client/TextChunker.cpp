#include "core/client/TextChunker.hpp"
#include "core/encoding/TextCodec.hpp"
#include <algorithm>
#include <stdexcept>

namespace core::client {

    std::vector<std::string> splitText(const std::string &text, size_t maxCodePoints) {
        if (maxCodePoints == 0) {
            throw std::invalid_argument("maxCodePoints must be positive");
        }

        std::vector<std::string> chunks;
        size_t start = 0;
        while (start < text.size()) {
            size_t position = start;
            size_t codePoints = 0;
            size_t lastNewlineEnd = std::string::npos;

            while (position < text.size() && codePoints < maxCodePoints) {
                unsigned char lead = static_cast<unsigned char>(text[position]);
                size_t length = encoding::TextCodec::sequenceLength(lead);
                position = std::min(text.size(), position + length);
                ++codePoints;
                if (lead == '\n') {
                    lastNewlineEnd = position;
                }
            }

            size_t end = position;
            if (position < text.size() && lastNewlineEnd != std::string::npos) {
                end = lastNewlineEnd;
            }
            chunks.push_back(text.substr(start, end - start));
            start = end;
        }
        return chunks;
    }

} // namespace core::client
