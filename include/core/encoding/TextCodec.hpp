#pragma once

#include <cstddef>
#include <string>

namespace core::encoding {

    /**
     * @brief Text conversions required by the printer service.
     */
    class TextCodec {
    public:
        /**
         * @brief Converts UTF-8 to GBK. Code points GBK cannot represent are dropped,
         *        as are malformed or truncated UTF-8 sequences.
         */
        static std::string utf8ToGbk(const std::string &utf8);

        /**
         * @brief Byte length of the UTF-8 sequence starting with @p leadByte (1 for invalid leads).
         */
        static size_t sequenceLength(unsigned char leadByte);

        static size_t codePointCount(const std::string &utf8);
    };

} // namespace core::encoding
