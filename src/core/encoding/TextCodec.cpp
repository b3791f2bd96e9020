#include "core/encoding/TextCodec.hpp"
#include "core/types/Error.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iconv.h>

namespace core::encoding {
    namespace {
        /**
         * @brief Scoped iconv descriptor.
         */
        class IconvHandle {
        public:
            IconvHandle(const char *to, const char *from) : cd_(iconv_open(to, from)) {
                if (cd_ == reinterpret_cast<iconv_t>(-1)) {
                    throw types::InvalidContentException(std::string("iconv_open failed: ") + std::strerror(errno));
                }
            }

            ~IconvHandle() {
                iconv_close(cd_);
            }

            IconvHandle(const IconvHandle &) = delete;

            IconvHandle &operator=(const IconvHandle &) = delete;

            iconv_t get() const { return cd_; }

        private:
            iconv_t cd_;
        };
    }

    std::string TextCodec::utf8ToGbk(const std::string &utf8) {
        IconvHandle handle("GBK", "UTF-8");

        std::string out;
        out.reserve(utf8.size());

        char buffer[4096];
        char *in = const_cast<char *>(utf8.data());
        size_t inLeft = utf8.size();

        while (inLeft > 0) {
            char *outPtr = buffer;
            size_t outLeft = sizeof(buffer);
            size_t result = iconv(handle.get(), &in, &inLeft, &outPtr, &outLeft);
            out.append(buffer, sizeof(buffer) - outLeft);

            if (result != static_cast<size_t>(-1)) {
                continue;
            }
            if (errno == E2BIG) {
                continue;
            }
            if (errno == EILSEQ) {
                // Not representable in GBK (or malformed): drop one code point
                size_t skip = std::min(sequenceLength(static_cast<unsigned char>(*in)), inLeft);
                in += skip;
                inLeft -= skip;
                continue;
            }
            // EINVAL: truncated sequence at the end of input
            break;
        }

        char *outPtr = buffer;
        size_t outLeft = sizeof(buffer);
        iconv(handle.get(), nullptr, nullptr, &outPtr, &outLeft);
        out.append(buffer, sizeof(buffer) - outLeft);
        return out;
    }

    size_t TextCodec::sequenceLength(unsigned char leadByte) {
        if (leadByte < 0x80) return 1;
        if ((leadByte & 0xE0) == 0xC0) return 2;
        if ((leadByte & 0xF0) == 0xE0) return 3;
        if ((leadByte & 0xF8) == 0xF0) return 4;
        return 1;
    }

    size_t TextCodec::codePointCount(const std::string &utf8) {
        size_t count = 0;
        for (size_t i = 0; i < utf8.size(); i += sequenceLength(static_cast<unsigned char>(utf8[i]))) {
            ++count;
        }
        return count;
    }

} // namespace core::encoding
