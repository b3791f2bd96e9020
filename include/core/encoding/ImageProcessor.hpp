#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace core::encoding {

    /**
     * @brief 8-bit luminance raster, row-major.
     */
    struct GrayImage {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> pixels;
    };

    enum class ImageFormat {
        Png,
        Jpeg,
        Unknown
    };

    /**
     * @brief Turns PNG/JPEG bytes into the 1-bit BMP the printer expects.
     *
     * Pipeline: decode, flatten alpha on white, luminance, area-average downscale to the
     * maximum width (never upscaled), Floyd-Steinberg dither, bottom-up 1-bpp BMP.
     * Output is a pure function of the input bytes and the maximum width.
     */
    class ImageProcessor {
    public:
        explicit ImageProcessor(int maxWidth);

        std::vector<uint8_t> toPrintableBitmap(const std::vector<uint8_t> &imageBytes) const;

        std::vector<uint8_t> toPrintableBitmap(const GrayImage &decoded) const;

        int maxWidth() const { return maxWidth_; }

        static ImageFormat detectFormat(const uint8_t *data, size_t size);

        /**
         * @throws InvalidImageException for unsupported or corrupt data.
         */
        static GrayImage decode(const std::vector<uint8_t> &imageBytes);

        static GrayImage fitToWidth(const GrayImage &image, int maxWidth);

        /**
         * @brief One byte per pixel: 1 = white (paper), 0 = black (dot).
         */
        static std::vector<uint8_t> ditherToMonochrome(const GrayImage &image);

        static std::vector<uint8_t> encodeMonochromeBmp(int width, int height, const std::vector<uint8_t> &bits);

    private:
        int maxWidth_;

        static GrayImage decodePng(const std::vector<uint8_t> &imageBytes);

        static GrayImage decodeJpeg(const std::vector<uint8_t> &imageBytes);

        static GrayImage resize(const GrayImage &image, int targetWidth, int targetHeight);
    };

} // namespace core::encoding
