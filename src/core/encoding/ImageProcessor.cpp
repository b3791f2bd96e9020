#include "core/encoding/ImageProcessor.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <string>
#include <png.h>
#include <jpeglib.h>

namespace core::encoding {
    namespace {
        constexpr uint64_t MAX_DECODED_PIXELS = 100ULL * 1000 * 1000;
        constexpr int32_t BMP_PIXELS_PER_METER = 2835; // 72 dpi

        const uint8_t PNG_SIGNATURE[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
        const uint8_t JPEG_SIGNATURE[] = {0xFF, 0xD8, 0xFF};

        void checkDimensions(uint64_t width, uint64_t height) {
            if (width == 0 || height == 0) {
                throw types::InvalidImageException("image has zero width or height");
            }
            if (width * height > MAX_DECODED_PIXELS) {
                throw types::InvalidImageException("image too large (" + std::to_string(width) + "x" +
                                                   std::to_string(height) + ")");
            }
        }

        // ITU-R 601-2 luma, after flattening alpha on a white background
        uint8_t luminance(uint32_t r, uint32_t g, uint32_t b, uint32_t a) {
            r = (r * a + 255 * (255 - a) + 127) / 255;
            g = (g * a + 255 * (255 - a) + 127) / 255;
            b = (b * a + 255 * (255 - a) + 127) / 255;
            return static_cast<uint8_t>((r * 299 + g * 587 + b * 114 + 500) / 1000);
        }

        struct JpegErrorManager {
            jpeg_error_mgr pub;
            jmp_buf setjmpBuffer;
            char message[JMSG_LENGTH_MAX];
        };

        void jpegErrorExit(j_common_ptr cinfo) {
            auto *err = reinterpret_cast<JpegErrorManager *>(cinfo->err);
            (*cinfo->err->format_message)(cinfo, err->message);
            longjmp(err->setjmpBuffer, 1);
        }

        void jpegSilentOutput(j_common_ptr) {
        }

        struct AxisSpan {
            int first = 0;
            std::vector<double> weights;
        };

        /**
         * @brief Area coverage of each source sample for every target sample (target <= source).
         */
        std::vector<AxisSpan> computeSpans(int sourceLength, int targetLength) {
            std::vector<AxisSpan> spans(targetLength);
            double scale = static_cast<double>(sourceLength) / targetLength;

            for (int i = 0; i < targetLength; ++i) {
                double start = i * scale;
                double end = std::min(static_cast<double>(sourceLength), (i + 1) * scale);
                int first = static_cast<int>(std::floor(start));
                int last = std::min(sourceLength, static_cast<int>(std::ceil(end)));

                AxisSpan &span = spans[i];
                span.first = first;
                double total = 0.0;
                for (int s = first; s < last; ++s) {
                    double coverage = std::min(end, s + 1.0) - std::max(start, static_cast<double>(s));
                    span.weights.push_back(std::max(0.0, coverage));
                    total += span.weights.back();
                }
                if (total > 0.0) {
                    for (double &w: span.weights) w /= total;
                }
            }
            return spans;
        }

        void writeU16(std::vector<uint8_t> &out, uint16_t value) {
            out.push_back(static_cast<uint8_t>(value & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        }

        void writeU32(std::vector<uint8_t> &out, uint32_t value) {
            for (int shift = 0; shift < 32; shift += 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }
    }

    ImageProcessor::ImageProcessor(int maxWidth) : maxWidth_(maxWidth) {
        if (maxWidth_ <= 0) {
            throw std::invalid_argument("maxWidth must be positive");
        }
    }

    std::vector<uint8_t> ImageProcessor::toPrintableBitmap(const std::vector<uint8_t> &imageBytes) const {
        return toPrintableBitmap(decode(imageBytes));
    }

    std::vector<uint8_t> ImageProcessor::toPrintableBitmap(const GrayImage &decoded) const {
        GrayImage fitted = fitToWidth(decoded, maxWidth_);
        std::vector<uint8_t> bits = ditherToMonochrome(fitted);
        return encodeMonochromeBmp(fitted.width, fitted.height, bits);
    }

    ImageFormat ImageProcessor::detectFormat(const uint8_t *data, size_t size) {
        if (size >= sizeof(PNG_SIGNATURE) && std::memcmp(data, PNG_SIGNATURE, sizeof(PNG_SIGNATURE)) == 0) {
            return ImageFormat::Png;
        }
        if (size >= sizeof(JPEG_SIGNATURE) && std::memcmp(data, JPEG_SIGNATURE, sizeof(JPEG_SIGNATURE)) == 0) {
            return ImageFormat::Jpeg;
        }
        return ImageFormat::Unknown;
    }

    GrayImage ImageProcessor::decode(const std::vector<uint8_t> &imageBytes) {
        if (imageBytes.empty()) {
            throw types::InvalidImageException("no image data");
        }

        switch (detectFormat(imageBytes.data(), imageBytes.size())) {
            case ImageFormat::Png:
                return decodePng(imageBytes);
            case ImageFormat::Jpeg:
                return decodeJpeg(imageBytes);
            default:
                throw types::InvalidImageException("unsupported image format (expected PNG or JPEG)");
        }
    }

    GrayImage ImageProcessor::decodePng(const std::vector<uint8_t> &imageBytes) {
        png_image image;
        std::memset(&image, 0, sizeof(image));
        image.version = PNG_IMAGE_VERSION;

        if (!png_image_begin_read_from_memory(&image, imageBytes.data(), imageBytes.size())) {
            throw types::InvalidImageException(std::string("cannot read PNG header: ") + image.message);
        }

        try {
            checkDimensions(image.width, image.height);
        } catch (...) {
            png_image_free(&image);
            throw;
        }

        image.format = PNG_FORMAT_RGBA;
        std::vector<uint8_t> rgba(PNG_IMAGE_SIZE(image));
        if (!png_image_finish_read(&image, nullptr, rgba.data(), 0, nullptr)) {
            std::string message = image.message;
            png_image_free(&image);
            throw types::InvalidImageException("corrupt PNG data: " + message);
        }

        GrayImage gray;
        gray.width = static_cast<int>(image.width);
        gray.height = static_cast<int>(image.height);
        gray.pixels.resize(static_cast<size_t>(gray.width) * gray.height);
        for (size_t i = 0; i < gray.pixels.size(); ++i) {
            const uint8_t *px = &rgba[i * 4];
            gray.pixels[i] = luminance(px[0], px[1], px[2], px[3]);
        }
        return gray;
    }

    GrayImage ImageProcessor::decodeJpeg(const std::vector<uint8_t> &imageBytes) {
        // Declared before setjmp: longjmp must not skip their construction
        GrayImage gray;
        jpeg_decompress_struct cinfo;
        JpegErrorManager jerr;

        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpegErrorExit;
        jerr.pub.output_message = jpegSilentOutput;

        if (setjmp(jerr.setjmpBuffer)) {
            jpeg_destroy_decompress(&cinfo);
            throw types::InvalidImageException(std::string("corrupt JPEG data: ") + jerr.message);
        }

        jpeg_create_decompress(&cinfo);
        jpeg_mem_src(&cinfo, const_cast<unsigned char *>(imageBytes.data()),
                     static_cast<unsigned long>(imageBytes.size()));
        jpeg_read_header(&cinfo, TRUE);
        cinfo.out_color_space = JCS_GRAYSCALE;
        jpeg_start_decompress(&cinfo);

        if (cinfo.output_width == 0 || cinfo.output_height == 0 ||
            static_cast<uint64_t>(cinfo.output_width) * cinfo.output_height > MAX_DECODED_PIXELS) {
            jpeg_destroy_decompress(&cinfo);
            throw types::InvalidImageException("JPEG dimensions out of range");
        }

        gray.width = static_cast<int>(cinfo.output_width);
        gray.height = static_cast<int>(cinfo.output_height);
        gray.pixels.resize(static_cast<size_t>(gray.width) * gray.height);

        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW row = &gray.pixels[static_cast<size_t>(cinfo.output_scanline) * gray.width];
            jpeg_read_scanlines(&cinfo, &row, 1);
        }

        jpeg_finish_decompress(&cinfo);
        jpeg_destroy_decompress(&cinfo);
        return gray;
    }

    GrayImage ImageProcessor::fitToWidth(const GrayImage &image, int maxWidth) {
        if (image.width <= maxWidth) {
            return image;
        }

        int targetHeight = std::max(1, static_cast<int>(static_cast<int64_t>(image.height) * maxWidth / image.width));
        Logger::logInfo("[ImageProcessor] Resizing image from " + std::to_string(image.width) + "x" +
                        std::to_string(image.height) + " to " + std::to_string(maxWidth) + "x" +
                        std::to_string(targetHeight));
        return resize(image, maxWidth, targetHeight);
    }

    GrayImage ImageProcessor::resize(const GrayImage &image, int targetWidth, int targetHeight) {
        std::vector<AxisSpan> columns = computeSpans(image.width, targetWidth);
        std::vector<AxisSpan> rows = computeSpans(image.height, targetHeight);

        // Horizontal pass
        std::vector<double> horizontal(static_cast<size_t>(targetWidth) * image.height);
        for (int y = 0; y < image.height; ++y) {
            const uint8_t *srcRow = &image.pixels[static_cast<size_t>(y) * image.width];
            double *dstRow = &horizontal[static_cast<size_t>(y) * targetWidth];
            for (int x = 0; x < targetWidth; ++x) {
                const AxisSpan &span = columns[x];
                double sum = 0.0;
                for (size_t k = 0; k < span.weights.size(); ++k) {
                    sum += srcRow[span.first + k] * span.weights[k];
                }
                dstRow[x] = sum;
            }
        }

        // Vertical pass
        GrayImage out;
        out.width = targetWidth;
        out.height = targetHeight;
        out.pixels.resize(static_cast<size_t>(targetWidth) * targetHeight);
        for (int y = 0; y < targetHeight; ++y) {
            const AxisSpan &span = rows[y];
            for (int x = 0; x < targetWidth; ++x) {
                double sum = 0.0;
                for (size_t k = 0; k < span.weights.size(); ++k) {
                    sum += horizontal[static_cast<size_t>(span.first + k) * targetWidth + x] * span.weights[k];
                }
                long rounded = std::lround(sum);
                out.pixels[static_cast<size_t>(y) * targetWidth + x] =
                        static_cast<uint8_t>(std::clamp(rounded, 0L, 255L));
            }
        }
        return out;
    }

    std::vector<uint8_t> ImageProcessor::ditherToMonochrome(const GrayImage &image) {
        std::vector<uint8_t> bits(static_cast<size_t>(image.width) * image.height);
        std::vector<int> current(image.width + 2, 0);
        std::vector<int> next(image.width + 2, 0);

        for (int y = 0; y < image.height; ++y) {
            std::fill(next.begin(), next.end(), 0);
            for (int x = 0; x < image.width; ++x) {
                size_t index = static_cast<size_t>(y) * image.width + x;
                int value = std::clamp(image.pixels[index] + current[x + 1], 0, 255);
                bool white = value >= 128;
                bits[index] = white ? 1 : 0;

                int error = value - (white ? 255 : 0);
                current[x + 2] += error * 7 / 16;
                next[x] += error * 3 / 16;
                next[x + 1] += error * 5 / 16;
                next[x + 2] += error / 16;
            }
            current.swap(next);
        }
        return bits;
    }

    std::vector<uint8_t> ImageProcessor::encodeMonochromeBmp(int width, int height, const std::vector<uint8_t> &bits) {
        if (width <= 0 || height <= 0 || bits.size() != static_cast<size_t>(width) * height) {
            throw types::InvalidImageException("bitmap dimensions do not match pixel data");
        }

        const uint32_t rowStride = ((static_cast<uint32_t>(width) + 31) / 32) * 4;
        const uint32_t imageSize = rowStride * static_cast<uint32_t>(height);
        const uint32_t pixelOffset = 14 + 40 + 8;

        std::vector<uint8_t> out;
        out.reserve(pixelOffset + imageSize);

        // BITMAPFILEHEADER
        out.push_back('B');
        out.push_back('M');
        writeU32(out, pixelOffset + imageSize);
        writeU16(out, 0);
        writeU16(out, 0);
        writeU32(out, pixelOffset);

        // BITMAPINFOHEADER
        writeU32(out, 40);
        writeU32(out, static_cast<uint32_t>(width));
        writeU32(out, static_cast<uint32_t>(height)); // positive: bottom-up
        writeU16(out, 1);
        writeU16(out, 1);
        writeU32(out, 0);
        writeU32(out, imageSize);
        writeU32(out, BMP_PIXELS_PER_METER);
        writeU32(out, BMP_PIXELS_PER_METER);
        writeU32(out, 2);
        writeU32(out, 2);

        // Palette: index 0 black, index 1 white
        writeU32(out, 0x00000000);
        writeU32(out, 0x00FFFFFF);

        std::vector<uint8_t> row(rowStride);
        for (int y = height - 1; y >= 0; --y) {
            std::fill(row.begin(), row.end(), 0);
            for (int x = 0; x < width; ++x) {
                if (bits[static_cast<size_t>(y) * width + x]) {
                    row[x / 8] |= static_cast<uint8_t>(0x80 >> (x % 8));
                }
            }
            out.insert(out.end(), row.begin(), row.end());
        }
        return out;
    }

} // namespace core::encoding
