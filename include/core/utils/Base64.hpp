#pragma once

#include <boost/beast/core/detail/base64.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core::utils {
    namespace base64 = boost::beast::detail::base64;

    /**
     * @brief Standard base64 (RFC 4648) with padding.
     */
    inline std::string base64Encode(const uint8_t *data, size_t length) {
        std::string out;
        out.resize(base64::encoded_size(length));
        out.resize(base64::encode(out.data(), data, length));
        return out;
    }

    inline std::string base64Encode(const std::vector<uint8_t> &data) {
        return base64Encode(data.data(), data.size());
    }

    inline std::string base64Encode(const std::string &data) {
        return base64Encode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
    }

    /**
     * @brief Decodes standard or url-safe base64. Whitespace is skipped, padding is optional.
     * @return std::nullopt on any other character, padding inside the data or a dangling 6-bit group.
     */
    inline std::optional<std::vector<uint8_t>> base64Decode(const std::string &encoded) {
        std::string normalized;
        normalized.reserve(encoded.size());
        for (char c: encoded) {
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
            normalized.push_back(c);
        }
        std::replace(normalized.begin(), normalized.end(), '-', '+');
        std::replace(normalized.begin(), normalized.end(), '_', '/');

        size_t padding = normalized.find('=');
        if (padding != std::string::npos) {
            if (normalized.find_first_not_of('=', padding) != std::string::npos) return std::nullopt;
            normalized.erase(padding);
        }
        if (normalized.size() % 4 == 1) return std::nullopt;

        std::vector<uint8_t> out(base64::decoded_size(normalized.size()) + 3);
        auto result = base64::decode(out.data(), normalized.data(), normalized.size());
        // decode() stops at the first character outside the alphabet
        if (result.second != normalized.size()) return std::nullopt;
        out.resize(result.first);
        return out;
    }
} // namespace core::utils
