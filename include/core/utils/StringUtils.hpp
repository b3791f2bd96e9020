#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace core::utils {

    inline std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    inline std::string trim(const std::string &value) {
        size_t first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

    inline std::vector<std::string> split(const std::string &value, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= value.size()) {
            size_t end = value.find(delimiter, start);
            if (end == std::string::npos) end = value.size();
            parts.push_back(value.substr(start, end - start));
            start = end + 1;
        }
        return parts;
    }

    inline bool startsWith(const std::string &value, const std::string &prefix) {
        return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
    }

    /**
     * @brief Keeps only the last 4 characters of a secret for log output.
     */
    inline std::string maskSecret(const std::string &secret) {
        if (secret.size() <= 4) return std::string(secret.size(), '*');
        return std::string(secret.size() - 4, '*') + secret.substr(secret.size() - 4);
    }

    /**
     * @brief Scheme, host and path of @p url for log output. Query, fragment and user info are dropped.
     */
    inline std::string redactUrl(const std::string &url) {
        std::string visible = url.substr(0, url.find_first_of("?#"));
        size_t authority = visible.find("://");
        authority = authority == std::string::npos ? 0 : authority + 3;
        size_t pathStart = visible.find('/', authority);
        size_t at = visible.rfind('@', pathStart == std::string::npos ? std::string::npos : pathStart);
        if (at != std::string::npos && at >= authority) {
            visible.erase(authority, at + 1 - authority);
        }
        return visible;
    }

    /**
     * @brief Cuts @p value to at most @p maxLength bytes without splitting a UTF-8 sequence.
     */
    inline std::string truncateForLog(const std::string &value, size_t maxLength = 200) {
        if (value.size() <= maxLength) return value;
        size_t cut = maxLength;
        while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        return value.substr(0, cut) + "...";
    }

    /**
     * @brief Replaces every byte that is not part of a well-formed UTF-8 sequence with U+FFFD.
     *
     * Service error pages may be GBK; their text ends up in JSON documents.
     */
    inline std::string toValidUtf8(const std::string &value) {
        static const std::string REPLACEMENT = "\xEF\xBF\xBD";
        std::string out;
        out.reserve(value.size());

        size_t i = 0;
        while (i < value.size()) {
            auto lead = static_cast<unsigned char>(value[i]);
            size_t length = 0;
            unsigned char low = 0x80, high = 0xBF;
            if (lead < 0x80) {
                length = 1;
            } else if (lead >= 0xC2 && lead <= 0xDF) {
                length = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                length = 3;
                if (lead == 0xE0) low = 0xA0;
                if (lead == 0xED) high = 0x9F;
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                length = 4;
                if (lead == 0xF0) low = 0x90;
                if (lead == 0xF4) high = 0x8F;
            }

            bool valid = length > 0 && i + length <= value.size();
            for (size_t k = 1; valid && k < length; ++k) {
                auto next = static_cast<unsigned char>(value[i + k]);
                unsigned char min = k == 1 ? low : 0x80;
                unsigned char max = k == 1 ? high : 0xBF;
                valid = next >= min && next <= max;
            }

            if (valid) {
                out.append(value, i, length);
                i += length;
            } else {
                out += REPLACEMENT;
                ++i;
            }
        }
        return out;
    }

}
