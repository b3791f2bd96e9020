#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace core::client {

    /**
     * @brief Splits UTF-8 text into chunks of at most @p maxCodePoints code points.
     *
     * A chunk ends after the last newline inside its window when there is one, otherwise
     * exactly at the limit. Concatenating the chunks gives back the input.
     */
    std::vector<std::string> splitText(const std::string &text, size_t maxCodePoints);

} // namespace core::client
