/******************************************************************************\
 * appboot_split.hpp - String splitting helpers
 *
 * Copyright 2026 Hewlett Packard Enterprise Development LP.
 *
 *     Redistribution and use in source and binary forms, with or
 *     without modification, are permitted provided that the following
 *     conditions are met:
 *
 *      - Redistributions of source code must retain the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer.
 *
 *      - Redistributions in binary form must reproduce the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer in the documentation and/or other materials
 *        provided with the distribution.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 ******************************************************************************/
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace appboot {

namespace split {

    // strip whitespace from both ends
    static inline std::string trim(std::string const& str, std::string const& whitespace = " \t\r")
    {
        auto const startPos = str.find_first_not_of(whitespace);
        if (startPos == std::string::npos) {
            return "";
        }
        auto const endPos = str.find_last_not_of(whitespace);
        return str.substr(startPos, endPos - startPos + 1);
    }

    // split at the first delimiter, the second half keeps any further delimiters.
    // without a delimiter the whole line is the first half
    static inline std::pair<std::string, std::string> pair(std::string const& line, char delim)
    {
        auto const pos = line.find(delim);
        if (pos == std::string::npos) {
            return std::make_pair(line, std::string{});
        }
        return std::make_pair(line.substr(0, pos), line.substr(pos + 1));
    }

    // split into every delimited field, keeping empty fields
    static inline std::vector<std::string> list(std::string const& line, char delim)
    {
        auto result = std::vector<std::string>{};
        if (line.empty()) {
            return result;
        }

        auto start = std::string::size_type{0};
        while (true) {
            auto const end = line.find(delim, start);
            if (end == std::string::npos) {
                result.emplace_back(line.substr(start));
                break;
            }
            result.emplace_back(line.substr(start, end - start));
            start = end + 1;
        }

        return result;
    }

} /* namespace appboot::split */

} /* namespace appboot */
