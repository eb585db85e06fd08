/******************************************************************************\
 * RuntimeLocator.cpp - Ordered probing of launcher candidates
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
#include "launcher/RuntimeLocator.hpp"
#include "launcher/Platform.hpp"

namespace appboot {

std::optional<LauncherCandidate>
RuntimeLocator::locate(std::vector<LauncherCandidate> const& candidates) const
{
    for (auto&& candidate : candidates) {
        if (candidate.isAvailable && candidate.isAvailable()) {
            m_platform.writeLog("locate: selected %s\n", candidate.name.c_str());
            return candidate;
        }
        m_platform.writeLog("locate: %s not present\n", candidate.name.c_str());
    }

    return std::nullopt;
}

LauncherCandidate
RuntimeLocator::require(std::vector<LauncherCandidate> const& candidates) const
{
    if (auto found = locate(candidates)) {
        return std::move(*found);
    }

    auto tried = std::vector<std::string>{};
    auto what = std::string{"no usable runtime found (tried "};
    for (auto&& candidate : candidates) {
        if (!tried.empty()) {
            what += ", ";
        }
        what += candidate.name;
        tried.push_back(candidate.name);
    }
    what += ")";

    throw RuntimeUnavailable{what, std::move(tried)};
}

} /* namespace appboot */
