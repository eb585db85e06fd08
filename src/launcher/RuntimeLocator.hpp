/******************************************************************************\
 * RuntimeLocator.hpp - Ordered probing of launcher candidates
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

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace appboot {

class Platform;

// one way to run the target program
struct LauncherCandidate {
    std::string              name;        // identity shown in logs and diagnostics
    std::vector<std::string> command;     // argv prefix placed before the entry file
    std::function<bool()>    isAvailable; // presence on this machine, no side effects
};

// no candidate is present on this machine
class RuntimeUnavailable : public std::runtime_error {
private:
    std::vector<std::string> m_tried;

public:
    RuntimeUnavailable(std::string const& what, std::vector<std::string> tried)
        : std::runtime_error{what}
        , m_tried{std::move(tried)}
    {}

    std::vector<std::string> const& tried() const { return m_tried; }
};

class RuntimeLocator {
private:
    Platform& m_platform;

public:
    explicit RuntimeLocator(Platform& platform)
        : m_platform{platform}
    {}

    // first candidate whose presence predicate holds, in list order
    std::optional<LauncherCandidate> locate(std::vector<LauncherCandidate> const& candidates) const;

    // as locate, but throws RuntimeUnavailable naming every candidate tried
    LauncherCandidate require(std::vector<LauncherCandidate> const& candidates) const;
};

} /* namespace appboot */
