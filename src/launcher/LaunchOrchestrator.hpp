/******************************************************************************\
 * LaunchOrchestrator.hpp - Single pass bootstrap-and-launch sequence
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

#include <optional>
#include <string>
#include <vector>

#include "launcher/EnvironmentProvisioner.hpp"
#include "launcher/LaunchConfig.hpp"
#include "launcher/RuntimeLocator.hpp"

namespace appboot {

class Platform;

enum class LaunchState
    { Start
    , Provisioning
    , Locating
    , Launching // terminal: target handed off
    , Failed    // terminal: diagnostic shown
};

char const* toString(LaunchState state);

/*
** Start -> (Provisioning) -> Locating -> {Launching | Failed}. No state is ever
** retried; every failure ends the run with a diagnostic and a non-zero status.
*/
class LaunchOrchestrator {
private:
    Platform&           m_platform;
    LaunchConfig const& m_config;

    std::vector<LaunchState>         m_states;
    std::optional<BootstrapResult>   m_bootstrap;
    std::optional<LauncherCandidate> m_launcher;

public:
    LaunchOrchestrator(Platform& platform, LaunchConfig const& config)
        : m_platform{platform}
        , m_config{config}
        , m_states{}
        , m_bootstrap{}
        , m_launcher{}
    {}

    // run the whole sequence, returns the process exit status
    int run();

    // argv handed to the platform for the chosen launcher
    std::vector<std::string> targetCommand(LauncherCandidate const& launcher) const;

    /* inspection after run */
    std::vector<LaunchState> const& states() const { return m_states; }
    LaunchState state() const { return m_states.empty() ? LaunchState::Start : m_states.back(); }
    std::optional<BootstrapResult> const& bootstrapResult() const { return m_bootstrap; }
    std::optional<LauncherCandidate> const& launcher() const { return m_launcher; }

private:
    void enter(LaunchState state);
    int fail(int exitStatus, std::string const& message);
};

} /* namespace appboot */
