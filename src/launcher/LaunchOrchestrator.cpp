/******************************************************************************\
 * LaunchOrchestrator.cpp - Single pass bootstrap-and-launch sequence
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
#include "appboot_defs.h"
#include "appboot.h"

#include "launcher/LaunchOrchestrator.hpp"
#include "launcher/Platform.hpp"

#include "useful/appboot_wrappers.hpp"

namespace appboot {

char const*
toString(LaunchState state)
{
    switch (state) {
        case LaunchState::Start:        return "start";
        case LaunchState::Provisioning: return "provisioning";
        case LaunchState::Locating:     return "locating";
        case LaunchState::Launching:    return "launching";
        case LaunchState::Failed:       return "failed";
    }
    return "unknown";
}

static int
exitStatusFor(BootstrapError error)
{
    switch (error) {
        case BootstrapError::None:                      return APPBOOT_EXIT_SUCCESS;
        case BootstrapError::NoBaseRuntime:             return APPBOOT_EXIT_NO_BASE_RUNTIME;
        case BootstrapError::EnvironmentCreationFailed: return APPBOOT_EXIT_ENV_CREATION_FAILED;
        case BootstrapError::DependencyInstallFailed:   return APPBOOT_EXIT_DEPENDENCY_FAILED;
    }
    return APPBOOT_EXIT_ENV_CREATION_FAILED;
}

void
LaunchOrchestrator::enter(LaunchState state)
{
    m_platform.writeLog("launch: -> %s\n", toString(state));
    m_states.push_back(state);
}

int
LaunchOrchestrator::fail(int exitStatus, std::string const& message)
{
    enter(LaunchState::Failed);
    m_platform.showMessage(m_config.displayName, message);
    return exitStatus;
}

std::vector<std::string>
LaunchOrchestrator::targetCommand(LauncherCandidate const& launcher) const
{
    auto result = launcher.command;
    result.push_back(m_config.entryPath);
    result.insert(result.end(), m_config.targetArgs.begin(), m_config.targetArgs.end());
    return result;
}

int
LaunchOrchestrator::run()
{
    m_states.clear();
    m_bootstrap.reset();
    m_launcher.reset();

    enter(LaunchState::Start);
    m_platform.writeLog("launch: root %s, entry %s, environment %s\n",
        m_config.installRoot.c_str(), m_config.entryPath.c_str(), m_config.environmentDir.c_str());

    // Nothing else is worth doing without something to run
    if (!pathExists(m_config.entryPath)) {
        return fail(APPBOOT_EXIT_ENTRY_MISSING,
            "The program file " + m_config.entryPath + " is missing. Reinstall the application.");
    }

    if (m_config.autoSetup) {
        enter(LaunchState::Provisioning);

        auto provisioner = EnvironmentProvisioner{m_platform, m_config};
        m_bootstrap = provisioner.ensure(m_config.environmentDir, m_config.manifestPath);

        m_platform.writeLog("launch: bootstrap %s (error %s, dependencies %s%s)\n",
            toString(m_bootstrap->status), toString(m_bootstrap->error),
            toString(m_bootstrap->dependencies), m_bootstrap->repaired ? ", repaired" : "");

        if (m_bootstrap->failed()) {
            return fail(exitStatusFor(m_bootstrap->error), m_bootstrap->message);
        }
    }

    enter(LaunchState::Locating);
    try {
        m_launcher = RuntimeLocator{m_platform}.require(m_platform.launcherCandidates(m_config));
    } catch (RuntimeUnavailable const& ex) {
        m_platform.writeLog("launch: %s\n", ex.what());
        return fail(APPBOOT_EXIT_RUNTIME_UNAVAILABLE,
            "Python 3 is required to run " + m_config.displayName + " but was not found. "
                + m_platform.runtimeInstallHint());
    }

    // Exec mode does not come back from here
    enter(LaunchState::Launching);
    try {
        m_platform.handOff(targetCommand(*m_launcher), m_config.installRoot, m_config.launchMode);
    } catch (std::exception const& ex) {
        return fail(APPBOOT_EXIT_LAUNCH_FAILED,
            "Failed to start " + m_config.displayName + " with " + m_launcher->name + ": " + ex.what());
    }

    return APPBOOT_EXIT_SUCCESS;
}

} /* namespace appboot */
