/******************************************************************************\
 * EnvironmentProvisioner.cpp - One-time creation and population of the isolated environment
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

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#include <filesystem>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/random_generator.hpp>

#include "launcher/EnvironmentProvisioner.hpp"
#include "launcher/Platform.hpp"
#include "launcher/RuntimeLocator.hpp"

#include "useful/appboot_flock.hpp"
#include "useful/appboot_wrappers.hpp"

namespace appboot {

char const*
toString(BootstrapStatus status)
{
    switch (status) {
        case BootstrapStatus::AlreadyPresent:      return "already-present";
        case BootstrapStatus::CreatedAndPopulated: return "created-and-populated";
        case BootstrapStatus::Failed:              return "failed";
    }
    return "unknown";
}

char const*
toString(BootstrapError error)
{
    switch (error) {
        case BootstrapError::None:                      return "none";
        case BootstrapError::NoBaseRuntime:             return "NoBaseRuntime";
        case BootstrapError::EnvironmentCreationFailed: return "EnvironmentCreationFailed";
        case BootstrapError::DependencyInstallFailed:   return "DependencyInstallFailed";
    }
    return "unknown";
}

char const*
toString(DependencyOutcome outcome)
{
    switch (outcome) {
        case DependencyOutcome::NotAttempted:      return "not-attempted";
        case DependencyOutcome::Installed:         return "installed";
        case DependencyOutcome::SkippedNoManifest: return "skipped-no-manifest";
        case DependencyOutcome::Failed:            return "failed";
    }
    return "unknown";
}

static BootstrapResult
makeFailure(BootstrapError error, std::string message, bool repaired = false)
{
    return BootstrapResult
        { BootstrapStatus::Failed
        , error
        , DependencyOutcome::NotAttempted
        , repaired
        , {}
        , std::move(message)
        };
}

static std::string
describe(ExecStatus const& status, unsigned long timeoutSecs)
{
    if (status.timedOut) {
        return "timed out after " + std::to_string(timeoutSecs) + "s";
    } else if (status.exitStatus == Execvp::ExecFailed) {
        return "could not be executed";
    }
    return "exited with status " + std::to_string(status.exitStatus);
}

static std::string
currentTimestamp()
{
    char stamp[32];
    auto const now = time(nullptr);
    struct tm tm_now;
    if (gmtime_r(&now, &tm_now) && strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm_now)) {
        return std::string{stamp};
    }
    return std::to_string(now);
}

bool
EnvironmentProvisioner::isPartial(std::string const& environmentDir)
{
    return pathExists(environmentDir + "/" APPBOOT_PROVISIONING_MARKER);
}

bool
EnvironmentProvisioner::isPresent(std::string const& environmentDir)
{
    return m_platform.isExecutable(m_platform.environmentLauncher(environmentDir))
        && !isPartial(environmentDir);
}

BootstrapResult
EnvironmentProvisioner::ensure(std::string const& environmentDir, std::string const& manifestPath)
{
    // Fast path, no writes at all
    if (isPresent(environmentDir)) {
        m_platform.writeLog("ensure: environment %s already present\n", environmentDir.c_str());
        return BootstrapResult
            { BootstrapStatus::AlreadyPresent
            , BootstrapError::None
            , DependencyOutcome::NotAttempted
            , false
            , {}
            , {}
            };
    }

    try {
        auto const lock = file_lock{m_config.lockPath, m_config.lockTimeout};
        m_platform.writeLog("ensure: holding %s\n", lock.path().c_str());

        // Another launch may have finished provisioning while we waited
        if (isPresent(environmentDir)) {
            m_platform.writeLog("ensure: environment %s provisioned by another process\n", environmentDir.c_str());
            return BootstrapResult
                { BootstrapStatus::AlreadyPresent
                , BootstrapError::None
                , DependencyOutcome::NotAttempted
                , false
                , {}
                , {}
                };
        }

        return provisionLocked(environmentDir, manifestPath);

    } catch (std::exception const& ex) {
        m_platform.writeLog("ensure: %s\n", ex.what());
        return makeFailure(BootstrapError::EnvironmentCreationFailed,
            "failed to create environment " + environmentDir + ": " + ex.what());
    }
}

BootstrapResult
EnvironmentProvisioner::provisionLocked(std::string const& environmentDir, std::string const& manifestPath)
{
    auto const launcher = m_platform.environmentLauncher(environmentDir);
    auto const markerPath = environmentDir + "/" APPBOOT_PROVISIONING_MARKER;
    auto const stampPath = environmentDir + "/" APPBOOT_PROVISIONED_STAMP;

    // Anything at the environment path now is left over from an interrupted run
    auto repaired = false;
    if (pathExists(environmentDir)) {
        fprintf(stderr, "warning: removing incomplete environment %s\n", environmentDir.c_str());
        m_platform.writeLog("ensure: removing incomplete environment %s\n", environmentDir.c_str());

        std::error_code ec;
        std::filesystem::remove_all(environmentDir, ec);
        if (ec) {
            return makeFailure(BootstrapError::EnvironmentCreationFailed,
                "failed to remove incomplete environment " + environmentDir + ": " + ec.message(), true);
        }
        repaired = true;
    }

    // Find something able to create the environment
    auto const baseRuntime = RuntimeLocator{m_platform}.locate(m_platform.baseRuntimeCandidates());
    if (!baseRuntime) {
        return makeFailure(BootstrapError::NoBaseRuntime,
            "no Python interpreter able to create the environment was found. " + m_platform.runtimeInstallHint(),
            repaired);
    }

    auto const runId = boost::uuids::to_string(boost::uuids::random_generator{}());
    m_platform.writeLog("ensure: provisioning %s with %s (run %s)\n",
        environmentDir.c_str(), baseRuntime->name.c_str(), runId.c_str());

    // Mark in-progress before the environment exists, so an interrupted or failed
    // creation that still left a launcher behind is rebuilt next time
    { std::error_code ec;
        std::filesystem::create_directories(environmentDir, ec);
        if (ec) {
            return makeFailure(BootstrapError::EnvironmentCreationFailed,
                "failed to create environment directory " + environmentDir + ": " + ec.message(), repaired);
        }
    }
    file::writeAtomic(markerPath,
        "run=" + runId + "\nstarted=" + currentTimestamp() + "\nmanifest=" + manifestPath + "\n",
        S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);

    // Create the environment, venv populates the existing directory
    { auto const status = m_platform.runCommand(
        m_platform.createEnvironmentCommand(*baseRuntime, environmentDir), m_config.envCreateTimeout);
        if (!status.succeeded()) {
            auto result = makeFailure(BootstrapError::EnvironmentCreationFailed,
                "creating environment " + environmentDir + " with " + baseRuntime->name + " "
                    + describe(status, m_config.envCreateTimeout),
                repaired);
            result.baseRuntime = baseRuntime->name;
            return result;
        }
    }

    auto result = BootstrapResult
        { BootstrapStatus::CreatedAndPopulated
        , BootstrapError::None
        , DependencyOutcome::NotAttempted
        , repaired
        , baseRuntime->name
        , {}
        };

    if (!m_platform.isExecutable(launcher)) {
        // Leave the marker: the environment is unusable and is rebuilt on the next launch
        result.dependencies = DependencyOutcome::Failed;
        result.message = "environment launcher " + launcher + " is missing after creation, dependencies were not installed";
        m_platform.writeLog("ensure: %s\n", result.message.c_str());
    } else {
        result.dependencies = installDependencies(environmentDir, manifestPath, result.message);
    }

    if (result.dependencies == DependencyOutcome::Failed) {
        if (m_config.dependencyPolicy == DependencyPolicy::FailFast) {
            result.status = BootstrapStatus::Failed;
            result.error = BootstrapError::DependencyInstallFailed;
            return result;
        }
        fprintf(stderr, "warning: %s\n", result.message.c_str());
        if (!m_platform.isExecutable(launcher)) {
            return result;
        }
    }

    // Publish
    if (::rename(markerPath.c_str(), stampPath.c_str())) {
        result.status = BootstrapStatus::Failed;
        result.error = BootstrapError::EnvironmentCreationFailed;
        result.message = "failed to publish environment " + environmentDir + ": " + strerror(errno);
        return result;
    }
    m_platform.writeLog("ensure: published %s (dependencies %s)\n",
        environmentDir.c_str(), toString(result.dependencies));

    return result;
}

DependencyOutcome
EnvironmentProvisioner::installDependencies(std::string const& environmentDir, std::string const& manifestPath,
    std::string& message)
{
    // Tooling upgrade failure is not fatal, the bundled pip usually still works
    { auto const status = m_platform.runCommand(
        m_platform.upgradeToolingCommand(environmentDir), m_config.dependencyTimeout);
        if (!status.succeeded()) {
            m_platform.writeLog("ensure: upgrading package tooling %s, continuing\n",
                describe(status, m_config.dependencyTimeout).c_str());
        }
    }

    if (manifestPath.empty() || !pathExists(manifestPath)) {
        m_platform.writeLog("ensure: no dependency manifest at %s, skipping dependency install\n",
            manifestPath.c_str());
        return DependencyOutcome::SkippedNoManifest;
    }

    auto const status = m_platform.runCommand(
        m_platform.installManifestCommand(environmentDir, manifestPath), m_config.dependencyTimeout);
    if (!status.succeeded()) {
        message = "installing dependencies from " + manifestPath + " "
            + describe(status, m_config.dependencyTimeout);
        m_platform.writeLog("ensure: %s\n", message.c_str());
        return DependencyOutcome::Failed;
    }

    return DependencyOutcome::Installed;
}

} /* namespace appboot */
