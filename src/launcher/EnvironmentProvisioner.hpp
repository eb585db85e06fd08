/******************************************************************************\
 * EnvironmentProvisioner.hpp - One-time creation and population of the isolated environment
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

#include "launcher/LaunchConfig.hpp"

namespace appboot {

class Platform;

enum class BootstrapStatus
    { AlreadyPresent
    , CreatedAndPopulated
    , Failed
};

enum class BootstrapError
    { None
    , NoBaseRuntime             // nothing able to create an environment
    , EnvironmentCreationFailed // creation step failed, timed out, or could not be published
    , DependencyInstallFailed   // only reported as failure under DependencyPolicy::FailFast
};

enum class DependencyOutcome
    { NotAttempted
    , Installed
    , SkippedNoManifest
    , Failed
};

struct BootstrapResult {
    BootstrapStatus   status;
    BootstrapError    error;
    DependencyOutcome dependencies;
    bool              repaired;    // a partial environment was removed first
    std::string       baseRuntime; // candidate used to create the environment
    std::string       message;     // human-readable detail for failures and warnings

    bool failed() const { return status == BootstrapStatus::Failed; }
};

char const* toString(BootstrapStatus status);
char const* toString(BootstrapError error);
char const* toString(DependencyOutcome outcome);

/*
** Owns the on-disk state of the environment. An environment counts as present
** when its launcher is executable and no in-progress marker is left behind.
** Provisioning runs under an exclusive lock on the install root's lock file and
** publishes the environment by renaming the marker to a completion stamp.
*/
class EnvironmentProvisioner {
private:
    Platform&           m_platform;
    LaunchConfig const& m_config;

public:
    EnvironmentProvisioner(Platform& platform, LaunchConfig const& config)
        : m_platform{platform}
        , m_config{config}
    {}

    // create and populate the environment unless it is already present.
    // performs no filesystem writes when it is.
    BootstrapResult ensure(std::string const& environmentDir, std::string const& manifestPath);

    // launcher present and not marked in-progress
    bool isPresent(std::string const& environmentDir);

    // in-progress marker left by an interrupted or failed provisioning
    static bool isPartial(std::string const& environmentDir);

private:
    BootstrapResult provisionLocked(std::string const& environmentDir, std::string const& manifestPath);
    DependencyOutcome installDependencies(std::string const& environmentDir, std::string const& manifestPath,
        std::string& message);
};

} /* namespace appboot */
