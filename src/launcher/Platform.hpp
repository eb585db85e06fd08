/******************************************************************************\
 * Platform.hpp - Platform capability interface
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

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "launcher/LaunchConfig.hpp"
#include "launcher/RuntimeLocator.hpp"
#include "useful/appboot_execvp.hpp"
#include "useful/appboot_log.h"

namespace appboot {

// on-disk format of the shortcut artifact
enum class ShortcutFormat
    { DesktopEntry // freedesktop.org .desktop file
};

/*
** The Platform object defines everything the launcher needs to know about the
** machine it runs on: which launchers and base interpreters to probe for, how to
** drive the environment tooling, where shortcuts go, and the primitives for
** probing, running processes and talking to the user. It is an abstract base
** class; the orchestration logic only ever sees this interface.
*/
class Platform {
public: // impl.-specific interface that derived type must implement

    // Platform implementations must implement the following static functions:

    // static char const* getName()
    //   return the short name that can be set in the APPBOOT_PLATFORM environment variable

    // static bool isSupported()
    //   determines in an implementation-specific manner if the Platform can run here


    // short platform name
    virtual char const* name() const = 0;

    /* candidate lists, evaluated fresh on every call */

    // ways to run the entry file, in priority order
    virtual std::vector<LauncherCandidate>
    launcherCandidates(LaunchConfig const& config) = 0;

    // interpreters able to create an isolated environment, in priority order
    virtual std::vector<LauncherCandidate>
    baseRuntimeCandidates() = 0;

    /* environment tooling */

    // launcher binary inside an environment
    virtual std::string
    environmentLauncher(std::string const& environmentDir) const = 0;

    virtual std::vector<std::string>
    createEnvironmentCommand(LauncherCandidate const& baseRuntime, std::string const& environmentDir) const = 0;

    virtual std::vector<std::string>
    upgradeToolingCommand(std::string const& environmentDir) const = 0;

    virtual std::vector<std::string>
    installManifestCommand(std::string const& environmentDir, std::string const& manifestPath) const = 0;

    // remediation shown when no runtime is present
    virtual std::string
    runtimeInstallHint() const = 0;

    /* shortcuts */

    // user desktop directory
    virtual std::string desktopPath() = 0;

    // user application menu directory
    virtual std::string applicationsPath() = 0;

    virtual ShortcutFormat shortcutFormat() const = 0;

    /* probing primitives */

    // path is an executable regular file
    virtual bool isExecutable(std::string const& path) = 0;

    // resolve name through the executable search path, empty if not found
    virtual std::string findExecutable(std::string const& name) = 0;

    /* processes */

    // run to completion, output forwarded to the log
    virtual ExecStatus runCommand(std::vector<std::string> const& argv, unsigned long timeoutSecs) = 0;

    // start the target program. Spawn returns once it is running, Exec never returns.
    virtual void handOff(std::vector<std::string> const& argv, std::string const& workingDir, LaunchMode mode) = 0;

    /* user-facing diagnostics */

    // modal error when a display is available, stderr otherwise
    virtual void showMessage(std::string const& title, std::string const& message) = 0;

protected: // Protected data members that belong to any platform
    Logger& m_logger;

public: // Public static utility methods
    // instantiate the implementation for this machine, honoring APPBOOT_PLATFORM
    static std::unique_ptr<Platform> make(Logger& logger);

public: // Public interface to generic platform-agnostic capabilities
    template <typename... Args>
    void writeLog(char const* fmt, Args&&... args)
    {
        m_logger.write(fmt, std::forward<Args>(args)...);
    }

    Logger& getLogger() { return m_logger; }

protected: // Constructor/destructors
    explicit Platform(Logger& logger)
        : m_logger{logger}
    {}
public:
    virtual ~Platform() = default;
    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;
    Platform(Platform&&) = delete;
    Platform& operator=(Platform&&) = delete;
};

} /* namespace appboot */
