/******************************************************************************\
 * Platform.hpp - Linux / XDG desktop platform implementation
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
#include <vector>

#include "launcher/Platform.hpp"

namespace appboot {

class LinuxPlatform : public Platform
{
public: // platform type interface
    static char const* getName() { return "linux"; }
    static bool isSupported();

    char const* name() const override { return getName(); }

public: // candidate lists
    std::vector<LauncherCandidate>
    launcherCandidates(LaunchConfig const& config) override;

    std::vector<LauncherCandidate>
    baseRuntimeCandidates() override;

public: // environment tooling
    std::string
    environmentLauncher(std::string const& environmentDir) const override;

    std::vector<std::string>
    createEnvironmentCommand(LauncherCandidate const& baseRuntime, std::string const& environmentDir) const override;

    std::vector<std::string>
    upgradeToolingCommand(std::string const& environmentDir) const override;

    std::vector<std::string>
    installManifestCommand(std::string const& environmentDir, std::string const& manifestPath) const override;

    std::string
    runtimeInstallHint() const override;

public: // shortcuts
    std::string desktopPath() override;
    std::string applicationsPath() override;
    ShortcutFormat shortcutFormat() const override { return ShortcutFormat::DesktopEntry; }

public: // primitives
    bool isExecutable(std::string const& path) override;
    std::string findExecutable(std::string const& name) override;

    ExecStatus runCommand(std::vector<std::string> const& argv, unsigned long timeoutSecs) override;
    void handOff(std::vector<std::string> const& argv, std::string const& workingDir, LaunchMode mode) override;

    void showMessage(std::string const& title, std::string const& message) override;

public: // helpers
    // XDG_DESKTOP_DIR from a user-dirs.dirs file, with $HOME expanded. empty if unset.
    static std::string parseUserDirsDesktop(std::string const& userDirsPath, std::string const& homeDir);

public: // constructor / destructor interface
    explicit LinuxPlatform(Logger& logger);
    ~LinuxPlatform() override = default;
    LinuxPlatform(const LinuxPlatform&) = delete;
    LinuxPlatform& operator=(const LinuxPlatform&) = delete;
    LinuxPlatform(LinuxPlatform&&) = delete;
    LinuxPlatform& operator=(LinuxPlatform&&) = delete;
};

} /* namespace appboot */
