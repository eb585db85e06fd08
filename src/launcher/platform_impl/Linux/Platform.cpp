/******************************************************************************\
 * Platform.cpp - Linux / XDG desktop platform implementation
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

#include <sys/utsname.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <tuple>

#include "launcher/platform_impl/Linux/Platform.hpp"

#include "useful/appboot_wrappers.hpp"
#include "useful/appboot_split.hpp"

namespace appboot {

bool
LinuxPlatform::isSupported()
{
    struct utsname info;
    if (uname(&info)) {
        return false;
    }
    return std::string{info.sysname} == "Linux";
}

LinuxPlatform::LinuxPlatform(Logger& logger)
    : Platform{logger}
{}

std::vector<LauncherCandidate>
LinuxPlatform::launcherCandidates(LaunchConfig const& config)
{
    auto const envLauncher = environmentLauncher(config.environmentDir);

    return
        { { "environment launcher (" + envLauncher + ")"
          , { envLauncher }
          , [this, envLauncher]() { return isExecutable(envLauncher); }
          }
        , { "version selector (" APPBOOT_VERSION_SELECTOR " " APPBOOT_VERSION_SELECTOR_ARG ")"
          , { APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG }
          , [this]() { return !findExecutable(APPBOOT_VERSION_SELECTOR).empty(); }
          }
        , { "system launcher (" APPBOOT_SYSTEM_LAUNCHER ")"
          , { APPBOOT_SYSTEM_LAUNCHER }
          , [this]() { return !findExecutable(APPBOOT_SYSTEM_LAUNCHER).empty(); }
          }
        };
}

std::vector<LauncherCandidate>
LinuxPlatform::baseRuntimeCandidates()
{
    return
        { { "version selector (" APPBOOT_VERSION_SELECTOR " " APPBOOT_VERSION_SELECTOR_ARG ")"
          , { APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG }
          , [this]() { return !findExecutable(APPBOOT_VERSION_SELECTOR).empty(); }
          }
        , { "system interpreter (" APPBOOT_SYSTEM_LAUNCHER ")"
          , { APPBOOT_SYSTEM_LAUNCHER }
          , [this]() { return !findExecutable(APPBOOT_SYSTEM_LAUNCHER).empty(); }
          }
        , { "generic interpreter (" APPBOOT_GENERIC_LAUNCHER ")"
          , { APPBOOT_GENERIC_LAUNCHER }
          , [this]() { return !findExecutable(APPBOOT_GENERIC_LAUNCHER).empty(); }
          }
        };
}

std::string
LinuxPlatform::environmentLauncher(std::string const& environmentDir) const
{
    return environmentDir + "/" APPBOOT_ENV_LAUNCHER;
}

std::vector<std::string>
LinuxPlatform::createEnvironmentCommand(LauncherCandidate const& baseRuntime, std::string const& environmentDir) const
{
    auto result = baseRuntime.command;
    result.insert(result.end(), { "-m", "venv", environmentDir });
    return result;
}

std::vector<std::string>
LinuxPlatform::upgradeToolingCommand(std::string const& environmentDir) const
{
    return { environmentLauncher(environmentDir), "-m", "pip", "install", "--upgrade", "pip" };
}

std::vector<std::string>
LinuxPlatform::installManifestCommand(std::string const& environmentDir, std::string const& manifestPath) const
{
    return { environmentLauncher(environmentDir), "-m", "pip", "install", "-r", manifestPath };
}

std::string
LinuxPlatform::runtimeInstallHint() const
{
    return "Install Python 3 from " APPBOOT_RUNTIME_URL " or with your distribution's package manager "
        "(for example `sudo apt install python3 python3-venv`).";
}

std::string
LinuxPlatform::parseUserDirsDesktop(std::string const& userDirsPath, std::string const& homeDir)
{
    auto userDirs = std::ifstream{userDirsPath};
    if (!userDirs) {
        return {};
    }

    // lines look like XDG_DESKTOP_DIR="$HOME/Desktop"
    auto line = std::string{};
    while (std::getline(userDirs, line)) {
        line = split::trim(line);
        if (line.empty() || (line[0] == '#')) {
            continue;
        }

        std::string key, value;
        std::tie(key, value) = split::pair(line, '=');
        if (split::trim(key) != "XDG_DESKTOP_DIR") {
            continue;
        }

        value = split::trim(value);
        if ((value.size() >= 2) && (value.front() == '"') && (value.back() == '"')) {
            value = value.substr(1, value.size() - 2);
        }
        if (value.compare(0, 5, "$HOME") == 0) {
            value = homeDir + value.substr(5);
        } else if (value.compare(0, 7, "${HOME}") == 0) {
            value = homeDir + value.substr(7);
        }

        // only absolute paths are allowed, and $HOME alone means the desktop is disabled
        if (value.empty() || (value.front() != '/')) {
            return {};
        }
        while ((value.size() > 1) && (value.back() == '/')) {
            value.pop_back();
        }
        if (value == homeDir) {
            return {};
        }
        return value;
    }

    return {};
}

std::string
LinuxPlatform::desktopPath()
{
    auto const homeDir = getHomeDir();
    auto const configHome = getenvOrDefault(XDG_CONFIG_HOME_ENV_VAR, homeDir + "/.config");

    auto desktop = parseUserDirsDesktop(configHome + "/" APPBOOT_USER_DIRS_FILE, homeDir);
    if (desktop.empty()) {
        desktop = homeDir + "/Desktop";
    }

    writeLog("desktop directory: %s\n", desktop.c_str());
    return desktop;
}

std::string
LinuxPlatform::applicationsPath()
{
    auto const homeDir = getHomeDir();
    return getenvOrDefault(XDG_DATA_HOME_ENV_VAR, homeDir + "/.local/share") + "/applications";
}

bool
LinuxPlatform::isExecutable(std::string const& path)
{
    return fileHasPerms(path.c_str(), X_OK);
}

std::string
LinuxPlatform::findExecutable(std::string const& name)
{
    return searchPath(name, getenvOrDefault(PATH_ENV_VAR, "/usr/local/bin:/usr/bin:/bin"));
}

ExecStatus
LinuxPlatform::runCommand(std::vector<std::string> const& argv, unsigned long timeoutSecs)
{
    auto const managedArgv = ManagedArgv{argv};
    writeLog("run: %s (timeout %lus)\n", managedArgv.string().c_str(), timeoutSecs);

    auto const status = Execvp::run(managedArgv, timeoutSecs, [this](std::string const& line) {
        writeLog("  | %s\n", line.c_str());
    }, APPBOOT_KILL_GRACE_PERIOD);

    if (status.timedOut) {
        writeLog("run: %s timed out, exit status %d\n", argv[0].c_str(), status.exitStatus);
    } else {
        writeLog("run: %s exited with status %d\n", argv[0].c_str(), status.exitStatus);
    }
    return status;
}

void
LinuxPlatform::handOff(std::vector<std::string> const& argv, std::string const& workingDir, LaunchMode mode)
{
    auto const managedArgv = ManagedArgv{argv};
    writeLog("handoff (%s): %s in %s\n", toString(mode), managedArgv.string().c_str(), workingDir.c_str());

    switch (mode) {
        case LaunchMode::Spawn:
            Execvp::spawnDetached(managedArgv, workingDir);
            return;
        case LaunchMode::Exec:
            Execvp::replace(managedArgv, workingDir);
    }
}

void
LinuxPlatform::showMessage(std::string const& title, std::string const& message)
{
    fprintf(stderr, "%s: %s\n", title.c_str(), message.c_str());
    writeLog("message: %s: %s\n", title.c_str(), message.c_str());

    // a launcher started from a desktop entry has nowhere visible to print to
    auto const haveDisplay = ::getenv(DISPLAY_ENV_VAR) || ::getenv(WAYLAND_DISPLAY_ENV_VAR);
    if (!haveDisplay || isatty(STDERR_FILENO)) {
        return;
    }

    auto const dialogTool = findExecutable(APPBOOT_DIALOG_TOOL);
    if (dialogTool.empty()) {
        return;
    }

    auto const dialogArgv = ManagedArgv
        { dialogTool
        , "--error"
        , "--no-markup"
        , "--title=" + title
        , "--text=" + message
        };
    try {
        auto const status = Execvp::run(dialogArgv, 0, nullptr);
        if (status.exitStatus == Execvp::ExecFailed) {
            writeLog("message: %s could not be started\n", dialogTool.c_str());
        }
    } catch (std::exception const& ex) {
        writeLog("message: dialog failed: %s\n", ex.what());
    }
}

} /* namespace appboot */
