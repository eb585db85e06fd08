/******************************************************************************\
 * appboot_iface.cpp - C interface to the bootstrap launcher
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
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <optional>

#include "launcher/appboot_iface.hpp"
#include "launcher/EnvironmentProvisioner.hpp"
#include "launcher/LaunchOrchestrator.hpp"
#include "launcher/Platform.hpp"
#include "launcher/ShortcutInstaller.hpp"

#include "useful/appboot_log.h"
#include "useful/appboot_wrappers.hpp"

#define DEFAULT_ERR_STR "Unknown appboot error"

namespace appboot {

char *      Launcher_iface::_appboot_err_str = nullptr;
std::string Launcher_iface::m_err_str = DEFAULT_ERR_STR;
std::map<appboot_attr_type_t, std::string> Launcher_iface::m_attributes;

/*********************
** internal functions
*********************/

void
Launcher_iface::set_error_str(std::string str)
{
    m_err_str = std::move(str);
}

// Note that we want to leak by design! Do not free the buffer!
// Since we pass this out via the c interface, we cannot safely
// reclaim the space.
const char *
Launcher_iface::get_error_str()
{
    if (_appboot_err_str == nullptr) {
        // Allocate space for the external string
        _appboot_err_str = (char *)std::malloc(APPBOOT_ERR_STR_SIZE);
        memset(_appboot_err_str, '\0', APPBOOT_ERR_STR_SIZE);
    }
    // Copy the internal error string to the external buffer
    strncpy(_appboot_err_str, m_err_str.c_str(), APPBOOT_ERR_STR_SIZE);
    // Enforce null termination
    _appboot_err_str[APPBOOT_ERR_STR_SIZE - 1] = '\0';
    return const_cast<const char *>(_appboot_err_str);
}

void
Launcher_iface::setAttribute(appboot_attr_type_t attrib, std::string const& value)
{
    switch (attrib) {
        case APPBOOT_ATTR_AUTO_SETUP:
        case APPBOOT_DEBUG:
            parseFlag(value);
            break;
        case APPBOOT_ATTR_DEPENDENCY_POLICY:
            parseDependencyPolicy(value);
            break;
        case APPBOOT_ATTR_LAUNCH_MODE:
            parseLaunchMode(value);
            break;
        case APPBOOT_LOG_DIR:
            if (!dirHasPerms(value.c_str(), R_OK | W_OK | X_OK)) {
                throw std::runtime_error("APPBOOT_LOG_DIR: Bad directory specified by value " + value);
            }
            break;
        case APPBOOT_ATTR_ENV_DIR:
        case APPBOOT_ATTR_MANIFEST:
        case APPBOOT_ATTR_ENTRY:
        case APPBOOT_ATTR_ICON:
        case APPBOOT_ATTR_NAME:
            if (value.empty()) {
                throw std::runtime_error("empty value for attribute " + std::to_string(attrib));
            }
            break;
        default:
            throw std::runtime_error("Invalid appboot_attr_type_t " + std::to_string((int)attrib));
    }
    m_attributes[attrib] = value;
}

void
Launcher_iface::resetAttributes()
{
    m_attributes.clear();
}

LaunchConfig
Launcher_iface::makeConfig(char const* installRoot)
{
    auto const root = ((installRoot != nullptr) && (installRoot[0] != '\0'))
        ? std::string{installRoot}
        : getenvOrDefault(APPBOOT_INSTALL_ROOT_ENV_VAR, cstr::getcwd());

    auto config = loadLaunchConfig(root);

    for (auto&& [attrib, value] : m_attributes) {
        switch (attrib) {
            case APPBOOT_ATTR_ENV_DIR:           config.environmentDir   = value;                        break;
            case APPBOOT_ATTR_MANIFEST:          config.manifestPath     = value;                        break;
            case APPBOOT_ATTR_ENTRY:             config.entryPath        = value;                        break;
            case APPBOOT_ATTR_ICON:              config.iconPath         = value;                        break;
            case APPBOOT_ATTR_NAME:              config.displayName      = value;                        break;
            case APPBOOT_ATTR_AUTO_SETUP:        config.autoSetup        = parseFlag(value);             break;
            case APPBOOT_ATTR_DEPENDENCY_POLICY: config.dependencyPolicy = parseDependencyPolicy(value); break;
            case APPBOOT_ATTR_LAUNCH_MODE:       config.launchMode       = parseLaunchMode(value);       break;
            case APPBOOT_DEBUG:                  config.debug            = parseFlag(value);             break;
            case APPBOOT_LOG_DIR:                config.logDir           = value;                        break;
        }
    }

    config.resolvePaths();
    return config;
}

static std::vector<std::string>
collectArgs(const char * const args[])
{
    auto result = std::vector<std::string>{};
    if (args != nullptr) {
        for (auto arg = args; *arg != nullptr; arg++) {
            result.emplace_back(*arg);
        }
    }
    return result;
}

static appboot_bootstrap_t
toC(BootstrapResult const& result)
{
    auto cResult = appboot_bootstrap_t{};

    switch (result.status) {
        case BootstrapStatus::AlreadyPresent:      cResult.status = APPBOOT_BOOTSTRAP_ALREADY_PRESENT;       break;
        case BootstrapStatus::CreatedAndPopulated: cResult.status = APPBOOT_BOOTSTRAP_CREATED_AND_POPULATED; break;
        case BootstrapStatus::Failed:              cResult.status = APPBOOT_BOOTSTRAP_FAILED;                break;
    }
    switch (result.error) {
        case BootstrapError::None:                      cResult.error = APPBOOT_BOOTSTRAP_ERROR_NONE;                      break;
        case BootstrapError::NoBaseRuntime:             cResult.error = APPBOOT_BOOTSTRAP_ERROR_NO_BASE_RUNTIME;           break;
        case BootstrapError::EnvironmentCreationFailed: cResult.error = APPBOOT_BOOTSTRAP_ERROR_ENV_CREATION_FAILED;       break;
        case BootstrapError::DependencyInstallFailed:   cResult.error = APPBOOT_BOOTSTRAP_ERROR_DEPENDENCY_INSTALL_FAILED; break;
    }
    switch (result.dependencies) {
        case DependencyOutcome::NotAttempted:      cResult.dependencies = APPBOOT_DEPENDENCIES_NOT_ATTEMPTED;       break;
        case DependencyOutcome::Installed:         cResult.dependencies = APPBOOT_DEPENDENCIES_INSTALLED;           break;
        case DependencyOutcome::SkippedNoManifest: cResult.dependencies = APPBOOT_DEPENDENCIES_SKIPPED_NO_MANIFEST; break;
        case DependencyOutcome::Failed:            cResult.dependencies = APPBOOT_DEPENDENCIES_FAILED;              break;
    }
    cResult.repaired = result.repaired ? 1 : 0;

    return cResult;
}

} /* namespace appboot */

using appboot::Launcher_iface;

/************************
* API function calls
************************/

const char *
appboot_version(void) {
    return APPBOOT_VERSION;
}

const char *
appboot_error_str(void) {
    return Launcher_iface::get_error_str();
}

int
appboot_error_str_r(char *buf, size_t buf_len) {
    if (buf_len < 1) {
        return ERANGE;
    }

    // fill buf from error string
    auto const error_str = Launcher_iface::get_error_str();
    std::strncpy(buf, error_str, buf_len - 1);
    buf[buf_len - 1] = '\0';

    return 0;
}

int
appboot_setAttribute(appboot_attr_type_t attrib, const char *value)
{
    return Launcher_iface::runSafely(__func__, [&](){
        if (value == nullptr) {
            throw std::runtime_error("NULL pointer pass as value argument.");
        }
        Launcher_iface::setAttribute(attrib, value);
        return Launcher_iface::SUCCESS;
    }, Launcher_iface::FAILURE);
}

void
appboot_resetAttributes(void)
{
    Launcher_iface::resetAttributes();
}

int
appboot_launch(const char *install_root, const char * const target_args[])
{
    return Launcher_iface::runSafely(__func__, [&](){
        auto config = Launcher_iface::makeConfig(install_root);
        config.targetArgs = appboot::collectArgs(target_args);

        auto logger = appboot::Logger{config.debug, config.logDir, "appboot-launch", getpid()};
        auto const platform = appboot::Platform::make(logger);

        // failures past this point have already been reported to the user
        auto orchestrator = appboot::LaunchOrchestrator{*platform, config};
        return orchestrator.run();
    }, (int)APPBOOT_EXIT_USAGE);
}

int
appboot_ensureEnvironment(const char *install_root, appboot_bootstrap_t *result)
{
    return Launcher_iface::runSafely(__func__, [&](){
        auto const config = Launcher_iface::makeConfig(install_root);

        auto logger = appboot::Logger{config.debug, config.logDir, "appboot-launch", getpid()};
        auto const platform = appboot::Platform::make(logger);

        auto provisioner = appboot::EnvironmentProvisioner{*platform, config};
        auto const bootstrap = provisioner.ensure(config.environmentDir, config.manifestPath);
        if (result != nullptr) {
            *result = appboot::toC(bootstrap);
        }
        if (bootstrap.failed()) {
            throw std::runtime_error(bootstrap.message);
        }
        return Launcher_iface::SUCCESS;
    }, Launcher_iface::FAILURE);
}

int
appboot_installShortcut(const char *target, const char *install_root, const char * const target_args[])
{
    return Launcher_iface::runSafely(__func__, [&](){
        if (target == nullptr) {
            throw std::runtime_error("NULL pointer pass as target argument.");
        }
        auto const config = Launcher_iface::makeConfig(install_root);

        auto logger = appboot::Logger{config.debug, config.logDir, "appboot-shortcut", getpid()};
        auto const platform = appboot::Platform::make(logger);

        auto const iconPath = config.iconPath.empty()
            ? std::nullopt
            : std::make_optional(config.iconPath);

        auto installer = appboot::ShortcutInstaller{*platform, config};
        try {
            installer.install(target, config.installRoot, iconPath, appboot::collectArgs(target_args));
        } catch (std::exception const& ex) {
            platform->showMessage(config.displayName, std::string{"Failed to create shortcuts: "} + ex.what());
            throw;
        }
        return Launcher_iface::SUCCESS;
    }, Launcher_iface::FAILURE);
}
