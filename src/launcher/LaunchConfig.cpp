/******************************************************************************\
 * LaunchConfig.cpp - Launcher configuration loading
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

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "launcher/LaunchConfig.hpp"
#include "useful/appboot_wrappers.hpp"

namespace appboot {

static std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return str;
}

DependencyPolicy
parseDependencyPolicy(std::string const& value)
{
    auto const setting = toLower(value);
    if ((setting == "best-effort") || (setting == "besteffort")) {
        return DependencyPolicy::BestEffort;
    } else if ((setting == "fail-fast") || (setting == "failfast")) {
        return DependencyPolicy::FailFast;
    }
    throw std::runtime_error("invalid dependency policy '" + value + "' (expected best-effort or fail-fast)");
}

char const*
toString(DependencyPolicy policy)
{
    switch (policy) {
        case DependencyPolicy::BestEffort: return "best-effort";
        case DependencyPolicy::FailFast:   return "fail-fast";
    }
    return "unknown";
}

LaunchMode
parseLaunchMode(std::string const& value)
{
    auto const setting = toLower(value);
    if (setting == "spawn") {
        return LaunchMode::Spawn;
    } else if (setting == "exec") {
        return LaunchMode::Exec;
    }
    throw std::runtime_error("invalid launch mode '" + value + "' (expected spawn or exec)");
}

char const*
toString(LaunchMode mode)
{
    switch (mode) {
        case LaunchMode::Spawn: return "spawn";
        case LaunchMode::Exec:  return "exec";
    }
    return "unknown";
}

bool
parseFlag(std::string const& value)
{
    auto const setting = toLower(value);
    if ((setting == "1") || (setting == "true") || (setting == "yes") || (setting == "on")) {
        return true;
    } else if ((setting == "0") || (setting == "false") || (setting == "no") || (setting == "off")) {
        return false;
    }
    throw std::runtime_error("invalid boolean setting '" + value + "'");
}

unsigned long
parseTimeout(std::string const& value)
{
    auto end = size_t{0};
    auto seconds = (long long)-1;
    try {
        seconds = std::stoll(value, &end);
    } catch (std::logic_error const&) {
        end = 0;
    }
    if ((end == 0) || (end != value.size())) {
        throw std::runtime_error("invalid timeout '" + value + "'");
    }
    if (seconds < 0) {
        throw std::runtime_error("timeout '" + value + "' must not be negative");
    }
    return static_cast<unsigned long>(seconds);
}

LaunchConfig
LaunchConfig::defaults(std::string const& installRoot)
{
    auto config = LaunchConfig{};

    config.installRoot    = installRoot;
    config.environmentDir = APPBOOT_DEFAULT_ENV_DIR;
    config.manifestPath   = APPBOOT_DEFAULT_MANIFEST;
    config.entryPath      = APPBOOT_DEFAULT_ENTRY;
    config.iconPath       = APPBOOT_DEFAULT_ICON;
    config.lockPath       = APPBOOT_LOCK_FILE;

    config.displayName = APPBOOT_DEFAULT_NAME;
    config.comment     = {};

    config.autoSetup        = true;
    config.dependencyPolicy = DependencyPolicy::BestEffort;
    config.launchMode       = LaunchMode::Spawn;

    config.debug  = false;
    config.logDir = {};

    config.envCreateTimeout  = APPBOOT_DEFAULT_ENV_TIMEOUT;
    config.dependencyTimeout = APPBOOT_DEFAULT_DEPS_TIMEOUT;
    config.lockTimeout       = APPBOOT_DEFAULT_LOCK_TIMEOUT;

    return config;
}

void
LaunchConfig::applyFile(std::string const& path)
{
    if (!pathExists(path)) {
        return;
    }

    auto root = boost::property_tree::ptree{};
    try {
        boost::property_tree::read_json(path, root);
    } catch (boost::property_tree::json_parser_error const& ex) {
        throw std::runtime_error("failed to parse " + path + ": " + ex.what());
    }

    try {
        if (auto const value = root.get_optional<std::string>("name")) {
            displayName = *value;
        }
        if (auto const value = root.get_optional<std::string>("comment")) {
            comment = *value;
        }
        if (auto const value = root.get_optional<std::string>("entry")) {
            entryPath = *value;
        }
        if (auto const value = root.get_optional<std::string>("manifest")) {
            manifestPath = *value;
        }
        if (auto const value = root.get_optional<std::string>("environment")) {
            environmentDir = *value;
        }
        if (auto const value = root.get_optional<std::string>("icon")) {
            iconPath = *value;
        }
        if (auto const value = root.get_optional<std::string>("autoSetup")) {
            autoSetup = parseFlag(*value);
        }
        if (auto const value = root.get_optional<std::string>("dependencyPolicy")) {
            dependencyPolicy = parseDependencyPolicy(*value);
        }
        if (auto const value = root.get_optional<std::string>("launchMode")) {
            launchMode = parseLaunchMode(*value);
        }
        if (auto const value = root.get_optional<std::string>("debug")) {
            debug = parseFlag(*value);
        }
        if (auto const value = root.get_optional<std::string>("logDir")) {
            logDir = *value;
        }
        if (auto const value = root.get_optional<std::string>("timeouts.environment")) {
            envCreateTimeout = parseTimeout(*value);
        }
        if (auto const value = root.get_optional<std::string>("timeouts.dependencies")) {
            dependencyTimeout = parseTimeout(*value);
        }
        if (auto const value = root.get_optional<std::string>("timeouts.lock")) {
            lockTimeout = parseTimeout(*value);
        }
    } catch (boost::property_tree::ptree_error const& ex) {
        throw std::runtime_error("invalid setting in " + path + ": " + ex.what());
    } catch (std::runtime_error const& ex) {
        throw std::runtime_error("invalid setting in " + path + ": " + ex.what());
    }
}

void
LaunchConfig::applyEnvironment()
{
    if (auto const value = ::getenv(APPBOOT_ENV_DIR_ENV_VAR)) {
        environmentDir = value;
    }
    if (auto const value = ::getenv(APPBOOT_MANIFEST_ENV_VAR)) {
        manifestPath = value;
    }
    if (auto const value = ::getenv(APPBOOT_ENTRY_ENV_VAR)) {
        entryPath = value;
    }
    if (auto const value = ::getenv(APPBOOT_AUTO_SETUP_ENV_VAR)) {
        autoSetup = parseFlag(value);
    }
    if (auto const value = ::getenv(APPBOOT_DEP_POLICY_ENV_VAR)) {
        dependencyPolicy = parseDependencyPolicy(value);
    }
    if (auto const value = ::getenv(APPBOOT_LAUNCH_MODE_ENV_VAR)) {
        launchMode = parseLaunchMode(value);
    }
    // any setting of the debug variable enables logging
    if (::getenv(APPBOOT_DBG_ENV_VAR)) {
        debug = true;
    }
    if (auto const value = ::getenv(APPBOOT_LOG_DIR_ENV_VAR)) {
        logDir = value;
    }
}

void
LaunchConfig::resolvePaths()
{
    if (installRoot.empty()) {
        throw std::runtime_error("install root is not set");
    }

    // strip trailing slashes so joined paths stay canonical
    while ((installRoot.size() > 1) && (installRoot.back() == '/')) {
        installRoot.pop_back();
    }
    if (installRoot.front() != '/') {
        installRoot = cstr::getcwd() + "/" + installRoot;
    }

    auto resolve = [this](std::string& path) {
        if (!path.empty() && (path.front() != '/')) {
            path = installRoot + "/" + path;
        }
    };
    resolve(environmentDir);
    resolve(manifestPath);
    resolve(entryPath);
    resolve(iconPath);
    resolve(lockPath);

    if (environmentDir.empty() || entryPath.empty()) {
        throw std::runtime_error("environment directory and entry file must be set");
    }
}

LaunchConfig
loadLaunchConfig(std::string const& installRoot)
{
    auto config = LaunchConfig::defaults(installRoot);
    config.applyFile(installRoot + "/" + APPBOOT_CONFIG_FILE);
    config.applyEnvironment();
    return config;
}

} /* namespace appboot */
