/******************************************************************************\
 * LaunchConfig.hpp - Launcher configuration built once at start-up
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

namespace appboot {

// what to do when installing the dependency manifest fails
enum class DependencyPolicy
    { BestEffort // log, publish the environment anyway
    , FailFast   // fail this launch, repair on the next one
};

// how control is handed to the target program
enum class LaunchMode
    { Spawn // detached child, launcher exits 0
    , Exec  // launcher process is replaced by the target
};

/*
** Every path the launcher touches, plus its behavior switches. Built once from
** defaults < appboot.json < environment < command line, then passed to every
** component by reference.
*/
struct LaunchConfig {
    std::string installRoot;
    std::string environmentDir;
    std::string manifestPath;
    std::string entryPath;
    std::string iconPath;
    std::string lockPath;

    // shortcut presentation
    std::string displayName;
    std::string comment;

    bool             autoSetup;
    DependencyPolicy dependencyPolicy;
    LaunchMode       launchMode;

    bool        debug;
    std::string logDir;

    // seconds, 0 disables
    unsigned long envCreateTimeout;
    unsigned long dependencyTimeout;
    unsigned long lockTimeout;

    // forwarded to the target after the entry file
    std::vector<std::string> targetArgs;

    // defaults relative to installRoot
    static LaunchConfig defaults(std::string const& installRoot);

    // overlay settings from a JSON config file. a missing file is not an error.
    void applyFile(std::string const& path);

    // overlay APPBOOT_* environment variable settings
    void applyEnvironment();

    // make every relative path absolute against installRoot
    void resolvePaths();
};

DependencyPolicy parseDependencyPolicy(std::string const& value);
char const* toString(DependencyPolicy policy);

LaunchMode parseLaunchMode(std::string const& value);
char const* toString(LaunchMode mode);

bool parseFlag(std::string const& value);

// whole seconds, zero or more
unsigned long parseTimeout(std::string const& value);

// defaults, then <installRoot>/appboot.json, then the environment
LaunchConfig loadLaunchConfig(std::string const& installRoot);

} /* namespace appboot */
