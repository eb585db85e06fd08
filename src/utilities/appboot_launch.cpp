/******************************************************************************\
 * appboot_launch.cpp - Entry point that provisions the environment and starts the target program
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
#include <stdio.h>
#include <stdlib.h>

#include <string>
#include <tuple>
#include <vector>

#include "appboot.h"
#include "appboot_argv_defs.hpp"

static void
usage(char *name)
{
    fprintf(stdout, "Usage: %s [OPTIONS]... [-- TARGET_ARGS...]\n", name);
    fprintf(stdout, "Create the application's Python environment if needed, then start the application\n\n");

    fprintf(stdout, "\t-%c, --%s     Install root holding the application (default: $APPBOOT_INSTALL_ROOT or .)\n",
        LauncherArgv::InstallRoot.val, LauncherArgv::InstallRoot.name);
    fprintf(stdout, "\t-%c, --%s      Environment directory, relative to the install root\n",
        LauncherArgv::EnvironmentDir.val, LauncherArgv::EnvironmentDir.name);
    fprintf(stdout, "\t-%c, --%s Dependency manifest, relative to the install root\n",
        LauncherArgv::Manifest.val, LauncherArgv::Manifest.name);
    fprintf(stdout, "\t-%c, --%s    Entry file, relative to the install root\n",
        LauncherArgv::Entry.val, LauncherArgv::Entry.name);
    fprintf(stdout, "\t-%c, --%s   Dependency install failure policy: best-effort or fail-fast\n",
        LauncherArgv::Policy.val, LauncherArgv::Policy.name);
    fprintf(stdout, "\t-%c, --%s     Hand-off mode: spawn or exec\n",
        LauncherArgv::Mode.val, LauncherArgv::Mode.name);
    fprintf(stdout, "\t-%c, --%s Skip creating the environment\n",
        LauncherArgv::NoSetup.val, LauncherArgv::NoSetup.name);
    fprintf(stdout, "\t-%c, --%s    Write a debug log\n",
        LauncherArgv::Debug.val, LauncherArgv::Debug.name);
    fprintf(stdout, "\t    --%s  Directory for the debug log\n",
        LauncherArgv::LogDir.name);
    fprintf(stdout, "\t    --%s  Display the version and exit\n",
        LauncherArgv::Version.name);
    fprintf(stdout, "\t-%c, --%s     Display this text and exit\n\n",
        LauncherArgv::Help.val, LauncherArgv::Help.name);

    fprintf(stdout, "Exit status: 0 started, 1 usage or configuration error, 2 no Python to create the\n"
        "environment, 3 environment creation failed, 4 no Python to run the application,\n"
        "5 dependency install failed, 6 application failed to start, 7 entry file missing\n");
}

static bool
setAttribute(appboot_attr_type_t attrib, std::string const& value)
{
    if (appboot_setAttribute(attrib, value.c_str())) {
        fprintf(stderr, "%s\n", appboot_error_str());
        return false;
    }
    return true;
}

int
main(int argc, char *argv[])
{
    auto installRoot = std::string{};
    auto targetArgs = appboot::ManagedArgv{};

    // parse incoming argv, everything after the options goes to the target
    { auto incomingArgv = appboot::IncomingArgv<LauncherArgv>{argc, argv};
        int c; std::string optarg;
        auto valid = true;
        while (valid) {
            std::tie(c, optarg) = incomingArgv.get_next();
            if (c < 0) {
                break;
            }

            switch (c) {

            case LauncherArgv::InstallRoot.val:
                installRoot = optarg;
                break;

            case LauncherArgv::EnvironmentDir.val:
                valid = setAttribute(APPBOOT_ATTR_ENV_DIR, optarg);
                break;

            case LauncherArgv::Manifest.val:
                valid = setAttribute(APPBOOT_ATTR_MANIFEST, optarg);
                break;

            case LauncherArgv::Entry.val:
                valid = setAttribute(APPBOOT_ATTR_ENTRY, optarg);
                break;

            case LauncherArgv::Policy.val:
                valid = setAttribute(APPBOOT_ATTR_DEPENDENCY_POLICY, optarg);
                break;

            case LauncherArgv::Mode.val:
                valid = setAttribute(APPBOOT_ATTR_LAUNCH_MODE, optarg);
                break;

            case LauncherArgv::NoSetup.val:
                valid = setAttribute(APPBOOT_ATTR_AUTO_SETUP, "0");
                break;

            case LauncherArgv::Debug.val:
                valid = setAttribute(APPBOOT_DEBUG, "1");
                break;

            case LauncherArgv::LogDir.val:
                valid = setAttribute(APPBOOT_LOG_DIR, optarg);
                break;

            case LauncherArgv::Version.val:
                fprintf(stdout, "%s\n", appboot_version());
                return APPBOOT_EXIT_SUCCESS;

            case LauncherArgv::Help.val:
                usage(argv[0]);
                return APPBOOT_EXIT_SUCCESS;

            case '?':
            default:
                usage(argv[0]);
                return APPBOOT_EXIT_USAGE;

            }
        }
        if (!valid) {
            return APPBOOT_EXIT_USAGE;
        }

        targetArgs.add(incomingArgv.get_rest());
    }

    auto const rc = appboot_launch(installRoot.empty() ? nullptr : installRoot.c_str(), targetArgs.get());

    // every other failure was already reported to the user by the launcher
    if (rc == APPBOOT_EXIT_USAGE) {
        fprintf(stderr, "%s\n", appboot_error_str());
    }

    return rc;
}
