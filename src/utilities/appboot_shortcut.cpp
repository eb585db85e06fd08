/******************************************************************************\
 * appboot_shortcut.cpp - Operator tool that creates desktop and application menu shortcuts
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
#include <unistd.h>

#include <string>
#include <tuple>
#include <vector>

#include "appboot_defs.h"
#include "appboot.h"
#include "appboot_argv_defs.hpp"

#include "useful/appboot_wrappers.hpp"

#define APPBOOT_LAUNCH_BINARY "appboot-launch"

static void
usage(char *name)
{
    fprintf(stdout, "Usage: %s [OPTIONS]...\n", name);
    fprintf(stdout, "Create desktop and application menu shortcuts for an application\n\n");

    fprintf(stdout, "\t-%c, --%s    Program the shortcut runs (default: " APPBOOT_LAUNCH_BINARY " for the install root)\n",
        ShortcutArgv::Target.val, ShortcutArgv::Target.name);
    fprintf(stdout, "\t-%c, --%s      Install root, used as working directory (default: $APPBOOT_INSTALL_ROOT or .)\n",
        ShortcutArgv::InstallRoot.val, ShortcutArgv::InstallRoot.name);
    fprintf(stdout, "\t-%c, --%s      Icon file, falls back to the target when missing\n",
        ShortcutArgv::Icon.val, ShortcutArgv::Icon.name);
    fprintf(stdout, "\t-%c, --%s      Display name of the shortcut\n",
        ShortcutArgv::Name.val, ShortcutArgv::Name.name);
    fprintf(stdout, "\t-%c, --%s     Write a debug log\n",
        ShortcutArgv::Debug.val, ShortcutArgv::Debug.name);
    fprintf(stdout, "\t    --%s  Directory for the debug log\n",
        ShortcutArgv::LogDir.name);
    fprintf(stdout, "\t-%c, --%s      Display this text and exit\n\n",
        ShortcutArgv::Help.val, ShortcutArgv::Help.name);
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

// launcher installed beside this tool, else the first one on PATH
static std::string
defaultTarget()
{
    try {
        auto const selfDir = appboot::cstr::dirname(appboot::cstr::readlink("/proc/self/exe"));
        auto const sibling = selfDir + "/" APPBOOT_LAUNCH_BINARY;
        if (appboot::fileHasPerms(sibling.c_str(), X_OK)) {
            return sibling;
        }
    } catch (std::exception const& ex) {
        fprintf(stderr, "warning: %s\n", ex.what());
    }
    return appboot::findPath(APPBOOT_LAUNCH_BINARY);
}

int
main(int argc, char *argv[])
{
    auto target = std::string{};
    auto installRoot = std::string{};

    { auto incomingArgv = appboot::IncomingArgv<ShortcutArgv>{argc, argv};
        int c; std::string optarg;
        auto valid = true;
        while (valid) {
            std::tie(c, optarg) = incomingArgv.get_next();
            if (c < 0) {
                break;
            }

            switch (c) {

            case ShortcutArgv::Target.val:
                target = optarg;
                break;

            case ShortcutArgv::InstallRoot.val:
                installRoot = optarg;
                break;

            case ShortcutArgv::Icon.val:
                valid = setAttribute(APPBOOT_ATTR_ICON, optarg);
                break;

            case ShortcutArgv::Name.val:
                valid = setAttribute(APPBOOT_ATTR_NAME, optarg);
                break;

            case ShortcutArgv::Debug.val:
                valid = setAttribute(APPBOOT_DEBUG, "1");
                break;

            case ShortcutArgv::LogDir.val:
                valid = setAttribute(APPBOOT_LOG_DIR, optarg);
                break;

            case ShortcutArgv::Help.val:
                usage(argv[0]);
                return 0;

            case '?':
            default:
                usage(argv[0]);
                return 1;

            }
        }
        if (!valid) {
            return 1;
        }
        if (!incomingArgv.get_rest().empty()) {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        // the shortcut must not depend on the directory the desktop starts it from
        if (installRoot.empty()) {
            installRoot = appboot::getenvOrDefault(APPBOOT_INSTALL_ROOT_ENV_VAR, appboot::cstr::getcwd());
        }
        if (installRoot.front() != '/') {
            installRoot = appboot::cstr::getcwd() + "/" + installRoot;
        }

        auto targetArgs = std::vector<char const*>{};
        if (target.empty()) {
            target = defaultTarget();
            targetArgs.push_back("--root");
            targetArgs.push_back(installRoot.c_str());
        }
        targetArgs.push_back(nullptr);

        // failures are shown to the user by the installer
        if (appboot_installShortcut(target.c_str(), installRoot.c_str(), targetArgs.data())) {
            fprintf(stderr, "%s\n", appboot_error_str());
            return 1;
        }

    } catch (std::exception const& ex) {
        fprintf(stderr, "%s: %s\n", argv[0], ex.what());
        return 1;
    }

    fprintf(stdout, "Shortcuts created for %s\n", installRoot.c_str());
    return 0;
}
