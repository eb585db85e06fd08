/******************************************************************************\
 * appboot_argv_defs.hpp - Command line option tables for the launcher tools
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

#include "useful/appboot_argv.hpp"

struct LauncherArgv : public appboot::Argv {
    using Option    = appboot::Argv::Option;
    using Parameter = appboot::Argv::Parameter;

    static constexpr Option NoSetup { "no-setup", 'n' };
    static constexpr Option Debug   { "debug",    'd' };
    static constexpr Option Version { "version",   1  };
    static constexpr Option Help    { "help",     'h' };

    static constexpr Parameter InstallRoot    { "root",     'r' };
    static constexpr Parameter EnvironmentDir { "env",      'e' };
    static constexpr Parameter Manifest       { "manifest", 'm' };
    static constexpr Parameter Entry          { "entry",    'E' };
    static constexpr Parameter Policy         { "policy",   'p' };
    static constexpr Parameter Mode           { "mode",     'M' };
    static constexpr Parameter LogDir         { "log-dir",   2  };

    static constexpr GNUOption long_options[] = {
        NoSetup,
        Debug,
        Version,
        Help,
        InstallRoot,
        EnvironmentDir,
        Manifest,
        Entry,
        Policy,
        Mode,
        LogDir,
        long_options_done
    };
};

struct ShortcutArgv : public appboot::Argv {
    using Option    = appboot::Argv::Option;
    using Parameter = appboot::Argv::Parameter;

    static constexpr Option Debug { "debug", 'd' };
    static constexpr Option Help  { "help",  'h' };

    static constexpr Parameter Target      { "target", 't' };
    static constexpr Parameter InstallRoot { "root",   'r' };
    static constexpr Parameter Icon        { "icon",   'i' };
    static constexpr Parameter Name        { "name",   'N' };
    static constexpr Parameter LogDir      { "log-dir", 1  };

    static constexpr GNUOption long_options[] = {
        Debug,
        Help,
        Target,
        InstallRoot,
        Icon,
        Name,
        LogDir,
        long_options_done
    };
};
