/******************************************************************************\
 * ShortcutInstaller.hpp - Desktop and application menu shortcut creation
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

#include <optional>
#include <string>
#include <vector>

#include "launcher/LaunchConfig.hpp"

namespace appboot {

class Platform;

/*
** Writes one launcher entry to the user's desktop and one to the application
** menu. Re-running replaces both files; each is written to a temporary file
** and renamed into place, so a reader never sees a partial entry.
*/
class ShortcutInstaller {
private:
    Platform&           m_platform;
    LaunchConfig const& m_config;

public:
    ShortcutInstaller(Platform& platform, LaunchConfig const& config)
        : m_platform{platform}
        , m_config{config}
    {}

    // returns the paths written, desktop entry first
    std::vector<std::string> install(std::string const& targetPath, std::string const& workingDir,
        std::optional<std::string> const& iconPath, std::vector<std::string> const& targetArgs = {});

    std::string renderDesktopEntry(std::string const& targetPath, std::string const& workingDir,
        std::string const& icon, std::vector<std::string> const& targetArgs) const;

    // file name shared by both copies, derived from the display name
    std::string entryFileName() const;

    // quoting rules for an argument of the Exec key
    static std::string quoteExecArgument(std::string const& arg);

    // escapes for a desktop entry string value
    static std::string escapeValue(std::string const& value);
};

} /* namespace appboot */
