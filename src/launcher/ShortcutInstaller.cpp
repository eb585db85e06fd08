/******************************************************************************\
 * ShortcutInstaller.cpp - Desktop and application menu shortcut creation
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

#include <ctype.h>
#include <sys/stat.h>

#include <filesystem>
#include <sstream>

#include <boost/algorithm/string/replace.hpp>

#include "launcher/Platform.hpp"
#include "launcher/ShortcutInstaller.hpp"

#include "useful/appboot_wrappers.hpp"

namespace appboot {

// characters that force an Exec argument into double quotes
static constexpr auto execReservedChars = " \t\n\"'\\><~|&;$*?#()`";

std::string
ShortcutInstaller::escapeValue(std::string const& value)
{
    auto result = value;
    boost::algorithm::replace_all(result, "\\", "\\\\");
    boost::algorithm::replace_all(result, "\n", "\\n");
    boost::algorithm::replace_all(result, "\t", "\\t");
    boost::algorithm::replace_all(result, "\r", "\\r");
    return result;
}

std::string
ShortcutInstaller::quoteExecArgument(std::string const& arg)
{
    auto result = arg;

    if (result.empty() || (result.find_first_of(execReservedChars) != std::string::npos)) {
        // inside double quotes, backslash-escape the four characters the shell would still expand
        boost::algorithm::replace_all(result, "\\", "\\\\");
        boost::algorithm::replace_all(result, "\"", "\\\"");
        boost::algorithm::replace_all(result, "`", "\\`");
        boost::algorithm::replace_all(result, "$", "\\$");
        result = "\"" + result + "\"";
    }

    // field codes
    boost::algorithm::replace_all(result, "%", "%%");

    // Exec is itself a string value, so its backslashes are escaped a second time
    return escapeValue(result);
}

std::string
ShortcutInstaller::entryFileName() const
{
    auto result = std::string{};
    for (auto const c : m_config.displayName) {
        if (::isalnum(static_cast<unsigned char>(c))) {
            result.push_back(::tolower(static_cast<unsigned char>(c)));
        } else if (!result.empty() && (result.back() != '-')) {
            result.push_back('-');
        }
    }
    while (!result.empty() && (result.back() == '-')) {
        result.pop_back();
    }
    if (result.empty()) {
        result = "appboot-application";
    }
    return result + ".desktop";
}

std::string
ShortcutInstaller::renderDesktopEntry(std::string const& targetPath, std::string const& workingDir,
    std::string const& icon, std::vector<std::string> const& targetArgs) const
{
    auto exec = quoteExecArgument(targetPath);
    for (auto&& arg : targetArgs) {
        exec += " " + quoteExecArgument(arg);
    }

    auto entry = std::stringstream{};
    entry << "[Desktop Entry]\n"
          << "Type=Application\n"
          << "Version=1.0\n"
          << "Name=" << escapeValue(m_config.displayName) << "\n";
    if (!m_config.comment.empty()) {
        entry << "Comment=" << escapeValue(m_config.comment) << "\n";
    }
    entry << "Exec=" << exec << "\n"
          << "Path=" << escapeValue(workingDir) << "\n"
          << "Icon=" << escapeValue(icon) << "\n"
          << "Terminal=false\n"
          << "Categories=Utility;\n";

    return entry.str();
}

static void
ensureDirectory(std::string const& path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw std::runtime_error("failed to create directory " + path + ": " + ec.message());
    }
    if (!dirHasPerms(path.c_str(), W_OK | X_OK)) {
        throw std::runtime_error("directory " + path + " is not writable");
    }
}

std::vector<std::string>
ShortcutInstaller::install(std::string const& targetPath, std::string const& workingDir,
    std::optional<std::string> const& iconPath, std::vector<std::string> const& targetArgs)
{
    if (m_platform.shortcutFormat() != ShortcutFormat::DesktopEntry) {
        throw std::runtime_error(std::string{"unsupported shortcut format for platform "} + m_platform.name());
    }

    if (targetPath.empty()) {
        throw std::runtime_error("no shortcut target given");
    }

    // a relative Exec path would resolve against whatever directory the desktop uses
    auto target = targetPath;
    if ((target.find('/') != std::string::npos) && (target.front() != '/')) {
        target = cstr::getcwd() + "/" + target;
    }

    // Icon falls back to the target itself
    auto icon = target;
    if (iconPath && pathExists(*iconPath)) {
        icon = *iconPath;
    } else if (iconPath) {
        m_platform.writeLog("shortcut: icon %s not found, using %s\n", iconPath->c_str(), target.c_str());
    }

    auto const desktopDir = m_platform.desktopPath();
    if (desktopDir.empty()) {
        throw std::runtime_error("could not determine the desktop directory");
    }
    auto const applicationsDir = m_platform.applicationsPath();
    if (applicationsDir.empty()) {
        throw std::runtime_error("could not determine the application menu directory");
    }

    auto const contents = renderDesktopEntry(target, workingDir, icon, targetArgs);
    auto const fileName = entryFileName();

    auto result = std::vector<std::string>{};

    // Desktop copy must be executable to be trusted as a launcher
    ensureDirectory(desktopDir);
    result.push_back(desktopDir + "/" + fileName);
    file::writeAtomic(result.back(), contents, S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
    m_platform.writeLog("shortcut: wrote %s\n", result.back().c_str());

    ensureDirectory(applicationsDir);
    result.push_back(applicationsDir + "/" + fileName);
    file::writeAtomic(result.back(), contents, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    m_platform.writeLog("shortcut: wrote %s\n", result.back().c_str());

    return result;
}

} /* namespace appboot */
