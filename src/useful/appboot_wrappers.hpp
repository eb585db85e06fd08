/******************************************************************************\
 * appboot_wrappers.hpp - Wrappers for C-style allocation, file and error handling routines
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

#include "appboot_defs.h"

#include <errno.h>
#include <fcntl.h>
#include <libgen.h>
#include <limits.h>
#include <pwd.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "useful/appboot_split.hpp"

namespace appboot {

// Return value of environment variable, or default string if unset or empty
inline static std::string getenvOrDefault(char const* env_var, std::string const& default_value)
{
    if (char const* env_value = ::getenv(env_var)) {
        if (env_value[0] != '\0') {
            return env_value;
        }
    }
    return default_value;
}

/* cstring wrappers, the libc versions may modify their argument */
namespace cstr {
    static inline std::vector<char> writableCopy(std::string const& str) {
        return std::vector<char>(str.c_str(), str.c_str() + str.size() + 1);
    }

    static inline std::string mkdtemp(std::string const& pathTemplate) {
        auto buf = writableCopy(pathTemplate);
        if (::mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed on " + pathTemplate + ": " + strerror(errno));
        }
        return std::string{buf.data()};
    }

    static inline std::string basename(std::string const& path) {
        auto buf = writableCopy(path);
        return std::string{::basename(buf.data())};
    }

    static inline std::string dirname(std::string const& path) {
        auto buf = writableCopy(path);
        return std::string{::dirname(buf.data())};
    }

    static inline std::string getcwd() {
        char buf[PATH_MAX + 1];
        if (::getcwd(buf, sizeof(buf)) == nullptr) {
            throw std::runtime_error("getcwd failed: " + std::string{strerror(errno)});
        }
        return std::string{buf};
    }

    static inline std::string readlink(std::string const& path) {
        char buf[PATH_MAX + 1];
        auto const len = ::readlink(path.c_str(), buf, PATH_MAX);
        if (len < 0) {
            throw std::runtime_error("readlink " + path + " failed: " + strerror(errno));
        }
        return std::string(buf, len);
    }
} /* namespace appboot::cstr */

/*
** Owns a file descriptor and closes it on destruction.
*/
class fd_handle {
private:
    int m_fd;

public:
    fd_handle()
        : m_fd{-1}
    {}

    explicit fd_handle(int fd)
        : m_fd{fd}
    {
        if (m_fd < 0) {
            throw std::runtime_error("invalid file descriptor");
        }
    }

    fd_handle(fd_handle const&) = delete;
    fd_handle& operator=(fd_handle const&) = delete;

    fd_handle(fd_handle&& moved)
        : m_fd{moved.release()}
    {}

    fd_handle& operator=(fd_handle&& moved)
    {
        reset(moved.release());
        return *this;
    }

    ~fd_handle() { reset(); }

    int fd() const { return m_fd; }

    int release()
    {
        auto const fd = m_fd;
        m_fd = -1;
        return fd;
    }

    void reset(int fd = -1)
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
        m_fd = fd;
    }
};

namespace file {
    // write contents to a temporary sibling of path, then rename it into place
    static inline void writeAtomic(std::string const& path, std::string const& contents, mode_t mode)
    {
        auto const tempPath = path + ".tmp." + std::to_string(::getpid());
        auto fail = [&tempPath](std::string const& what) {
            auto const message = what + " " + tempPath + " failed: " + strerror(errno);
            ::unlink(tempPath.c_str());
            throw std::runtime_error(message);
        };

        { auto const rawFd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
            if (rawFd < 0) {
                throw std::runtime_error("open " + tempPath + " failed: " + strerror(errno));
            }
            auto const tempFd = fd_handle{rawFd};

            auto remaining = contents.size();
            auto data = contents.data();
            while (remaining > 0) {
                auto const written = ::write(tempFd.fd(), data, remaining);
                if (written < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    fail("write");
                }
                data += written;
                remaining -= written;
            }

            // the creation mode is filtered by umask
            if (::fchmod(tempFd.fd(), mode)) {
                fail("chmod");
            }
            if (::fsync(tempFd.fd())) {
                fail("fsync");
            }
        }

        if (::rename(tempPath.c_str(), path.c_str())) {
            fail("rename to " + path + " of");
        }
    }
} /* namespace appboot::file */

// Test if a path exists (any type)
static inline bool
pathExists(std::string const& path)
{
    struct stat st;
    return !path.empty() && !stat(path.c_str(), &st);
}

// Test that a path is of the given type (S_IFDIR, S_IFREG) and accessible with perms
static inline bool
hasTypeAndPerms(char const* path, mode_t const type, int const perms)
{
    struct stat st;
    return (path != nullptr)
        && !stat(path, &st)
        && ((st.st_mode & S_IFMT) == type)
        && !access(path, perms);
}

static inline bool
dirHasPerms(char const* dirPath, int const perms)
{
    return hasTypeAndPerms(dirPath, S_IFDIR, perms);
}

static inline bool
fileHasPerms(char const* filePath, int const perms)
{
    return hasTypeAndPerms(filePath, S_IFREG, perms);
}

// First executable regular file named fileName in a colon separated directory list,
// or empty. Names containing a slash are checked as given.
static inline std::string
searchPath(std::string const& fileName, std::string const& searchPath)
{
    if (fileName.empty()) {
        return {};
    }
    if (fileName.find('/') != std::string::npos) {
        return fileHasPerms(fileName.c_str(), X_OK) ? fileName : std::string{};
    }

    for (auto&& dir : split::list(searchPath, ':')) {
        // empty element means the current directory
        auto const candidate = (dir.empty() ? std::string{"."} : dir) + "/" + fileName;
        if (fileHasPerms(candidate.c_str(), X_OK)) {
            return candidate;
        }
    }

    return {};
}

// as searchPath over $PATH, throwing when nothing is found
static inline std::string
findPath(std::string const& fileName)
{
    auto const fullPath = searchPath(fileName, getenvOrDefault(PATH_ENV_VAR, "/usr/local/bin:/usr/bin:/bin"));
    if (fullPath.empty()) {
        throw std::runtime_error(fileName + ": Could not locate in PATH.");
    }
    return fullPath;
}

// Home directory from the environment, falling back to the password database
static inline std::string
getHomeDir()
{
    if (auto const home = ::getenv(HOME_ENV_VAR)) {
        if (home[0] != '\0') {
            return std::string{home};
        }
    }

    struct passwd pwd;
    struct passwd *result = nullptr;
    char buf[4096];
    if (getpwuid_r(getuid(), &pwd, buf, sizeof(buf), &result) || (result == nullptr)) {
        throw std::runtime_error("could not determine home directory of uid " + std::to_string(getuid()));
    }
    return std::string{pwd.pw_dir};
}

} /* namespace appboot */
