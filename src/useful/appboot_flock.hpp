/******************************************************************************\
 * appboot_flock.hpp - RAII exclusive advisory file lock
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

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <sys/file.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "useful/appboot_wrappers.hpp"

namespace appboot {

/*
** Holds an flock(LOCK_EX) on a lock file for its lifetime. The lock file itself is
** left in place; the kernel drops the lock if the holder dies.
*/
class file_lock {
private:
    std::string m_path;
    fd_handle   m_fd;

public:
    // block until the lock is held or timeoutSecs elapse (0 waits forever)
    file_lock(std::string const& path, unsigned long timeoutSecs)
        : m_path{path}
        , m_fd{}
    {
        auto const rawFd = ::open(m_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
        if (rawFd < 0) {
            throw std::runtime_error("open lock file " + m_path + " failed: " + strerror(errno));
        }
        m_fd = fd_handle{rawFd};

        if (timeoutSecs == 0) {
            while (::flock(m_fd.fd(), LOCK_EX)) {
                if (errno != EINTR) {
                    throw std::runtime_error("flock " + m_path + " failed: " + strerror(errno));
                }
            }
            return;
        }

        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds{timeoutSecs};
        while (::flock(m_fd.fd(), LOCK_EX | LOCK_NB)) {
            if ((errno != EWOULDBLOCK) && (errno != EINTR)) {
                throw std::runtime_error("flock " + m_path + " failed: " + strerror(errno));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                throw std::runtime_error("timed out after " + std::to_string(timeoutSecs)
                    + "s waiting for lock " + m_path);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
    }

    ~file_lock()
    {
        if (m_fd.fd() >= 0) {
            ::flock(m_fd.fd(), LOCK_UN);
        }
    }

    file_lock(file_lock const&) = delete;
    file_lock& operator=(file_lock const&) = delete;

    std::string const& path() const { return m_path; }
};

} /* namespace appboot */
