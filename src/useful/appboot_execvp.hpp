/******************************************************************************\
 * appboot_execvp.hpp - fork / execvp a program with a timeout, or hand off to it
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
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

#include "useful/appboot_argv.hpp"

namespace appboot {

class FdPair {
protected:
    enum Ends { ReadEnd = 0, WriteEnd = 1 };
    bool readOpened = false;
    bool writeOpened = false;

    int fds[2];

public:
    static const int stdin = 0;
    static const int stdout = 1;
    static const int stderr = 2;

    FdPair()
        : readOpened{false}
        , writeOpened{false}
        , fds{-1, -1}
    {}

    ~FdPair() {
        if (readOpened) {
            close(fds[ReadEnd]);
        }

        if (writeOpened) {
            close(fds[WriteEnd]);
        }
    }

    FdPair(FdPair const&) = delete;
    FdPair& operator=(FdPair const&) = delete;

    void closeRead() {
        if (!readOpened) {
            throw std::logic_error("Already closed read end");
        }

        close(fds[ReadEnd]);
        readOpened = false;
    }

    void closeWrite() {
        if (!writeOpened) {
            throw std::logic_error("Already closed write end");
        }

        close(fds[WriteEnd]);
        writeOpened = false;
    }

    int getReadFd() const { return fds[ReadEnd]; }
    int getWriteFd() const { return fds[WriteEnd]; }

    /* Pipe - create and track closed ends of pipe */
    void pipe(int flags = 0)
    {
        if (readOpened || writeOpened) {
            throw std::runtime_error("read or write pipe already opened");
        }

        if (::pipe2(fds, flags)) {
            throw std::runtime_error(std::string{"Pipe error: "} + strerror(errno));
        }

        readOpened = true;
        writeOpened = true;
    }
};

struct Pipe : public FdPair
{
    Pipe(int flags = 0)
        : FdPair{}
    {
        pipe(flags);
    }
};

// Outcome of a child run to completion
struct ExecStatus {
    int  exitStatus; // exit code, or 128 + signal number if killed by a signal
    bool timedOut;   // killed after exceeding its timeout

    bool succeeded() const { return !timedOut && (exitStatus == 0); }
};

/* Execvp - fork / execvp a program, forward its output, and bound its run time.
   A timed out program is killed together with everything in its process group. */
class Execvp {
public:
    using LineHandler = std::function<void(std::string const&)>;

    // exit code used by the child when execvp itself fails
    static constexpr int ExecFailed = 127;

private:
    using Clock = std::chrono::steady_clock;

    static void redirectToDevNull(int targetFd, int flags)
    {
        auto const nullFd = ::open("/dev/null", flags);
        if (nullFd >= 0) {
            dup2(nullFd, targetFd);
            if (nullFd != targetFd) {
                close(nullFd);
            }
        }
    }

    static int decodeStatus(int status)
    {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

    // wait for child until deadline, returns true and fills status if it exited
    static bool waitUntil(pid_t child, Clock::time_point deadline, bool bounded, int& status)
    {
        while (true) {
            auto const rc = ::waitpid(child, &status, bounded ? WNOHANG : 0);
            if (rc == child) {
                return true;
            } else if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("waitpid() on " + std::to_string(child) + " failed: " + strerror(errno));
            }

            // still running
            if (Clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{50});
        }
    }

    // child leads its own process group, so helpers it started are signalled too
    static int terminate(pid_t child, unsigned long gracePeriod)
    {
        int status = 0;
        ::kill(-child, SIGTERM);
        if (!waitUntil(child, Clock::now() + std::chrono::seconds{gracePeriod}, true, status)) {
            ::kill(-child, SIGKILL);
            waitUntil(child, Clock::now(), false, status);
        }
        // members that ignored SIGTERM outlive the leader
        ::kill(-child, SIGKILL);
        return status;
    }

public:
    // run argv to completion with stdin on /dev/null. stdout and stderr are merged and
    // forwarded line by line to onLine. a timeout of 0 waits forever.
    static ExecStatus run(ManagedArgv const& argv, unsigned long timeoutSecs, LineHandler const& onLine,
        unsigned long gracePeriod = 5)
    {
        auto const binaryName = argv.get()[0];
        if (binaryName == nullptr) {
            throw std::logic_error("attempted to run an empty argument array");
        }

        auto p = Pipe{O_CLOEXEC};
        auto const child = fork();
        if (child < 0) {
            throw std::runtime_error(std::string("fork() for ") + binaryName + " failed: " + strerror(errno));
        } else if (child == 0) { // child side of fork
            ::setpgid(0, 0);
            redirectToDevNull(STDIN_FILENO, O_RDONLY);
            dup2(p.getWriteFd(), Pipe::stdout);
            dup2(p.getWriteFd(), Pipe::stderr);

            execvp(binaryName, const_cast<char* const*>(argv.get()));
            _exit(ExecFailed);
        }
        // also from the parent, so a timeout right after fork still reaches the group
        ::setpgid(child, child);
        p.closeWrite();

        auto const bounded = (timeoutSecs > 0);
        auto const deadline = Clock::now() + std::chrono::seconds{timeoutSecs};

        // forward output until EOF or deadline
        auto pending = std::string{};
        auto flushLines = [&](bool all) {
            auto pos = std::string::size_type{0};
            while ((pos = pending.find('\n')) != std::string::npos) {
                if (onLine) { onLine(pending.substr(0, pos)); }
                pending.erase(0, pos + 1);
            }
            if (all && !pending.empty()) {
                if (onLine) { onLine(pending); }
                pending.clear();
            }
        };

        auto timedOut = false;
        while (true) {
            auto waitMs = -1;
            if (bounded) {
                auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
                if (remaining <= 0) {
                    timedOut = true;
                    break;
                }
                waitMs = static_cast<int>(std::min<long long>(remaining, 1000));
            }

            struct pollfd pfd { p.getReadFd(), POLLIN, 0 };
            auto const rc = ::poll(&pfd, 1, waitMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                terminate(child, gracePeriod);
                throw std::runtime_error(std::string{"poll failed: "} + strerror(errno));
            } else if (rc == 0) {
                continue;
            }

            char buf[4096];
            auto const numBytesRead = ::read(p.getReadFd(), buf, sizeof(buf));
            if (numBytesRead < 0) {
                if ((errno == EINTR) || (errno == EAGAIN)) {
                    continue;
                }
                terminate(child, gracePeriod);
                throw std::runtime_error(std::string{"read failed: "} + strerror(errno));
            } else if (numBytesRead == 0) {
                break;
            }
            pending.append(buf, numBytesRead);
            flushLines(false);
        }
        flushLines(true);

        int status = 0;
        if (timedOut || !waitUntil(child, deadline, bounded, status)) {
            status = terminate(child, gracePeriod);
            return ExecStatus{decodeStatus(status), true};
        }

        return ExecStatus{decodeStatus(status), false};
    }

    // start argv detached from this process: new session, stdio on /dev/null, working
    // directory chdirPath. returns once the program image has been replaced, throws if
    // the exec failed.
    static pid_t spawnDetached(ManagedArgv const& argv, std::string const& chdirPath)
    {
        auto const binaryName = argv.get()[0];
        if (binaryName == nullptr) {
            throw std::logic_error("attempted to spawn an empty argument array");
        }

        // exec failure is reported back through a close-on-exec pipe
        auto p = Pipe{O_CLOEXEC};
        auto const child = fork();
        if (child < 0) {
            throw std::runtime_error(std::string("fork() for ") + binaryName + " failed: " + strerror(errno));
        } else if (child == 0) {
            p.closeRead();
            setsid();

            // double fork so the target is reparented and never becomes our zombie
            auto const grandchild = fork();
            if (grandchild < 0) {
                int const err = errno;
                (void)!::write(p.getWriteFd(), &err, sizeof(err));
                _exit(ExecFailed);
            } else if (grandchild > 0) {
                _exit(0);
            }

            if (!chdirPath.empty() && ::chdir(chdirPath.c_str())) {
                int const err = errno;
                (void)!::write(p.getWriteFd(), &err, sizeof(err));
                _exit(ExecFailed);
            }
            redirectToDevNull(STDIN_FILENO, O_RDONLY);
            redirectToDevNull(STDOUT_FILENO, O_WRONLY);
            redirectToDevNull(STDERR_FILENO, O_WRONLY);

            execvp(binaryName, const_cast<char* const*>(argv.get()));
            int const err = errno;
            (void)!::write(p.getWriteFd(), &err, sizeof(err));
            _exit(ExecFailed);
        }
        p.closeWrite();

        // reap the intermediate child
        int status = 0;
        while ((::waitpid(child, &status, 0) < 0) && (errno == EINTR)) {}

        int childErrno = 0;
        while (true) {
            auto const numBytesRead = ::read(p.getReadFd(), &childErrno, sizeof(childErrno));
            if (numBytesRead < 0 && errno == EINTR) {
                continue;
            } else if (numBytesRead == sizeof(childErrno)) {
                throw std::runtime_error(std::string{"executing "} + binaryName + " failed: " + strerror(childErrno));
            }
            break;
        }

        return child;
    }

    // replace the current process image. only returns by throwing.
    [[noreturn]] static void replace(ManagedArgv const& argv, std::string const& chdirPath)
    {
        auto const binaryName = argv.get()[0];
        if (binaryName == nullptr) {
            throw std::logic_error("attempted to exec an empty argument array");
        }

        if (!chdirPath.empty() && ::chdir(chdirPath.c_str())) {
            throw std::runtime_error("chdir " + chdirPath + " failed: " + strerror(errno));
        }

        execvp(binaryName, const_cast<char* const*>(argv.get()));
        throw std::runtime_error(std::string{"executing "} + binaryName + " failed: " + strerror(errno));
    }
};

} /* namespace appboot */
