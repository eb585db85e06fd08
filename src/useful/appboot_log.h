/******************************************************************************\
 * appboot_log.h - Header file for the log interface.
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
#ifndef _APPBOOT_LOG_H
#define _APPBOOT_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE appboot_log_t;

// create a new logfile in directory with format <filename>.<suffix>.log
// returns NULL if the file could not be created
appboot_log_t* _appboot_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _appboot_close_log(appboot_log_t* log_file);

// write the given formatted string to the log file (if nonnull)
int _appboot_write_log(appboot_log_t* log_file, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

#ifdef __cplusplus
}

#include <string>
#include <memory>
#include <utility>

namespace appboot {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<appboot_log_t, int(*)(appboot_log_t*)>;

private: // variables
    LogPtr logFile;

public: // interface
    // disabled logger, writes are no-ops
    Logger() : logFile{nullptr, _appboot_close_log} {}

    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _appboot_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_appboot_create_log(dir, filename.c_str(), suffix), _appboot_close_log};
        }
    }

    bool enabled() const { return logFile != nullptr; }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _appboot_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }
};

} /* namespace appboot */

#endif /* __cplusplus */

#endif /* _APPBOOT_LOG_H */
