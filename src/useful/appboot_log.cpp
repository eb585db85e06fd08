/******************************************************************************\
 * appboot_log.cpp - Functions relating to creating and writing log files.
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

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include "useful/appboot_log.h"

appboot_log_t*
_appboot_create_log(char const* directory, char const* filename, int suffix)
{
    char logfile[PATH_MAX];

    if (filename == nullptr) {
        return nullptr;
    }

    // fall back to the scratch directory if no log directory was provided
    if (directory == nullptr) {
        directory = getenv(SCRATCH_ENV_VAR);
        if ((directory == nullptr) || (directory[0] == '\0')) {
            directory = "/tmp";
        }
    }

    if (access(directory, R_OK | W_OK | X_OK)) {
        fprintf(stderr, "warning: log directory %s is not accessible: %s\n", directory, strerror(errno));
        return nullptr;
    }

    if (snprintf(logfile, sizeof(logfile), "%s/%s.%d.log", directory, filename, suffix) >= (int)sizeof(logfile)) {
        fprintf(stderr, "warning: log path for %s is too long\n", filename);
        return nullptr;
    }

    // close-on-exec, the log must not leak into spawned tooling or the target
    auto const fp = fopen(logfile, "ae");
    if (fp == nullptr) {
        fprintf(stderr, "warning: failed to open log file %s: %s\n", logfile, strerror(errno));
        return nullptr;
    }

    // unbuffered, the launcher may exec away without returning through exit handlers
    setvbuf(fp, nullptr, _IONBF, 0);

    return fp;
}

int
_appboot_close_log(appboot_log_t* log_file)
{
    if (log_file == nullptr) {
        return 0;
    }

    _appboot_write_log(log_file, "log closed\n");
    return fclose(log_file);
}

int
_appboot_write_log(appboot_log_t* log_file, const char *fmt, ...)
{
    if ((log_file == nullptr) || (fmt == nullptr)) {
        return 1;
    }

    // timestamp prefix
    char stamp[32];
    auto const now = time(nullptr);
    struct tm tm_now;
    if (localtime_r(&now, &tm_now) && strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now)) {
        fprintf(log_file, "%s %d: ", stamp, getpid());
    }

    va_list vargs;
    va_start(vargs, fmt);
    vfprintf(log_file, fmt, vargs);
    va_end(vargs);

    return 0;
}
