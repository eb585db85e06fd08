/******************************************************************************\
 * appboot.h - The public API definitions for the application bootstrap launcher.
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
#ifndef _APPBOOT_H
#define _APPBOOT_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/************************************************************
 * Types defined by the bootstrap launcher interface
 ***********************************************************/

/*
 *  Settings that can be applied with appboot_setAttribute. They override
 *  the defaults, the install root's appboot.json and the APPBOOT_*
 *  environment variables for every later call in this process.
 */
typedef enum
{
    APPBOOT_ATTR_ENV_DIR,
    APPBOOT_ATTR_MANIFEST,
    APPBOOT_ATTR_ENTRY,
    APPBOOT_ATTR_ICON,
    APPBOOT_ATTR_NAME,
    APPBOOT_ATTR_AUTO_SETUP,
    APPBOOT_ATTR_DEPENDENCY_POLICY,
    APPBOOT_ATTR_LAUNCH_MODE,
    APPBOOT_DEBUG,
    APPBOOT_LOG_DIR
} appboot_attr_type_t;

/*
 * Process exit status returned by appboot_launch.
 */
typedef enum
{
    APPBOOT_EXIT_SUCCESS                = 0,
    APPBOOT_EXIT_USAGE                  = 1,
    APPBOOT_EXIT_NO_BASE_RUNTIME        = 2,
    APPBOOT_EXIT_ENV_CREATION_FAILED    = 3,
    APPBOOT_EXIT_RUNTIME_UNAVAILABLE    = 4,
    APPBOOT_EXIT_DEPENDENCY_FAILED      = 5,
    APPBOOT_EXIT_LAUNCH_FAILED          = 6,
    APPBOOT_EXIT_ENTRY_MISSING          = 7
} appboot_exit_status_t;

typedef enum
{
    APPBOOT_BOOTSTRAP_ALREADY_PRESENT,
    APPBOOT_BOOTSTRAP_CREATED_AND_POPULATED,
    APPBOOT_BOOTSTRAP_FAILED
} appboot_bootstrap_status_t;

typedef enum
{
    APPBOOT_BOOTSTRAP_ERROR_NONE,
    APPBOOT_BOOTSTRAP_ERROR_NO_BASE_RUNTIME,
    APPBOOT_BOOTSTRAP_ERROR_ENV_CREATION_FAILED,
    APPBOOT_BOOTSTRAP_ERROR_DEPENDENCY_INSTALL_FAILED
} appboot_bootstrap_error_t;

typedef enum
{
    APPBOOT_DEPENDENCIES_NOT_ATTEMPTED,
    APPBOOT_DEPENDENCIES_INSTALLED,
    APPBOOT_DEPENDENCIES_SKIPPED_NO_MANIFEST,
    APPBOOT_DEPENDENCIES_FAILED
} appboot_dependency_outcome_t;

/*
 * Outcome of appboot_ensureEnvironment.
 */
typedef struct
{
    appboot_bootstrap_status_t   status;
    appboot_bootstrap_error_t    error;
    appboot_dependency_outcome_t dependencies;
    int                          repaired;  // nonzero if a partial environment was rebuilt
} appboot_bootstrap_t;

/*******************************************************************************
 * The bootstrap launcher calls are defined below.
 ******************************************************************************/

/*
 * appboot_version - Returns the version string of the launcher library.
 *
 * Arguments
 *      None.
 *
 * Returns
 *      A string containing the library version in the form
 *      major.minor.revision.
 *
 */
const char * appboot_version(void);

/*
 * appboot_error_str - Returns an error string associated with a command that
 *                     returned an error value.
 *
 * Detail
 *      This function returns the internal error string associated with a
 *      failed command. The string is prefixed with the name of the failing
 *      call. If no error is known, the string will contain
 *      "Unknown appboot error".
 *
 * Arguments
 *      None.
 *
 * Returns
 *      A string containing the error message.
 *
 */
const char * appboot_error_str(void);

/*
 * appboot_error_str_r - Copies the error string into a user-provided buffer.
 *
 * Arguments
 *      buf - buffer to fill with error string
 *      buf_len - length of buf, at least 1
 *
 * Returns
 *      0 on success, ERANGE if buf_len is 0.
 *
 */
int appboot_error_str_r(char *buf, size_t buf_len);

/*
 * appboot_setAttribute - Override a launcher setting.
 *
 * Detail
 *      Values are validated when set. Boolean settings accept 1/0, true/false,
 *      yes/no or on/off. APPBOOT_ATTR_DEPENDENCY_POLICY accepts best-effort or
 *      fail-fast. APPBOOT_ATTR_LAUNCH_MODE accepts spawn or exec. Relative
 *      paths are resolved against the install root of each call.
 *
 * Arguments
 *      attrib - The attribute to set.
 *      value - The new value, as a string.
 *
 * Returns
 *      0 on success, or else 1 on failure.
 *
 */
int appboot_setAttribute(appboot_attr_type_t attrib, const char *value);

/*
 * appboot_resetAttributes - Drop every override set with appboot_setAttribute.
 *
 * Arguments
 *      None.
 *
 * Returns
 *      Nothing.
 *
 */
void appboot_resetAttributes(void);

/*
 * appboot_launch - Run the target program of an install root, creating its
 *                  isolated environment first when needed.
 *
 * Detail
 *      Checks the entry file, provisions the environment (unless auto setup is
 *      disabled), picks the best available launcher and hands the entry file
 *      off to it. In spawn mode the target is started detached and this call
 *      returns. In exec mode the calling process is replaced by the target on
 *      success. Every failure is reported to the user before returning.
 *
 * Arguments
 *      install_root - Directory holding the target program. NULL uses
 *                     $APPBOOT_INSTALL_ROOT or else the working directory.
 *      target_args - NULL terminated list of arguments passed to the target
 *                    after the entry file, or NULL.
 *
 * Returns
 *      An appboot_exit_status_t value.
 *
 */
int appboot_launch(const char *install_root, const char * const target_args[]);

/*
 * appboot_ensureEnvironment - Create and populate the isolated environment of
 *                             an install root if it is not already present.
 *
 * Detail
 *      Performs no filesystem writes when the environment is present.
 *      Concurrent callers on the same install root serialize on its lock file.
 *
 * Arguments
 *      install_root - As for appboot_launch.
 *      result - Filled in with the outcome. May be NULL.
 *
 * Returns
 *      0 if the environment is usable, or else 1 on failure.
 *
 */
int appboot_ensureEnvironment(const char *install_root, appboot_bootstrap_t *result);

/*
 * appboot_installShortcut - Create desktop and application menu shortcuts.
 *
 * Detail
 *      Writes the same desktop entry to the user's desktop and application menu
 *      directories, replacing any earlier copy. The icon is the install root's
 *      icon when present, else the target itself. A failure is also shown to
 *      the user.
 *
 * Arguments
 *      target - Program the shortcut runs.
 *      install_root - Working directory of the shortcut, as for appboot_launch.
 *      target_args - NULL terminated list of arguments for the target, or NULL.
 *
 * Returns
 *      0 on success, or else 1 on failure.
 *
 */
int appboot_installShortcut(const char *target, const char *install_root, const char * const target_args[]);

#ifdef __cplusplus
}
#endif

#endif /* _APPBOOT_H */
