/******************************************************************************\
 * appboot_defs.h - Global definitions for the bootstrap launcher
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

/*******************************************************************************
** Install root layout
*******************************************************************************/
#define APPBOOT_CONFIG_FILE         "appboot.json"          // optional launcher configuration, relative to install root
#define APPBOOT_DEFAULT_ENTRY       "main.py"               // target entry file
#define APPBOOT_DEFAULT_MANIFEST    "requirements.txt"      // dependency manifest, may be absent
#define APPBOOT_DEFAULT_ENV_DIR     ".venv"                 // isolated environment, created on demand
#define APPBOOT_DEFAULT_ICON        "app.png"               // shortcut icon, may be absent
#define APPBOOT_LOCK_FILE           ".appboot.lock"         // advisory lock taken while provisioning
#define APPBOOT_DEFAULT_NAME        "Application"           // display name used for shortcuts

/*******************************************************************************
** Environment provisioning state
*******************************************************************************/
#define APPBOOT_PROVISIONING_MARKER ".appboot-provisioning" // written before dependency work, removed on publish
#define APPBOOT_PROVISIONED_STAMP   ".appboot-provisioned"  // completion stamp, renamed from the marker

/*******************************************************************************
** Timeouts (seconds, 0 disables)
*******************************************************************************/
#define APPBOOT_DEFAULT_ENV_TIMEOUT     300ul   // creating the environment
#define APPBOOT_DEFAULT_DEPS_TIMEOUT    1800ul  // upgrading tooling and installing the manifest
#define APPBOOT_DEFAULT_LOCK_TIMEOUT    600ul   // waiting for another process to finish provisioning
#define APPBOOT_KILL_GRACE_PERIOD       5ul     // between SIGTERM and SIGKILL of a timed out child

/*******************************************************************************
** Linux runtime names
*******************************************************************************/
#define APPBOOT_ENV_LAUNCHER        "bin/python"            // launcher inside the environment
#define APPBOOT_VERSION_SELECTOR    "py"                    // python launcher / version selector
#define APPBOOT_VERSION_SELECTOR_ARG "-3"
#define APPBOOT_SYSTEM_LAUNCHER     "python3"
#define APPBOOT_GENERIC_LAUNCHER    "python"
#define APPBOOT_RUNTIME_URL         "https://www.python.org/downloads/"
#define APPBOOT_DIALOG_TOOL         "zenity"                // modal messages when a display is available
#define APPBOOT_USER_DIRS_FILE      "user-dirs.dirs"        // XDG user directory configuration

/*******************************************************************************
** Environment variables
*******************************************************************************/
#define APPBOOT_INSTALL_ROOT_ENV_VAR    "APPBOOT_INSTALL_ROOT"      // override the install root
#define APPBOOT_ENV_DIR_ENV_VAR         "APPBOOT_ENV_DIR"           // override the environment directory
#define APPBOOT_MANIFEST_ENV_VAR        "APPBOOT_MANIFEST"          // override the dependency manifest
#define APPBOOT_ENTRY_ENV_VAR           "APPBOOT_ENTRY"             // override the entry file
#define APPBOOT_AUTO_SETUP_ENV_VAR      "APPBOOT_AUTO_SETUP"        // 0 disables provisioning
#define APPBOOT_DEP_POLICY_ENV_VAR      "APPBOOT_DEPENDENCY_POLICY" // best-effort or fail-fast
#define APPBOOT_LAUNCH_MODE_ENV_VAR     "APPBOOT_LAUNCH_MODE"       // spawn or exec
#define APPBOOT_DBG_ENV_VAR             "APPBOOT_DEBUG"             // enable debug logging
#define APPBOOT_LOG_DIR_ENV_VAR         "APPBOOT_LOG_DIR"           // directory for debug logs
#define APPBOOT_PLATFORM_ENV_VAR        "APPBOOT_PLATFORM"          // force a platform implementation
#define SCRATCH_ENV_VAR                 "TMPDIR"
#define DISPLAY_ENV_VAR                 "DISPLAY"
#define WAYLAND_DISPLAY_ENV_VAR         "WAYLAND_DISPLAY"
#define HOME_ENV_VAR                    "HOME"
#define XDG_CONFIG_HOME_ENV_VAR         "XDG_CONFIG_HOME"
#define XDG_DATA_HOME_ENV_VAR           "XDG_DATA_HOME"
#define PATH_ENV_VAR                    "PATH"

/*******************************************************************************
** Interface
*******************************************************************************/
#define APPBOOT_VERSION             "1.0.0"
#define APPBOOT_ERR_STR_SIZE        1024    // longest error string handed out through the C interface
