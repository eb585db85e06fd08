/******************************************************************************\
 * appboot_iface.hpp - Internal state behind the public C interface
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

// Need to include external interface definitions
#include "appboot.h"

#include <map>
#include <string>
#include <utility>

#include "launcher/LaunchConfig.hpp"

namespace appboot {

class Launcher_iface final {
private: // Static internal data
    // Error string we export to callers - we want this to leak!
    static char *       _appboot_err_str;
    static std::string  m_err_str;
    // Overrides from appboot_setAttribute, applied on top of the loaded configuration
    static std::map<appboot_attr_type_t, std::string> m_attributes;

private:
    // Used to set the external facing error string
    static void set_error_str(std::string str);

public:
    // Used to obtain a pointer to the internal error string.
    // This is for external consumption.
    static const char *get_error_str();

    // Validate and store an attribute override
    static void setAttribute(appboot_attr_type_t attrib, std::string const& value);
    static void resetAttributes();

    // Configuration for an install root with every override applied and paths resolved.
    // A null or empty root uses $APPBOOT_INSTALL_ROOT, then the working directory.
    static LaunchConfig makeConfig(char const* installRoot);

    // Return codes
    static constexpr auto SUCCESS = int{0};
    static constexpr auto FAILURE = int{1};

    // Safely run code that can throw and use it to set the error string instead.
    // A C api should never allow an exception to escape the runtime.
    template <typename FuncType, typename ReturnType = decltype(std::declval<FuncType>()())>
    static ReturnType
    runSafely(std::string const& caller, FuncType&& func, ReturnType const onError) {
        try {
            return std::forward<FuncType>(func)();
        } catch (std::exception const& ex) {
            auto const message = std::string{ex.what() ? ex.what() : "(null error string)"};
            set_error_str(caller + ": " + message);
            return onError;
        }
    }

public: // Constructor/destructors
    Launcher_iface() = delete;
};

} /* namespace appboot */
