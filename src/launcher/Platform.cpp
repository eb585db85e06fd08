/******************************************************************************\
 * Platform.cpp - Platform detection and instantiation
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

#include <stdexcept>

#include "launcher/Platform.hpp"
#include "launcher/platform_impl/Linux/Platform.hpp"

namespace appboot {

std::unique_ptr<Platform>
Platform::make(Logger& logger)
{
    // Check environment platform setting, if provided
    if (auto const platformSetting = ::getenv(APPBOOT_PLATFORM_ENV_VAR)) {
        auto const setting = std::string{platformSetting};
        if (setting == LinuxPlatform::getName()) {
            logger.write("platform: %s (from " APPBOOT_PLATFORM_ENV_VAR ")\n", LinuxPlatform::getName());
            return std::make_unique<LinuxPlatform>(logger);
        }
        throw std::runtime_error("invalid platform setting for " APPBOOT_PLATFORM_ENV_VAR ": '" + setting + "'");
    }

    // Run available platform detection heuristics
    if (LinuxPlatform::isSupported()) {
        logger.write("platform: %s\n", LinuxPlatform::getName());
        return std::make_unique<LinuxPlatform>(logger);
    }

    throw std::runtime_error("this system is not supported. Set " APPBOOT_PLATFORM_ENV_VAR " to force a platform.");
}

} /* namespace appboot */
