/******************************************************************************\
 * Platform.cpp - A mock Linux platform over a scratch install root
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
#include <sys/stat.h>

#include <algorithm>
#include <filesystem>

#include "MockPlatform/Platform.hpp"

#include "useful/appboot_log.h"
#include "useful/appboot_wrappers.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::WithoutArgs;

static appboot::Logger& disabledLogger()
{
    static auto logger = appboot::Logger{};
    return logger;
}

static bool contains(std::vector<std::string> const& argv, std::string const& arg)
{
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

/* MockPlatform implementation */

MockPlatform::MockPlatform()
    : appboot::LinuxPlatform{disabledLogger()}
{
    // describe behavior of mock findExecutable
    ON_CALL(*this, findExecutable(_))
        .WillByDefault(Invoke([this](std::string const& name) {
            return onPath.count(name) ? fakePath(name) : std::string{};
        }));

    // describe behavior of mock runCommand
    ON_CALL(*this, runCommand(_, _))
        .WillByDefault(Invoke([this](std::vector<std::string> const& argv, unsigned long) {
            commands.push_back(argv);

            if (contains(argv, "venv")) {
                if (createFails) {
                    return appboot::ExecStatus{1, false};
                }
                auto const environmentDir = argv.back();
                std::filesystem::create_directories(environmentDir + "/bin");
                if (createsLauncher) {
                    appboot::file::writeAtomic(environmentLauncher(environmentDir), "#!/bin/sh\nexit 0\n",
                        S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
                }
                return createStatus;
            } else if (contains(argv, "-r")) {
                return installStatus;
            }
            return appboot::ExecStatus{0, false};
        }));

    // describe behavior of mock handOff
    ON_CALL(*this, handOff(_, _, _))
        .WillByDefault(Invoke([this](std::vector<std::string> const& argv, std::string const& workingDir,
            appboot::LaunchMode mode) {
            handOffs.push_back(HandOff{argv, workingDir, mode});
        }));

    // describe behavior of mock showMessage
    ON_CALL(*this, showMessage(_, _))
        .WillByDefault(Invoke([this](std::string const&, std::string const& message) {
            messages.push_back(message);
        }));

    ON_CALL(*this, desktopPath())
        .WillByDefault(WithoutArgs(Invoke([this]() { return desktopDir; })));
    ON_CALL(*this, applicationsPath())
        .WillByDefault(WithoutArgs(Invoke([this]() { return applicationsDir; })));
}

size_t
MockPlatform::countCommands(std::string const& arg) const
{
    return std::count_if(commands.begin(), commands.end(), [&arg](std::vector<std::string> const& argv) {
        return contains(argv, arg);
    });
}
