/******************************************************************************\
 * appboot_config_unit_test.cpp - Unit tests for configuration loading and the C interface
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
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include "appboot_config_unit_test.hpp"

using ::testing::HasSubstr;
using ::testing::StartsWith;

AppBootConfigUnitTest::AppBootConfigUnitTest()
{
}

AppBootConfigUnitTest::~AppBootConfigUnitTest()
{
    for (auto&& name : m_setVars) {
        unsetenv(name.c_str());
    }
    appboot_resetAttributes();
}

void
AppBootConfigUnitTest::setEnv(char const* name, std::string const& value)
{
    setenv(name, value.c_str(), 1);
    m_setVars.emplace_back(name);
}

/******************************************
*         CONFIGURATION LAYERING          *
******************************************/

TEST_F(AppBootConfigUnitTest, Defaults)
{
    auto config = appboot::loadLaunchConfig(installRoot.path());
    config.resolvePaths();

    EXPECT_EQ(config.installRoot,    installRoot.path());
    EXPECT_EQ(config.entryPath,      installRoot / "main.py");
    EXPECT_EQ(config.manifestPath,   installRoot / "requirements.txt");
    EXPECT_EQ(config.environmentDir, installRoot / ".venv");
    EXPECT_EQ(config.iconPath,       installRoot / "app.png");
    EXPECT_EQ(config.lockPath,       installRoot / ".appboot.lock");

    EXPECT_TRUE(config.autoSetup);
    EXPECT_EQ(config.dependencyPolicy, appboot::DependencyPolicy::BestEffort);
    EXPECT_EQ(config.launchMode, appboot::LaunchMode::Spawn);
    EXPECT_FALSE(config.debug);
    EXPECT_EQ(config.envCreateTimeout, APPBOOT_DEFAULT_ENV_TIMEOUT);
}

TEST_F(AppBootConfigUnitTest, FileOverridesDefaults)
{
    installRoot.writeFile(APPBOOT_CONFIG_FILE, R"({
        "name": "Daily Automation",
        "comment": "Runs the daily reports",
        "entry": "app/run.py",
        "manifest": "/etc/app/requirements.txt",
        "dependencyPolicy": "fail-fast",
        "launchMode": "exec",
        "autoSetup": "false",
        "timeouts": { "environment": 60, "lock": 0 }
    })");

    auto config = appboot::loadLaunchConfig(installRoot.path());
    config.resolvePaths();

    EXPECT_EQ(config.displayName, "Daily Automation");
    EXPECT_EQ(config.comment, "Runs the daily reports");
    EXPECT_EQ(config.entryPath, installRoot / "app/run.py");
    EXPECT_EQ(config.manifestPath, "/etc/app/requirements.txt");
    EXPECT_EQ(config.dependencyPolicy, appboot::DependencyPolicy::FailFast);
    EXPECT_EQ(config.launchMode, appboot::LaunchMode::Exec);
    EXPECT_FALSE(config.autoSetup);
    EXPECT_EQ(config.envCreateTimeout, 60ul);
    EXPECT_EQ(config.lockTimeout, 0ul);

    // untouched settings keep their defaults
    EXPECT_EQ(config.environmentDir, installRoot / ".venv");
    EXPECT_EQ(config.dependencyTimeout, APPBOOT_DEFAULT_DEPS_TIMEOUT);
}

TEST_F(AppBootConfigUnitTest, EnvironmentOverridesFile)
{
    installRoot.writeFile(APPBOOT_CONFIG_FILE, R"({ "dependencyPolicy": "fail-fast", "environment": "envs/a" })");
    setEnv(APPBOOT_DEP_POLICY_ENV_VAR, "best-effort");
    setEnv(APPBOOT_ENV_DIR_ENV_VAR, "envs/b");
    setEnv(APPBOOT_AUTO_SETUP_ENV_VAR, "0");

    auto config = appboot::loadLaunchConfig(installRoot.path());
    config.resolvePaths();

    EXPECT_EQ(config.dependencyPolicy, appboot::DependencyPolicy::BestEffort);
    EXPECT_EQ(config.environmentDir, installRoot / "envs/b");
    EXPECT_FALSE(config.autoSetup);
}

TEST_F(AppBootConfigUnitTest, AttributesOverrideEnvironment)
{
    setEnv(APPBOOT_ENTRY_ENV_VAR, "from-env.py");
    setEnv(APPBOOT_LAUNCH_MODE_ENV_VAR, "exec");

    ASSERT_EQ(appboot_setAttribute(APPBOOT_ATTR_ENTRY, "from-cli.py"), 0);
    ASSERT_EQ(appboot_setAttribute(APPBOOT_ATTR_LAUNCH_MODE, "spawn"), 0);

    auto const config = appboot::Launcher_iface::makeConfig(installRoot.path().c_str());
    EXPECT_EQ(config.entryPath, installRoot / "from-cli.py");
    EXPECT_EQ(config.launchMode, appboot::LaunchMode::Spawn);

    // reset drops back to the environment layer
    appboot_resetAttributes();
    auto const reset = appboot::Launcher_iface::makeConfig(installRoot.path().c_str());
    EXPECT_EQ(reset.entryPath, installRoot / "from-env.py");
    EXPECT_EQ(reset.launchMode, appboot::LaunchMode::Exec);
}

TEST_F(AppBootConfigUnitTest, InstallRootFromEnvironment)
{
    setEnv(APPBOOT_INSTALL_ROOT_ENV_VAR, installRoot.path() + "//");

    auto const config = appboot::Launcher_iface::makeConfig(nullptr);
    EXPECT_EQ(config.installRoot, installRoot.path());
    EXPECT_EQ(config.entryPath, installRoot / "main.py");
}

TEST_F(AppBootConfigUnitTest, InvalidSettings)
{
    EXPECT_THROW(appboot::parseDependencyPolicy("sometimes"), std::runtime_error);
    EXPECT_THROW(appboot::parseLaunchMode("fork"), std::runtime_error);
    EXPECT_THROW(appboot::parseFlag("maybe"), std::runtime_error);
    EXPECT_TRUE(appboot::parseFlag("Yes"));
    EXPECT_FALSE(appboot::parseFlag("off"));
    EXPECT_EQ(appboot::parseDependencyPolicy("FAIL-FAST"), appboot::DependencyPolicy::FailFast);

    // bad values in the file name the file
    installRoot.writeFile(APPBOOT_CONFIG_FILE, R"({ "launchMode": "fork" })");
    try {
        appboot::loadLaunchConfig(installRoot.path());
        FAIL() << "invalid launch mode was accepted";
    } catch (std::runtime_error const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr(APPBOOT_CONFIG_FILE));
    }

    // a negative timeout must not wrap around to an effectively unlimited one
    EXPECT_EQ(appboot::parseTimeout("0"), 0ul);
    EXPECT_EQ(appboot::parseTimeout("300"), 300ul);
    EXPECT_THROW(appboot::parseTimeout("-1"), std::runtime_error);
    EXPECT_THROW(appboot::parseTimeout("ten"), std::runtime_error);
    EXPECT_THROW(appboot::parseTimeout("5s"), std::runtime_error);
    installRoot.writeFile(APPBOOT_CONFIG_FILE, R"({ "timeouts": { "environment": -1 } })");
    try {
        appboot::loadLaunchConfig(installRoot.path());
        FAIL() << "negative timeout was accepted";
    } catch (std::runtime_error const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr(APPBOOT_CONFIG_FILE));
        EXPECT_THAT(ex.what(), HasSubstr("negative"));
    }

    installRoot.writeFile(APPBOOT_CONFIG_FILE, "{ not json");
    EXPECT_THROW(appboot::loadLaunchConfig(installRoot.path()), std::runtime_error);

    // an unusable environment variable is also rejected
    installRoot.writeFile(APPBOOT_CONFIG_FILE, "{}");
    setEnv(APPBOOT_DEP_POLICY_ENV_VAR, "never");
    EXPECT_THROW(appboot::loadLaunchConfig(installRoot.path()), std::runtime_error);
}

/******************************************
*            C INTERFACE TESTS            *
******************************************/

TEST_F(AppBootConfigUnitTest, setAttribute_rejects_bad_values)
{
    EXPECT_EQ(appboot_setAttribute(APPBOOT_ATTR_DEPENDENCY_POLICY, "sometimes"), 1);
    EXPECT_THAT(appboot_error_str(), StartsWith("appboot_setAttribute: "));

    EXPECT_EQ(appboot_setAttribute(APPBOOT_ATTR_ENTRY, nullptr), 1);
    EXPECT_EQ(appboot_setAttribute(APPBOOT_ATTR_ENTRY, ""), 1);
    EXPECT_EQ(appboot_setAttribute(APPBOOT_LOG_DIR, (installRoot / "absent").c_str()), 1);
    EXPECT_EQ(appboot_setAttribute(APPBOOT_LOG_DIR, installRoot.path().c_str()), 0);

    char buf[16];
    EXPECT_EQ(appboot_error_str_r(buf, 0), ERANGE);
    EXPECT_EQ(appboot_error_str_r(buf, sizeof(buf)), 0);
    EXPECT_EQ(strlen(buf), sizeof(buf) - 1);
}

TEST_F(AppBootConfigUnitTest, launch_reports_invalid_configuration)
{
    installRoot.writeFile(APPBOOT_CONFIG_FILE, R"({ "dependencyPolicy": "never" })");

    EXPECT_EQ(appboot_launch(installRoot.path().c_str(), nullptr), APPBOOT_EXIT_USAGE);
    EXPECT_THAT(appboot_error_str(), HasSubstr("appboot_launch: "));
    EXPECT_THAT(appboot_error_str(), HasSubstr(APPBOOT_CONFIG_FILE));
}

TEST_F(AppBootConfigUnitTest, launch_without_entry_file)
{
    // nothing is provisioned when there is nothing to run
    EXPECT_EQ(appboot_launch(installRoot.path().c_str(), nullptr), APPBOOT_EXIT_ENTRY_MISSING);
    EXPECT_FALSE(appboot::pathExists(installRoot / ".venv"));
    EXPECT_FALSE(appboot::pathExists(installRoot / APPBOOT_LOCK_FILE));
}

TEST_F(AppBootConfigUnitTest, version)
{
    EXPECT_STREQ(appboot_version(), APPBOOT_VERSION);
}
