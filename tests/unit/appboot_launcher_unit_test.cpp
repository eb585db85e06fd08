/******************************************************************************\
 * appboot_launcher_unit_test.cpp - Unit tests for runtime location, provisioning and the launch sequence
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
#include "appboot.h"

#include <stdexcept>

#include "appboot_launcher_unit_test.hpp"

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Throw;

using appboot::BootstrapError;
using appboot::BootstrapStatus;
using appboot::DependencyOutcome;
using appboot::LaunchState;

AppBootLauncherUnitTest::AppBootLauncherUnitTest()
    : installRoot{}
    , platform{}
    , config{appboot::LaunchConfig::defaults(installRoot.path())}
{
    config.displayName = "Unit Test App";
    config.lockTimeout = 5;
    config.resolvePaths();
}

AppBootLauncherUnitTest::~AppBootLauncherUnitTest()
{
}

void
AppBootLauncherUnitTest::installEntry()
{
    installRoot.writeFile(APPBOOT_DEFAULT_ENTRY, "print('hello')\n");
}

void
AppBootLauncherUnitTest::installManifest()
{
    installRoot.writeFile(APPBOOT_DEFAULT_MANIFEST, "requests\n");
}

void
AppBootLauncherUnitTest::installEnvironment()
{
    installRoot.writeFile(APPBOOT_DEFAULT_ENV_DIR "/" APPBOOT_ENV_LAUNCHER, "#!/bin/sh\nexit 0\n", 0755);
    installRoot.writeFile(APPBOOT_DEFAULT_ENV_DIR "/" APPBOOT_PROVISIONED_STAMP, "");
}

std::string
AppBootLauncherUnitTest::environmentLauncher() const
{
    return platform.environmentLauncher(config.environmentDir);
}

/******************************************
*           RUNTIME LOCATOR TESTS         *
******************************************/

TEST_F(AppBootLauncherUnitTest, RuntimeLocator_FirstAvailableWins)
{
    auto const locator = appboot::RuntimeLocator{platform};

    // every availability pattern over three candidates
    for (unsigned mask = 0; mask < 8; mask++) {
        auto probes = std::vector<std::string>{};
        auto candidates = std::vector<appboot::LauncherCandidate>{};
        for (unsigned i = 0; i < 3; i++) {
            auto const name = "candidate" + std::to_string(i);
            auto const available = bool(mask & (1u << i));
            candidates.push_back({ name, { name }, [&probes, name, available]() {
                probes.push_back(name);
                return available;
            }});
        }

        auto const found = locator.locate(candidates);
        if (mask == 0) {
            EXPECT_FALSE(found.has_value()) << "mask " << mask;
            EXPECT_EQ(probes.size(), 3);
            continue;
        }

        // lowest set bit is the highest priority available candidate
        auto expected = 0u;
        while (!(mask & (1u << expected))) {
            expected++;
        }
        ASSERT_TRUE(found.has_value()) << "mask " << mask;
        EXPECT_EQ(found->name, "candidate" + std::to_string(expected)) << "mask " << mask;

        // nothing past the winner is probed
        EXPECT_EQ(probes.size(), expected + 1) << "mask " << mask;
    }
}

TEST_F(AppBootLauncherUnitTest, RuntimeLocator_RequireNamesEveryCandidate)
{
    auto const candidates = std::vector<appboot::LauncherCandidate>
        { { "first",  { "a" }, []() { return false; } }
        , { "second", { "b" }, []() { return false; } }
        };

    try {
        appboot::RuntimeLocator{platform}.require(candidates);
        FAIL() << "require returned without an available candidate";
    } catch (appboot::RuntimeUnavailable const& ex) {
        EXPECT_THAT(ex.tried(), ElementsAre("first", "second"));
        EXPECT_THAT(ex.what(), HasSubstr("first"));
        EXPECT_THAT(ex.what(), HasSubstr("second"));
    }
}

TEST_F(AppBootLauncherUnitTest, RuntimeLocator_EnvironmentLauncherPreferred)
{
    platform.onPath = { APPBOOT_VERSION_SELECTOR, APPBOOT_SYSTEM_LAUNCHER };
    auto const locator = appboot::RuntimeLocator{platform};

    // without an environment the version selector outranks the system launcher
    auto found = locator.locate(platform.launcherCandidates(config));
    ASSERT_TRUE(found.has_value());
    EXPECT_THAT(found->command, ElementsAre(APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG));

    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    found = locator.locate(platform.launcherCandidates(config));
    ASSERT_TRUE(found.has_value());
    EXPECT_THAT(found->command, ElementsAre(APPBOOT_SYSTEM_LAUNCHER));

    installEnvironment();
    found = locator.locate(platform.launcherCandidates(config));
    ASSERT_TRUE(found.has_value());
    EXPECT_THAT(found->command, ElementsAre(environmentLauncher()));
}

TEST_F(AppBootLauncherUnitTest, BaseRuntimeCandidates_Order)
{
    auto const candidates = platform.baseRuntimeCandidates();
    ASSERT_EQ(candidates.size(), 3);
    EXPECT_THAT(candidates[0].command, ElementsAre(APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG));
    EXPECT_THAT(candidates[1].command, ElementsAre(APPBOOT_SYSTEM_LAUNCHER));
    EXPECT_THAT(candidates[2].command, ElementsAre(APPBOOT_GENERIC_LAUNCHER));

    // only the generic interpreter installed
    platform.onPath = { APPBOOT_GENERIC_LAUNCHER };
    auto const found = appboot::RuntimeLocator{platform}.locate(candidates);
    ASSERT_TRUE(found.has_value());
    EXPECT_THAT(found->command, ElementsAre(APPBOOT_GENERIC_LAUNCHER));
}

/******************************************
*      ENVIRONMENT PROVISIONER TESTS      *
******************************************/

TEST_F(AppBootLauncherUnitTest, ensure_AlreadyPresent)
{
    installEnvironment();
    auto const before = installRoot.snapshot();

    EXPECT_CALL(platform, runCommand(_, _)).Times(0);
    auto const result = appboot::EnvironmentProvisioner{platform, config}.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::AlreadyPresent);
    EXPECT_EQ(result.error, BootstrapError::None);
    EXPECT_EQ(installRoot.snapshot(), before);
}

TEST_F(AppBootLauncherUnitTest, ensure_Idempotent)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    installManifest();

    auto provisioner = appboot::EnvironmentProvisioner{platform, config};
    auto const first = provisioner.ensure(config.environmentDir, config.manifestPath);
    ASSERT_EQ(first.status, BootstrapStatus::CreatedAndPopulated);
    auto const commandCount = platform.commands.size();
    auto const before = installRoot.snapshot();

    // second call finds the published environment and writes nothing
    auto const second = provisioner.ensure(config.environmentDir, config.manifestPath);
    EXPECT_EQ(second.status, BootstrapStatus::AlreadyPresent);
    EXPECT_EQ(platform.commands.size(), commandCount);
    EXPECT_EQ(installRoot.snapshot(), before);
}

TEST_F(AppBootLauncherUnitTest, ensure_CreatesAndPopulates)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    installManifest();

    auto const result = appboot::EnvironmentProvisioner{platform, config}.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_EQ(result.dependencies, DependencyOutcome::Installed);
    EXPECT_FALSE(result.repaired);
    EXPECT_THAT(result.baseRuntime, HasSubstr(APPBOOT_SYSTEM_LAUNCHER));

    // create, upgrade tooling, install the manifest, in that order
    ASSERT_EQ(platform.commands.size(), 3);
    EXPECT_THAT(platform.commands[0], ElementsAre(APPBOOT_SYSTEM_LAUNCHER, "-m", "venv", config.environmentDir));
    EXPECT_THAT(platform.commands[1], ElementsAre(environmentLauncher(), "-m", "pip", "install", "--upgrade", "pip"));
    EXPECT_THAT(platform.commands[2], ElementsAre(environmentLauncher(), "-m", "pip", "install", "-r", config.manifestPath));

    // published
    EXPECT_TRUE(appboot::pathExists(config.environmentDir + "/" APPBOOT_PROVISIONED_STAMP));
    EXPECT_FALSE(appboot::EnvironmentProvisioner::isPartial(config.environmentDir));

    // later lookups find the environment launcher ahead of the system launcher
    auto const found = appboot::RuntimeLocator{platform}.locate(platform.launcherCandidates(config));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->command.front(), environmentLauncher());
}

TEST_F(AppBootLauncherUnitTest, ensure_MissingManifest)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };

    auto const result = appboot::EnvironmentProvisioner{platform, config}.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_EQ(result.dependencies, DependencyOutcome::SkippedNoManifest);
    EXPECT_EQ(platform.countCommands("-r"), 0);
    EXPECT_TRUE(appboot::pathExists(config.environmentDir + "/" APPBOOT_PROVISIONED_STAMP));
}

TEST_F(AppBootLauncherUnitTest, ensure_NoBaseRuntime)
{
    auto const result = appboot::EnvironmentProvisioner{platform, config}.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::Failed);
    EXPECT_EQ(result.error, BootstrapError::NoBaseRuntime);
    EXPECT_THAT(result.message, HasSubstr(APPBOOT_RUNTIME_URL));
    EXPECT_TRUE(platform.commands.empty());
    EXPECT_FALSE(appboot::pathExists(config.environmentDir));
}

TEST_F(AppBootLauncherUnitTest, ensure_PrefersVersionSelector)
{
    platform.onPath = { APPBOOT_VERSION_SELECTOR, APPBOOT_SYSTEM_LAUNCHER, APPBOOT_GENERIC_LAUNCHER };

    auto const result = appboot::EnvironmentProvisioner{platform, config}.ensure(config.environmentDir, config.manifestPath);

    ASSERT_EQ(result.status, BootstrapStatus::CreatedAndPopulated);
    ASSERT_FALSE(platform.commands.empty());
    EXPECT_THAT(platform.commands[0],
        ElementsAre(APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG, "-m", "venv", config.environmentDir));
}

TEST_F(AppBootLauncherUnitTest, ensure_CreationFails)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    platform.createFails = true;

    auto const result = appboot::EnvironmentProvisioner{platform, config}.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::Failed);
    EXPECT_EQ(result.error, BootstrapError::EnvironmentCreationFailed);
    EXPECT_THAT(result.message, HasSubstr("exited with status 1"));
    EXPECT_EQ(platform.countCommands("pip"), 0);
}

TEST_F(AppBootLauncherUnitTest, ensure_CreationTimeoutAfterLauncherWritten)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    // venv wrote bin/python, then was killed while bootstrapping pip
    platform.createStatus = appboot::ExecStatus{137, true};

    auto provisioner = appboot::EnvironmentProvisioner{platform, config};
    auto const failed = provisioner.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(failed.status, BootstrapStatus::Failed);
    EXPECT_EQ(failed.error, BootstrapError::EnvironmentCreationFailed);
    EXPECT_THAT(failed.message, HasSubstr("timed out"));

    // the launcher is there, but the environment is not accepted
    EXPECT_TRUE(platform.isExecutable(environmentLauncher()));
    EXPECT_TRUE(appboot::EnvironmentProvisioner::isPartial(config.environmentDir));
    EXPECT_FALSE(provisioner.isPresent(config.environmentDir));

    platform.createStatus = appboot::ExecStatus{0, false};
    auto const rebuilt = provisioner.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(rebuilt.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_TRUE(rebuilt.repaired);
    EXPECT_EQ(platform.countCommands("venv"), 2);
    EXPECT_TRUE(provisioner.isPresent(config.environmentDir));
}

TEST_F(AppBootLauncherUnitTest, ensure_RepairsPartialEnvironment)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };

    // launcher present but the last run never finished
    installRoot.writeFile(APPBOOT_DEFAULT_ENV_DIR "/" APPBOOT_ENV_LAUNCHER, "#!/bin/sh\n", 0755);
    installRoot.writeFile(APPBOOT_DEFAULT_ENV_DIR "/" APPBOOT_PROVISIONING_MARKER, "run=interrupted\n");
    installRoot.writeFile(APPBOOT_DEFAULT_ENV_DIR "/lib/half-installed", "");

    auto provisioner = appboot::EnvironmentProvisioner{platform, config};
    EXPECT_FALSE(provisioner.isPresent(config.environmentDir));
    EXPECT_TRUE(appboot::EnvironmentProvisioner::isPartial(config.environmentDir));

    auto const result = provisioner.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_TRUE(result.repaired);
    EXPECT_FALSE(appboot::pathExists(config.environmentDir + "/lib/half-installed"));
    EXPECT_TRUE(provisioner.isPresent(config.environmentDir));
}

TEST_F(AppBootLauncherUnitTest, ensure_FailFastLeavesEnvironmentForRepair)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    platform.installStatus = appboot::ExecStatus{1, false};
    config.dependencyPolicy = appboot::DependencyPolicy::FailFast;
    installManifest();

    auto provisioner = appboot::EnvironmentProvisioner{platform, config};
    auto const failed = provisioner.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(failed.status, BootstrapStatus::Failed);
    EXPECT_EQ(failed.error, BootstrapError::DependencyInstallFailed);
    EXPECT_EQ(failed.dependencies, DependencyOutcome::Failed);
    EXPECT_TRUE(appboot::EnvironmentProvisioner::isPartial(config.environmentDir));
    EXPECT_FALSE(provisioner.isPresent(config.environmentDir));

    // next launch rebuilds it
    platform.installStatus = appboot::ExecStatus{0, false};
    auto const repaired = provisioner.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(repaired.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_EQ(repaired.dependencies, DependencyOutcome::Installed);
    EXPECT_TRUE(repaired.repaired);
    EXPECT_EQ(platform.countCommands("venv"), 2);
}

TEST_F(AppBootLauncherUnitTest, ensure_BestEffortPublishesDespiteDependencyFailure)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    platform.installStatus = appboot::ExecStatus{137, true};
    installManifest();

    auto provisioner = appboot::EnvironmentProvisioner{platform, config};
    auto const result = provisioner.ensure(config.environmentDir, config.manifestPath);

    EXPECT_EQ(result.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_EQ(result.error, BootstrapError::None);
    EXPECT_EQ(result.dependencies, DependencyOutcome::Failed);
    EXPECT_THAT(result.message, HasSubstr("timed out"));
    EXPECT_TRUE(provisioner.isPresent(config.environmentDir));
}

TEST_F(AppBootLauncherUnitTest, ensure_LauncherMissingAfterCreation)
{
    platform.onPath = { APPBOOT_VERSION_SELECTOR };
    platform.createsLauncher = false;
    installManifest();

    auto provisioner = appboot::EnvironmentProvisioner{platform, config};
    auto const result = provisioner.ensure(config.environmentDir, config.manifestPath);

    // nothing can be installed without the launcher, and the environment stays unpublished
    EXPECT_EQ(result.status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_EQ(result.dependencies, DependencyOutcome::Failed);
    EXPECT_EQ(platform.countCommands("pip"), 0);
    EXPECT_TRUE(appboot::EnvironmentProvisioner::isPartial(config.environmentDir));
}

/******************************************
*        LAUNCH ORCHESTRATOR TESTS        *
******************************************/

TEST_F(AppBootLauncherUnitTest, run_ExistingEnvironment)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    installEntry();
    installEnvironment();
    auto const before = installRoot.snapshot();

    EXPECT_CALL(platform, runCommand(_, _)).Times(0);
    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_SUCCESS);

    EXPECT_THAT(orchestrator.states(),
        ElementsAre(LaunchState::Start, LaunchState::Provisioning, LaunchState::Locating, LaunchState::Launching));
    ASSERT_TRUE(orchestrator.bootstrapResult().has_value());
    EXPECT_EQ(orchestrator.bootstrapResult()->status, BootstrapStatus::AlreadyPresent);
    EXPECT_EQ(installRoot.snapshot(), before);

    ASSERT_EQ(platform.handOffs.size(), 1);
    EXPECT_THAT(platform.handOffs[0].argv, ElementsAre(environmentLauncher(), config.entryPath));
    EXPECT_EQ(platform.handOffs[0].workingDir, config.installRoot);
    EXPECT_EQ(platform.handOffs[0].mode, appboot::LaunchMode::Spawn);
}

TEST_F(AppBootLauncherUnitTest, run_NoRuntimeAnywhere)
{
    installEntry();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_NO_BASE_RUNTIME);

    EXPECT_EQ(orchestrator.state(), LaunchState::Failed);
    EXPECT_TRUE(platform.handOffs.empty());
    ASSERT_EQ(platform.messages.size(), 1);
    EXPECT_THAT(platform.messages[0], HasSubstr("Python"));
    EXPECT_THAT(platform.messages[0], HasSubstr(APPBOOT_RUNTIME_URL));
}

TEST_F(AppBootLauncherUnitTest, run_ProvisionsThenUsesEnvironment)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    installEntry();
    installManifest();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_SUCCESS);

    ASSERT_TRUE(orchestrator.bootstrapResult().has_value());
    EXPECT_EQ(orchestrator.bootstrapResult()->status, BootstrapStatus::CreatedAndPopulated);
    EXPECT_EQ(orchestrator.bootstrapResult()->dependencies, DependencyOutcome::Installed);

    // the environment launcher wins over the system launcher that built it
    ASSERT_EQ(platform.handOffs.size(), 1);
    EXPECT_EQ(platform.handOffs[0].argv.front(), environmentLauncher());
}

TEST_F(AppBootLauncherUnitTest, run_OnlyVersionSelector)
{
    platform.onPath = { APPBOOT_VERSION_SELECTOR };
    platform.createsLauncher = false;
    installEntry();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_SUCCESS);

    // used to provision
    ASSERT_FALSE(platform.commands.empty());
    EXPECT_THAT(platform.commands[0],
        ElementsAre(APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG, "-m", "venv", config.environmentDir));

    // and to launch, since the environment launcher never appeared
    ASSERT_EQ(platform.handOffs.size(), 1);
    EXPECT_THAT(platform.handOffs[0].argv,
        ElementsAre(APPBOOT_VERSION_SELECTOR, APPBOOT_VERSION_SELECTOR_ARG, config.entryPath));
}

TEST_F(AppBootLauncherUnitTest, run_EntryMissing)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_ENTRY_MISSING);

    EXPECT_THAT(orchestrator.states(), ElementsAre(LaunchState::Start, LaunchState::Failed));
    EXPECT_TRUE(platform.commands.empty());
    ASSERT_EQ(platform.messages.size(), 1);
    EXPECT_THAT(platform.messages[0], HasSubstr(config.entryPath));
}

TEST_F(AppBootLauncherUnitTest, run_WithoutAutoSetup)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    config.autoSetup = false;
    installEntry();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_SUCCESS);

    EXPECT_THAT(orchestrator.states(), ElementsAre(LaunchState::Start, LaunchState::Locating, LaunchState::Launching));
    EXPECT_FALSE(orchestrator.bootstrapResult().has_value());
    EXPECT_TRUE(platform.commands.empty());
    ASSERT_EQ(platform.handOffs.size(), 1);
    EXPECT_THAT(platform.handOffs[0].argv, ElementsAre(APPBOOT_SYSTEM_LAUNCHER, config.entryPath));
}

TEST_F(AppBootLauncherUnitTest, run_RuntimeUnavailable)
{
    config.autoSetup = false;
    installEntry();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_RUNTIME_UNAVAILABLE);

    EXPECT_THAT(orchestrator.states(), ElementsAre(LaunchState::Start, LaunchState::Locating, LaunchState::Failed));
    ASSERT_EQ(platform.messages.size(), 1);
    EXPECT_THAT(platform.messages[0], HasSubstr(APPBOOT_RUNTIME_URL));
}

TEST_F(AppBootLauncherUnitTest, run_EnvironmentCreationFailed)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    platform.createFails = true;
    installEntry();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_ENV_CREATION_FAILED);
    EXPECT_TRUE(platform.handOffs.empty());
    EXPECT_EQ(platform.messages.size(), 1);
}

TEST_F(AppBootLauncherUnitTest, run_FailFastDependencyFailure)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    platform.installStatus = appboot::ExecStatus{1, false};
    config.dependencyPolicy = appboot::DependencyPolicy::FailFast;
    installEntry();
    installManifest();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_DEPENDENCY_FAILED);
    EXPECT_TRUE(platform.handOffs.empty());
}

TEST_F(AppBootLauncherUnitTest, run_BestEffortDependencyFailureStillLaunches)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    platform.installStatus = appboot::ExecStatus{1, false};
    installEntry();
    installManifest();

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_SUCCESS);
    ASSERT_EQ(platform.handOffs.size(), 1);
    EXPECT_EQ(platform.handOffs[0].argv.front(), environmentLauncher());
}

TEST_F(AppBootLauncherUnitTest, run_HandOffFailure)
{
    platform.onPath = { APPBOOT_SYSTEM_LAUNCHER };
    installEntry();
    installEnvironment();

    EXPECT_CALL(platform, handOff(_, _, _))
        .WillOnce(Throw(std::runtime_error("executing python failed: Permission denied")));

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_LAUNCH_FAILED);

    EXPECT_EQ(orchestrator.state(), LaunchState::Failed);
    ASSERT_EQ(platform.messages.size(), 1);
    EXPECT_THAT(platform.messages[0], HasSubstr("Permission denied"));
}

TEST_F(AppBootLauncherUnitTest, run_ForwardsTargetArguments)
{
    installEntry();
    installEnvironment();
    config.targetArgs = { "--report", "daily run" };
    config.launchMode = appboot::LaunchMode::Exec;

    auto orchestrator = appboot::LaunchOrchestrator{platform, config};
    EXPECT_EQ(orchestrator.run(), APPBOOT_EXIT_SUCCESS);

    ASSERT_EQ(platform.handOffs.size(), 1);
    EXPECT_THAT(platform.handOffs[0].argv, ElementsAre(environmentLauncher(), config.entryPath, "--report", "daily run"));
    EXPECT_EQ(platform.handOffs[0].mode, appboot::LaunchMode::Exec);
}
