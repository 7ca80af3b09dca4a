#include <gtest/gtest.h>
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command_registry.hpp"

using namespace phasegraph;

// =============================================================================
// Test Fixture
// =============================================================================

class CommandRegistryTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        PhaseJson compile;
        compile.name = "_phase:compile";
        compile.upstream_dependencies = {"_phase:compile"};

        PhaseJson test;
        test.name = "_phase:test";
        test.self_dependencies = {"_phase:compile"};

        phases.add_declared_phases({compile, test});
    }

    static CommandJson bulk(const std::string& name)
    {
        CommandJson json;
        json.command_kind = CommandKind::Bulk;
        json.name = name;
        return json;
    }

    static CommandJson phased(const std::string& name, std::vector<std::string> phase_names)
    {
        CommandJson json;
        json.command_kind = CommandKind::Phased;
        json.name = name;
        json.phases = std::move(phase_names);
        return json;
    }

    static CommandJson global(const std::string& name)
    {
        CommandJson json;
        json.command_kind = CommandKind::Global;
        json.name = name;
        json.shell_command = "echo hello";
        return json;
    }

    const PhasedCommand& phased_at(const std::string& name) const
    {
        return std::get<PhasedCommand>(commands.at(*commands.find(name)));
    }

    PhaseRegistry phases;
    CommandRegistry commands{phases};
};

// =============================================================================
// Phased commands
// =============================================================================

TEST_F(CommandRegistryTests, PhasedCommand_ExpandsSelfDependencies)
{
    commands.add_declared_commands({phased("test", {"_phase:test"})});

    const PhasedCommand& command = phased_at("test");
    EXPECT_FALSE(command.is_synthetic);
    EXPECT_EQ(command.phases->size(), 2u);
    EXPECT_TRUE(command.phases->contains(*phases.find("_phase:compile")));
    EXPECT_TRUE(command.phases->contains(*phases.find("_phase:test")));
}

TEST_F(CommandRegistryTests, PhasedCommand_MissingPhase_Throws)
{
    try
    {
        commands.add_declared_commands({phased("test", {"_phase:nope"})});
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::MissingPhase);
        EXPECT_EQ(std::string(e.what()),
                  "In command-line.json, in the \"phases\" property of the \"test\" command, the "
                  "phase \"_phase:nope\" does not exist.");
    }
}

TEST_F(CommandRegistryTests, PhasedCommand_WatchPhasesAreNotExpanded)
{
    CommandJson json = phased("dev", {"_phase:test"});
    json.watch_options = WatchOptionsJson{true, {"_phase:test"}};
    commands.add_declared_commands({json});

    const PhasedCommand& command = phased_at("dev");
    EXPECT_TRUE(command.always_watch);
    EXPECT_EQ(command.watch_phases->size(), 1u);
    EXPECT_TRUE(command.watch_phases->contains(*phases.find("_phase:test")));
}

TEST_F(CommandRegistryTests, DuplicateCommand_Throws)
{
    try
    {
        commands.add_declared_commands({global("deploy"), global("deploy")});
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::DuplicateCommandName);
    }
}

// =============================================================================
// Bulk translation
// =============================================================================

TEST_F(CommandRegistryTests, BulkCommand_BecomesSyntheticPhasedCommand)
{
    CommandJson json = bulk("lint");
    json.ignore_missing_script = true;
    json.allow_warnings_in_successful_build = true;
    commands.add_declared_commands({json});

    const PhasedCommand& command = phased_at("lint");
    EXPECT_TRUE(command.is_synthetic);
    ASSERT_EQ(command.phases->size(), 1u);

    PhaseIdx synthetic = command.phases->at(0);
    EXPECT_EQ(commands.synthetic_phase_for_bulk_command("lint"), synthetic);

    const Phase& phase = phases.at(synthetic);
    EXPECT_EQ(phase.name, "lint");
    EXPECT_TRUE(phase.is_synthetic);
    EXPECT_TRUE(phase.ignore_missing_script);
    EXPECT_TRUE(phase.allow_warnings_on_success);
    EXPECT_TRUE(phase.dependencies.upstream.contains(synthetic));
}

TEST_F(CommandRegistryTests, BulkCommand_IgnoreDependencyOrder_DropsUpstreamEdge)
{
    CommandJson json = bulk("format");
    json.ignore_dependency_order = true;
    commands.add_declared_commands({json});

    PhaseIdx synthetic = *commands.synthetic_phase_for_bulk_command("format");
    EXPECT_TRUE(phases.at(synthetic).dependencies.upstream.empty());
}

TEST_F(CommandRegistryTests, BulkCommand_WatchForChanges_WatchesItsOwnPhase)
{
    CommandJson json = bulk("start");
    json.watch_for_changes = true;
    commands.add_declared_commands({json});

    const PhasedCommand& command = phased_at("start");
    EXPECT_TRUE(command.always_watch);
    EXPECT_EQ(*command.watch_phases, *command.phases);
}

// =============================================================================
// build / rebuild
// =============================================================================

TEST_F(CommandRegistryTests, BuildAsGlobal_IsRejectedNamingAllKinds)
{
    try
    {
        commands.add_declared_commands({global("build")});
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::InvalidBuildCommandKind);
        std::string message = e.what();
        EXPECT_NE(message.find("\"build\""), std::string::npos) << message;
        EXPECT_NE(message.find("\"global\""), std::string::npos) << message;
        EXPECT_NE(message.find("\"bulk\""), std::string::npos) << message;
        EXPECT_NE(message.find("\"phased\""), std::string::npos) << message;
    }
}

TEST_F(CommandRegistryTests, RebuildAsGlobal_IsRejected)
{
    EXPECT_THROW(commands.add_declared_commands({global("rebuild")}), ConfigurationError);
}

TEST_F(CommandRegistryTests, BuildSafeForSimultaneousProcesses_IsRejected)
{
    CommandJson json = phased("build", {"_phase:compile"});
    json.safe_for_simultaneous_rush_processes = true;
    try
    {
        commands.add_declared_commands({json});
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::UnsafeBuildCommand);
        std::string message = e.what();
        EXPECT_NE(message.find("safeForSimultaneousRushProcesses=true"), std::string::npos) << message;
        EXPECT_NE(message.find("\"build\""), std::string::npos) << message;
    }
}

TEST_F(CommandRegistryTests, DefaultBuildCommands_AreAddedWhenMissing)
{
    commands.add_default_build_commands();

    const PhasedCommand& build = phased_at("build");
    const PhasedCommand& rebuild = phased_at("rebuild");

    EXPECT_TRUE(build.is_synthetic);
    EXPECT_TRUE(build.incremental);
    EXPECT_TRUE(build.enable_parallelism);
    EXPECT_FALSE(rebuild.incremental);
    EXPECT_TRUE(rebuild.enable_parallelism);
}

TEST_F(CommandRegistryTests, DefaultRebuild_SharesPhasesAndParametersWithBuild)
{
    commands.add_declared_commands({phased("build", {"_phase:compile"})});
    commands.add_default_build_commands();

    const PhasedCommand& build = phased_at("build");
    const PhasedCommand& rebuild = phased_at("rebuild");

    EXPECT_EQ(build.phases.get(), rebuild.phases.get());
    EXPECT_EQ(build.associated_parameters.get(), rebuild.associated_parameters.get());

    build.associated_parameters->insert(7);
    EXPECT_TRUE(rebuild.associated_parameters->contains(7));
}

TEST_F(CommandRegistryTests, DeclaredRebuild_IsKept)
{
    commands.add_declared_commands({phased("rebuild", {"_phase:test"})});
    commands.add_default_build_commands();

    EXPECT_EQ(phased_at("rebuild").phases->size(), 2u);
    EXPECT_NE(phased_at("build").phases.get(), phased_at("rebuild").phases.get());
}

TEST_F(CommandRegistryTests, MergeCommandJson_RepositoryValuesWin)
{
    CommandJson repo = bulk("build");
    repo.enable_parallelism = false;
    repo.summary = "Custom build";

    CommandJson merged = CommandRegistry::merge_command_json(CommandRegistry::default_build_command_json(), repo);

    EXPECT_EQ(merged.enable_parallelism, false);
    EXPECT_EQ(merged.summary, std::string("Custom build"));
    EXPECT_EQ(merged.incremental, true);
    EXPECT_TRUE(merged.description.has_value());
    EXPECT_EQ(merged.command_kind, CommandKind::Bulk);
}
