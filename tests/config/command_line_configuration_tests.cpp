#include <gtest/gtest.h>
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command_line_configuration.hpp"

using namespace phasegraph;

namespace
{

PhaseJson make_phase(const std::string& name,
                     std::vector<std::string> self = {},
                     std::vector<std::string> upstream = {})
{
    PhaseJson json;
    json.name = name;
    json.self_dependencies = std::move(self);
    json.upstream_dependencies = std::move(upstream);
    return json;
}

CommandJson make_phased(const std::string& name, std::vector<std::string> phases)
{
    CommandJson json;
    json.command_kind = CommandKind::Phased;
    json.name = name;
    json.phases = std::move(phases);
    return json;
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(CommandLineConfigurationTests, EmptyFile_YieldsBuildAndRebuild)
{
    CommandLineConfiguration configuration{CommandLineJson{}};

    EXPECT_EQ(configuration.commands().size(), 2u);
    const PhasedCommand& build = configuration.get_phased_command("build");
    const PhasedCommand& rebuild = configuration.get_phased_command("rebuild");

    ASSERT_EQ(build.phases->size(), 1u);
    EXPECT_EQ(configuration.phases().at(build.phases->at(0)).name, "build");
    EXPECT_EQ(build.phases.get(), rebuild.phases.get());
    EXPECT_EQ(build.associated_parameters.get(), rebuild.associated_parameters.get());
}

TEST(CommandLineConfigurationTests, ParameterOnBuild_IsVisibleOnRebuild)
{
    CommandLineJson json;
    ParameterJson production;
    production.parameter_kind = ParameterKind::Flag;
    production.long_name = "--production";
    production.associated_commands = {"build"};

    CommandJson build;
    build.command_kind = CommandKind::Bulk;
    build.name = "build";
    json.commands.push_back(build);
    json.parameters.push_back(production);

    CommandLineConfiguration configuration{json};

    const PhasedCommand& rebuild = configuration.get_phased_command("rebuild");
    EXPECT_TRUE(rebuild.associated_parameters->contains(0));
    EXPECT_EQ(configuration.parameter(0).long_name, "--production");
    EXPECT_EQ(configuration.parameters().size(), 1u);
}

TEST(CommandLineConfigurationTests, WithoutDefaults_OnlyDeclaredCommandsExist)
{
    CommandLineJson json;
    json.phases = {make_phase("_phase:compile")};
    json.commands = {make_phased("compile", {"_phase:compile"})};

    CommandLineConfigurationOptions options;
    options.include_default_build_commands = false;
    CommandLineConfiguration configuration{json, options};

    EXPECT_EQ(configuration.commands().size(), 1u);
    EXPECT_FALSE(configuration.commands().find("build").has_value());
}

TEST(CommandLineConfigurationTests, MergeDefaultBuildCommands_FillsUnsetFields)
{
    CommandLineJson json;
    CommandJson build;
    build.command_kind = CommandKind::Bulk;
    build.name = "build";
    build.enable_parallelism = false;
    json.commands.push_back(build);

    CommandLineJson merged = CommandLineConfiguration::merge_default_build_commands(json);
    ASSERT_EQ(merged.commands.size(), 1u);
    EXPECT_EQ(merged.commands[0].enable_parallelism, false);
    EXPECT_EQ(merged.commands[0].incremental, true);

    CommandLineConfiguration configuration{merged};
    EXPECT_FALSE(configuration.get_phased_command("build").enable_parallelism);
    EXPECT_TRUE(configuration.get_phased_command("build").incremental);
}

// =============================================================================
// Expansion closure
// =============================================================================

TEST(CommandLineConfigurationTests, PhasedCommand_PhaseSetIsClosedUnderDependencies)
{
    CommandLineJson json;
    json.phases = {
        make_phase("_phase:compile", {}, {"_phase:compile"}),
        make_phase("_phase:lint", {}, {"_phase:compile"}),
        make_phase("_phase:test", {"_phase:compile", "_phase:lint"}),
        make_phase("_phase:deploy", {"_phase:test"}),
    };
    json.commands = {make_phased("test", {"_phase:test"})};

    CommandLineConfiguration configuration{json};
    const PhasedCommand& test = configuration.get_phased_command("test");

    EXPECT_TRUE(test.phases->contains(*configuration.phases().find("_phase:test")));
    EXPECT_FALSE(test.phases->contains(*configuration.phases().find("_phase:deploy")));
    for (PhaseIdx idx : *test.phases)
    {
        const Phase& phase = configuration.phases().at(idx);
        for (PhaseIdx dependency : phase.dependencies.self)
        {
            EXPECT_TRUE(test.phases->contains(dependency)) << phase.name;
        }
        for (PhaseIdx dependency : phase.dependencies.upstream)
        {
            EXPECT_TRUE(test.phases->contains(dependency)) << phase.name;
        }
    }
}

// =============================================================================
// Lookup
// =============================================================================

TEST(CommandLineConfigurationTests, GetCommand_Unknown_Throws)
{
    CommandLineConfiguration configuration{CommandLineJson{}};
    try
    {
        configuration.get_command("publish");
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::MissingCommand);
        EXPECT_EQ(std::string(e.what()), "The command \"publish\" is not defined in command-line.json.");
    }
}

TEST(CommandLineConfigurationTests, GetCommand_WrongKind_Throws)
{
    CommandLineJson json;
    CommandJson deploy;
    deploy.command_kind = CommandKind::Global;
    deploy.name = "deploy";
    deploy.shell_command = "deploy.sh";
    json.commands.push_back(deploy);

    CommandLineConfiguration configuration{json};

    EXPECT_EQ(configuration.get_global_command("deploy").shell_command, "deploy.sh");
    try
    {
        configuration.get_phased_command("deploy");
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::WrongCommandKind);
    }
    EXPECT_THROW(configuration.get_global_command("build"), ConfigurationError);
}

TEST(CommandLineConfigurationTests, InvalidConfiguration_FailsAtConstruction)
{
    CommandLineJson json;
    json.phases = {make_phase("_phase:a", {"_phase:b"}), make_phase("_phase:b", {"_phase:a"})};
    EXPECT_THROW(CommandLineConfiguration{json}, ConfigurationError);
}
