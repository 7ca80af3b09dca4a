#include <gtest/gtest.h>
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/parameter_binder.hpp"

using namespace phasegraph;

// =============================================================================
// Test Fixture
// =============================================================================

class ParameterBinderTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        PhaseJson compile;
        compile.name = "_phase:compile";
        phases.add_declared_phases({compile});

        CommandJson phased;
        phased.command_kind = CommandKind::Phased;
        phased.name = "test";
        phased.phases = {"_phase:compile"};

        CommandJson bulk;
        bulk.command_kind = CommandKind::Bulk;
        bulk.name = "lint";

        CommandJson global;
        global.command_kind = CommandKind::Global;
        global.name = "deploy";
        global.shell_command = "deploy.sh";

        commands.add_declared_commands({phased, bulk, global});
    }

    static ParameterJson flag(const std::string& long_name, std::vector<std::string> associated_commands)
    {
        ParameterJson json;
        json.parameter_kind = ParameterKind::Flag;
        json.long_name = long_name;
        json.associated_commands = std::move(associated_commands);
        return json;
    }

    ConfigurationErrorCode bind_error(const ParameterJson& json)
    {
        try
        {
            binder.bind(json, 0);
        }
        catch (const ConfigurationError& e)
        {
            return e.code();
        }
        ADD_FAILURE() << "expected a ConfigurationError";
        return ConfigurationErrorCode::MissingCommand;
    }

    PhaseRegistry phases;
    CommandRegistry commands{phases};
    ParameterBinder binder{phases, commands};
};

// =============================================================================
// Association
// =============================================================================

TEST_F(ParameterBinderTests, PhasedCommandAndPhase_AreBothLinked)
{
    ParameterJson json = flag("--production", {"test"});
    json.associated_phases = {"_phase:compile"};

    Parameter parameter = binder.bind(json, 3);

    const Command& test = commands.at(*commands.find("test"));
    EXPECT_TRUE(command_parameters(test)->contains(3));

    PhaseIdx compile = *phases.find("_phase:compile");
    EXPECT_TRUE(phases.at(compile).associated_parameters.contains(3));
    EXPECT_TRUE(parameter.phase_indices.contains(compile));
    ASSERT_EQ(parameter.command_indices.size(), 1u);
    EXPECT_EQ(parameter.command_indices[0], *commands.find("test"));
}

TEST_F(ParameterBinderTests, BulkCommand_ImplicitlyAssociatesItsSyntheticPhase)
{
    Parameter parameter = binder.bind(flag("--fix", {"lint"}), 0);

    PhaseIdx synthetic = *commands.synthetic_phase_for_bulk_command("lint");
    EXPECT_TRUE(parameter.phase_indices.contains(synthetic));
    EXPECT_TRUE(phases.at(synthetic).associated_parameters.contains(0));
    ASSERT_EQ(parameter.associated_phases.size(), 1u);
    EXPECT_EQ(parameter.associated_phases[0], "lint");
}

TEST_F(ParameterBinderTests, GlobalCommand_NeedsNoPhase)
{
    Parameter parameter = binder.bind(flag("--dry-run", {"deploy"}), 1);

    EXPECT_TRUE(parameter.phase_indices.empty());
    const Command& deploy = commands.at(*commands.find("deploy"));
    EXPECT_TRUE(command_parameters(deploy)->contains(1));
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ParameterBinderTests, UnknownCommand_Throws)
{
    EXPECT_EQ(bind_error(flag("--verbose", {"nope"})), ConfigurationErrorCode::MissingCommand);
}

TEST_F(ParameterBinderTests, UnknownPhase_Throws)
{
    ParameterJson json = flag("--verbose", {"test"});
    json.associated_phases = {"_phase:nope"};
    EXPECT_EQ(bind_error(json), ConfigurationErrorCode::MissingPhase);
}

TEST_F(ParameterBinderTests, NoCommands_Throws)
{
    EXPECT_EQ(bind_error(flag("--orphan", {})), ConfigurationErrorCode::ParameterWithoutCommand);
}

TEST_F(ParameterBinderTests, OnlyPhasedCommandsWithoutPhases_Throws)
{
    try
    {
        binder.bind(flag("--quiet", {"test"}), 0);
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::ParameterWithoutPhase);
        EXPECT_NE(std::string(e.what()).find("\"--quiet\""), std::string::npos);
    }
}

TEST_F(ParameterBinderTests, ChoiceDefaultOutsideAlternatives_Throws)
{
    ParameterJson json;
    json.parameter_kind = ParameterKind::Choice;
    json.long_name = "--locale";
    json.associated_commands = {"deploy"};
    json.alternatives = {{"en-us", "English"}, {"fr-fr", "French"}};
    json.default_value = "de-de";

    try
    {
        binder.bind(json, 0);
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::InvalidChoiceDefault);
        std::string message = e.what();
        EXPECT_NE(message.find("\"de-de\""), std::string::npos) << message;
        EXPECT_NE(message.find("\"en-us,fr-fr\""), std::string::npos) << message;
    }
}

// =============================================================================
// Argument formatting
// =============================================================================

TEST_F(ParameterBinderTests, FormatArguments_PerKind)
{
    Parameter flag_parameter;
    flag_parameter.kind = ParameterKind::Flag;
    flag_parameter.long_name = "--production";

    Parameter choice;
    choice.kind = ParameterKind::Choice;
    choice.long_name = "--locale";
    choice.default_value = "en-us";

    Parameter text;
    text.kind = ParameterKind::String;
    text.long_name = "--message";

    ParameterValues none;
    EXPECT_TRUE(format_parameter_arguments(flag_parameter, none).empty());
    EXPECT_EQ(format_parameter_arguments(choice, none), (std::vector<std::string>{"--locale", "en-us"}));
    EXPECT_TRUE(format_parameter_arguments(text, none).empty());

    ParameterValues values{{"--production", ""}, {"--locale", "fr-fr"}, {"--message", "hi there"}};
    EXPECT_EQ(format_parameter_arguments(flag_parameter, values), (std::vector<std::string>{"--production"}));
    EXPECT_EQ(format_parameter_arguments(choice, values), (std::vector<std::string>{"--locale", "fr-fr"}));
    EXPECT_EQ(format_parameter_arguments(text, values), (std::vector<std::string>{"--message", "hi there"}));
}
