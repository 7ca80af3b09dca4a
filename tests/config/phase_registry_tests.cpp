#include <gtest/gtest.h>
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/phase_registry.hpp"

using namespace phasegraph;

// =============================================================================
// Test Fixture
// =============================================================================

class PhaseRegistryTests : public ::testing::Test
{
protected:
    static PhaseJson phase(const std::string& name,
                           std::vector<std::string> self = {},
                           std::vector<std::string> upstream = {})
    {
        PhaseJson json;
        json.name = name;
        json.self_dependencies = std::move(self);
        json.upstream_dependencies = std::move(upstream);
        return json;
    }

    static ConfigurationErrorCode error_code_of(PhaseRegistry& registry, const std::vector<PhaseJson>& phases)
    {
        try
        {
            registry.add_declared_phases(phases);
        }
        catch (const ConfigurationError& e)
        {
            return e.code();
        }
        ADD_FAILURE() << "expected a ConfigurationError";
        return ConfigurationErrorCode::MissingPhase;
    }

    PhaseRegistry registry;
};

// =============================================================================
// Name validation
// =============================================================================

TEST_F(PhaseRegistryTests, IsValidPhaseName_AcceptsPrefixedKebabCase)
{
    EXPECT_TRUE(PhaseRegistry::is_valid_phase_name("_phase:build"));
    EXPECT_TRUE(PhaseRegistry::is_valid_phase_name("_phase:lint-2"));
    EXPECT_TRUE(PhaseRegistry::is_valid_phase_name("_phase:a1-b2-c3"));
}

TEST_F(PhaseRegistryTests, IsValidPhaseName_RejectsMalformedNames)
{
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("build"));
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("_phase:"));
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("_phase:Build"));
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("_phase:1build"));
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("_phase:build-"));
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("_phase:build--test"));
    EXPECT_FALSE(PhaseRegistry::is_valid_phase_name("_phase:build_test"));
}

TEST_F(PhaseRegistryTests, AddDeclaredPhases_InvalidName_Throws)
{
    EXPECT_EQ(error_code_of(registry, {phase("_phase:Build")}), ConfigurationErrorCode::InvalidPhaseName);
}

TEST_F(PhaseRegistryTests, AddDeclaredPhases_DuplicateName_Throws)
{
    EXPECT_EQ(error_code_of(registry, {phase("_phase:build"), phase("_phase:build")}),
              ConfigurationErrorCode::DuplicatePhaseName);
}

TEST_F(PhaseRegistryTests, LogFilenameIdentifier_ReplacesColons)
{
    registry.add_declared_phases({phase("_phase:build")});
    EXPECT_EQ(registry.at(0).log_filename_identifier, "_phase_build");
    EXPECT_EQ(PhaseRegistry::normalize_log_filename_identifier("a:b:c"), "a_b_c");
}

// =============================================================================
// Dependency resolution
// =============================================================================

TEST_F(PhaseRegistryTests, AddDeclaredPhases_ResolvesForwardReferences)
{
    registry.add_declared_phases({
        phase("_phase:test", {"_phase:build"}),
        phase("_phase:build", {}, {"_phase:build"}),
    });

    ASSERT_EQ(registry.size(), 2u);
    PhaseIdx test = *registry.find("_phase:test");
    PhaseIdx build = *registry.find("_phase:build");
    EXPECT_TRUE(registry.at(test).dependencies.self.contains(build));
    EXPECT_TRUE(registry.at(build).dependencies.upstream.contains(build));
    EXPECT_FALSE(registry.at(build).is_synthetic);
}

TEST_F(PhaseRegistryTests, AddDeclaredPhases_MissingSelfDependency_NamesBothPhases)
{
    try
    {
        registry.add_declared_phases({phase("_phase:test", {"_phase:compile"})});
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::MissingPhase);
        EXPECT_EQ(std::string(e.what()),
                  "In command-line.json, in the phase \"_phase:test\", the self dependency phase "
                  "\"_phase:compile\" does not exist.");
    }
}

TEST_F(PhaseRegistryTests, AddDeclaredPhases_MissingUpstreamDependency_Throws)
{
    EXPECT_EQ(error_code_of(registry, {phase("_phase:test", {}, {"_phase:compile"})}),
              ConfigurationErrorCode::MissingPhase);
}

// =============================================================================
// Cycle detection
// =============================================================================

TEST_F(PhaseRegistryTests, SelfDependencyCycle_IsRejected)
{
    try
    {
        registry.add_declared_phases({
            phase("_phase:a", {"_phase:b"}),
            phase("_phase:b", {"_phase:c"}),
            phase("_phase:c", {"_phase:a"}),
        });
        FAIL() << "expected a ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(e.code(), ConfigurationErrorCode::PhaseCycleDetected);
        std::string message = e.what();
        EXPECT_NE(message.find("there exists a cycle"), std::string::npos) << message;
        EXPECT_NE(message.find("_phase:a, _phase:b, _phase:c, _phase:a"), std::string::npos) << message;
    }
}

TEST_F(PhaseRegistryTests, DirectSelfLoop_IsRejected)
{
    EXPECT_EQ(error_code_of(registry, {phase("_phase:a", {"_phase:a"})}),
              ConfigurationErrorCode::PhaseCycleDetected);
}

TEST_F(PhaseRegistryTests, UpstreamSelfReference_IsNotACycle)
{
    EXPECT_NO_THROW(registry.add_declared_phases({
        phase("_phase:build", {}, {"_phase:build"}),
        phase("_phase:test", {"_phase:build"}, {"_phase:test"}),
    }));
}

TEST_F(PhaseRegistryTests, DiamondSelfDependencies_AreNotACycle)
{
    EXPECT_NO_THROW(registry.add_declared_phases({
        phase("_phase:a"),
        phase("_phase:b", {"_phase:a"}),
        phase("_phase:c", {"_phase:a"}),
        phase("_phase:d", {"_phase:b", "_phase:c"}),
    }));
}

// =============================================================================
// Expansion and synthetic phases
// =============================================================================

TEST_F(PhaseRegistryTests, ExpandDependencies_IsTransitive)
{
    registry.add_declared_phases({
        phase("_phase:a"),
        phase("_phase:b", {"_phase:a"}),
        phase("_phase:c", {"_phase:b"}),
        phase("_phase:unused"),
    });

    IndexSet selection{*registry.find("_phase:c")};
    registry.expand_dependencies(selection);

    EXPECT_EQ(selection.size(), 3u);
    EXPECT_TRUE(selection.contains(*registry.find("_phase:a")));
    EXPECT_TRUE(selection.contains(*registry.find("_phase:b")));
    EXPECT_FALSE(selection.contains(*registry.find("_phase:unused")));
}

TEST_F(PhaseRegistryTests, AddSyntheticPhase_DependsOnUpstreamSelfByDefault)
{
    PhaseIdx idx = registry.add_synthetic_phase("build", false, true, true);

    const Phase& phase = registry.at(idx);
    EXPECT_TRUE(phase.is_synthetic);
    EXPECT_TRUE(phase.allow_warnings_on_success);
    EXPECT_TRUE(phase.dependencies.upstream.contains(idx));
    EXPECT_TRUE(phase.dependencies.self.empty());
}

TEST_F(PhaseRegistryTests, AddSyntheticPhase_IgnoringDependencyOrder_HasNoEdges)
{
    PhaseIdx idx = registry.add_synthetic_phase("lint", true, false, false);
    EXPECT_TRUE(registry.at(idx).dependencies.upstream.empty());
    EXPECT_TRUE(registry.at(idx).ignore_missing_script);
}

TEST_F(PhaseRegistryTests, At_UnknownIndex_Throws)
{
    EXPECT_THROW(registry.at(3), std::out_of_range);
    EXPECT_FALSE(registry.find("_phase:none").has_value());
}
