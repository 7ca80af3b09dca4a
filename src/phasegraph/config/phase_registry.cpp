#include "phasegraph/config/phase_registry.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <regex>

namespace phasegraph
{

// ============================================================================
// Name helpers
// ============================================================================

bool PhaseRegistry::is_valid_phase_name(const std::string& name)
{
    static const std::regex phase_name_regex{
        std::string{"^"} + constants::phase_name_prefix + "[a-z][a-z0-9]*([-][a-z0-9]+)*$"};
    return std::regex_match(name, phase_name_regex);
}

std::string PhaseRegistry::normalize_log_filename_identifier(const std::string& name)
{
    std::string result = name;
    std::replace(result.begin(), result.end(), ':', '_');
    return result;
}

// ============================================================================
// Loading
// ============================================================================

void PhaseRegistry::add_declared_phases(const std::vector<PhaseJson>& phases)
{
    // Pass 1: register every phase so that dependencies may refer forward.
    std::vector<PhaseIdx> declared;
    declared.reserve(phases.size());
    for (const auto& raw : phases)
    {
        if (m_index_by_name.count(raw.name) != 0)
        {
            throw ConfigurationError(
                ConfigurationErrorCode::DuplicatePhaseName,
                fmt::format("In {}, the phase \"{}\" is specified more than once.",
                            constants::command_line_filename, raw.name));
        }

        if (!is_valid_phase_name(raw.name))
        {
            throw ConfigurationError(
                ConfigurationErrorCode::InvalidPhaseName,
                fmt::format("In {}, the phase \"{}\"'s name is not a valid phase name. Phase names "
                            "must begin with the required prefix \"{}\" followed by a name containing "
                            "lowercase letters, numbers, or hyphens. The name must start with a "
                            "letter and must not end with a hyphen.",
                            constants::command_line_filename, raw.name,
                            constants::phase_name_prefix));
        }

        Phase phase;
        phase.name = raw.name;
        phase.is_synthetic = false;
        phase.log_filename_identifier = normalize_log_filename_identifier(raw.name);
        phase.ignore_missing_script = raw.ignore_missing_script;
        phase.allow_warnings_on_success = raw.allow_warnings_on_success;
        declared.push_back(add_phase(std::move(phase)));
    }

    // Pass 2: resolve dependency names.
    for (size_t i = 0; i < phases.size(); ++i)
    {
        const PhaseJson& raw = phases[i];
        Phase& phase = m_phases[declared[i]];

        for (const auto& dependency_name : raw.self_dependencies)
        {
            auto dependency = find(dependency_name);
            if (!dependency)
            {
                throw ConfigurationError(
                    ConfigurationErrorCode::MissingPhase,
                    fmt::format("In {}, in the phase \"{}\", the self dependency phase \"{}\" "
                                "does not exist.",
                                constants::command_line_filename, phase.name, dependency_name));
            }
            phase.dependencies.self.insert(*dependency);
        }

        for (const auto& dependency_name : raw.upstream_dependencies)
        {
            auto dependency = find(dependency_name);
            if (!dependency)
            {
                throw ConfigurationError(
                    ConfigurationErrorCode::MissingPhase,
                    fmt::format("In {}, in the phase \"{}\", the upstream dependency phase \"{}\" "
                                "does not exist.",
                                constants::command_line_filename, phase.name, dependency_name));
            }
            phase.dependencies.upstream.insert(*dependency);
        }
    }

    // Pass 3: the recursive check, now that all edges exist.
    check_for_self_cycles();
}

PhaseIdx PhaseRegistry::add_synthetic_phase(const std::string& name,
                                            bool ignore_missing_script,
                                            bool allow_warnings_on_success,
                                            bool depends_on_upstream_self)
{
    if (m_index_by_name.count(name) != 0)
    {
        throw ConfigurationError(
            ConfigurationErrorCode::DuplicatePhaseName,
            fmt::format("In {}, the phase \"{}\" generated for the bulk command \"{}\" conflicts "
                        "with an existing phase.",
                        constants::command_line_filename, name, name));
    }

    Phase phase;
    phase.name = name;
    phase.is_synthetic = true;
    phase.log_filename_identifier = normalize_log_filename_identifier(name);
    phase.ignore_missing_script = ignore_missing_script;
    phase.allow_warnings_on_success = allow_warnings_on_success;

    PhaseIdx idx = add_phase(std::move(phase));
    if (depends_on_upstream_self)
    {
        m_phases[idx].dependencies.upstream.insert(idx);
    }
    return idx;
}

PhaseIdx PhaseRegistry::add_phase(Phase phase)
{
    PhaseIdx idx = m_phases.size();
    m_index_by_name.emplace(phase.name, idx);
    m_phases.push_back(std::move(phase));
    return idx;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<PhaseIdx> PhaseRegistry::find(const std::string& name) const
{
    auto it = m_index_by_name.find(name);
    if (it == m_index_by_name.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Phase& PhaseRegistry::at(PhaseIdx idx) const
{
    if (idx >= m_phases.size())
    {
        throw std::out_of_range("PhaseRegistry::at: phase index " + std::to_string(idx) +
                                " does not exist");
    }
    return m_phases[idx];
}

Phase& PhaseRegistry::at(PhaseIdx idx)
{
    if (idx >= m_phases.size())
    {
        throw std::out_of_range("PhaseRegistry::at: phase index " + std::to_string(idx) +
                                " does not exist");
    }
    return m_phases[idx];
}

void PhaseRegistry::expand_dependencies(IndexSet& phases) const
{
    // The set grows while it is walked, so newly added phases are expanded too.
    for (size_t pos = 0; pos < phases.size(); ++pos)
    {
        const Phase& phase = at(phases.at(pos));
        for (PhaseIdx dependency : phase.dependencies.self)
        {
            phases.insert(dependency);
        }
        for (PhaseIdx dependency : phase.dependencies.upstream)
        {
            phases.insert(dependency);
        }
    }
}

// ============================================================================
// Cycle detection
// ============================================================================

void PhaseRegistry::check_for_self_cycles() const
{
    enum class VisitState
    {
        Unvisited,
        InPath,
        CycleFree
    };

    std::vector<VisitState> states(m_phases.size(), VisitState::Unvisited);
    std::vector<PhaseIdx> path;

    std::function<void(PhaseIdx)> visit = [&](PhaseIdx idx)
    {
        states[idx] = VisitState::InPath;
        path.push_back(idx);

        for (PhaseIdx dependency : m_phases[idx].dependencies.self)
        {
            if (states[dependency] == VisitState::InPath)
            {
                std::vector<std::string> cycle;
                auto start = std::find(path.begin(), path.end(), dependency);
                for (auto it = start; it != path.end(); ++it)
                {
                    cycle.push_back(m_phases[*it].name);
                }
                cycle.push_back(m_phases[dependency].name);

                throw ConfigurationError(
                    ConfigurationErrorCode::PhaseCycleDetected,
                    fmt::format("In {}, there exists a cycle within the set of {} dependencies: {}",
                                constants::command_line_filename, m_phases[dependency].name,
                                fmt::join(cycle, ", ")));
            }
            if (states[dependency] == VisitState::Unvisited)
            {
                visit(dependency);
            }
        }

        path.pop_back();
        states[idx] = VisitState::CycleFree;
    };

    for (PhaseIdx idx = 0; idx < m_phases.size(); ++idx)
    {
        if (states[idx] == VisitState::Unvisited)
        {
            visit(idx);
        }
    }
}

} // namespace phasegraph
