/**
 * @file phase_registry.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command_line_json.hpp"
#include "phasegraph/config/phase.hpp"

namespace phasegraph
{

/**
 * @brief Indexed table of all phases, declared and synthetic.
 *
 * @details
 * `PhaseRegistry` owns every `Phase` and hands out `PhaseIdx` values. Phases
 * refer to each other only by index, so the registry is a plain arena with
 * index-based edges.
 *
 * @par Loading declared phases
 * `add_declared_phases()` performs the whole validation sequence:
 * 1. Names must be unique and match `^_phase:[a-z][a-z0-9]*([-][a-z0-9]+)*$`.
 * 2. Self and upstream dependency names are resolved; unknown names are fatal.
 * 3. The self-dependency relation is checked for cycles.
 *
 * Upstream dependencies are not part of the cycle check: they always refer to
 * the phase in a different (upstream) project, never to the same operation.
 *
 * @par Thread safety
 * - No internal synchronization. Concurrent reads are safe.
 */
class PhaseRegistry
{
public:
    /**
     * @brief Validate and add all declared phases.
     * @throw ConfigurationError on duplicate or malformed names, missing
     *        dependency references, or a cycle among self dependencies.
     */
    void add_declared_phases(const std::vector<PhaseJson>& phases);

    /**
     * @brief Add a phase generated from a bulk command.
     * @param name The bulk command's name, used verbatim as the phase name.
     * @param depends_on_upstream_self If true, the phase upstream-depends on itself.
     * @return Index of the new phase.
     * @throw ConfigurationError if a phase with that name already exists.
     */
    PhaseIdx add_synthetic_phase(const std::string& name,
                                 bool ignore_missing_script,
                                 bool allow_warnings_on_success,
                                 bool depends_on_upstream_self);

    std::optional<PhaseIdx> find(const std::string& name) const;

    /**
     * @throw std::out_of_range for an invalid index.
     */
    const Phase& at(PhaseIdx idx) const;
    Phase& at(PhaseIdx idx);

    size_t size() const noexcept
    {
        return m_phases.size();
    }

    /**
     * @brief Grow `phases` until it is closed under self and upstream dependencies.
     *
     * @details
     * Newly added dependencies are themselves expanded (breadth-first), so a
     * command listing phase A implicitly includes everything A depends on.
     */
    void expand_dependencies(IndexSet& phases) const;

    /**
     * @brief Check whether a name is a valid declared phase name.
     */
    static bool is_valid_phase_name(const std::string& name);

    /**
     * @brief Replace every ':' with '_' to get a filesystem-safe identifier.
     */
    static std::string normalize_log_filename_identifier(const std::string& name);

private:
    PhaseIdx add_phase(Phase phase);

    /// Three-color DFS over self dependencies; throws on the first back-edge.
    void check_for_self_cycles() const;

    std::vector<Phase> m_phases;
    std::unordered_map<std::string, PhaseIdx> m_index_by_name;
};

} // namespace phasegraph
