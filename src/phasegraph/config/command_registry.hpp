/**
 * @file command_registry.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/errors.hpp"
#include "phasegraph/config/command.hpp"
#include "phasegraph/config/command_line_json.hpp"
#include "phasegraph/config/phase_registry.hpp"

namespace phasegraph
{

/**
 * @brief Indexed table of normalized commands.
 *
 * @details
 * `CommandRegistry` turns `CommandJson` declarations into `Command` values:
 * - Global commands are copied as they are.
 * - Bulk commands are translated into phased commands with one synthetic
 *   phase named after the command. Unless `ignoreDependencyOrder` is set, the
 *   synthetic phase upstream-depends on itself. The bulk name to synthetic
 *   phase mapping is kept for parameter association.
 * - Phased commands have their phase list resolved and expanded to the
 *   dependency closure. Watch phases are resolved but not expanded.
 *
 * The "build" and "rebuild" commands may not be global and may not be safe for
 * simultaneous processes; both rules are enforced while loading.
 *
 * @par Ownership
 * - The registry refers to (and adds synthetic phases to) a `PhaseRegistry`
 *   owned elsewhere, which must outlive it.
 *
 * @par Thread safety
 * - No internal synchronization. Concurrent reads are safe.
 */
class CommandRegistry
{
public:
    explicit CommandRegistry(PhaseRegistry& phases);

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /**
     * @brief Normalize, validate and add declared commands in order.
     * @throw ConfigurationError on duplicate names, unknown phases, or a
     *        violated build/rebuild rule.
     */
    void add_declared_commands(const std::vector<CommandJson>& commands);

    /**
     * @brief Add the default "build" and "rebuild" commands where missing.
     *
     * @details
     * A synthesized "rebuild" shares the phase set and the associated
     * parameter set of "build" (the same objects, not copies).
     *
     * @throw ConfigurationError with `MissingBuildPhases` if "rebuild" must be
     *        synthesized but the phases of "build" are unknown.
     */
    void add_default_build_commands();

    std::optional<CommandIdx> find(const std::string& name) const;

    /**
     * @throw std::out_of_range for an invalid index.
     */
    const Command& at(CommandIdx idx) const;
    Command& at(CommandIdx idx);

    size_t size() const noexcept
    {
        return m_commands.size();
    }

    /**
     * @brief Synthetic phase generated for a translated bulk command, if any.
     */
    std::optional<PhaseIdx> synthetic_phase_for_bulk_command(const std::string& name) const;

    /**
     * @brief Declaration used for "build" when configuration does not provide one.
     */
    static CommandJson default_build_command_json();

    /**
     * @brief Declaration used for "rebuild" when configuration does not provide one.
     */
    static CommandJson default_rebuild_command_json();

    /**
     * @brief Shallow merge: every member left unset in `repo` takes the value
     *        from `defaults`. Kind and name always come from `repo`.
     */
    static CommandJson merge_command_json(const CommandJson& defaults, const CommandJson& repo);

private:
    GlobalCommand normalize_global_command(const CommandJson& raw) const;
    PhasedCommand normalize_phased_command(const CommandJson& raw) const;
    PhasedCommand translate_bulk_command(const CommandJson& raw);

    /// Enforces the build/rebuild rules on a normalized command.
    void validate_build_command(const CommandJson& raw, const Command& normalized) const;

    CommandIdx add_command(Command command);

    PhaseRegistry& m_phases;
    std::vector<Command> m_commands;
    std::unordered_map<std::string, CommandIdx> m_index_by_name;
    std::unordered_map<std::string, PhaseIdx> m_synthetic_phase_by_bulk_command;

    /// Phases of "build", recorded in case "rebuild" must be synthesized.
    PhaseSetPtr m_build_command_phases;
};

} // namespace phasegraph
