#include "phasegraph/graph/operation_graph_builder.hpp"
#include <fmt/format.h>

namespace phasegraph
{

OperationGraphBuilder::OperationGraphBuilder(const CommandLineConfiguration& configuration,
                                             const ProjectGraph& projects,
                                             OperationRunnerFactoryPtr runner_factory)
    : m_configuration{configuration}
    , m_projects{projects}
    , m_runner_factory{std::move(runner_factory)}
{
    if (!m_runner_factory)
    {
        throw std::invalid_argument("OperationGraphBuilder: runner factory is null");
    }
}

OperationGraphPtr OperationGraphBuilder::build(const Command& command,
                                               const std::vector<ProjectIdx>& projects,
                                               bool watch) const
{
    return std::visit(
        [&](const auto& c) -> OperationGraphPtr
        {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, GlobalCommand>)
            {
                return build_global(c);
            }
            else
            {
                return build_phased(watch ? *c.watch_phases : *c.phases, projects);
            }
        },
        command);
}

OperationGraphPtr OperationGraphBuilder::build_phased(const IndexSet& phases,
                                                      const std::vector<ProjectIdx>& projects) const
{
    auto graph = std::make_shared<OperationGraph>();

    IndexSet project_set;
    for (ProjectIdx project : projects)
    {
        checked_project(project);
        project_set.insert(project);
    }

    // Step 1: one operation per (phase, project).
    std::map<std::pair<PhaseIdx, ProjectIdx>, OperationIdx> index;
    for (PhaseIdx phase_idx : phases)
    {
        const Phase& phase = checked_phase(phase_idx);
        for (ProjectIdx project_idx : project_set)
        {
            const Project& project = m_projects.at(project_idx);

            Operation operation;
            operation.name = fmt::format("{} ({})", project.name, phase.name);
            operation.phase = phase_idx;
            operation.project = project_idx;
            operation.runner = checked_runner(
                m_runner_factory->create_phase_runner(phase, project), operation.name);

            index.emplace(std::make_pair(phase_idx, project_idx), graph->operations.size());
            graph->operations.push_back(std::move(operation));
        }
    }

    auto link = [&](OperationIdx dependency, OperationIdx consumer)
    {
        graph->operations[consumer].dependencies.insert(dependency);
        graph->operations[dependency].consumers.insert(consumer);
    };

    // Step 2: wire self and upstream edges.
    for (OperationIdx idx = 0; idx < graph->operations.size(); ++idx)
    {
        PhaseIdx phase_idx = *graph->operations[idx].phase;
        ProjectIdx project_idx = *graph->operations[idx].project;
        const Phase& phase = checked_phase(phase_idx);
        const Project& project = m_projects.at(project_idx);

        for (PhaseIdx self_dependency : phase.dependencies.self)
        {
            checked_phase(self_dependency);
            auto it = index.find(std::make_pair(self_dependency, project_idx));
            if (it != index.end())
            {
                link(it->second, idx);
            }
        }

        for (ProjectIdx upstream_project : nearest_selected_upstream(project, project_set))
        {
            for (PhaseIdx upstream_dependency : phase.dependencies.upstream)
            {
                checked_phase(upstream_dependency);
                auto it = index.find(std::make_pair(upstream_dependency, upstream_project));
                if (it != index.end())
                {
                    link(it->second, idx);
                }
            }
        }
    }

    return graph;
}

OperationGraphPtr OperationGraphBuilder::build_global(const GlobalCommand& command) const
{
    auto graph = std::make_shared<OperationGraph>();

    Operation operation;
    operation.name = command.name;
    operation.runner = checked_runner(m_runner_factory->create_global_runner(command), command.name);
    graph->operations.push_back(std::move(operation));

    return graph;
}

std::vector<ProjectIdx> OperationGraphBuilder::nearest_selected_upstream(const Project& project,
                                                                       const IndexSet& selection) const
{
    std::vector<ProjectIdx> result;
    IndexSet visited;
    std::vector<ProjectIdx> pending(project.dependencies.values().rbegin(), project.dependencies.values().rend());
    while (!pending.empty())
    {
        ProjectIdx upstream = pending.back();
        pending.pop_back();
        if (!visited.insert(upstream))
        {
            continue;
        }
        const Project& upstream_project = checked_project(upstream);
        if (selection.contains(upstream))
        {
            result.push_back(upstream);
            continue;
        }
        // Not part of this run: look through it to the projects it builds on.
        const auto& next = upstream_project.dependencies.values();
        pending.insert(pending.end(), next.rbegin(), next.rend());
    }
    return result;
}

const Phase& OperationGraphBuilder::checked_phase(PhaseIdx idx) const
{
    if (idx >= m_configuration.phases().size())
    {
        throw GraphConsistencyError(
            fmt::format("Operation graph refers to phase index {}, but only {} phases exist", idx,
                        m_configuration.phases().size()));
    }
    return m_configuration.phases().at(idx);
}

const Project& OperationGraphBuilder::checked_project(ProjectIdx idx) const
{
    if (idx >= m_projects.size())
    {
        throw GraphConsistencyError(
            fmt::format("Operation graph refers to project index {}, but only {} projects exist",
                        idx, m_projects.size()));
    }
    return m_projects.at(idx);
}

OperationRunnerPtr OperationGraphBuilder::checked_runner(OperationRunnerPtr runner,
                                                         const std::string& name) const
{
    if (!runner)
    {
        throw GraphConsistencyError(
            fmt::format("The runner factory produced no runner for operation \"{}\"", name));
    }
    return runner;
}

} // namespace phasegraph
