/**
 * @file project_graph.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include "phasegraph/common/config_enums.hpp"
#include "phasegraph/common/index_set.hpp"

namespace phasegraph
{

/**
 * @brief A project in the monorepo.
 */
struct Project
{
    std::string name;

    /// Working directory for the project's scripts.
    std::string folder;

    /// Script name (a phase name) to shell command text.
    std::unordered_map<std::string, std::string> scripts;

    /// Direct upstream dependencies, i.e. projects that must build first.
    IndexSet dependencies;
};

/**
 * @brief The project dependency graph, as supplied by the workspace loader.
 *
 * @details
 * Edges point from a project to its direct upstream dependencies. The graph is
 * expected to be acyclic; the caller guarantees this, so no check is made
 * beyond rejecting a project that depends on itself.
 *
 * @par Thread safety
 * - No internal synchronization. Concurrent reads are safe.
 */
class ProjectGraph
{
public:
    /**
     * @brief Add a project.
     * @return Index of the new project.
     * @throw std::invalid_argument if the name is already taken.
     */
    ProjectIdx add_project(std::string name,
                           std::string folder,
                           std::unordered_map<std::string, std::string> scripts = {});

    /**
     * @brief Record that `project` depends on `upstream`.
     * @throw std::out_of_range for an invalid index.
     * @throw std::invalid_argument if `project == upstream`.
     */
    void add_dependency(ProjectIdx project, ProjectIdx upstream);

    std::optional<ProjectIdx> find(const std::string& name) const;

    /**
     * @throw std::out_of_range for an invalid index.
     */
    const Project& at(ProjectIdx idx) const;

    size_t size() const noexcept
    {
        return m_projects.size();
    }

    /**
     * @brief All project indices in insertion order.
     */
    std::vector<ProjectIdx> all_projects() const;

    /**
     * @brief The selection plus every transitive upstream dependency of it.
     *
     * @details
     * Selected projects come first, in the given order, followed by pulled-in
     * dependencies in breadth-first order. Duplicates are dropped.
     */
    std::vector<ProjectIdx> with_upstream_closure(const std::vector<ProjectIdx>& selection) const;

private:
    std::vector<Project> m_projects;
    std::unordered_map<std::string, ProjectIdx> m_index_by_name;
};

} // namespace phasegraph
