#include "phasegraph/graph/project_graph.hpp"

namespace phasegraph
{

ProjectIdx ProjectGraph::add_project(std::string name,
                                     std::string folder,
                                     std::unordered_map<std::string, std::string> scripts)
{
    if (m_index_by_name.count(name) != 0)
    {
        throw std::invalid_argument("ProjectGraph::add_project: project \"" + name +
                                    "\" already exists");
    }

    ProjectIdx idx = m_projects.size();
    m_index_by_name.emplace(name, idx);

    Project project;
    project.name = std::move(name);
    project.folder = std::move(folder);
    project.scripts = std::move(scripts);
    m_projects.push_back(std::move(project));
    return idx;
}

void ProjectGraph::add_dependency(ProjectIdx project, ProjectIdx upstream)
{
    if (project >= m_projects.size() || upstream >= m_projects.size())
    {
        throw std::out_of_range("ProjectGraph::add_dependency: project index does not exist");
    }
    if (project == upstream)
    {
        throw std::invalid_argument("ProjectGraph::add_dependency: project \"" +
                                    m_projects[project].name + "\" cannot depend on itself");
    }
    m_projects[project].dependencies.insert(upstream);
}

std::optional<ProjectIdx> ProjectGraph::find(const std::string& name) const
{
    auto it = m_index_by_name.find(name);
    if (it == m_index_by_name.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Project& ProjectGraph::at(ProjectIdx idx) const
{
    if (idx >= m_projects.size())
    {
        throw std::out_of_range("ProjectGraph::at: project index " + std::to_string(idx) +
                                " does not exist");
    }
    return m_projects[idx];
}

std::vector<ProjectIdx> ProjectGraph::all_projects() const
{
    std::vector<ProjectIdx> result(m_projects.size());
    for (ProjectIdx idx = 0; idx < m_projects.size(); ++idx)
    {
        result[idx] = idx;
    }
    return result;
}

std::vector<ProjectIdx> ProjectGraph::with_upstream_closure(
    const std::vector<ProjectIdx>& selection) const
{
    IndexSet closure;
    for (ProjectIdx idx : selection)
    {
        if (idx >= m_projects.size())
        {
            throw std::out_of_range("ProjectGraph::with_upstream_closure: project index " +
                                    std::to_string(idx) + " does not exist");
        }
        closure.insert(idx);
    }

    for (size_t pos = 0; pos < closure.size(); ++pos)
    {
        for (ProjectIdx upstream : m_projects[closure.at(pos)].dependencies)
        {
            closure.insert(upstream);
        }
    }

    return closure.values();
}

} // namespace phasegraph
