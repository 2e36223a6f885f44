#include "ddlsort/ddl/ddl_dependency_graph.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <utility>

namespace ddlsort::ddl {

namespace {

constexpr std::size_t kNotOnPath = std::numeric_limits<std::size_t>::max();

void insert_sorted_unique(std::vector<TableIndex>& indexes, TableIndex value)
{
    const auto position = std::lower_bound(indexes.begin(), indexes.end(), value);
    if (position == indexes.end() || *position != value) {
        indexes.insert(position, value);
    }
}

}  // namespace

TableIndex DdlDependencyGraph::add_table(std::string name)
{
    if (const auto existing = find(name)) {
        return *existing;
    }

    const auto index = nodes_.size();
    index_by_name_.emplace(name, index);
    auto& node = nodes_.emplace_back();
    node.name = std::move(name);
    return index;
}

bool DdlDependencyGraph::add_dependency(TableIndex dependent, std::string_view referenced)
{
    auto& node = nodes_.at(dependent);
    const auto target = find(referenced);
    if (!target) {
        if (std::find(node.external_references.begin(), node.external_references.end(), referenced)
            == node.external_references.end()) {
            node.external_references.emplace_back(referenced);
        }
        return false;
    }

    if (std::find(node.dependencies.begin(), node.dependencies.end(), *target) != node.dependencies.end()) {
        return true;
    }

    node.dependencies.push_back(*target);
    insert_sorted_unique(nodes_[*target].dependents, dependent);
    if (*target == dependent) {
        node.self_referencing = true;
    }
    ++edge_count_;
    return true;
}

std::optional<TableIndex> DdlDependencyGraph::find(std::string_view name) const
{
    const auto it = index_by_name_.find(std::string{name});
    if (it == index_by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const TableNode& DdlDependencyGraph::node(TableIndex index) const
{
    return nodes_.at(index);
}

const std::string& DdlDependencyGraph::name(TableIndex index) const
{
    return nodes_.at(index).name;
}

const std::vector<TableIndex>& DdlDependencyGraph::dependencies_of(TableIndex index) const
{
    return nodes_.at(index).dependencies;
}

const std::vector<TableIndex>& DdlDependencyGraph::dependents_of(TableIndex index) const
{
    return nodes_.at(index).dependents;
}

const std::vector<std::string>& DdlDependencyGraph::external_references_of(TableIndex index) const
{
    return nodes_.at(index).external_references;
}

TopologicalOrder DdlDependencyGraph::topological_order() const
{
    TopologicalOrder result{};
    result.order.reserve(nodes_.size());

    std::vector<std::size_t> remaining(nodes_.size(), 0U);
    std::vector<bool> resolved(nodes_.size(), false);
    std::deque<TableIndex> ready{};

    for (TableIndex index = 0U; index < nodes_.size(); ++index) {
        remaining[index] = nodes_[index].dependencies.size();
        if (remaining[index] == 0U) {
            ready.push_back(index);
        }
    }

    while (!ready.empty()) {
        const auto current = ready.front();
        ready.pop_front();
        resolved[current] = true;
        result.order.push_back(current);

        for (const auto dependent : nodes_[current].dependents) {
            if (remaining[dependent] == 0U) {
                continue;
            }
            if (--remaining[dependent] == 0U) {
                ready.push_back(dependent);
            }
        }
    }

    if (result.order.size() == nodes_.size()) {
        return result;
    }

    for (TableIndex index = 0U; index < nodes_.size(); ++index) {
        if (!resolved[index]) {
            result.unresolved.push_back(index);
        }
    }
    result.cycles = find_cycles(resolved);
    result.error = make_error_code(DdlErrc::DependencyCycle);
    return result;
}

// Every unresolved table still waits on at least one unresolved table, so following
// those edges from any unresolved table must eventually revisit a table on the path.
std::vector<std::vector<TableIndex>> DdlDependencyGraph::find_cycles(const std::vector<bool>& resolved) const
{
    std::vector<std::vector<TableIndex>> cycles;
    std::vector<bool> walked(nodes_.size(), false);
    std::vector<std::size_t> path_position(nodes_.size(), kNotOnPath);
    std::vector<TableIndex> path;

    for (TableIndex start = 0U; start < nodes_.size(); ++start) {
        if (resolved[start] || walked[start]) {
            continue;
        }

        path.clear();
        auto current = start;
        while (true) {
            if (walked[current]) {
                break;
            }
            if (path_position[current] != kNotOnPath) {
                std::vector<TableIndex> cycle(path.begin() + static_cast<std::ptrdiff_t>(path_position[current]),
                                              path.end());
                const auto smallest = std::min_element(cycle.begin(), cycle.end());
                std::rotate(cycle.begin(), smallest, cycle.end());
                cycles.push_back(std::move(cycle));
                break;
            }

            path_position[current] = path.size();
            path.push_back(current);

            const auto& dependencies = nodes_[current].dependencies;
            const auto next = std::find_if(dependencies.begin(), dependencies.end(), [&resolved](TableIndex index) {
                return !resolved[index];
            });
            if (next == dependencies.end()) {
                break;
            }
            current = *next;
        }

        for (const auto index : path) {
            walked[index] = true;
            path_position[index] = kNotOnPath;
        }
    }

    return cycles;
}

std::vector<std::string> DdlDependencyGraph::names(const std::vector<TableIndex>& indexes) const
{
    std::vector<std::string> result;
    result.reserve(indexes.size());
    for (const auto index : indexes) {
        result.push_back(nodes_.at(index).name);
    }
    return result;
}

}  // namespace ddlsort::ddl
