#pragma once

#include "ddlsort/ddl/ddl_errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace ddlsort::ddl {

using TableIndex = std::size_t;

struct TableNode final {
    std::string name{};
    std::vector<TableIndex> dependencies{};
    std::vector<TableIndex> dependents{};
    std::vector<std::string> external_references{};
    bool self_referencing = false;
};

struct TopologicalOrder final {
    std::vector<TableIndex> order{};
    std::vector<TableIndex> unresolved{};
    std::vector<std::vector<TableIndex>> cycles{};
    std::error_code error{};

    [[nodiscard]] bool complete() const noexcept { return unresolved.empty(); }
};

// Tables are stored in insertion order and addressed by index; edges point from a
// table to the tables it references. Only tables present in the graph form edges.
class DdlDependencyGraph final {
public:
    TableIndex add_table(std::string name);

    // Returns false when the referenced table is not part of the graph; the name is
    // then kept as an external reference and never blocks ordering.
    bool add_dependency(TableIndex dependent, std::string_view referenced);

    [[nodiscard]] std::optional<TableIndex> find(std::string_view name) const;
    [[nodiscard]] const TableNode& node(TableIndex index) const;
    [[nodiscard]] const std::string& name(TableIndex index) const;

    [[nodiscard]] std::size_t table_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }

    [[nodiscard]] const std::vector<TableIndex>& dependencies_of(TableIndex index) const;
    [[nodiscard]] const std::vector<TableIndex>& dependents_of(TableIndex index) const;
    [[nodiscard]] const std::vector<std::string>& external_references_of(TableIndex index) const;

    [[nodiscard]] TopologicalOrder topological_order() const;

    [[nodiscard]] std::vector<std::string> names(const std::vector<TableIndex>& indexes) const;

private:
    [[nodiscard]] std::vector<std::vector<TableIndex>> find_cycles(const std::vector<bool>& resolved) const;

    std::vector<TableNode> nodes_{};
    std::unordered_map<std::string, TableIndex> index_by_name_{};
    std::size_t edge_count_ = 0U;
};

}  // namespace ddlsort::ddl
