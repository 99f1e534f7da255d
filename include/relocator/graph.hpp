// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "concurrent_map.hpp"
#include "types.hpp"
#include <array>
#include <memory>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

namespace relocator {

using json = nlohmann::json;

// Node and edge counts of a graph
struct GraphStatistics {
    size_t solutions = 0;
    size_t projects = 0;
    size_t files = 0;
    size_t types = 0;
    size_t packages = 0;
    size_t namespaces = 0;
    std::array<size_t, EDGE_KIND_COUNT> edges_by_kind{};

    size_t edges_of(EdgeKind kind) const { return edges_by_kind[static_cast<size_t>(kind)]; }
    size_t node_count() const;
    size_t edge_count() const;
    // TypeInherits + TypeImplements
    size_t inheritance_count() const;

    // Multi-line summary for logs and the --stats command
    std::string to_string() const;
};

// Dependency graph of one or more solutions.
//
// All add_* and query methods may be called concurrently. Node inserts are
// idempotent by id; edges are appended unconditionally. Queries return
// copies, so results stay valid while the graph keeps growing.
class SolutionGraph {
public:
    SolutionGraph() = default;
    SolutionGraph(const SolutionGraph &) = delete;
    SolutionGraph &operator=(const SolutionGraph &) = delete;

    // Insert a node; false if a node with the same id already exists
    bool add_solution(SolutionNode node);
    bool add_project(ProjectNode node);
    bool add_file(FileNode node);
    bool add_type(TypeNode node);
    bool add_package(PackageNode node);
    bool add_namespace(NamespaceNode node);

    void add_edge(Edge edge);

    // Lookup across all node stores (solution, project, file, type, package, namespace)
    std::optional<GraphNode> get_node(const std::string &id) const;

    std::optional<SolutionNode> find_solution(const std::string &id) const;
    std::optional<ProjectNode> find_project(const std::string &id) const;
    std::optional<FileNode> find_file(const std::string &id) const;
    std::optional<TypeNode> find_type_by_id(const std::string &id) const;
    std::optional<PackageNode> find_package(const std::string &id) const;
    std::optional<NamespaceNode> find_namespace(const std::string &id) const;

    bool has_namespace(const std::string &namespace_name) const;

    // Snapshots, sorted by id
    std::vector<SolutionNode> solutions() const;
    std::vector<ProjectNode> projects() const;
    std::vector<FileNode> files() const;
    std::vector<TypeNode> types() const;
    std::vector<PackageNode> packages() const;
    std::vector<NamespaceNode> namespaces() const;

    // All edges in insertion order
    std::vector<Edge> edges() const;

    std::vector<Edge> outgoing_edges(const std::string &node_id) const;
    std::vector<Edge> incoming_edges(const std::string &node_id) const;

    // Nodes at the other end of any outgoing / incoming edge
    std::vector<GraphNode> dependencies(const std::string &node_id) const;
    std::vector<GraphNode> dependents(const std::string &node_id) const;

    // ------------------------------------------------------------------
    // Derived queries
    // ------------------------------------------------------------------

    std::vector<TypeNode> types_in_namespace(const std::string &namespace_name) const;

    // Types with a usage, inherits or implements edge to / from type_id
    std::vector<TypeNode> types_referencing(const std::string &type_id) const;
    std::vector<TypeNode> types_referenced_by(const std::string &type_id) const;

    // Distinct files owning a type that references type_id
    std::vector<FileNode> files_referencing_type(const std::string &type_id) const;
    std::vector<FileNode> files_using_namespace(const std::string &namespace_name) const;

    std::optional<FileNode> file_containing_type(const std::string &type_id) const;
    std::optional<ProjectNode> project_containing_file(const std::string &file_id) const;

    std::vector<ProjectNode> project_dependencies(const std::string &project_id) const;
    std::vector<ProjectNode> projects_depending_on(const std::string &project_id) const;

    // True if a ProjectReference cycle is reachable from project_id
    bool has_cyclic_dependency(const std::string &project_id) const;

    std::optional<TypeNode> find_type(const std::string &full_name) const;

    // Path lookups compare case-insensitively
    std::optional<FileNode> find_file_by_path(const std::string &path) const;
    std::vector<FileNode> files_under(const std::string &folder) const;

    bool uses_namespace(const std::string &file_id, const std::string &namespace_name) const;
    // Line of the first using directive for namespace_name in the file
    std::optional<uint32_t> using_line(const std::string &file_id,
                                       const std::string &namespace_name) const;

    GraphStatistics statistics() const;

    // ------------------------------------------------------------------
    // Index file
    // ------------------------------------------------------------------

    json to_json() const;
    void save(const std::string &filepath) const;

    static std::unique_ptr<SolutionGraph> from_json(const json &j);
    static std::unique_ptr<SolutionGraph> load(const std::string &filepath);

private:
    ConcurrentMap<SolutionNode> solutions_;
    ConcurrentMap<ProjectNode> projects_;
    ConcurrentMap<FileNode> files_;
    ConcurrentMap<TypeNode> types_;
    ConcurrentMap<PackageNode> packages_;
    ConcurrentMap<NamespaceNode> namespaces_;

    // Edge list and its source/target indices share one lock
    mutable std::shared_mutex edges_mutex_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, std::vector<size_t>> outgoing_index_;
    std::unordered_map<std::string, std::vector<size_t>> incoming_index_;

    std::vector<Edge> edges_at(const std::unordered_map<std::string, std::vector<size_t>> &index,
                               const std::string &node_id) const;
};

// Lower-case and forward-slash a path for comparisons
std::string normalize_path_key(const std::string &path);

} // namespace relocator
