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

#include "relocator/graph.hpp"
#include "relocator/version.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace relocator {

// ============================================================================
// Edge helpers
// ============================================================================

bool edge_kind_from_string(const std::string &s, EdgeKind &out) {
    for (size_t i = 0; i < EDGE_KIND_COUNT; ++i) {
        EdgeKind kind = static_cast<EdgeKind>(i);
        if (s == edge_kind_to_string(kind)) {
            out = kind;
            return true;
        }
    }
    return false;
}

TypeUsageKind type_usage_kind_from_string(const std::string &s) {
    static const TypeUsageKind all[] = {
        TypeUsageKind::Field,           TypeUsageKind::Property,
        TypeUsageKind::MethodParameter, TypeUsageKind::MethodReturn,
        TypeUsageKind::LocalVariable,   TypeUsageKind::GenericArgument,
        TypeUsageKind::Attribute,       TypeUsageKind::BaseType,
        TypeUsageKind::Interface};
    for (TypeUsageKind kind : all) {
        if (s == type_usage_kind_to_string(kind))
            return kind;
    }
    return TypeUsageKind::Other;
}

std::string Edge::description() const {
    switch (kind) {
    case EdgeKind::SolutionContainsProject:
    case EdgeKind::ProjectContainsFile:
        return "contains";
    case EdgeKind::ProjectReference:
        return "references project";
    case EdgeKind::PackageReference:
        return "references package";
    case EdgeKind::FileContainsType:
        return "defines";
    case EdgeKind::FileUsesNamespace:
        return "uses namespace";
    case EdgeKind::TypeInNamespace:
        return "is in namespace";
    case EdgeKind::TypeInherits:
        return "inherits";
    case EdgeKind::TypeImplements:
        return "implements";
    case EdgeKind::TypeUsage:
        break;
    }

    TypeUsageKind usage = TypeUsageKind::Other;
    if (auto *info = std::get_if<TypeUsageInfo>(&payload))
        usage = info->usage;

    switch (usage) {
    case TypeUsageKind::Field:
        return "has field of type";
    case TypeUsageKind::Property:
        return "has property of type";
    case TypeUsageKind::MethodParameter:
        return "has parameter of type";
    case TypeUsageKind::MethodReturn:
        return "returns";
    case TypeUsageKind::LocalVariable:
        return "uses locally";
    case TypeUsageKind::GenericArgument:
        return "uses as generic argument";
    case TypeUsageKind::Attribute:
        return "is decorated with";
    case TypeUsageKind::BaseType:
        return "inherits";
    case TypeUsageKind::Interface:
        return "implements";
    default:
        return "uses";
    }
}

std::string normalize_path_key(const std::string &path) {
    std::string key = path;
    for (char &c : key) {
        if (c == '\\')
            c = '/';
        else
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

// ============================================================================
// Statistics
// ============================================================================

size_t GraphStatistics::node_count() const {
    return solutions + projects + files + types + packages + namespaces;
}

size_t GraphStatistics::edge_count() const {
    size_t total = 0;
    for (size_t n : edges_by_kind)
        total += n;
    return total;
}

size_t GraphStatistics::inheritance_count() const {
    return edges_of(EdgeKind::TypeInherits) + edges_of(EdgeKind::TypeImplements);
}

std::string GraphStatistics::to_string() const {
    std::ostringstream out;
    out << "Graph statistics:\n";
    out << "  Solutions:  " << solutions << "\n";
    out << "  Projects:   " << projects << "\n";
    out << "  Files:      " << files << "\n";
    out << "  Types:      " << types << "\n";
    out << "  Packages:   " << packages << "\n";
    out << "  Namespaces: " << namespaces << "\n";
    out << "  Nodes:      " << node_count() << "\n";
    out << "  Edges:      " << edge_count() << "\n";
    out << "    Project references: " << edges_of(EdgeKind::ProjectReference) << "\n";
    out << "    Package references: " << edges_of(EdgeKind::PackageReference) << "\n";
    out << "    Using directives:   " << edges_of(EdgeKind::FileUsesNamespace) << "\n";
    out << "    Inheritance:        " << inheritance_count() << "\n";
    out << "    Type usages:        " << edges_of(EdgeKind::TypeUsage) << "\n";
    return out.str();
}

// ============================================================================
// Mutation
// ============================================================================

bool SolutionGraph::add_solution(SolutionNode node) {
    std::string id = node.id;
    return solutions_.try_add(id, std::move(node));
}

bool SolutionGraph::add_project(ProjectNode node) {
    std::string id = node.id;
    return projects_.try_add(id, std::move(node));
}

bool SolutionGraph::add_file(FileNode node) {
    std::string id = node.id;
    return files_.try_add(id, std::move(node));
}

bool SolutionGraph::add_type(TypeNode node) {
    std::string id = node.id;
    return types_.try_add(id, std::move(node));
}

bool SolutionGraph::add_package(PackageNode node) {
    std::string id = node.id;
    return packages_.try_add(id, std::move(node));
}

bool SolutionGraph::add_namespace(NamespaceNode node) {
    std::string id = node.id;
    return namespaces_.try_add(id, std::move(node));
}

void SolutionGraph::add_edge(Edge edge) {
    std::unique_lock<std::shared_mutex> lock(edges_mutex_);
    size_t idx = edges_.size();
    outgoing_index_[edge.source_id].push_back(idx);
    incoming_index_[edge.target_id].push_back(idx);
    edges_.push_back(std::move(edge));
}

// ============================================================================
// Node lookup
// ============================================================================

std::optional<GraphNode> SolutionGraph::get_node(const std::string &id) const {
    if (auto n = solutions_.find(id))
        return GraphNode(std::move(*n));
    if (auto n = projects_.find(id))
        return GraphNode(std::move(*n));
    if (auto n = files_.find(id))
        return GraphNode(std::move(*n));
    if (auto n = types_.find(id))
        return GraphNode(std::move(*n));
    if (auto n = packages_.find(id))
        return GraphNode(std::move(*n));
    if (auto n = namespaces_.find(id))
        return GraphNode(std::move(*n));
    return std::nullopt;
}

std::optional<SolutionNode> SolutionGraph::find_solution(const std::string &id) const {
    return solutions_.find(id);
}

std::optional<ProjectNode> SolutionGraph::find_project(const std::string &id) const {
    return projects_.find(id);
}

std::optional<FileNode> SolutionGraph::find_file(const std::string &id) const {
    return files_.find(id);
}

std::optional<TypeNode> SolutionGraph::find_type_by_id(const std::string &id) const {
    return types_.find(id);
}

std::optional<PackageNode> SolutionGraph::find_package(const std::string &id) const {
    return packages_.find(id);
}

std::optional<NamespaceNode> SolutionGraph::find_namespace(const std::string &id) const {
    return namespaces_.find(id);
}

bool SolutionGraph::has_namespace(const std::string &namespace_name) const {
    return namespaces_.contains(make_namespace_id(namespace_name));
}

namespace {

template <typename T>
std::vector<T> sorted_by_id(std::vector<T> nodes) {
    std::sort(nodes.begin(), nodes.end(),
              [](const T &a, const T &b) { return a.id < b.id; });
    return nodes;
}

} // namespace

std::vector<SolutionNode> SolutionGraph::solutions() const {
    return sorted_by_id(solutions_.values());
}

std::vector<ProjectNode> SolutionGraph::projects() const {
    return sorted_by_id(projects_.values());
}

std::vector<FileNode> SolutionGraph::files() const { return sorted_by_id(files_.values()); }

std::vector<TypeNode> SolutionGraph::types() const { return sorted_by_id(types_.values()); }

std::vector<PackageNode> SolutionGraph::packages() const {
    return sorted_by_id(packages_.values());
}

std::vector<NamespaceNode> SolutionGraph::namespaces() const {
    return sorted_by_id(namespaces_.values());
}

// ============================================================================
// Edge lookup
// ============================================================================

std::vector<Edge> SolutionGraph::edges() const {
    std::shared_lock<std::shared_mutex> lock(edges_mutex_);
    return edges_;
}

std::vector<Edge>
SolutionGraph::edges_at(const std::unordered_map<std::string, std::vector<size_t>> &index,
                        const std::string &node_id) const {
    std::vector<Edge> result;
    std::shared_lock<std::shared_mutex> lock(edges_mutex_);
    auto it = index.find(node_id);
    if (it == index.end())
        return result;
    result.reserve(it->second.size());
    for (size_t idx : it->second) {
        result.push_back(edges_[idx]);
    }
    return result;
}

std::vector<Edge> SolutionGraph::outgoing_edges(const std::string &node_id) const {
    return edges_at(outgoing_index_, node_id);
}

std::vector<Edge> SolutionGraph::incoming_edges(const std::string &node_id) const {
    return edges_at(incoming_index_, node_id);
}

std::vector<GraphNode> SolutionGraph::dependencies(const std::string &node_id) const {
    std::vector<GraphNode> result;
    for (const auto &edge : outgoing_edges(node_id)) {
        if (auto node = get_node(edge.target_id))
            result.push_back(std::move(*node));
    }
    return result;
}

std::vector<GraphNode> SolutionGraph::dependents(const std::string &node_id) const {
    std::vector<GraphNode> result;
    for (const auto &edge : incoming_edges(node_id)) {
        if (auto node = get_node(edge.source_id))
            result.push_back(std::move(*node));
    }
    return result;
}

// ============================================================================
// Derived queries
// ============================================================================

std::vector<TypeNode> SolutionGraph::types_in_namespace(const std::string &namespace_name) const {
    std::vector<TypeNode> result;
    types_.for_each([&](const TypeNode &type) {
        if (type.namespace_name == namespace_name)
            result.push_back(type);
    });
    return sorted_by_id(std::move(result));
}

std::vector<TypeNode> SolutionGraph::types_referencing(const std::string &type_id) const {
    std::vector<TypeNode> result;
    for (const auto &edge : incoming_edges(type_id)) {
        if (!edge.is_type_reference())
            continue;
        if (auto type = types_.find(edge.source_id))
            result.push_back(std::move(*type));
    }
    return result;
}

std::vector<TypeNode> SolutionGraph::types_referenced_by(const std::string &type_id) const {
    std::vector<TypeNode> result;
    for (const auto &edge : outgoing_edges(type_id)) {
        if (!edge.is_type_reference())
            continue;
        if (auto type = types_.find(edge.target_id))
            result.push_back(std::move(*type));
    }
    return result;
}

std::vector<FileNode> SolutionGraph::files_referencing_type(const std::string &type_id) const {
    std::vector<FileNode> result;
    std::unordered_set<std::string> seen;
    for (const auto &type : types_referencing(type_id)) {
        if (!seen.insert(type.file_id).second)
            continue;
        if (auto file = files_.find(type.file_id))
            result.push_back(std::move(*file));
    }
    return result;
}

std::vector<FileNode>
SolutionGraph::files_using_namespace(const std::string &namespace_name) const {
    std::vector<FileNode> result;
    std::string ns_id = make_namespace_id(namespace_name);
    if (!namespaces_.contains(ns_id))
        return result;

    std::unordered_set<std::string> seen;
    for (const auto &edge : incoming_edges(ns_id)) {
        if (edge.kind != EdgeKind::FileUsesNamespace)
            continue;
        if (!seen.insert(edge.source_id).second)
            continue;
        if (auto file = files_.find(edge.source_id))
            result.push_back(std::move(*file));
    }
    return result;
}

std::optional<FileNode> SolutionGraph::file_containing_type(const std::string &type_id) const {
    auto type = types_.find(type_id);
    if (!type)
        return std::nullopt;
    return files_.find(type->file_id);
}

std::optional<ProjectNode>
SolutionGraph::project_containing_file(const std::string &file_id) const {
    for (const auto &edge : incoming_edges(file_id)) {
        if (edge.kind == EdgeKind::ProjectContainsFile)
            return projects_.find(edge.source_id);
    }
    return std::nullopt;
}

std::vector<ProjectNode> SolutionGraph::project_dependencies(const std::string &project_id) const {
    std::vector<ProjectNode> result;
    for (const auto &edge : outgoing_edges(project_id)) {
        if (edge.kind != EdgeKind::ProjectReference)
            continue;
        if (auto project = projects_.find(edge.target_id))
            result.push_back(std::move(*project));
    }
    return result;
}

std::vector<ProjectNode>
SolutionGraph::projects_depending_on(const std::string &project_id) const {
    std::vector<ProjectNode> result;
    for (const auto &edge : incoming_edges(project_id)) {
        if (edge.kind != EdgeKind::ProjectReference)
            continue;
        if (auto project = projects_.find(edge.source_id))
            result.push_back(std::move(*project));
    }
    return result;
}

bool SolutionGraph::has_cyclic_dependency(const std::string &project_id) const {
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> on_stack;

    std::function<bool(const std::string &)> visit = [&](const std::string &id) {
        visited.insert(id);
        on_stack.insert(id);
        for (const auto &edge : outgoing_edges(id)) {
            if (edge.kind != EdgeKind::ProjectReference)
                continue;
            if (on_stack.count(edge.target_id))
                return true;
            if (!visited.count(edge.target_id) && visit(edge.target_id))
                return true;
        }
        on_stack.erase(id);
        return false;
    };

    return visit(project_id);
}

std::optional<TypeNode> SolutionGraph::find_type(const std::string &full_name) const {
    std::optional<TypeNode> found;
    types_.for_each([&](const TypeNode &type) {
        // Lowest id wins so partial parts resolve the same way every run
        if (type.full_name == full_name && (!found || type.id < found->id))
            found = type;
    });
    return found;
}

std::optional<FileNode> SolutionGraph::find_file_by_path(const std::string &path) const {
    std::string key = normalize_path_key(path);
    std::optional<FileNode> found;
    files_.for_each([&](const FileNode &file) {
        if (!found && normalize_path_key(file.path) == key)
            found = file;
    });
    return found;
}

std::vector<FileNode> SolutionGraph::files_under(const std::string &folder) const {
    std::string prefix = normalize_path_key(folder);
    while (!prefix.empty() && prefix.back() == '/')
        prefix.pop_back();
    prefix += '/';

    std::vector<FileNode> result;
    files_.for_each([&](const FileNode &file) {
        if (normalize_path_key(file.path).compare(0, prefix.size(), prefix) == 0)
            result.push_back(file);
    });
    std::sort(result.begin(), result.end(),
              [](const FileNode &a, const FileNode &b) { return a.path < b.path; });
    return result;
}

bool SolutionGraph::uses_namespace(const std::string &file_id,
                                   const std::string &namespace_name) const {
    return using_line(file_id, namespace_name).has_value();
}

std::optional<uint32_t> SolutionGraph::using_line(const std::string &file_id,
                                                  const std::string &namespace_name) const {
    std::string ns_id = make_namespace_id(namespace_name);
    for (const auto &edge : outgoing_edges(file_id)) {
        if (edge.kind == EdgeKind::FileUsesNamespace && edge.target_id == ns_id) {
            if (auto *usage = std::get_if<NamespaceUsage>(&edge.payload))
                return usage->line;
            return 0u;
        }
    }
    return std::nullopt;
}

GraphStatistics SolutionGraph::statistics() const {
    GraphStatistics stats;
    stats.solutions = solutions_.size();
    stats.projects = projects_.size();
    stats.files = files_.size();
    stats.types = types_.size();
    stats.packages = packages_.size();
    stats.namespaces = namespaces_.size();

    std::shared_lock<std::shared_mutex> lock(edges_mutex_);
    for (const auto &edge : edges_) {
        stats.edges_by_kind[static_cast<size_t>(edge.kind)]++;
    }
    return stats;
}

// ============================================================================
// Index serialization
// ============================================================================

namespace {

json optional_to_json(const std::optional<std::string> &value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_from_json(const json &j, const char *key) {
    if (!j.contains(key) || j[key].is_null())
        return std::nullopt;
    return j[key].get<std::string>();
}

json payload_to_json(const EdgePayload &payload) {
    if (auto *ns = std::get_if<NamespaceUsage>(&payload))
        return json{{"line", ns->line}};
    if (auto *usage = std::get_if<TypeUsageInfo>(&payload)) {
        json j;
        j["usage"] = type_usage_kind_to_string(usage->usage);
        j["member"] = optional_to_json(usage->member_name);
        j["line"] = usage->line ? json(*usage->line) : json(nullptr);
        return j;
    }
    return nullptr;
}

EdgePayload payload_from_json(EdgeKind kind, const json &j) {
    if (j.is_null())
        return std::monostate{};
    if (kind == EdgeKind::FileUsesNamespace)
        return NamespaceUsage{j.value("line", 0u)};
    if (kind == EdgeKind::TypeUsage) {
        TypeUsageInfo info;
        info.usage = type_usage_kind_from_string(j.value("usage", std::string("other")));
        info.member_name = optional_from_json(j, "member");
        if (j.contains("line") && !j["line"].is_null())
            info.line = j["line"].get<uint32_t>();
        return info;
    }
    return std::monostate{};
}

} // namespace

json SolutionGraph::to_json() const {
    json j;

    GraphStatistics stats = statistics();
    j["metadata"]["version"] = INDEX_SCHEMA_VERSION;
    j["metadata"]["num_nodes"] = stats.node_count();
    j["metadata"]["num_edges"] = stats.edge_count();

    json solutions_json = json::array();
    for (const auto &s : solutions()) {
        solutions_json.push_back({{"id", s.id}, {"path", s.path}, {"name", s.name}});
    }
    j["solutions"] = std::move(solutions_json);

    json projects_json = json::array();
    for (const auto &p : projects()) {
        projects_json.push_back({{"id", p.id},
                                 {"path", p.path},
                                 {"name", p.name},
                                 {"root_namespace", optional_to_json(p.root_namespace)},
                                 {"target_framework", optional_to_json(p.target_framework)},
                                 {"kind", project_kind_to_string(p.kind)}});
    }
    j["projects"] = std::move(projects_json);

    json files_json = json::array();
    for (const auto &f : files()) {
        files_json.push_back({{"id", f.id},
                              {"path", f.path},
                              {"namespace", optional_to_json(f.namespace_name)},
                              {"kind", file_kind_to_string(f.kind)}});
    }
    j["files"] = std::move(files_json);

    json types_json = json::array();
    for (const auto &t : types()) {
        types_json.push_back({{"id", t.id},
                              {"full_name", t.full_name},
                              {"namespace", t.namespace_name},
                              {"name", t.name},
                              {"kind", type_kind_to_string(t.kind)},
                              {"file_id", t.file_id},
                              {"public", t.is_public},
                              {"partial", t.is_partial},
                              {"static", t.is_static},
                              {"abstract", t.is_abstract}});
    }
    j["types"] = std::move(types_json);

    json packages_json = json::array();
    for (const auto &p : packages()) {
        packages_json.push_back(
            {{"id", p.id}, {"package_id", p.package_id}, {"version", optional_to_json(p.version)}});
    }
    j["packages"] = std::move(packages_json);

    json namespaces_json = json::array();
    for (const auto &n : namespaces()) {
        namespaces_json.push_back({{"id", n.id}, {"namespace", n.namespace_name}});
    }
    j["namespaces"] = std::move(namespaces_json);

    json edges_json = json::array();
    for (const auto &e : edges()) {
        json ej = {{"kind", edge_kind_to_string(e.kind)},
                   {"source", e.source_id},
                   {"target", e.target_id}};
        json payload = payload_to_json(e.payload);
        if (!payload.is_null())
            ej["payload"] = std::move(payload);
        edges_json.push_back(std::move(ej));
    }
    j["edges"] = std::move(edges_json);

    return j;
}

void SolutionGraph::save(const std::string &filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filepath);
    }
    file << to_json().dump();
    if (!file) {
        throw std::runtime_error("Failed to write index file: " + filepath);
    }
}

std::unique_ptr<SolutionGraph> SolutionGraph::from_json(const json &j) {
    std::string file_version;
    try {
        if (j.contains("metadata") && j["metadata"].contains("version"))
            file_version = j["metadata"]["version"].get<std::string>();
    } catch (const json::exception &ex) {
        throw std::runtime_error(std::string("Malformed index file: ") + ex.what());
    }

    // Check schema version compatibility
    if (!file_version.empty()) {
        int major = 0, minor = 0, patch = 0;
        if (!parse_version(file_version, major, minor, patch) ||
            !is_schema_compatible(major, minor, patch)) {
            throw std::runtime_error("Index file version " + file_version +
                                     " is not compatible with this version of relocator "
                                     "(requires " +
                                     std::to_string(INDEX_SCHEMA_MAJOR) + ".x). Please re-index.");
        }
    }

    auto g = std::make_unique<SolutionGraph>();

    try {
        for (const auto &s : j.value("solutions", json::array())) {
            g->add_solution({s.at("id").get<std::string>(), s.at("path").get<std::string>(),
                             s.at("name").get<std::string>()});
        }

        for (const auto &p : j.value("projects", json::array())) {
            ProjectNode node;
            node.id = p.at("id").get<std::string>();
            node.path = p.at("path").get<std::string>();
            node.name = p.at("name").get<std::string>();
            node.root_namespace = optional_from_json(p, "root_namespace");
            node.target_framework = optional_from_json(p, "target_framework");
            node.kind = project_kind_from_string(p.value("kind", std::string("library")));
            g->add_project(std::move(node));
        }

        for (const auto &f : j.value("files", json::array())) {
            FileNode node;
            node.id = f.at("id").get<std::string>();
            node.path = f.at("path").get<std::string>();
            node.namespace_name = optional_from_json(f, "namespace");
            node.kind = file_kind_from_string(f.value("kind", std::string("source")));
            g->add_file(std::move(node));
        }

        for (const auto &t : j.value("types", json::array())) {
            TypeNode node;
            node.id = t.at("id").get<std::string>();
            node.full_name = t.at("full_name").get<std::string>();
            node.namespace_name = t.value("namespace", std::string());
            node.name = t.at("name").get<std::string>();
            node.kind = type_kind_from_string(t.value("kind", std::string("class")));
            node.file_id = t.at("file_id").get<std::string>();
            node.is_public = t.value("public", true);
            node.is_partial = t.value("partial", false);
            node.is_static = t.value("static", false);
            node.is_abstract = t.value("abstract", false);
            g->add_type(std::move(node));
        }

        for (const auto &p : j.value("packages", json::array())) {
            g->add_package({p.at("id").get<std::string>(), p.at("package_id").get<std::string>(),
                            optional_from_json(p, "version")});
        }

        for (const auto &n : j.value("namespaces", json::array())) {
            g->add_namespace({n.at("id").get<std::string>(), n.at("namespace").get<std::string>()});
        }

        for (const auto &e : j.value("edges", json::array())) {
            std::string kind_name = e.at("kind").get<std::string>();
            EdgeKind kind;
            if (!edge_kind_from_string(kind_name, kind)) {
                throw std::runtime_error("Unknown edge kind in index: " + kind_name);
            }
            EdgePayload payload =
                e.contains("payload") ? payload_from_json(kind, e["payload"]) : EdgePayload{};
            g->add_edge(Edge(kind, e.at("source").get<std::string>(),
                             e.at("target").get<std::string>(), std::move(payload)));
        }
    } catch (const json::exception &ex) {
        throw std::runtime_error(std::string("Malformed index file: ") + ex.what());
    }

    return g;
}

std::unique_ptr<SolutionGraph> SolutionGraph::load(const std::string &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error &ex) {
        throw std::runtime_error("Failed to parse index file " + filepath + ": " + ex.what());
    }
    return from_json(j);
}

} // namespace relocator
