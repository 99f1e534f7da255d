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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relocator {

// ============================================================================
// Node kinds
// ============================================================================

// Project classification
enum class ProjectKind { Library, Executable, Gui, WebApi, Test, Other };

// File content classification
enum class FileKind { Source, Markup, Data, Other };

// Declared type classification
enum class TypeKind { Class, Interface, Record, Struct, Enum, Delegate };

inline const char *project_kind_to_string(ProjectKind kind) {
    switch (kind) {
    case ProjectKind::Library:
        return "library";
    case ProjectKind::Executable:
        return "executable";
    case ProjectKind::Gui:
        return "gui";
    case ProjectKind::WebApi:
        return "web-api";
    case ProjectKind::Test:
        return "test";
    default:
        return "other";
    }
}

inline ProjectKind project_kind_from_string(const std::string &s) {
    if (s == "library")
        return ProjectKind::Library;
    if (s == "executable")
        return ProjectKind::Executable;
    if (s == "gui")
        return ProjectKind::Gui;
    if (s == "web-api")
        return ProjectKind::WebApi;
    if (s == "test")
        return ProjectKind::Test;
    return ProjectKind::Other;
}

inline const char *file_kind_to_string(FileKind kind) {
    switch (kind) {
    case FileKind::Source:
        return "source";
    case FileKind::Markup:
        return "markup";
    case FileKind::Data:
        return "data";
    default:
        return "other";
    }
}

inline FileKind file_kind_from_string(const std::string &s) {
    if (s == "source")
        return FileKind::Source;
    if (s == "markup")
        return FileKind::Markup;
    if (s == "data")
        return FileKind::Data;
    return FileKind::Other;
}

// Get file kind from file extension (lower-case, with the dot)
inline FileKind file_kind_from_extension(const std::string &ext) {
    if (ext == ".cs")
        return FileKind::Source;
    if (ext == ".xaml" || ext == ".razor")
        return FileKind::Markup;
    if (ext == ".json" || ext == ".xml" || ext == ".csproj" || ext == ".props" ||
        ext == ".targets")
        return FileKind::Data;
    return FileKind::Other;
}

inline const char *type_kind_to_string(TypeKind kind) {
    switch (kind) {
    case TypeKind::Class:
        return "class";
    case TypeKind::Interface:
        return "interface";
    case TypeKind::Record:
        return "record";
    case TypeKind::Struct:
        return "struct";
    case TypeKind::Enum:
        return "enum";
    case TypeKind::Delegate:
        return "delegate";
    }
    return "class";
}

inline TypeKind type_kind_from_string(const std::string &s) {
    if (s == "interface")
        return TypeKind::Interface;
    if (s == "record")
        return TypeKind::Record;
    if (s == "struct")
        return TypeKind::Struct;
    if (s == "enum")
        return TypeKind::Enum;
    if (s == "delegate")
        return TypeKind::Delegate;
    return TypeKind::Class;
}

// Last path component, accepting both separators
inline std::string path_file_name(const std::string &path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

// Everything before the last separator (empty if there is none)
inline std::string path_directory(const std::string &path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

// ============================================================================
// Nodes
// ============================================================================

struct SolutionNode {
    std::string id;
    std::string path;
    std::string name;

    const std::string &display_name() const { return name; }
};

struct ProjectNode {
    std::string id;
    std::string path;
    std::string name;
    std::optional<std::string> root_namespace;
    std::optional<std::string> target_framework;
    ProjectKind kind = ProjectKind::Library;

    const std::string &display_name() const { return name; }
    std::string directory() const { return path_directory(path); }
};

struct FileNode {
    std::string id;
    std::string path;
    std::optional<std::string> namespace_name;
    FileKind kind = FileKind::Source;

    std::string display_name() const { return path_file_name(path); }
    std::string file_name() const { return path_file_name(path); }
    std::string directory() const { return path_directory(path); }
};

struct TypeNode {
    std::string id;
    std::string full_name;
    std::string namespace_name;
    std::string name;
    TypeKind kind = TypeKind::Class;
    std::string file_id;
    bool is_public = true;
    bool is_partial = false;
    bool is_static = false;
    bool is_abstract = false;

    const std::string &display_name() const { return name; }
};

struct PackageNode {
    std::string id;
    std::string package_id;
    std::optional<std::string> version;

    std::string display_name() const {
        return version ? package_id + " (" + *version + ")" : package_id;
    }
};

struct NamespaceNode {
    std::string id;
    std::string namespace_name;

    const std::string &display_name() const { return namespace_name; }
};

// Any node, as returned by the id lookup facade
using GraphNode =
    std::variant<SolutionNode, ProjectNode, FileNode, TypeNode, PackageNode, NamespaceNode>;

inline const std::string &node_id(const GraphNode &node) {
    return std::visit([](const auto &n) -> const std::string & { return n.id; }, node);
}

inline std::string node_display_name(const GraphNode &node) {
    return std::visit([](const auto &n) { return std::string(n.display_name()); }, node);
}

// Id conventions shared by the builder, the loader and the tests
inline std::string make_solution_id(const std::string &path) { return "sln:" + path; }
inline std::string make_project_id(const std::string &path) { return "proj:" + path; }
inline std::string make_file_id(const std::string &path) { return "file:" + path; }
inline std::string make_type_id(const std::string &full_name) { return "type:" + full_name; }
inline std::string make_package_id(const std::string &name) { return "pkg:" + name; }
inline std::string make_namespace_id(const std::string &ns) { return "ns:" + ns; }

// ============================================================================
// Edges
// ============================================================================

enum class EdgeKind {
    SolutionContainsProject,
    ProjectContainsFile,
    ProjectReference,
    PackageReference,
    FileContainsType,
    FileUsesNamespace,
    TypeInNamespace,
    TypeInherits,
    TypeImplements,
    TypeUsage
};

constexpr size_t EDGE_KIND_COUNT = 10;

// How a type is used by another type
enum class TypeUsageKind {
    Field,
    Property,
    MethodParameter,
    MethodReturn,
    LocalVariable,
    GenericArgument,
    Attribute,
    BaseType,
    Interface,
    Other
};

inline const char *edge_kind_to_string(EdgeKind kind) {
    switch (kind) {
    case EdgeKind::SolutionContainsProject:
        return "SolutionContainsProject";
    case EdgeKind::ProjectContainsFile:
        return "ProjectContainsFile";
    case EdgeKind::ProjectReference:
        return "ProjectReference";
    case EdgeKind::PackageReference:
        return "PackageReference";
    case EdgeKind::FileContainsType:
        return "FileContainsType";
    case EdgeKind::FileUsesNamespace:
        return "FileUsesNamespace";
    case EdgeKind::TypeInNamespace:
        return "TypeInNamespace";
    case EdgeKind::TypeInherits:
        return "TypeInherits";
    case EdgeKind::TypeImplements:
        return "TypeImplements";
    case EdgeKind::TypeUsage:
        return "TypeUsage";
    }
    return "Unknown";
}

// Returns false if the name is not a known edge kind
bool edge_kind_from_string(const std::string &s, EdgeKind &out);

inline const char *type_usage_kind_to_string(TypeUsageKind kind) {
    switch (kind) {
    case TypeUsageKind::Field:
        return "field";
    case TypeUsageKind::Property:
        return "property";
    case TypeUsageKind::MethodParameter:
        return "method-parameter";
    case TypeUsageKind::MethodReturn:
        return "method-return";
    case TypeUsageKind::LocalVariable:
        return "local-variable";
    case TypeUsageKind::GenericArgument:
        return "generic-argument";
    case TypeUsageKind::Attribute:
        return "attribute";
    case TypeUsageKind::BaseType:
        return "base-type";
    case TypeUsageKind::Interface:
        return "interface";
    default:
        return "other";
    }
}

TypeUsageKind type_usage_kind_from_string(const std::string &s);

// Payload of a FileUsesNamespace edge
struct NamespaceUsage {
    uint32_t line = 0;
};

// Payload of a TypeUsage edge
struct TypeUsageInfo {
    TypeUsageKind usage = TypeUsageKind::Other;
    std::optional<std::string> member_name;
    std::optional<uint32_t> line;
};

using EdgePayload = std::variant<std::monostate, NamespaceUsage, TypeUsageInfo>;

struct Edge {
    EdgeKind kind;
    std::string source_id;
    std::string target_id;
    EdgePayload payload;

    Edge(EdgeKind k, std::string source, std::string target, EdgePayload p = std::monostate{})
        : kind(k), source_id(std::move(source)), target_id(std::move(target)),
          payload(std::move(p)) {}

    // Source line for FileUsesNamespace and TypeUsage edges
    std::optional<uint32_t> line_number() const {
        if (auto *ns = std::get_if<NamespaceUsage>(&payload))
            return ns->line;
        if (auto *usage = std::get_if<TypeUsageInfo>(&payload))
            return usage->line;
        return std::nullopt;
    }

    // Relationship description for display
    std::string description() const;

    bool is_type_reference() const {
        return kind == EdgeKind::TypeUsage || kind == EdgeKind::TypeInherits ||
               kind == EdgeKind::TypeImplements;
    }
};

} // namespace relocator
