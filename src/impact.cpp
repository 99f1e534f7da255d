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

#include "relocator/impact.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace relocator {

namespace {

constexpr size_t LARGE_FOLDER_THRESHOLD = 10;
const char *const UNKNOWN_PROJECT = "unknown";

std::string trim_trailing_separators(std::string path) {
    while (!path.empty() && (path.back() == '/' || path.back() == '\\'))
        path.pop_back();
    return path;
}

std::string trim_leading_separators(const std::string &path) {
    size_t start = path.find_first_not_of("/\\");
    return start == std::string::npos ? std::string() : path.substr(start);
}

// True if `path` is `dir` or lies below it
bool is_within(const std::string &path, const std::string &dir) {
    std::string key = normalize_path_key(path);
    std::string prefix = trim_trailing_separators(normalize_path_key(dir));
    if (prefix.empty())
        return false;
    if (key == prefix)
        return true;
    return key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0 &&
           key[prefix.size()] == '/';
}

std::string project_path_of(const SolutionGraph &graph, const FileNode &file) {
    auto project = graph.project_containing_file(file.id);
    return project ? project->path : std::string(UNKNOWN_PROJECT);
}

std::vector<TypeNode> types_declared_in(const SolutionGraph &graph, const FileNode &file) {
    std::vector<TypeNode> result;
    for (auto &type : graph.types()) {
        if (type.file_id == file.id)
            result.push_back(std::move(type));
    }
    return result;
}

RequiredChange make_change(ChangeKind kind, std::optional<uint32_t> line,
                           std::optional<std::string> current, std::optional<std::string> next,
                           std::string description) {
    RequiredChange change;
    change.kind = kind;
    change.line = line;
    change.current_value = std::move(current);
    change.new_value = std::move(next);
    change.description = std::move(description);
    return change;
}

Diagnostic make_diagnostic(std::string code, std::string message,
                           std::optional<std::string> file_path = std::nullopt) {
    Diagnostic diagnostic;
    diagnostic.code = std::move(code);
    diagnostic.message = std::move(message);
    diagnostic.file_path = std::move(file_path);
    return diagnostic;
}

// Using change for a file that references a type leaving `old_namespace`
RequiredChange using_change(const SolutionGraph &graph, const FileNode &file,
                            const std::string &old_namespace, const std::string &new_namespace,
                            const std::string &type_name) {
    if (auto line = graph.using_line(file.id, old_namespace)) {
        return make_change(ChangeKind::UpdateUsingDirective, *line > 0 ? line : std::nullopt,
                           "using " + old_namespace + ";", "using " + new_namespace + ";",
                           "Update using directive for " + type_name);
    }
    return make_change(ChangeKind::AddUsingDirective, std::nullopt, std::nullopt,
                       "using " + new_namespace + ";", "Add using directive for " + type_name);
}

// Affected files merged by path in first-seen order; affected types by (type, file)
void deduplicate(ImpactReport &report) {
    std::vector<AffectedFile> files;
    std::unordered_map<std::string, size_t> file_index;
    for (auto &file : report.affected_files) {
        auto [it, inserted] = file_index.emplace(file.file_path, files.size());
        if (inserted) {
            AffectedFile merged = file;
            merged.required_changes.clear();
            files.push_back(std::move(merged));
        }
        auto &changes = files[it->second].required_changes;
        for (auto &change : file.required_changes) {
            if (std::find(changes.begin(), changes.end(), change) == changes.end())
                changes.push_back(std::move(change));
        }
    }
    report.affected_files = std::move(files);

    std::vector<AffectedType> types;
    std::set<std::pair<std::string, std::string>> seen;
    for (auto &type : report.affected_types) {
        if (seen.emplace(type.type_full_name, type.file_path).second)
            types.push_back(std::move(type));
    }
    report.affected_types = std::move(types);
}

ImpactReport finish(ImpactReport report) {
    deduplicate(report);

    ComplexityInputs inputs;
    inputs.affected_files = report.affected_file_count();
    inputs.affected_types = report.affected_type_count();
    inputs.required_project_references = report.required_project_references.size();
    inputs.distinct_projects = report.affected_project_count();
    inputs.has_errors = !report.errors.empty();
    report.complexity = score_complexity(inputs);
    return report;
}

} // namespace

// ============================================================================
// Operations
// ============================================================================

std::string MoveOperation::description() const {
    return "Move " + path_file_name(trim_trailing_separators(source_path)) + " to " + target_path;
}

std::string RenameNamespaceOperation::description() const {
    return "Rename namespace " + old_namespace + " to " + new_namespace;
}

std::string DeleteOperation::description() const {
    return "Delete " + path_file_name(trim_trailing_separators(path));
}

std::string MoveTypeOperation::description() const {
    return "Move type " + type_full_name + " to " + new_namespace;
}

std::string operation_description(const MigrationOperation &operation) {
    return std::visit([](const auto &op) { return op.description(); }, operation);
}

// ============================================================================
// Report
// ============================================================================

const char *change_kind_to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::UpdateUsingDirective:
        return "UpdateUsingDirective";
    case ChangeKind::AddUsingDirective:
        return "AddUsingDirective";
    case ChangeKind::RemoveUsingDirective:
        return "RemoveUsingDirective";
    case ChangeKind::UpdateFullyQualifiedName:
        return "UpdateFullyQualifiedName";
    case ChangeKind::UpdateNamespace:
        return "UpdateNamespace";
    case ChangeKind::UpdateXamlNamespace:
        return "UpdateXamlNamespace";
    case ChangeKind::UpdateProjectReference:
        return "UpdateProjectReference";
    case ChangeKind::MoveFile:
        return "MoveFile";
    case ChangeKind::DeleteFile:
        return "DeleteFile";
    }
    return "MoveFile";
}

const char *affected_file_reason_to_string(AffectedFileReason reason) {
    switch (reason) {
    case AffectedFileReason::DirectlyMoved:
        return "DirectlyMoved";
    case AffectedFileReason::DirectlyDeleted:
        return "DirectlyDeleted";
    case AffectedFileReason::ContainsUsingDirective:
        return "ContainsUsingDirective";
    case AffectedFileReason::ContainsFullyQualifiedReference:
        return "ContainsFullyQualifiedReference";
    case AffectedFileReason::ContainsInheritance:
        return "ContainsInheritance";
    case AffectedFileReason::ContainsTypeUsage:
        return "ContainsTypeUsage";
    case AffectedFileReason::ContainsXamlReference:
        return "ContainsXamlReference";
    case AffectedFileReason::ProjectFileUpdate:
        return "ProjectFileUpdate";
    }
    return "DirectlyMoved";
}

const char *affected_type_reason_to_string(AffectedTypeReason reason) {
    switch (reason) {
    case AffectedTypeReason::DirectlyMoved:
        return "DirectlyMoved";
    case AffectedTypeReason::DirectlyDeleted:
        return "DirectlyDeleted";
    case AffectedTypeReason::NamespaceChanged:
        return "NamespaceChanged";
    case AffectedTypeReason::ReferencesMovedType:
        return "ReferencesMovedType";
    case AffectedTypeReason::InheritsFromMovedType:
        return "InheritsFromMovedType";
    case AffectedTypeReason::ImplementsMovedInterface:
        return "ImplementsMovedInterface";
    }
    return "DirectlyMoved";
}

bool RequiredChange::operator==(const RequiredChange &other) const {
    return kind == other.kind && line == other.line && current_value == other.current_value &&
           new_value == other.new_value && description == other.description;
}

size_t ImpactReport::affected_project_count() const {
    std::unordered_set<std::string> projects;
    for (const auto &file : affected_files)
        projects.insert(file.project_path);
    return projects.size();
}

size_t ImpactReport::required_change_count() const {
    size_t total = 0;
    for (const auto &file : affected_files)
        total += file.required_changes.size();
    return total;
}

// ============================================================================
// Analyzer
// ============================================================================

ImpactReport ImpactAnalyzer::analyze(const SolutionGraph &graph,
                                     const MigrationOperation &operation) const {
    struct Dispatch {
        const ImpactAnalyzer &analyzer;
        const SolutionGraph &graph;

        ImpactReport operator()(const MoveOperation &op) const {
            return analyzer.analyze_move(graph, op);
        }
        ImpactReport operator()(const RenameNamespaceOperation &op) const {
            return analyzer.analyze_rename_namespace(graph, op);
        }
        ImpactReport operator()(const DeleteOperation &op) const {
            return analyzer.analyze_delete(graph, op);
        }
        ImpactReport operator()(const MoveTypeOperation &op) const {
            return analyzer.analyze_move_type(graph, op);
        }
    };
    return std::visit(Dispatch{*this, graph}, operation);
}

ImpactReport ImpactAnalyzer::analyze_move(const SolutionGraph &graph,
                                          const MoveOperation &op) const {
    ImpactReport report;
    report.operation = op;

    auto source = graph.find_file_by_path(op.source_path);
    if (!source && !op.is_folder) {
        report.errors.push_back(make_diagnostic(
            "FILE_NOT_FOUND", "Source file not found in graph: " + op.source_path,
            op.source_path));
        return finish(std::move(report));
    }

    if (graph.find_file_by_path(op.target_path)) {
        report.errors.push_back(make_diagnostic(
            "TARGET_EXISTS", "Target file already exists: " + op.target_path, op.target_path));
    }

    if (source) {
        const std::optional<std::string> &old_namespace = source->namespace_name;
        const std::optional<std::string> &new_namespace = op.new_namespace;
        bool namespace_changes =
            old_namespace && new_namespace && *old_namespace != *new_namespace;

        AffectedFile moved;
        moved.file_path = source->path;
        moved.project_path = project_path_of(graph, *source);
        moved.reason = AffectedFileReason::DirectlyMoved;
        moved.required_changes.push_back(make_change(ChangeKind::MoveFile, std::nullopt,
                                                     source->path, op.target_path,
                                                     "Move file to " + op.target_path));
        if (namespace_changes) {
            moved.required_changes.push_back(
                make_change(ChangeKind::UpdateNamespace, std::nullopt, *old_namespace,
                            *new_namespace,
                            "Update namespace from " + *old_namespace + " to " + *new_namespace));
        }
        report.affected_files.push_back(std::move(moved));

        std::vector<TypeNode> moved_types = types_declared_in(graph, *source);
        for (const auto &type : moved_types) {
            report.affected_types.push_back(
                {type.full_name, source->path, AffectedTypeReason::DirectlyMoved});

            for (const auto &ref_file : graph.files_referencing_type(type.id)) {
                if (ref_file.id == source->id || !namespace_changes)
                    continue;

                AffectedFile affected;
                affected.file_path = ref_file.path;
                affected.project_path = project_path_of(graph, ref_file);
                affected.reason = AffectedFileReason::ContainsUsingDirective;
                affected.required_changes.push_back(
                    using_change(graph, ref_file, *old_namespace, *new_namespace, type.name));
                report.affected_files.push_back(std::move(affected));

                report.affected_types.push_back(
                    {type.full_name, ref_file.path, AffectedTypeReason::ReferencesMovedType});
            }

            // Subtypes elsewhere only need a note; their source is unchanged
            for (const auto &edge : graph.incoming_edges(type.id)) {
                if (edge.kind != EdgeKind::TypeInherits && edge.kind != EdgeKind::TypeImplements)
                    continue;
                auto subtype = graph.find_type_by_id(edge.source_id);
                if (!subtype)
                    continue;
                auto subtype_file = graph.file_containing_type(subtype->id);
                if (!subtype_file || subtype_file->id == source->id)
                    continue;
                report.affected_types.push_back(
                    {subtype->full_name, subtype_file->path,
                     edge.kind == EdgeKind::TypeInherits
                         ? AffectedTypeReason::InheritsFromMovedType
                         : AffectedTypeReason::ImplementsMovedInterface});
            }
        }

        // Partial parts registered under other ids
        std::vector<TypeNode> all_types = graph.types();
        for (const auto &type : moved_types) {
            if (!type.is_partial)
                continue;
            size_t other_parts = static_cast<size_t>(
                std::count_if(all_types.begin(), all_types.end(), [&](const TypeNode &t) {
                    return t.full_name == type.full_name && t.id != type.id;
                }));
            if (other_parts > 0) {
                report.warnings.push_back(make_diagnostic(
                    "PARTIAL_CLASS",
                    "Type " + type.name + " is a partial class with " +
                        std::to_string(other_parts) +
                        " other part(s). Consider moving all parts together.",
                    op.source_path));
            }
        }

        // Cross-project move: referencing projects may need a reference to the target
        auto source_project = graph.project_containing_file(source->id);
        if (source_project) {
            std::string target_dir = path_directory(op.target_path);
            std::optional<ProjectNode> target_project;
            for (const auto &project : graph.projects()) {
                if (!is_within(target_dir, project.directory()))
                    continue;
                // Innermost project wins for nested project directories
                if (!target_project || project.directory().size() > target_project->directory().size())
                    target_project = project;
            }

            if (target_project && target_project->id != source_project->id) {
                std::vector<std::string> referencing_projects;
                for (const auto &file : report.affected_files) {
                    if (file.reason != AffectedFileReason::ContainsUsingDirective)
                        continue;
                    if (std::find(referencing_projects.begin(), referencing_projects.end(),
                                  file.project_path) == referencing_projects.end())
                        referencing_projects.push_back(file.project_path);
                }

                std::vector<ProjectNode> projects = graph.projects();
                for (const auto &project_path : referencing_projects) {
                    std::string key = normalize_path_key(project_path);
                    auto it = std::find_if(projects.begin(), projects.end(), [&](const ProjectNode &p) {
                        return normalize_path_key(p.path) == key;
                    });
                    if (it == projects.end() || it->id == target_project->id)
                        continue;

                    auto deps = graph.project_dependencies(it->id);
                    bool has_reference =
                        std::any_of(deps.begin(), deps.end(), [&](const ProjectNode &dep) {
                            return dep.id == target_project->id;
                        });
                    if (!has_reference) {
                        report.required_project_references.push_back(
                            {project_path, target_project->path,
                             "Required for access to moved type(s)"});
                    }
                }
            }
        }
    }

    if (op.is_folder) {
        std::string source_root = trim_trailing_separators(op.source_path);
        std::string target_root = trim_trailing_separators(op.target_path);
        std::vector<FileNode> files = graph.files_under(source_root);

        for (const auto &file : files) {
            std::string relative = trim_leading_separators(file.path.substr(
                std::min(source_root.size(), file.path.size())));
            std::string new_path = target_root + "/" + relative;

            AffectedFile affected;
            affected.file_path = file.path;
            affected.project_path = project_path_of(graph, file);
            affected.reason = AffectedFileReason::DirectlyMoved;
            affected.required_changes.push_back(make_change(
                ChangeKind::MoveFile, std::nullopt, file.path, new_path, "Move file to " + new_path));
            report.affected_files.push_back(std::move(affected));
        }

        if (files.size() > LARGE_FOLDER_THRESHOLD) {
            report.warnings.push_back(make_diagnostic(
                "LARGE_FOLDER_MOVE",
                "Moving " + std::to_string(files.size()) +
                    " files. Consider reviewing the impact carefully.",
                op.source_path));
        }
    }

    return finish(std::move(report));
}

ImpactReport ImpactAnalyzer::analyze_rename_namespace(const SolutionGraph &graph,
                                                      const RenameNamespaceOperation &op) const {
    ImpactReport report;
    report.operation = op;

    std::vector<TypeNode> types = graph.types_in_namespace(op.old_namespace);
    if (types.empty()) {
        report.warnings.push_back(
            make_diagnostic("NAMESPACE_EMPTY", "No types found in namespace " + op.old_namespace));
    }

    std::unordered_set<std::string> declaring_ids;
    for (const auto &type : types) {
        auto file = graph.file_containing_type(type.id);
        if (!file || !declaring_ids.insert(file->id).second)
            continue;

        AffectedFile affected;
        affected.file_path = file->path;
        affected.project_path = project_path_of(graph, *file);
        affected.reason = AffectedFileReason::ContainsUsingDirective;
        affected.required_changes.push_back(make_change(ChangeKind::UpdateNamespace, std::nullopt,
                                                        op.old_namespace, op.new_namespace,
                                                        "Update namespace declaration"));
        report.affected_files.push_back(std::move(affected));
    }

    for (const auto &file : graph.files_using_namespace(op.old_namespace)) {
        if (declaring_ids.count(file.id))
            continue;

        auto line = graph.using_line(file.id, op.old_namespace);
        AffectedFile affected;
        affected.file_path = file.path;
        affected.project_path = project_path_of(graph, file);
        affected.reason = AffectedFileReason::ContainsUsingDirective;
        affected.required_changes.push_back(make_change(
            ChangeKind::UpdateUsingDirective, line && *line > 0 ? line : std::nullopt,
            "using " + op.old_namespace + ";", "using " + op.new_namespace + ";",
            "Update using directive"));
        report.affected_files.push_back(std::move(affected));
    }

    for (const auto &type : types) {
        auto file = graph.file_containing_type(type.id);
        report.affected_types.push_back({type.full_name,
                                         file ? file->path : std::string(UNKNOWN_PROJECT),
                                         AffectedTypeReason::NamespaceChanged});
    }

    return finish(std::move(report));
}

ImpactReport ImpactAnalyzer::analyze_delete(const SolutionGraph &graph,
                                            const DeleteOperation &op) const {
    ImpactReport report;
    report.operation = op;

    auto target = graph.find_file_by_path(op.path);
    if (!target && !op.is_folder) {
        report.errors.push_back(
            make_diagnostic("FILE_NOT_FOUND", "File not found in graph: " + op.path, op.path));
        return finish(std::move(report));
    }

    std::vector<FileNode> deleted;
    if (target)
        deleted.push_back(*target);
    if (op.is_folder) {
        for (auto &file : graph.files_under(op.path))
            deleted.push_back(std::move(file));
    }

    std::unordered_set<std::string> deleted_ids;
    for (const auto &file : deleted)
        deleted_ids.insert(file.id);

    std::unordered_set<std::string> analyzed;
    for (const auto &file : deleted) {
        if (!analyzed.insert(file.id).second)
            continue;

        AffectedFile affected;
        affected.file_path = file.path;
        affected.project_path = project_path_of(graph, file);
        affected.reason = AffectedFileReason::DirectlyDeleted;
        affected.required_changes.push_back(make_change(ChangeKind::DeleteFile, std::nullopt,
                                                        file.path, std::nullopt, "Delete file"));
        report.affected_files.push_back(std::move(affected));

        for (const auto &type : types_declared_in(graph, file)) {
            report.affected_types.push_back(
                {type.full_name, file.path, AffectedTypeReason::DirectlyDeleted});

            for (const auto &ref_file : graph.files_referencing_type(type.id)) {
                // References from files deleted alongside do not break
                if (deleted_ids.count(ref_file.id))
                    continue;

                if (!op.force) {
                    report.errors.push_back(make_diagnostic(
                        "TYPE_IN_USE",
                        "Type " + type.name + " is referenced in " + ref_file.path +
                            ". Use --force to delete anyway.",
                        ref_file.path));
                } else {
                    report.warnings.push_back(make_diagnostic(
                        "BROKEN_REFERENCE",
                        "Deleting " + type.name + " will break references in " + ref_file.path,
                        ref_file.path));
                }
            }
        }
    }

    return finish(std::move(report));
}

ImpactReport ImpactAnalyzer::analyze_move_type(const SolutionGraph &graph,
                                               const MoveTypeOperation &op) const {
    ImpactReport report;
    report.operation = op;

    auto type = graph.find_type(op.type_full_name);
    if (!type) {
        report.errors.push_back(
            make_diagnostic("TYPE_NOT_FOUND", "Type not found: " + op.type_full_name));
        return finish(std::move(report));
    }

    auto source = graph.file_containing_type(type->id);
    if (!source) {
        report.errors.push_back(make_diagnostic(
            "FILE_NOT_FOUND", "Source file not found for type: " + op.type_full_name));
        return finish(std::move(report));
    }

    AffectedFile moved;
    moved.file_path = source->path;
    moved.project_path = project_path_of(graph, *source);
    moved.reason = AffectedFileReason::DirectlyMoved;
    moved.required_changes.push_back(make_change(ChangeKind::UpdateNamespace, std::nullopt,
                                                 type->namespace_name, op.new_namespace,
                                                 "Update namespace for " + type->name));
    if (op.new_file_path) {
        moved.required_changes.push_back(make_change(ChangeKind::MoveFile, std::nullopt,
                                                     source->path, *op.new_file_path,
                                                     "Move file to " + *op.new_file_path));
    }
    report.affected_files.push_back(std::move(moved));
    report.affected_types.push_back(
        {type->full_name, source->path, AffectedTypeReason::DirectlyMoved});

    for (const auto &ref_file : graph.files_referencing_type(type->id)) {
        if (ref_file.id == source->id)
            continue;

        AffectedFile affected;
        affected.file_path = ref_file.path;
        affected.project_path = project_path_of(graph, ref_file);
        affected.reason = AffectedFileReason::ContainsUsingDirective;
        affected.required_changes.push_back(
            using_change(graph, ref_file, type->namespace_name, op.new_namespace, type->name));
        report.affected_files.push_back(std::move(affected));
    }

    return finish(std::move(report));
}

} // namespace relocator
