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

#include "complexity.hpp"
#include "graph.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relocator {

// ============================================================================
// Operations
// ============================================================================

struct MoveOperation {
    std::string source_path;
    std::string target_path;
    std::optional<std::string> new_namespace;
    bool is_folder = false;

    std::string description() const;
};

struct RenameNamespaceOperation {
    std::string old_namespace;
    std::string new_namespace;

    std::string description() const;
};

struct DeleteOperation {
    std::string path;
    bool force = false;
    bool is_folder = false;

    std::string description() const;
};

struct MoveTypeOperation {
    std::string type_full_name;
    std::string new_namespace;
    std::optional<std::string> new_file_path;

    std::string description() const;
};

using MigrationOperation =
    std::variant<MoveOperation, RenameNamespaceOperation, DeleteOperation, MoveTypeOperation>;

std::string operation_description(const MigrationOperation &operation);

// ============================================================================
// Report
// ============================================================================

enum class ChangeKind {
    UpdateUsingDirective,
    AddUsingDirective,
    RemoveUsingDirective,
    UpdateFullyQualifiedName,
    UpdateNamespace,
    UpdateXamlNamespace,
    UpdateProjectReference,
    MoveFile,
    DeleteFile
};

enum class AffectedFileReason {
    DirectlyMoved,
    DirectlyDeleted,
    ContainsUsingDirective,
    ContainsFullyQualifiedReference,
    ContainsInheritance,
    ContainsTypeUsage,
    ContainsXamlReference,
    ProjectFileUpdate
};

enum class AffectedTypeReason {
    DirectlyMoved,
    DirectlyDeleted,
    NamespaceChanged,
    ReferencesMovedType,
    InheritsFromMovedType,
    ImplementsMovedInterface
};

const char *change_kind_to_string(ChangeKind kind);
const char *affected_file_reason_to_string(AffectedFileReason reason);
const char *affected_type_reason_to_string(AffectedTypeReason reason);

struct RequiredChange {
    ChangeKind kind = ChangeKind::MoveFile;
    std::optional<uint32_t> line;
    std::optional<std::string> current_value;
    std::optional<std::string> new_value;
    std::string description;

    bool operator==(const RequiredChange &other) const;
};

struct AffectedFile {
    std::string file_path;
    std::string project_path;
    AffectedFileReason reason = AffectedFileReason::DirectlyMoved;
    std::vector<RequiredChange> required_changes;
};

struct AffectedType {
    std::string type_full_name;
    std::string file_path;
    AffectedTypeReason reason = AffectedTypeReason::DirectlyMoved;
};

struct RequiredProjectReference {
    std::string project_path;
    std::string reference_path;
    std::string reason;
};

struct RequiredPackageReference {
    std::string project_path;
    std::string package_id;
    std::optional<std::string> version;
    std::string reason;
};

// Error or warning entry
struct Diagnostic {
    std::string code;
    std::string message;
    std::optional<std::string> file_path;
    std::optional<uint32_t> line;
};

struct ImpactReport {
    MigrationOperation operation;
    Complexity complexity = Complexity::Simple;
    std::vector<AffectedFile> affected_files;
    std::vector<AffectedType> affected_types;
    std::vector<RequiredProjectReference> required_project_references;
    std::vector<RequiredPackageReference> required_package_references;
    std::vector<Diagnostic> warnings;
    std::vector<Diagnostic> errors;

    bool can_proceed() const { return errors.empty(); }

    size_t affected_file_count() const { return affected_files.size(); }
    size_t affected_type_count() const { return affected_types.size(); }
    // Distinct project paths among affected files
    size_t affected_project_count() const;
    size_t required_change_count() const;
};

// ============================================================================
// Analyzer
// ============================================================================

// Stateless; safe to call concurrently against one graph. Expected failures
// (missing file, existing target, type in use) become report errors, never
// exceptions.
class ImpactAnalyzer {
public:
    ImpactReport analyze(const SolutionGraph &graph, const MigrationOperation &operation) const;

    ImpactReport analyze_move(const SolutionGraph &graph, const MoveOperation &op) const;
    ImpactReport analyze_rename_namespace(const SolutionGraph &graph,
                                          const RenameNamespaceOperation &op) const;
    ImpactReport analyze_delete(const SolutionGraph &graph, const DeleteOperation &op) const;
    ImpactReport analyze_move_type(const SolutionGraph &graph, const MoveTypeOperation &op) const;
};

} // namespace relocator
