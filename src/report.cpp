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

#include "relocator/report.hpp"
#include <algorithm>
#include <sstream>

namespace relocator {

namespace {

template <typename T> json optional_json(const std::optional<T> &value) {
    return value ? json(*value) : json(nullptr);
}

void write_diagnostics(std::ostringstream &out, const std::vector<Diagnostic> &entries) {
    for (const auto &entry : entries) {
        out << "- **" << entry.code << "**: " << entry.message << "\n";
        if (entry.file_path)
            out << "  - File: `" << *entry.file_path << "`\n";
    }
    out << "\n";
}

json diagnostics_json(const std::vector<Diagnostic> &entries) {
    json result = json::array();
    for (const auto &entry : entries) {
        result.push_back({{"code", entry.code},
                          {"message", entry.message},
                          {"filePath", optional_json(entry.file_path)},
                          {"lineNumber", optional_json(entry.line)}});
    }
    return result;
}

} // namespace

std::string render_markdown(const ImpactReport &report) {
    std::ostringstream out;

    out << "# Migration Impact Report\n\n";
    out << "## Summary\n\n";
    out << "| Metric | Value |\n";
    out << "|--------|-------|\n";
    out << "| Operation | " << operation_description(report.operation) << " |\n";
    out << "| Complexity | " << complexity_to_string(report.complexity) << " |\n";
    out << "| Can Proceed | " << (report.can_proceed() ? "✅ Yes" : "❌ No") << " |\n";
    out << "| Affected Files | " << report.affected_file_count() << " |\n";
    out << "| Affected Types | " << report.affected_type_count() << " |\n";
    out << "| Affected Projects | " << report.affected_project_count() << " |\n";
    out << "| Required Changes | " << report.required_change_count() << " |\n\n";

    if (!report.errors.empty()) {
        out << "## ❌ Errors (Must Fix)\n\n";
        write_diagnostics(out, report.errors);
    }

    if (!report.warnings.empty()) {
        out << "## ⚠️ Warnings\n\n";
        write_diagnostics(out, report.warnings);
    }

    if (!report.affected_files.empty()) {
        out << "## Affected Files\n\n";

        std::vector<AffectedFileReason> reasons;
        for (const auto &file : report.affected_files) {
            if (std::find(reasons.begin(), reasons.end(), file.reason) == reasons.end())
                reasons.push_back(file.reason);
        }

        for (AffectedFileReason reason : reasons) {
            out << "### " << affected_file_reason_to_string(reason) << "\n\n";
            out << "| File | Changes |\n";
            out << "|------|---------|\n";
            for (const auto &file : report.affected_files) {
                if (file.reason != reason)
                    continue;
                out << "| `" << path_file_name(file.file_path) << "` | ";
                for (size_t i = 0; i < file.required_changes.size(); ++i) {
                    if (i > 0)
                        out << ", ";
                    out << change_kind_to_string(file.required_changes[i].kind);
                }
                out << " |\n";
            }
            out << "\n";
        }
    }

    if (!report.required_project_references.empty()) {
        out << "## Required Project References\n\n";
        out << "| Project | Needs Reference To |\n";
        out << "|---------|-------------------|\n";
        for (const auto &ref : report.required_project_references) {
            out << "| `" << path_file_name(ref.project_path) << "` | `"
                << path_file_name(ref.reference_path) << "` |\n";
        }
        out << "\n";
    }

    return out.str();
}

json report_to_json(const ImpactReport &report) {
    json j;
    j["operation"] = operation_description(report.operation);
    j["canProceed"] = report.can_proceed();
    j["complexity"] = complexity_to_string(report.complexity);
    j["summary"] = {{"affectedFilesCount", report.affected_file_count()},
                    {"affectedTypesCount", report.affected_type_count()},
                    {"affectedProjectsCount", report.affected_project_count()},
                    {"requiredChangesCount", report.required_change_count()},
                    {"warningsCount", report.warnings.size()},
                    {"errorsCount", report.errors.size()}};

    json files = json::array();
    for (const auto &file : report.affected_files) {
        json changes = json::array();
        for (const auto &change : file.required_changes) {
            changes.push_back({{"type", change_kind_to_string(change.kind)},
                               {"lineNumber", optional_json(change.line)},
                               {"currentValue", optional_json(change.current_value)},
                               {"newValue", optional_json(change.new_value)},
                               {"description", change.description}});
        }
        files.push_back({{"filePath", file.file_path},
                         {"projectPath", file.project_path},
                         {"reason", affected_file_reason_to_string(file.reason)},
                         {"changes", changes}});
    }
    j["affectedFiles"] = files;

    json types = json::array();
    for (const auto &type : report.affected_types) {
        types.push_back({{"typeFullName", type.type_full_name},
                         {"filePath", type.file_path},
                         {"reason", affected_type_reason_to_string(type.reason)}});
    }
    j["affectedTypes"] = types;

    json project_refs = json::array();
    for (const auto &ref : report.required_project_references) {
        project_refs.push_back({{"projectPath", ref.project_path},
                                {"referencePath", ref.reference_path},
                                {"reason", ref.reason}});
    }
    j["requiredProjectReferences"] = project_refs;

    json package_refs = json::array();
    for (const auto &ref : report.required_package_references) {
        package_refs.push_back({{"projectPath", ref.project_path},
                                {"packageId", ref.package_id},
                                {"version", optional_json(ref.version)},
                                {"reason", ref.reason}});
    }
    j["requiredPackageReferences"] = package_refs;

    j["warnings"] = diagnostics_json(report.warnings);
    j["errors"] = diagnostics_json(report.errors);
    return j;
}

} // namespace relocator
