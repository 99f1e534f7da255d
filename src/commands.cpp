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

#include "relocator/commands.hpp"
#include "relocator/parser.hpp"
#include "relocator/report.hpp"
#include "relocator/workspace.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace relocator {

std::unique_ptr<SolutionGraph> load_graph() {
    try {
        return SolutionGraph::load(INDEX_FILE);
    } catch (const std::exception &e) {
        std::cerr << "Error loading index: " << e.what() << std::endl;
        std::cerr << "Please run 'relocator --index <solution>' first." << std::endl;
        return nullptr;
    }
}

std::optional<ProjectNode> find_project(const SolutionGraph &graph, const std::string &key) {
    std::string path_key = normalize_path_key(key);
    for (auto &project : graph.projects()) {
        if (project.name == key || project.id == key || normalize_path_key(project.path) == path_key)
            return project;
    }
    return std::nullopt;
}

MigrationOperation make_operation(const AnalyzeArgs &args) {
    std::string op = args.operation;
    std::transform(op.begin(), op.end(), op.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (op == "move") {
        if (!args.target)
            throw std::invalid_argument("Target path is required for move operation");
        MoveOperation move;
        move.source_path = args.source;
        move.target_path = *args.target;
        move.new_namespace = args.new_namespace;
        move.is_folder = args.folder;
        return move;
    }
    if (op == "rename-namespace" || op == "rename-ns") {
        if (!args.target)
            throw std::invalid_argument(
                "Target namespace is required for rename-namespace operation");
        return RenameNamespaceOperation{args.source, *args.target};
    }
    if (op == "delete") {
        DeleteOperation del;
        del.path = args.source;
        del.force = args.force;
        del.is_folder = args.folder;
        return del;
    }
    if (op == "move-type") {
        if (!args.target)
            throw std::invalid_argument("Target namespace is required for move-type operation");
        return MoveTypeOperation{args.source, *args.target, args.new_file};
    }
    throw std::invalid_argument("Unknown operation: " + args.operation +
                                ". Valid operations: move, rename-namespace, delete, move-type");
}

int cmd_index(const std::vector<std::string> &roots, const BuildOptions &options) {
    std::cout << "Indexing " << roots.size() << " input(s)..." << std::endl;

    MsBuildWorkspaceLoader loader(options.verbose);
    CSharpParser parser;
    GraphBuilder builder(loader, parser, options);

    BuildPhase last_phase = BuildPhase::LoadingSolution;
    std::mutex progress_mutex;
    auto progress = [&last_phase, &progress_mutex](const BuildProgress &p) {
        // Only phase changes are printed; per-item updates are too chatty
        std::lock_guard<std::mutex> lock(progress_mutex);
        if (p.phase != last_phase) {
            last_phase = p.phase;
            std::cout << "  " << build_phase_to_string(p.phase) << "..." << std::endl;
        }
    };

    std::unique_ptr<SolutionGraph> graph;
    try {
        graph = builder.build(roots, progress);
    } catch (const BuildError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const auto &stats = builder.stats();
    std::cout << "\nIndexed " << stats.projects_processed.load() << " projects, "
              << stats.files_processed.load() << " files, " << stats.types_found.load()
              << " types" << std::endl;
    if (stats.files_failed.load() > 0)
        std::cout << "  " << stats.files_failed.load() << " files could not be parsed" << std::endl;

    try {
        graph->save(INDEX_FILE);
        std::cout << "Index saved to: " << INDEX_FILE << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error saving index: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int cmd_stats() {
    auto graph = load_graph();
    if (!graph)
        return 1;
    std::cout << graph->statistics().to_string();
    return 0;
}

int cmd_deps(const std::string &project_key) {
    auto graph = load_graph();
    if (!graph)
        return 1;

    auto project = find_project(*graph, project_key);
    if (!project) {
        std::cerr << "Error: project not found: " << project_key << std::endl;
        return 1;
    }

    std::cout << project->name << " (" << project_kind_to_string(project->kind) << ")"
              << std::endl;

    auto deps = graph->project_dependencies(project->id);
    std::cout << "References (" << deps.size() << "):" << std::endl;
    if (deps.empty())
        std::cout << "  (none)" << std::endl;
    for (const auto &dep : deps)
        std::cout << "  " << dep.name << " [" << dep.path << "]" << std::endl;

    auto dependents = graph->projects_depending_on(project->id);
    std::cout << "Referenced by (" << dependents.size() << "):" << std::endl;
    if (dependents.empty())
        std::cout << "  (none)" << std::endl;
    for (const auto &dep : dependents)
        std::cout << "  " << dep.name << " [" << dep.path << "]" << std::endl;

    if (graph->has_cyclic_dependency(project->id))
        std::cout << "Warning: " << project->name << " is part of a reference cycle" << std::endl;
    return 0;
}

int cmd_cycles() {
    auto graph = load_graph();
    if (!graph)
        return 1;

    std::vector<std::string> cyclic;
    for (const auto &project : graph->projects()) {
        if (graph->has_cyclic_dependency(project.id))
            cyclic.push_back(project.name);
    }

    if (cyclic.empty()) {
        std::cout << "No cyclic project references found." << std::endl;
        return 0;
    }
    std::cout << cyclic.size() << " project(s) reach a reference cycle:" << std::endl;
    for (const auto &name : cyclic)
        std::cout << "  " << name << std::endl;
    return 0;
}

int cmd_analyze(const AnalyzeArgs &args) {
    MigrationOperation operation;
    try {
        operation = make_operation(args);
    } catch (const std::invalid_argument &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto graph = load_graph();
    if (!graph)
        return 1;

    ImpactAnalyzer analyzer;
    ImpactReport report = analyzer.analyze(*graph, operation);

    if (args.markdown) {
        std::cout << render_markdown(report);
    } else {
        json j = report_to_json(report);
        j["success"] = true;
        std::cout << j.dump(2) << std::endl;
    }
    return report.can_proceed() ? 0 : 2;
}

} // namespace relocator
