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

#include "facts.hpp"
#include "graph.hpp"
#include "workspace.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace relocator {

enum class BuildPhase {
    LoadingSolution,
    AnalyzingProjects,
    AnalyzingFiles,
    AnalyzingTypes,
    AnalyzingUsages,
    BuildingEdges,
    Completed
};

const char *build_phase_to_string(BuildPhase phase);

struct BuildProgress {
    BuildPhase phase = BuildPhase::LoadingSolution;
    std::string current_item;
    int percent = 0;
    size_t processed = 0;
    size_t total = 0;
};

// Callback for progress reporting; may be invoked from any worker thread
using BuildProgressCallback = std::function<void(const BuildProgress &)>;

// Builder configuration
struct BuildOptions {
    bool analyze_type_usages = true;
    bool analyze_using_directives = true;
    bool include_private_types = false;
    bool include_generated_files = false;
    std::vector<std::string> exclude_patterns = {"**/bin/**", "**/obj/**", "**/.vs/**"};
    int max_type_usage_depth = 3;

    // Threading config
    unsigned int worker_threads = 0; // 0 = auto-detect
    bool verbose = false;

    // Structure only: no usages, no usings, public types only
    static BuildOptions fast();
    // Everything, with a deeper usage search
    static BuildOptions full();
};

// Glob match with '*' inside a segment and '**' across segments.
// Back slashes are treated as '/', comparison ignores case.
bool glob_match(const std::string &pattern, const std::string &path);

// *.g.cs, *.generated.cs and *.Designer.*
bool is_generated_file(const std::string &path);

class GraphBuilder {
public:

    GraphBuilder(WorkspaceLoader &loader, FactExtractor &extractor,
                 BuildOptions options = BuildOptions{});

    // Build one graph from all root inputs (solutions or project files).
    // Throws BuildError if a root input cannot be opened.
    std::unique_ptr<SolutionGraph> build(const std::vector<std::string> &root_paths,
                                         BuildProgressCallback progress = nullptr,
                                         const std::atomic<bool> *cancel = nullptr);

    // True if the last build stopped early on cancellation
    bool cancelled() const { return cancelled_.load(); }

    // Get statistics
    struct Stats {
        std::atomic<size_t> projects_processed{0};
        std::atomic<size_t> files_processed{0};
        std::atomic<size_t> files_failed{0};
        std::atomic<size_t> types_found{0};
        std::atomic<size_t> usage_edges{0};
    };
    const Stats &stats() const { return stats_; }

    bool should_exclude(const std::string &path) const;

private:

    // Per-project work item
    struct ProjectWork {
        const SolutionNode *solution;
        const ProjectDescriptor *project;
    };

    // Per-type facts kept for the usage and edge phases
    struct PendingType {
        std::string type_id;
        std::string name;
        std::string namespace_name;
        std::string file_id;
        std::optional<std::string> base_type;
        std::vector<std::string> interfaces;
        std::vector<TypeReference> references;
        std::vector<std::string> file_usings;
    };

    WorkspaceLoader &loader_;
    FactExtractor &extractor_;
    BuildOptions options_;
    Stats stats_;
    std::atomic<bool> cancelled_{false};

    // Thread synchronization
    std::mutex output_mutex_;
    std::mutex pending_mutex_;

    std::vector<PendingType> pending_types_;
    std::unordered_set<std::string> known_projects_;

    void log(const std::string &message);
    void warn(const std::string &message);
    void report(const BuildProgressCallback &progress, BuildPhase phase,
                const std::string &item, size_t processed, size_t total);

    void ensure_namespace(SolutionGraph &graph, const std::string &namespace_name);

    void process_project(SolutionGraph &graph, const ProjectWork &work,
                         const std::atomic<bool> *cancel);
    void process_file(SolutionGraph &graph, const ProjectNode &project, const std::string &path);

    // Worker function for thread pool
    void worker_process_projects(SolutionGraph &graph, const std::vector<ProjectWork> &work,
                                 size_t start_idx, size_t end_idx,
                                 const BuildProgressCallback &progress,
                                 std::atomic<size_t> &processed, const std::atomic<bool> *cancel);

    // Resolve a type name written in a file to a known type id
    std::optional<std::string>
    resolve_type(const std::unordered_map<std::string, std::vector<const TypeNode *>> &by_name,
                 const std::string &name, const PendingType &from) const;

    void build_inheritance_edges(SolutionGraph &graph, const BuildProgressCallback &progress,
                                 const std::vector<TypeNode> &types);
    void build_usage_edges(SolutionGraph &graph, const BuildProgressCallback &progress,
                           const std::vector<TypeNode> &types, const std::atomic<bool> *cancel);
};

} // namespace relocator
