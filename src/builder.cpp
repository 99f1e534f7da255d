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

#include "relocator/builder.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace relocator {

const char *build_phase_to_string(BuildPhase phase) {
    switch (phase) {
    case BuildPhase::LoadingSolution:
        return "Loading solution";
    case BuildPhase::AnalyzingProjects:
        return "Analyzing projects";
    case BuildPhase::AnalyzingFiles:
        return "Analyzing files";
    case BuildPhase::AnalyzingTypes:
        return "Analyzing types";
    case BuildPhase::AnalyzingUsages:
        return "Analyzing usages";
    case BuildPhase::BuildingEdges:
        return "Building edges";
    case BuildPhase::Completed:
        return "Completed";
    }
    return "Unknown";
}

BuildOptions BuildOptions::fast() {
    BuildOptions options;
    options.analyze_type_usages = false;
    options.analyze_using_directives = false;
    options.include_private_types = false;
    options.include_generated_files = false;
    return options;
}

BuildOptions BuildOptions::full() {
    BuildOptions options;
    options.analyze_type_usages = true;
    options.analyze_using_directives = true;
    options.include_private_types = true;
    options.include_generated_files = true;
    options.max_type_usage_depth = 5;
    return options;
}

// ============================================================================
// Path filters
// ============================================================================

namespace {

std::string normalize_for_glob(const std::string &s) {
    std::string out = s;
    for (char &c : out) {
        if (c == '\\')
            c = '/';
        else
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool glob_match_impl(const char *p, const char *s) {
    while (*p) {
        if (p[0] == '*' && p[1] == '*') {
            p += 2;
            // "**/" may also match nothing at all
            if (*p == '/' && glob_match_impl(p + 1, s))
                return true;
            for (const char *t = s;; ++t) {
                if (glob_match_impl(p, t))
                    return true;
                if (!*t)
                    break;
            }
            return false;
        }
        if (*p == '*') {
            ++p;
            for (const char *t = s;; ++t) {
                if (glob_match_impl(p, t))
                    return true;
                if (!*t || *t == '/')
                    break;
            }
            return false;
        }
        if (!*s)
            return false;
        if (*p == '?') {
            if (*s == '/')
                return false;
        } else if (*p != *s) {
            return false;
        }
        ++p;
        ++s;
    }
    return *s == '\0';
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool glob_match(const std::string &pattern, const std::string &path) {
    std::string p = normalize_for_glob(pattern);
    std::string s = normalize_for_glob(path);
    return glob_match_impl(p.c_str(), s.c_str());
}

bool is_generated_file(const std::string &path) {
    std::string name = normalize_for_glob(path_file_name(path));
    return ends_with(name, ".g.cs") || ends_with(name, ".generated.cs") ||
           name.find(".designer.") != std::string::npos;
}

// ============================================================================
// GraphBuilder
// ============================================================================

GraphBuilder::GraphBuilder(WorkspaceLoader &loader, FactExtractor &extractor, BuildOptions options)
    : loader_(loader), extractor_(extractor), options_(std::move(options)) {
    // Auto-detect thread count if not specified
    if (options_.worker_threads == 0) {
        options_.worker_threads = std::thread::hardware_concurrency();
        if (options_.worker_threads == 0)
            options_.worker_threads = 4; // Fallback
    }
}

bool GraphBuilder::should_exclude(const std::string &path) const {
    if (!options_.include_generated_files && is_generated_file(path))
        return true;
    for (const auto &pattern : options_.exclude_patterns) {
        if (glob_match(pattern, path))
            return true;
    }
    return false;
}

void GraphBuilder::log(const std::string &message) {
    if (!options_.verbose)
        return;
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << message << std::endl;
}

void GraphBuilder::warn(const std::string &message) {
    if (!options_.verbose)
        return;
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << "Warning: " << message << std::endl;
}

void GraphBuilder::report(const BuildProgressCallback &progress, BuildPhase phase,
                          const std::string &item, size_t processed, size_t total) {
    if (!progress)
        return;
    BuildProgress p;
    p.phase = phase;
    p.current_item = item;
    p.processed = processed;
    p.total = total;
    p.percent = total == 0 ? 0 : static_cast<int>(processed * 100 / total);
    // Called from any worker without a lock; the sink serializes itself
    progress(p);
}

void GraphBuilder::ensure_namespace(SolutionGraph &graph, const std::string &namespace_name) {
    graph.add_namespace({make_namespace_id(namespace_name), namespace_name});
}

void GraphBuilder::process_file(SolutionGraph &graph, const ProjectNode &project,
                                const std::string &path) {
    FileNode file;
    file.id = make_file_id(path);
    file.path = path;
    std::string name = path_file_name(path);
    size_t dot = name.rfind('.');
    file.kind = file_kind_from_extension(
        dot == std::string::npos ? std::string() : normalize_for_glob(name.substr(dot)));

    FileFacts facts;
    bool have_facts = false;
    std::string extract_error;
    try {
        facts = extractor_.extract(path);
        have_facts = true;
    } catch (const std::exception &e) {
        extract_error = e.what();
    }

    if (have_facts) {
        file.kind = facts.kind;
        file.namespace_name = facts.namespace_name;
    }

    // A file has one owning project: the first to register it
    if (!graph.add_file(file)) {
        warn(path + " already belongs to another project, skipped for " + project.name);
        return;
    }
    graph.add_edge(Edge(EdgeKind::ProjectContainsFile, project.id, file.id));
    stats_.files_processed++;

    if (!have_facts) {
        // Still registered, just without facts
        warn("could not analyze " + path + ": " + extract_error);
        stats_.files_failed++;
        return;
    }

    std::vector<std::string> usings;
    if (options_.analyze_using_directives) {
        for (const auto &directive : facts.usings) {
            ensure_namespace(graph, directive.namespace_name);
            graph.add_edge(Edge(EdgeKind::FileUsesNamespace, file.id,
                                make_namespace_id(directive.namespace_name),
                                NamespaceUsage{directive.line}));
        }
    }
    for (const auto &directive : facts.usings) {
        usings.push_back(directive.namespace_name);
    }

    std::vector<PendingType> local_pending;
    for (const auto &decl : facts.types) {
        if (!options_.include_private_types && decl.accessibility == Accessibility::Private)
            continue;

        TypeNode type;
        type.id = make_type_id(decl.full_name);
        type.full_name = decl.full_name;
        type.namespace_name = decl.namespace_name;
        type.name = decl.name;
        type.kind = decl.kind;
        type.file_id = file.id;
        type.is_public = decl.accessibility == Accessibility::Public;
        type.is_partial = decl.is_partial;
        type.is_static = decl.is_static;
        type.is_abstract = decl.is_abstract;

        graph.add_type(type);
        graph.add_edge(Edge(EdgeKind::FileContainsType, file.id, type.id));
        stats_.types_found++;

        if (!type.namespace_name.empty()) {
            ensure_namespace(graph, type.namespace_name);
            graph.add_edge(
                Edge(EdgeKind::TypeInNamespace, type.id, make_namespace_id(type.namespace_name)));
        }

        PendingType pending;
        pending.type_id = type.id;
        pending.name = type.name;
        pending.namespace_name = type.namespace_name;
        pending.file_id = file.id;
        pending.base_type = decl.base_type;
        pending.interfaces = decl.interfaces;
        pending.references = decl.referenced_types;
        pending.file_usings = usings;
        local_pending.push_back(std::move(pending));
    }

    if (!local_pending.empty()) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_types_.insert(pending_types_.end(), std::make_move_iterator(local_pending.begin()),
                              std::make_move_iterator(local_pending.end()));
    }
}

void GraphBuilder::process_project(SolutionGraph &graph, const ProjectWork &work,
                                   const std::atomic<bool> *cancel) {
    const ProjectDescriptor &desc = *work.project;

    ProjectNode project;
    project.id = make_project_id(desc.path);
    project.path = desc.path;
    project.name = desc.name;
    project.root_namespace = desc.root_namespace;
    project.target_framework = desc.target_framework;
    project.kind = desc.kind;

    graph.add_project(project);
    graph.add_edge(Edge(EdgeKind::SolutionContainsProject, work.solution->id, project.id));

    for (const auto &ref : desc.project_references) {
        std::string ref_id = make_project_id(ref);
        if (!known_projects_.count(ref_id)) {
            warn("unresolved project reference from " + desc.name + ": " + ref);
            continue;
        }
        graph.add_edge(Edge(EdgeKind::ProjectReference, project.id, ref_id));
    }

    for (const auto &package : desc.packages) {
        std::string package_id = make_package_id(package.id);
        graph.add_package({package_id, package.id, package.version});
        graph.add_edge(Edge(EdgeKind::PackageReference, project.id, package_id));
    }

    for (const auto &path : desc.files) {
        if (cancel && cancel->load()) {
            cancelled_ = true;
            return;
        }
        if (should_exclude(path))
            continue;
        process_file(graph, project, path);
    }

    stats_.projects_processed++;
}

void GraphBuilder::worker_process_projects(SolutionGraph &graph,
                                           const std::vector<ProjectWork> &work, size_t start_idx,
                                           size_t end_idx, const BuildProgressCallback &progress,
                                           std::atomic<size_t> &processed,
                                           const std::atomic<bool> *cancel) {
    for (size_t i = start_idx; i < end_idx; ++i) {
        if (cancelled_ || (cancel && cancel->load())) {
            cancelled_ = true;
            return;
        }

        const auto &item = work[i];
        process_project(graph, item, cancel);
        if (cancelled_)
            return;

        size_t done = ++processed;
        log("Analyzed project: " + item.project->name);
        report(progress, BuildPhase::AnalyzingProjects, item.project->name, done, work.size());
    }
}

std::optional<std::string> GraphBuilder::resolve_type(
    const std::unordered_map<std::string, std::vector<const TypeNode *>> &by_name,
    const std::string &name, const PendingType &from) const {
    std::string simple = name;
    size_t dot = simple.rfind('.');
    if (dot != std::string::npos)
        simple = simple.substr(dot + 1);

    auto it = by_name.find(simple);
    if (it == by_name.end())
        return std::nullopt;

    // A written qualifier must match exactly
    if (dot != std::string::npos) {
        for (const TypeNode *candidate : it->second) {
            if (candidate->full_name == name)
                return candidate->id;
        }
    }

    // Visible namespaces, nearest first: own, enclosing (bounded), imported
    std::vector<std::string> visible;
    std::string ns = from.namespace_name;
    visible.push_back(ns);
    for (int level = 0; level < options_.max_type_usage_depth && !ns.empty(); ++level) {
        size_t pos = ns.rfind('.');
        ns = pos == std::string::npos ? std::string() : ns.substr(0, pos);
        visible.push_back(ns);
    }
    visible.insert(visible.end(), from.file_usings.begin(), from.file_usings.end());

    for (const auto &candidate_ns : visible) {
        for (const TypeNode *candidate : it->second) {
            if (candidate->namespace_name == candidate_ns)
                return candidate->id;
        }
    }
    return std::nullopt;
}

void GraphBuilder::build_usage_edges(SolutionGraph &graph, const BuildProgressCallback &progress,
                                     const std::vector<TypeNode> &types,
                                     const std::atomic<bool> *cancel) {
    std::unordered_map<std::string, std::vector<const TypeNode *>> by_name;
    for (const auto &type : types) {
        by_name[type.name].push_back(&type);
    }

    // Pairs already linked by inheritance or implementation
    std::set<std::pair<std::string, std::string>> linked;
    for (const auto &edge : graph.edges()) {
        if (edge.kind == EdgeKind::TypeInherits || edge.kind == EdgeKind::TypeImplements)
            linked.emplace(edge.source_id, edge.target_id);
    }

    size_t total = pending_types_.size();
    size_t processed = 0;
    report(progress, BuildPhase::AnalyzingUsages, "", 0, total);

    for (const auto &pending : pending_types_) {
        if (cancel && cancel->load()) {
            cancelled_ = true;
            return;
        }
        ++processed;

        for (const auto &ref : pending.references) {
            auto target = resolve_type(by_name, ref.name, pending);
            if (!target || *target == pending.type_id)
                continue;
            if (!linked.emplace(pending.type_id, *target).second)
                continue;

            TypeUsageInfo info;
            info.usage = ref.usage;
            info.member_name = ref.member_name;
            if (ref.line > 0)
                info.line = ref.line;
            graph.add_edge(Edge(EdgeKind::TypeUsage, pending.type_id, *target, std::move(info)));
            stats_.usage_edges++;
        }

        if (processed % 100 == 0)
            report(progress, BuildPhase::AnalyzingUsages, pending.name, processed, total);
    }
    report(progress, BuildPhase::AnalyzingUsages, "", total, total);
}

void GraphBuilder::build_inheritance_edges(SolutionGraph &graph,
                                           const BuildProgressCallback &progress,
                                           const std::vector<TypeNode> &types) {
    std::unordered_map<std::string, std::vector<const TypeNode *>> by_name;
    for (const auto &type : types) {
        by_name[type.name].push_back(&type);
    }

    report(progress, BuildPhase::BuildingEdges, "", 0, pending_types_.size());

    // Unresolvable names keep the extractor's best guess as a dangling target
    auto target_of = [&](const std::string &name, const PendingType &from) {
        if (graph.find_type_by_id(make_type_id(name)))
            return make_type_id(name);
        if (auto resolved = resolve_type(by_name, name, from))
            return *resolved;
        return make_type_id(name);
    };

    for (const auto &pending : pending_types_) {
        if (pending.base_type) {
            graph.add_edge(
                Edge(EdgeKind::TypeInherits, pending.type_id, target_of(*pending.base_type, pending)));
        }
        for (const auto &iface : pending.interfaces) {
            graph.add_edge(
                Edge(EdgeKind::TypeImplements, pending.type_id, target_of(iface, pending)));
        }
    }
}

std::unique_ptr<SolutionGraph> GraphBuilder::build(const std::vector<std::string> &root_paths,
                                                   BuildProgressCallback progress,
                                                   const std::atomic<bool> *cancel) {
    auto graph = std::make_unique<SolutionGraph>();
    cancelled_ = false;
    pending_types_.clear();
    known_projects_.clear();
    stats_.projects_processed = 0;
    stats_.files_processed = 0;
    stats_.files_failed = 0;
    stats_.types_found = 0;
    stats_.usage_edges = 0;

    // Phase 1: Load solutions and projects
    std::vector<LoadedWorkspace> workspaces;
    size_t total_projects = 0;
    for (const auto &path : root_paths) {
        if (cancel && cancel->load()) {
            cancelled_ = true;
            return graph;
        }
        report(progress, BuildPhase::LoadingSolution, path, 0, 0);

        LoadedWorkspace workspace = loader_.load(path);
        graph->add_solution(workspace.solution);
        total_projects += workspace.projects.size();
        for (const auto &project : workspace.projects) {
            known_projects_.insert(make_project_id(project.path));
        }
        workspaces.push_back(std::move(workspace));
    }

    log("Found " + std::to_string(total_projects) + " projects in " +
        std::to_string(root_paths.size()) + " root input(s).");
    log("Using " + std::to_string(options_.worker_threads) + " threads.");

    // Phase 2: Parallel project processing
    std::vector<ProjectWork> work;
    work.reserve(total_projects);
    for (const auto &workspace : workspaces) {
        for (const auto &project : workspace.projects) {
            work.push_back({&workspace.solution, &project});
        }
    }

    report(progress, BuildPhase::AnalyzingProjects, "", 0, work.size());

    std::atomic<size_t> processed{0};
    std::vector<std::thread> threads;
    size_t per_thread = (work.size() + options_.worker_threads - 1) / options_.worker_threads;

    for (unsigned int t = 0; t < options_.worker_threads && per_thread > 0; ++t) {
        size_t start_idx = t * per_thread;
        size_t end_idx = std::min(start_idx + per_thread, work.size());

        if (start_idx >= work.size())
            break;

        threads.emplace_back(&GraphBuilder::worker_process_projects, this, std::ref(*graph),
                             std::cref(work), start_idx, end_idx, std::cref(progress),
                             std::ref(processed), cancel);
    }

    // Wait for all threads
    for (auto &t : threads) {
        t.join();
    }

    if (cancelled_) {
        log("Build cancelled.");
        return graph;
    }

    // Worker interleaving must not change the edge order
    std::sort(pending_types_.begin(), pending_types_.end(),
              [](const PendingType &a, const PendingType &b) {
                  return a.type_id != b.type_id ? a.type_id < b.type_id : a.file_id < b.file_id;
              });

    std::vector<TypeNode> types = graph->types();

    // Phase 3: Inheritance and implementation edges
    build_inheritance_edges(*graph, progress, types);

    // Phase 4: Type usages
    if (options_.analyze_type_usages) {
        log("Building type usage edges...");
        build_usage_edges(*graph, progress, types, cancel);
        if (cancelled_) {
            log("Build cancelled.");
            return graph;
        }
    }

    report(progress, BuildPhase::Completed, "Done", work.size(), work.size());

    log("\nGraph build complete.");
    log("  Projects processed: " + std::to_string(stats_.projects_processed.load()));
    log("  Files processed: " + std::to_string(stats_.files_processed.load()));
    log("  Files without facts: " + std::to_string(stats_.files_failed.load()));
    log(graph->statistics().to_string());

    return graph;
}

} // namespace relocator
