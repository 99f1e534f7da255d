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

#include "builder.hpp"
#include "graph.hpp"
#include "impact.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relocator {

constexpr const char *INDEX_FILE = ".relocator.json";

// Raw --analyze arguments as given on the command line
struct AnalyzeArgs {
    std::string operation;
    std::string source;
    std::optional<std::string> target;
    std::optional<std::string> new_namespace;
    std::optional<std::string> new_file;
    bool folder = false;
    bool force = false;
    bool markdown = false;
};

// Command implementations
int cmd_index(const std::vector<std::string> &roots, const BuildOptions &options);
int cmd_stats();
int cmd_deps(const std::string &project);
int cmd_cycles();
int cmd_analyze(const AnalyzeArgs &args);

// Helper functions
std::unique_ptr<SolutionGraph> load_graph();

// Throws std::invalid_argument on an unknown operation or a missing target
MigrationOperation make_operation(const AnalyzeArgs &args);

// Project by name, path or id
std::optional<ProjectNode> find_project(const SolutionGraph &graph, const std::string &key);

} // namespace relocator
