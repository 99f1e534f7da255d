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

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace relocator {

// A root input (solution or project file) could not be opened
class BuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PackageRef {
    std::string id;
    std::optional<std::string> version;
};

// One project as described by its manifest
struct ProjectDescriptor {
    std::string path;
    std::string name;
    std::optional<std::string> root_namespace;
    std::optional<std::string> target_framework;
    ProjectKind kind = ProjectKind::Library;
    std::vector<std::string> project_references; // manifest paths
    std::vector<PackageRef> packages;
    std::vector<std::string> files;
};

// Result of loading one root input
struct LoadedWorkspace {
    SolutionNode solution;
    // Set when the root input was a single project file
    bool is_virtual_solution = false;
    std::vector<ProjectDescriptor> projects;
};

// Turns a solution or project path into project descriptors
class WorkspaceLoader {
public:
    virtual ~WorkspaceLoader() = default;

    // Throws BuildError when the path cannot be opened
    virtual LoadedWorkspace load(const std::string &path) = 0;
};

// Loader for .sln and .csproj files on disk
class MsBuildWorkspaceLoader : public WorkspaceLoader {
public:
    explicit MsBuildWorkspaceLoader(bool verbose = false) : verbose_(verbose) {}

    LoadedWorkspace load(const std::string &path) override;

    // Parse one .csproj; throws BuildError if it cannot be read or is not XML
    ProjectDescriptor load_project(const std::string &path) const;

    // Project entries of a solution file: (name, absolute manifest path)
    std::vector<std::pair<std::string, std::string>>
    parse_solution(const std::string &path) const;

private:
    bool verbose_;

    void warn(const std::string &message) const;
};

// Project classification from manifest properties
struct ProjectTraits {
    std::string name;
    std::string sdk;
    std::optional<std::string> output_type;
    std::optional<std::string> target_framework;
    bool is_test_project = false;
    bool uses_wpf = false;
    bool uses_winforms = false;
    bool uses_maui = false;
    std::vector<std::string> framework_references;
    std::vector<std::string> package_ids;
};

ProjectKind classify_project(const ProjectTraits &traits);

} // namespace relocator
