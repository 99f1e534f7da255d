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

#include "relocator/workspace.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>
#include <tinyxml2.h>
#include <unordered_set>

namespace relocator {

namespace fs = std::filesystem;

namespace {

constexpr const char *SOLUTION_FOLDER_GUID = "2150E333-8FDC-42A3-9474-1A3956D46DE8";

const std::unordered_set<std::string> TEST_PACKAGES = {
    "xunit",          "xunit.runner.visualstudio", "nunit",
    "nunit3testadapter", "mstest.testframework",   "mstest.testadapter",
    "microsoft.net.test.sdk"};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool is_true(const std::optional<std::string> &value) {
    return value && to_lower(trim(*value)) == "true";
}

// Manifest paths use back slashes regardless of platform
fs::path resolve_relative(const fs::path &base_dir, std::string relative) {
    std::replace(relative.begin(), relative.end(), '\\', '/');
    return fs::absolute(base_dir / relative).lexically_normal();
}

std::string get_string_attr(const tinyxml2::XMLElement *elem, const char *name) {
    const char *val = elem->Attribute(name);
    return val ? std::string(val) : std::string();
}

// First non-empty <name> inside any <PropertyGroup>
std::optional<std::string> get_property(const tinyxml2::XMLElement *root, const char *name) {
    for (const auto *group = root->FirstChildElement("PropertyGroup"); group;
         group = group->NextSiblingElement("PropertyGroup")) {
        const auto *elem = group->FirstChildElement(name);
        if (elem && elem->GetText()) {
            std::string text = trim(elem->GetText());
            if (!text.empty())
                return text;
        }
    }
    return std::nullopt;
}

// Visit every <tag> inside any <ItemGroup>
template <typename Visitor>
void for_each_item(const tinyxml2::XMLElement *root, const char *tag, Visitor visit) {
    for (const auto *group = root->FirstChildElement("ItemGroup"); group;
         group = group->NextSiblingElement("ItemGroup")) {
        for (const auto *item = group->FirstChildElement(tag); item;
             item = item->NextSiblingElement(tag)) {
            visit(item);
        }
    }
}

bool is_project_content(const std::string &ext) {
    return ext == ".cs" || ext == ".xaml" || ext == ".razor" || ext == ".json";
}

bool contains_project_file(const fs::path &dir) {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && to_lower(it->path().extension().string()) == ".csproj")
            return true;
    }
    return false;
}

std::vector<std::string> enumerate_files(const fs::path &project_dir) {
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(project_dir,
                                        fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return files;

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec)
            break;
        if (it->is_directory(ec)) {
            // Nested projects own their own files
            if (contains_project_file(it->path()))
                it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec))
            continue;
        if (is_project_content(to_lower(it->path().extension().string())))
            files.push_back(it->path().lexically_normal().string());
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

ProjectKind classify_project(const ProjectTraits &traits) {
    if (traits.is_test_project)
        return ProjectKind::Test;
    for (const auto &package : traits.package_ids) {
        if (TEST_PACKAGES.count(to_lower(package)))
            return ProjectKind::Test;
    }
    if (ends_with(traits.name, ".Tests") || ends_with(traits.name, ".Test"))
        return ProjectKind::Test;

    std::string output = traits.output_type ? to_lower(*traits.output_type) : "";
    if (traits.uses_wpf || traits.uses_winforms || traits.uses_maui || output == "winexe")
        return ProjectKind::Gui;

    if (to_lower(traits.sdk) == "microsoft.net.sdk.web")
        return ProjectKind::WebApi;
    for (const auto &framework : traits.framework_references) {
        if (to_lower(framework).find("aspnetcore") != std::string::npos)
            return ProjectKind::WebApi;
    }

    if (output == "exe")
        return ProjectKind::Executable;
    return ProjectKind::Library;
}

void MsBuildWorkspaceLoader::warn(const std::string &message) const {
    if (verbose_)
        std::cerr << "Warning: " << message << std::endl;
}

ProjectDescriptor MsBuildWorkspaceLoader::load_project(const std::string &path) const {
    fs::path project_path = fs::absolute(fs::path(path)).lexically_normal();

    std::ifstream file(project_path);
    if (!file.is_open()) {
        throw BuildError("Cannot open project file: " + project_path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    tinyxml2::XMLDocument doc;
    const tinyxml2::XMLError err = doc.Parse(content.c_str(), content.size());
    if (err != tinyxml2::XML_SUCCESS) {
        throw BuildError("Failed to parse project file " + project_path.string() + ": " +
                         std::string(doc.ErrorStr()));
    }

    const auto *root = doc.RootElement();
    if (!root || std::string(root->Name()) != "Project") {
        throw BuildError("Not an MSBuild project: " + project_path.string());
    }

    fs::path project_dir = project_path.parent_path();

    ProjectDescriptor desc;
    desc.path = project_path.string();
    desc.name = project_path.stem().string();

    desc.target_framework = get_property(root, "TargetFramework");
    if (!desc.target_framework) {
        // First of a ';' separated multi-target list
        if (auto frameworks = get_property(root, "TargetFrameworks")) {
            std::string first = trim(frameworks->substr(0, frameworks->find(';')));
            if (!first.empty())
                desc.target_framework = first;
        }
    }
    desc.root_namespace = get_property(root, "RootNamespace");
    if (!desc.root_namespace)
        desc.root_namespace = desc.name;

    ProjectTraits traits;
    traits.name = desc.name;
    traits.sdk = get_string_attr(root, "Sdk");
    traits.output_type = get_property(root, "OutputType");
    traits.target_framework = desc.target_framework;
    traits.is_test_project = is_true(get_property(root, "IsTestProject"));
    traits.uses_wpf = is_true(get_property(root, "UseWPF"));
    traits.uses_winforms = is_true(get_property(root, "UseWindowsForms"));
    traits.uses_maui = is_true(get_property(root, "UseMaui"));

    for_each_item(root, "ProjectReference", [&](const tinyxml2::XMLElement *item) {
        std::string include = get_string_attr(item, "Include");
        if (!include.empty())
            desc.project_references.push_back(resolve_relative(project_dir, include).string());
    });

    for_each_item(root, "PackageReference", [&](const tinyxml2::XMLElement *item) {
        std::string id = get_string_attr(item, "Include");
        if (id.empty())
            return;
        PackageRef ref;
        ref.id = id;
        std::string version = get_string_attr(item, "Version");
        if (version.empty()) {
            const auto *child = item->FirstChildElement("Version");
            if (child && child->GetText())
                version = trim(child->GetText());
        }
        if (!version.empty())
            ref.version = version;
        traits.package_ids.push_back(id);
        desc.packages.push_back(std::move(ref));
    });

    for_each_item(root, "FrameworkReference", [&](const tinyxml2::XMLElement *item) {
        traits.framework_references.push_back(get_string_attr(item, "Include"));
    });

    desc.kind = classify_project(traits);
    desc.files = enumerate_files(project_dir);
    return desc;
}

std::vector<std::pair<std::string, std::string>>
MsBuildWorkspaceLoader::parse_solution(const std::string &path) const {
    fs::path solution_path = fs::absolute(fs::path(path)).lexically_normal();

    std::ifstream file(solution_path);
    if (!file.is_open()) {
        throw BuildError("Cannot open solution file: " + solution_path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    static const std::regex project_pattern(
        R"(Project\("\{([A-F0-9-]+)\}"\)\s*=\s*"([^"]+)"\s*,\s*"([^"]+)"\s*,\s*"\{([A-F0-9-]+)\}")",
        std::regex::icase);

    std::vector<std::pair<std::string, std::string>> projects;
    fs::path solution_dir = solution_path.parent_path();

    for (auto it = std::sregex_iterator(content.begin(), content.end(), project_pattern);
         it != std::sregex_iterator(); ++it) {
        const std::smatch &match = *it;
        std::string type_guid = match[1].str();
        std::transform(type_guid.begin(), type_guid.end(), type_guid.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (type_guid == SOLUTION_FOLDER_GUID)
            continue;

        std::string relative = match[3].str();
        if (to_lower(fs::path(relative).extension().string()) != ".csproj")
            continue;
        projects.emplace_back(match[2].str(), resolve_relative(solution_dir, relative).string());
    }
    return projects;
}

LoadedWorkspace MsBuildWorkspaceLoader::load(const std::string &path) {
    fs::path root_path = fs::absolute(fs::path(path)).lexically_normal();
    if (!fs::is_regular_file(root_path)) {
        throw BuildError("Path does not exist or is not a file: " + path);
    }

    LoadedWorkspace workspace;
    std::string ext = to_lower(root_path.extension().string());

    if (ext == ".csproj") {
        // Single project: virtual solution plus every project it reaches
        workspace.is_virtual_solution = true;
        workspace.solution = {make_project_id(root_path.string()), root_path.string(),
                              root_path.stem().string()};

        workspace.projects.push_back(load_project(root_path.string()));

        std::unordered_set<std::string> seen = {root_path.string()};
        for (size_t i = 0; i < workspace.projects.size(); ++i) {
            std::vector<std::string> refs = workspace.projects[i].project_references;
            for (const auto &ref : refs) {
                if (!seen.insert(ref).second)
                    continue;
                try {
                    workspace.projects.push_back(load_project(ref));
                } catch (const BuildError &e) {
                    warn(std::string("skipping referenced project: ") + e.what());
                }
            }
        }
        return workspace;
    }

    if (ext != ".sln") {
        throw BuildError("Unsupported root input (expected .sln or .csproj): " + path);
    }

    workspace.solution = {make_solution_id(root_path.string()), root_path.string(),
                          root_path.stem().string()};

    for (const auto &[name, project_path] : parse_solution(root_path.string())) {
        try {
            ProjectDescriptor desc = load_project(project_path);
            desc.name = name;
            workspace.projects.push_back(std::move(desc));
        } catch (const BuildError &e) {
            warn(std::string("skipping project ") + name + ": " + e.what());
        }
    }
    return workspace;
}

} // namespace relocator
