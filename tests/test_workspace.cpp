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

#include <gtest/gtest.h>

#include <algorithm>

#include "relocator/workspace.hpp"
#include "test_helpers.hpp"

using namespace relocator;
using relocator::fixtures::TempDir;

namespace {

const char *CORE_PROJECT = R"(<Project Sdk="Microsoft.NET.Sdk">
  <PropertyGroup>
    <TargetFrameworks>net8.0;net6.0</TargetFrameworks>
    <RootNamespace>Acme.Core</RootNamespace>
  </PropertyGroup>
  <ItemGroup>
    <PackageReference Include="Newtonsoft.Json" Version="13.0.3" />
    <PackageReference Include="Serilog">
      <Version>3.1.1</Version>
    </PackageReference>
  </ItemGroup>
</Project>
)";

const char *WEB_PROJECT = R"(<Project Sdk="Microsoft.NET.Sdk.Web">
  <PropertyGroup>
    <TargetFramework>net8.0</TargetFramework>
  </PropertyGroup>
  <ItemGroup>
    <ProjectReference Include="..\Core\Core.csproj" />
  </ItemGroup>
</Project>
)";

const char *SOLUTION = R"(
Microsoft Visual Studio Solution File, Format Version 12.00
# Visual Studio Version 17
Project("{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}") = "Core", "Core\Core.csproj", "{11111111-1111-1111-1111-111111111111}"
EndProject
Project("{9A19103F-16F7-4668-BE54-9A1E7A4F7556}") = "Web", "Web\Web.csproj", "{22222222-2222-2222-2222-222222222222}"
EndProject
Project("{2150E333-8FDC-42A3-9474-1A3956D46DE8}") = "Solution Items", "Solution Items", "{33333333-3333-3333-3333-333333333333}"
EndProject
Project("{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}") = "Gone", "Gone\Gone.csproj", "{44444444-4444-4444-4444-444444444444}"
EndProject
Global
EndGlobal
)";

// Solution with Core, Web and a listed project whose file is missing
struct SampleWorkspace {
    TempDir dir;
    std::string solution;
    std::string core;
    std::string web;

    explicit SampleWorkspace(const std::string &name) : dir("relocator_workspace_" + name) {
        core = dir.write("Core/Core.csproj", CORE_PROJECT);
        dir.write("Core/Order.cs", "namespace Acme.Core;\npublic class Order { }\n");
        dir.write("Core/Models/Customer.cs", "namespace Acme.Core.Models;\n");
        dir.write("Core/README.md", "# Core\n");
        web = dir.write("Web/Web.csproj", WEB_PROJECT);
        dir.write("Web/Program.cs", "var app = 1;\n");
        dir.write("Web/appsettings.json", "{}");
        solution = dir.write("Acme.sln", SOLUTION);
    }
};

} // namespace

// ============================================================================
// Project files
// ============================================================================

TEST(MsBuildWorkspaceLoader, LoadsProjectProperties) {
    SampleWorkspace ws("properties");
    MsBuildWorkspaceLoader loader;
    ProjectDescriptor core = loader.load_project(ws.core);

    EXPECT_EQ(core.path, ws.core);
    EXPECT_EQ(core.name, "Core");
    EXPECT_EQ(core.root_namespace, std::optional<std::string>("Acme.Core"));
    // First of a multi-target list
    EXPECT_EQ(core.target_framework, std::optional<std::string>("net8.0"));
    EXPECT_EQ(core.kind, ProjectKind::Library);

    ASSERT_EQ(core.packages.size(), 2U);
    EXPECT_EQ(core.packages[0].id, "Newtonsoft.Json");
    EXPECT_EQ(core.packages[0].version, std::optional<std::string>("13.0.3"));
    EXPECT_EQ(core.packages[1].id, "Serilog");
    EXPECT_EQ(core.packages[1].version, std::optional<std::string>("3.1.1"));
}

TEST(MsBuildWorkspaceLoader, EnumeratesContentFiles) {
    SampleWorkspace ws("files");
    MsBuildWorkspaceLoader loader;
    ProjectDescriptor core = loader.load_project(ws.core);

    ASSERT_EQ(core.files.size(), 2U);
    EXPECT_TRUE(std::is_sorted(core.files.begin(), core.files.end()));
    EXPECT_NE(std::find(core.files.begin(), core.files.end(),
                        (ws.dir.path / "Core/Order.cs").string()),
              core.files.end());
    EXPECT_NE(std::find(core.files.begin(), core.files.end(),
                        (ws.dir.path / "Core/Models/Customer.cs").string()),
              core.files.end());
}

TEST(MsBuildWorkspaceLoader, NestedProjectsOwnTheirFiles) {
    TempDir dir("relocator_workspace_nested");
    std::string app = dir.write("App/App.csproj", "<Project Sdk=\"Microsoft.NET.Sdk\" />");
    std::string program = dir.write("App/Program.cs", "class Program { }\n");
    std::string model = dir.write("App/Models/Order.cs", "class Order { }\n");
    std::string sub =
        dir.write("App/Plugins/Plugins.csproj", "<Project Sdk=\"Microsoft.NET.Sdk\" />");
    std::string plugin = dir.write("App/Plugins/Plugin.cs", "class Plugin { }\n");
    std::string deep = dir.write("App/Plugins/Impl/Deep.cs", "class Deep { }\n");

    MsBuildWorkspaceLoader loader;
    ProjectDescriptor outer = loader.load_project(app);
    std::vector<std::string> expected = {model, program};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(outer.files, expected);

    ProjectDescriptor inner = loader.load_project(sub);
    std::vector<std::string> inner_expected = {deep, plugin};
    std::sort(inner_expected.begin(), inner_expected.end());
    EXPECT_EQ(inner.files, inner_expected);
}

TEST(MsBuildWorkspaceLoader, ResolvesProjectReferences) {
    SampleWorkspace ws("references");
    MsBuildWorkspaceLoader loader;
    ProjectDescriptor web = loader.load_project(ws.web);

    EXPECT_EQ(web.kind, ProjectKind::WebApi);
    EXPECT_EQ(web.root_namespace, std::optional<std::string>("Web"));
    ASSERT_EQ(web.project_references.size(), 1U);
    EXPECT_EQ(web.project_references[0], ws.core);
    EXPECT_EQ(web.files.size(), 2U);
}

TEST(MsBuildWorkspaceLoader, RejectsBadProjects) {
    TempDir dir("relocator_workspace_bad");
    std::string broken = dir.write("Broken/Broken.csproj", "<Project><PropertyGroup>");
    std::string other = dir.write("Other/Other.csproj", "<Package />");

    MsBuildWorkspaceLoader loader;
    EXPECT_THROW(loader.load_project(broken), BuildError);
    EXPECT_THROW(loader.load_project(other), BuildError);
    EXPECT_THROW(loader.load_project((dir.path / "Missing.csproj").string()), BuildError);
}

// ============================================================================
// Solutions
// ============================================================================

TEST(MsBuildWorkspaceLoader, ParsesSolutionEntries) {
    SampleWorkspace ws("solution_entries");
    MsBuildWorkspaceLoader loader;
    auto entries = loader.parse_solution(ws.solution);

    // Solution folders are not projects
    ASSERT_EQ(entries.size(), 3U);
    EXPECT_EQ(entries[0].first, "Core");
    EXPECT_EQ(entries[0].second, ws.core);
    EXPECT_EQ(entries[1].first, "Web");
    EXPECT_EQ(entries[1].second, ws.web);
    EXPECT_EQ(entries[2].first, "Gone");
}

TEST(MsBuildWorkspaceLoader, LoadsSolutionSkippingMissingProjects) {
    SampleWorkspace ws("solution");
    MsBuildWorkspaceLoader loader;
    LoadedWorkspace workspace = loader.load(ws.solution);

    EXPECT_FALSE(workspace.is_virtual_solution);
    EXPECT_EQ(workspace.solution.id, make_solution_id(ws.solution));
    EXPECT_EQ(workspace.solution.name, "Acme");
    ASSERT_EQ(workspace.projects.size(), 2U);
    EXPECT_EQ(workspace.projects[0].name, "Core");
    EXPECT_EQ(workspace.projects[1].name, "Web");
}

TEST(MsBuildWorkspaceLoader, SingleProjectBecomesVirtualSolution) {
    SampleWorkspace ws("virtual");
    MsBuildWorkspaceLoader loader;
    LoadedWorkspace workspace = loader.load(ws.web);

    EXPECT_TRUE(workspace.is_virtual_solution);
    EXPECT_EQ(workspace.solution.id, make_project_id(ws.web));
    EXPECT_EQ(workspace.solution.name, "Web");
    // Referenced projects are loaded transitively
    ASSERT_EQ(workspace.projects.size(), 2U);
    EXPECT_EQ(workspace.projects[0].path, ws.web);
    EXPECT_EQ(workspace.projects[1].path, ws.core);
}

TEST(MsBuildWorkspaceLoader, RejectsMissingOrUnsupportedRoots) {
    TempDir dir("relocator_workspace_roots");
    std::string notes = dir.write("notes.txt", "hello");

    MsBuildWorkspaceLoader loader;
    EXPECT_THROW(loader.load((dir.path / "Missing.sln").string()), BuildError);
    EXPECT_THROW(loader.load(notes), BuildError);
    EXPECT_THROW(loader.load(dir.path.string()), BuildError);
}

// ============================================================================
// Classification
// ============================================================================

TEST(ClassifyProject, TestProjects) {
    ProjectTraits flagged;
    flagged.name = "Acme";
    flagged.is_test_project = true;
    EXPECT_EQ(classify_project(flagged), ProjectKind::Test);

    ProjectTraits by_package;
    by_package.name = "Acme.Specs";
    by_package.package_ids = {"xunit"};
    EXPECT_EQ(classify_project(by_package), ProjectKind::Test);

    ProjectTraits by_name;
    by_name.name = "Acme.Tests";
    by_name.output_type = "Exe";
    EXPECT_EQ(classify_project(by_name), ProjectKind::Test);
}

TEST(ClassifyProject, GuiWebExecutableLibrary) {
    ProjectTraits wpf;
    wpf.name = "Desk";
    wpf.uses_wpf = true;
    EXPECT_EQ(classify_project(wpf), ProjectKind::Gui);

    ProjectTraits winexe;
    winexe.name = "Tool";
    winexe.output_type = "WinExe";
    EXPECT_EQ(classify_project(winexe), ProjectKind::Gui);

    ProjectTraits web;
    web.name = "Api";
    web.sdk = "Microsoft.NET.Sdk.Web";
    EXPECT_EQ(classify_project(web), ProjectKind::WebApi);

    ProjectTraits framework;
    framework.name = "Api";
    framework.framework_references = {"Microsoft.AspNetCore.App"};
    EXPECT_EQ(classify_project(framework), ProjectKind::WebApi);

    ProjectTraits exe;
    exe.name = "Cli";
    exe.output_type = "Exe";
    EXPECT_EQ(classify_project(exe), ProjectKind::Executable);

    ProjectTraits lib;
    lib.name = "Lib";
    EXPECT_EQ(classify_project(lib), ProjectKind::Library);
}
