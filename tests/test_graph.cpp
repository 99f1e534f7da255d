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

#include <thread>
#include <vector>

#include "relocator/version.hpp"
#include "test_helpers.hpp"

using namespace relocator;
using namespace relocator::fixtures;

// ============================================================================
// Insertion
// ============================================================================

TEST(SolutionGraph, InsertIsIdempotentPerId) {
    SolutionGraph graph;
    ProjectNode project;
    project.id = make_project_id("/src/App/App.csproj");
    project.path = "/src/App/App.csproj";
    project.name = "App";

    EXPECT_TRUE(graph.add_project(project));

    ProjectNode renamed = project;
    renamed.name = "Other";
    EXPECT_FALSE(graph.add_project(renamed));

    ASSERT_EQ(graph.projects().size(), 1U);
    EXPECT_EQ(graph.projects()[0].name, "App");
}

TEST(SolutionGraph, ConcurrentInsertKeepsOneNodePerId) {
    SolutionGraph graph;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&graph]() {
            for (int i = 0; i < 200; ++i) {
                std::string path = "/src/F" + std::to_string(i) + ".cs";
                graph.add_file({make_file_id(path), path, std::string("App"), FileKind::Source});
                graph.add_edge(Edge(EdgeKind::FileUsesNamespace, make_file_id(path), "ns:App"));
            }
        });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(graph.files().size(), 200U);
    EXPECT_EQ(graph.edges().size(), 1600U);
    EXPECT_EQ(graph.outgoing_edges(make_file_id("/src/F7.cs")).size(), 8U);
}

TEST(SolutionGraph, GetNodeResolvesAnyKind) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto file = add_file(graph, project, "/src/App/A.cs", "App");
    auto type = add_type(graph, file, "App", "A");

    auto node = graph.get_node(type.id);
    ASSERT_TRUE(node.has_value());
    EXPECT_TRUE(std::holds_alternative<TypeNode>(*node));
    EXPECT_EQ(node_display_name(*node), "A");

    EXPECT_FALSE(graph.get_node("type:Missing").has_value());
    EXPECT_EQ(node_display_name(*graph.get_node(file.id)), "A.cs");
}

// ============================================================================
// Queries
// ============================================================================

TEST(SolutionGraph, FilesReferencingTypeFollowsTypeEdges) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto f1 = add_file(graph, project, "/src/App/Service.cs", "App.Services");
    auto f2 = add_file(graph, project, "/src/App/Controller.cs", "App.Web");
    auto f3 = add_file(graph, project, "/src/App/Other.cs", "App.Web");
    auto service = add_type(graph, f1, "App.Services", "Service");
    auto controller = add_type(graph, f2, "App.Web", "Controller");
    auto helper = add_type(graph, f2, "App.Web", "Helper");
    add_type(graph, f3, "App.Web", "Other");

    add_usage(graph, controller, service);
    add_usage(graph, helper, service);

    auto files = graph.files_referencing_type(service.id);
    ASSERT_EQ(files.size(), 1U);
    EXPECT_EQ(files[0].path, "/src/App/Controller.cs");

    auto referencing = graph.types_referencing(service.id);
    EXPECT_EQ(referencing.size(), 2U);
    auto referenced = graph.types_referenced_by(controller.id);
    ASSERT_EQ(referenced.size(), 1U);
    EXPECT_EQ(referenced[0].full_name, "App.Services.Service");
}

TEST(SolutionGraph, TypesInNamespaceAndContainment) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto f1 = add_file(graph, project, "/src/App/A.cs", "App.Core");
    auto f2 = add_file(graph, project, "/src/App/B.cs", "App.Other");
    add_type(graph, f1, "App.Core", "B");
    add_type(graph, f1, "App.Core", "A");
    add_type(graph, f2, "App.Other", "C");

    auto types = graph.types_in_namespace("App.Core");
    ASSERT_EQ(types.size(), 2U);
    EXPECT_EQ(types[0].name, "A");
    EXPECT_EQ(types[1].name, "B");

    auto file = graph.file_containing_type(make_type_id("App.Other.C"));
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->path, "/src/App/B.cs");

    auto owner = graph.project_containing_file(f2.id);
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->name, "App");

    EXPECT_TRUE(graph.has_namespace("App.Core"));
    EXPECT_FALSE(graph.has_namespace("App.Missing"));
}

TEST(SolutionGraph, UsingLineAndFilesUsingNamespace) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto f1 = add_file(graph, project, "/src/App/A.cs", "App");
    auto f2 = add_file(graph, project, "/src/App/B.cs", "App");
    add_using(graph, f1, "System.Linq", 3);
    add_using(graph, f2, "System", 1);

    EXPECT_TRUE(graph.uses_namespace(f1.id, "System.Linq"));
    EXPECT_FALSE(graph.uses_namespace(f2.id, "System.Linq"));
    EXPECT_EQ(graph.using_line(f1.id, "System.Linq"), std::optional<uint32_t>(3));

    auto users = graph.files_using_namespace("System.Linq");
    ASSERT_EQ(users.size(), 1U);
    EXPECT_EQ(users[0].id, f1.id);
    EXPECT_TRUE(graph.files_using_namespace("Nope").empty());
}

TEST(SolutionGraph, FindFileByPathIgnoresCaseAndSeparators) {
    SolutionGraph graph;
    auto project = add_project(graph, "C:/src/App/App.csproj", "App");
    add_file(graph, project, "C:/src/App/Models/User.cs", "App.Models");

    auto found = graph.find_file_by_path("c:\\SRC\\app\\models\\user.cs");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->path, "C:/src/App/Models/User.cs");
    EXPECT_FALSE(graph.find_file_by_path("C:/src/App/Models/Missing.cs").has_value());
}

TEST(SolutionGraph, FilesUnderRequiresSeparatorBoundary) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    add_file(graph, project, "/src/App/Models/User.cs", "App.Models");
    add_file(graph, project, "/src/App/Models/Deep/Role.cs", "App.Models.Deep");
    add_file(graph, project, "/src/App/ModelsExtra/Other.cs", "App.ModelsExtra");

    auto files = graph.files_under("/src/App/Models/");
    ASSERT_EQ(files.size(), 2U);
    EXPECT_EQ(files[0].path, "/src/App/Models/Deep/Role.cs");
    EXPECT_EQ(files[1].path, "/src/App/Models/User.cs");
}

TEST(SolutionGraph, FindTypePrefersLowestId) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto f1 = add_file(graph, project, "/src/App/A.cs", "App");
    auto f2 = add_file(graph, project, "/src/App/A.Part.cs", "App");
    add_type(graph, f2, "App", "A", true, "#2");
    add_type(graph, f1, "App", "A", true);

    auto type = graph.find_type("App.A");
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ(type->id, "type:App.A");
    EXPECT_FALSE(graph.find_type("App.B").has_value());
}

// ============================================================================
// Project references
// ============================================================================

TEST(SolutionGraph, CyclicDependencyDetected) {
    SolutionGraph graph;
    auto a = add_project(graph, "/src/A/A.csproj", "A");
    auto b = add_project(graph, "/src/B/B.csproj", "B");
    auto c = add_project(graph, "/src/C/C.csproj", "C");
    add_project_reference(graph, a, b);
    add_project_reference(graph, b, c);
    add_project_reference(graph, c, a);

    EXPECT_TRUE(graph.has_cyclic_dependency(a.id));
    EXPECT_TRUE(graph.has_cyclic_dependency(b.id));
    EXPECT_TRUE(graph.has_cyclic_dependency(c.id));
}

TEST(SolutionGraph, AcyclicDiamondIsNotACycle) {
    SolutionGraph graph;
    auto a = add_project(graph, "/src/A/A.csproj", "A");
    auto b = add_project(graph, "/src/B/B.csproj", "B");
    auto c = add_project(graph, "/src/C/C.csproj", "C");
    auto d = add_project(graph, "/src/D/D.csproj", "D");
    add_project_reference(graph, a, b);
    add_project_reference(graph, a, c);
    add_project_reference(graph, b, d);
    add_project_reference(graph, c, d);

    EXPECT_FALSE(graph.has_cyclic_dependency(a.id));
    EXPECT_FALSE(graph.has_cyclic_dependency(d.id));

    auto deps = graph.project_dependencies(a.id);
    EXPECT_EQ(deps.size(), 2U);
    auto dependents = graph.projects_depending_on(d.id);
    EXPECT_EQ(dependents.size(), 2U);
}

TEST(SolutionGraph, SelfReferenceIsACycle) {
    SolutionGraph graph;
    auto a = add_project(graph, "/src/A/A.csproj", "A");
    add_project_reference(graph, a, a);
    EXPECT_TRUE(graph.has_cyclic_dependency(a.id));
}

// ============================================================================
// Statistics and persistence
// ============================================================================

TEST(SolutionGraph, StatisticsCountNodesAndEdges) {
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto file = add_file(graph, project, "/src/App/A.cs", "App");
    auto a = add_type(graph, file, "App", "A");
    auto b = add_type(graph, file, "App", "B");
    graph.add_edge(Edge(EdgeKind::TypeInherits, b.id, a.id));

    GraphStatistics stats = graph.statistics();
    EXPECT_EQ(stats.projects, 1U);
    EXPECT_EQ(stats.files, 1U);
    EXPECT_EQ(stats.types, 2U);
    EXPECT_EQ(stats.namespaces, 1U);
    EXPECT_EQ(stats.inheritance_count(), 1U);
    EXPECT_EQ(stats.edges_of(EdgeKind::FileContainsType), 2U);
    EXPECT_NE(stats.to_string().find("Graph statistics:"), std::string::npos);
}

TEST(SolutionGraph, JsonRoundTripPreservesQueries) {
    SolutionGraph graph;
    graph.add_solution({make_solution_id("/src/App.sln"), "/src/App.sln", "App"});
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    auto f1 = add_file(graph, project, "/src/App/A.cs", "App.Core");
    auto f2 = add_file(graph, project, "/src/App/B.cs", "App.Web");
    auto a = add_type(graph, f1, "App.Core", "A");
    auto b = add_type(graph, f2, "App.Web", "B");
    add_using(graph, f2, "App.Core", 4);
    add_usage(graph, b, a);
    graph.add_package({make_package_id("Serilog"), "Serilog", std::string("3.1.0")});

    auto reloaded = SolutionGraph::from_json(graph.to_json());

    EXPECT_EQ(reloaded->statistics().node_count(), graph.statistics().node_count());
    EXPECT_EQ(reloaded->edges().size(), graph.edges().size());
    EXPECT_EQ(reloaded->using_line(f2.id, "App.Core"), std::optional<uint32_t>(4));

    auto files = reloaded->files_referencing_type(a.id);
    ASSERT_EQ(files.size(), 1U);
    EXPECT_EQ(files[0].path, "/src/App/B.cs");

    auto package = reloaded->find_package(make_package_id("Serilog"));
    ASSERT_TRUE(package.has_value());
    EXPECT_EQ(package->version, std::optional<std::string>("3.1.0"));
}

TEST(SolutionGraph, SaveAndLoadFromDisk) {
    TempDir dir("relocator_graph_save");
    SolutionGraph graph;
    auto project = add_project(graph, "/src/App/App.csproj", "App");
    add_file(graph, project, "/src/App/A.cs", "App");

    std::string path = (dir.path / "index.json").string();
    graph.save(path);
    auto loaded = SolutionGraph::load(path);
    EXPECT_EQ(loaded->files().size(), 1U);
    EXPECT_TRUE(loaded->project_containing_file(make_file_id("/src/App/A.cs")).has_value());
}

TEST(SolutionGraph, IncompatibleIndexVersionRejected) {
    json j = SolutionGraph().to_json();
    j["metadata"]["version"] = std::to_string(INDEX_SCHEMA_MAJOR + 1) + ".0.0";
    EXPECT_THROW(SolutionGraph::from_json(j), std::runtime_error);
}

TEST(SolutionGraph, MalformedIndexRejected) {
    json j = SolutionGraph().to_json();
    json file;
    file["path"] = "/missing/id.cs";
    j["files"] = json::array();
    j["files"].push_back(file);
    EXPECT_THROW(SolutionGraph::from_json(j), std::runtime_error);
}

TEST(SolutionGraph, NonStringIndexVersionIsMalformed) {
    json j = SolutionGraph().to_json();
    j["metadata"]["version"] = 1;
    try {
        SolutionGraph::from_json(j);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find("Malformed index file"), std::string::npos);
    }
}

TEST(SolutionGraph, LoadMissingFileThrows) {
    EXPECT_THROW(SolutionGraph::load("/nonexistent/relocator/index.json"), std::runtime_error);
}

TEST(Edge, DescriptionNamesRelationship) {
    Edge inherits(EdgeKind::TypeInherits, "type:B", "type:A");
    EXPECT_EQ(inherits.description(), "inherits");

    TypeUsageInfo info;
    info.usage = TypeUsageKind::MethodParameter;
    Edge usage(EdgeKind::TypeUsage, "type:B", "type:A", info);
    EXPECT_EQ(usage.description(), "has parameter of type");
    EXPECT_TRUE(usage.is_type_reference());

    Edge contains(EdgeKind::ProjectContainsFile, "proj:x", "file:y");
    EXPECT_FALSE(contains.is_type_reference());
    EXPECT_FALSE(contains.line_number().has_value());
}
