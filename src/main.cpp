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

#include <cxxopts.hpp>
#include <iostream>

#include "relocator/commands.hpp"
#include "relocator/version.hpp"

using namespace relocator;

void print_banner() {
    std::cout << R"(
  ____      _                 _
 |  _ \ ___| | ___   ___ __ _| |_ ___  _ __
 | |_) / _ \ |/ _ \ / __/ _` | __/ _ \| '__|
 |  _ <  __/ | (_) | (_| (_| | || (_) | |
 |_| \_\___|_|\___/ \___\__,_|\__\___/|_|

)" << "  Reorganization Impact Analyzer v"
              << VERSION_STRING << "\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "relocator", "Impact Analyzer - Plan moves, renames and deletes across C# solutions");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("index", "Build the solution graph for .sln/.csproj inputs (comma-separated)",
         cxxopts::value<std::vector<std::string>>());
    opts("fast", "Structure only: skip usages, usings and private types");
    opts("full", "Analyze everything, including generated files");
    opts("j,jobs", "Number of threads for indexing (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("verbose", "Log skipped projects and files");
    opts("stats", "Print graph statistics");
    opts("deps", "Show references of a project (name or path)", cxxopts::value<std::string>());
    opts("cycles", "List projects that reach a reference cycle");
    opts("analyze", "Analyze an operation: move, rename-namespace, delete, move-type",
         cxxopts::value<std::string>());
    opts("s,source", "Source file, folder, namespace or type", cxxopts::value<std::string>());
    opts("t,target", "Target path or namespace", cxxopts::value<std::string>());
    opts("namespace", "New namespace for a move", cxxopts::value<std::string>());
    opts("new-file", "New file path for move-type", cxxopts::value<std::string>());
    opts("folder", "Source is a folder (move, delete)");
    opts("force", "Delete even if types are still referenced");
    opts("markdown", "Print the impact report as markdown instead of JSON");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  relocator --index App.sln                 Build index for a solution"
                      << std::endl;
            std::cout << "  relocator --index App.sln --fast -j 8     Structure-only index, 8 threads"
                      << std::endl;
            std::cout << "  relocator --stats                         Print graph statistics"
                      << std::endl;
            std::cout << "  relocator --deps App.Core                 Show project references"
                      << std::endl;
            std::cout << "  relocator --cycles                        Find reference cycles"
                      << std::endl;
            std::cout << "  relocator --analyze move -s src/A.cs -t lib/A.cs --namespace Lib"
                      << std::endl;
            std::cout << "  relocator --analyze rename-namespace -s App.Old -t App.New"
                      << std::endl;
            std::cout << "  relocator --analyze delete -s src/A.cs --force --markdown"
                      << std::endl;
            std::cout << "  relocator --analyze move-type -s App.Models.User -t App.Domain"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "relocator v" << VERSION_STRING << std::endl;
            return 0;
        }

        if (result.count("index")) {
            auto roots = result["index"].as<std::vector<std::string>>();
            BuildOptions build_options;
            if (result.count("fast"))
                build_options = BuildOptions::fast();
            else if (result.count("full"))
                build_options = BuildOptions::full();
            build_options.worker_threads = result["jobs"].as<unsigned int>();
            build_options.verbose = result.count("verbose") > 0;
            return cmd_index(roots, build_options);
        }

        if (result.count("stats")) {
            return cmd_stats();
        }

        if (result.count("deps")) {
            return cmd_deps(result["deps"].as<std::string>());
        }

        if (result.count("cycles")) {
            return cmd_cycles();
        }

        if (result.count("analyze")) {
            if (!result.count("source")) {
                std::cerr << "Error: --source is required for --analyze" << std::endl;
                return 1;
            }
            AnalyzeArgs args;
            args.operation = result["analyze"].as<std::string>();
            args.source = result["source"].as<std::string>();
            if (result.count("target"))
                args.target = result["target"].as<std::string>();
            if (result.count("namespace"))
                args.new_namespace = result["namespace"].as<std::string>();
            if (result.count("new-file"))
                args.new_file = result["new-file"].as<std::string>();
            args.folder = result.count("folder") > 0;
            args.force = result.count("force") > 0;
            args.markdown = result.count("markdown") > 0;
            return cmd_analyze(args);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
