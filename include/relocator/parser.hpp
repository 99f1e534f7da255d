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
#include <functional>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declaration for the tree-sitter C# grammar
extern "C" {
const TSLanguage *tree_sitter_c_sharp();
}

namespace relocator {

// Owns a tree-sitter parser and the tree of the last parse
class CSharpSyntax {
public:

    CSharpSyntax();
    ~CSharpSyntax();

    // Non-copyable
    CSharpSyntax(const CSharpSyntax &) = delete;
    CSharpSyntax &operator=(const CSharpSyntax &) = delete;

    // Movable
    CSharpSyntax(CSharpSyntax &&other) noexcept;
    CSharpSyntax &operator=(CSharpSyntax &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    // Get root node
    TSNode root() const;

    const std::string &source() const { return source_; }

    // Helper to get node text
    std::string node_text(TSNode node) const;

    // Pre-order walk; returning false from the visitor skips that node's children
    void visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const;

private:

    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;
};

// Fact extractor for C# sources. Markup and data files are classified by
// extension and yield no declarations. Each call uses its own tree-sitter
// parser, so one instance can serve every builder worker.
class CSharpParser : public FactExtractor {
public:

    FileFacts extract(const std::string &path) override;

    // Extract facts from C# source text
    FileFacts parse_source(const std::string &source) const;
};

// "Foo.Bar<T>" -> "Foo.Bar", "global::X" -> "X"
std::string strip_type_name(const std::string &name);

// True for names following the I-prefix interface convention (IService)
bool looks_like_interface(const std::string &name);

} // namespace relocator
