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

// A `using X.Y;` directive
struct UsingDirective {
    std::string namespace_name;
    uint32_t line = 0;
};

enum class Accessibility { Public, Internal, Protected, Private };

// A type name used inside a declaration
struct TypeReference {
    std::string name; // simple name as written
    TypeUsageKind usage = TypeUsageKind::Other;
    std::optional<std::string> member_name;
    uint32_t line = 0;
};

// A declared type as seen by the extractor
struct TypeDeclaration {
    TypeKind kind = TypeKind::Class;
    std::string full_name;
    std::string name;
    std::string namespace_name;
    Accessibility accessibility = Accessibility::Internal;
    bool is_partial = false;
    bool is_static = false;
    bool is_abstract = false;
    // Unqualified names are qualified against the file's namespace;
    // generic arguments are stripped
    std::optional<std::string> base_type;
    std::vector<std::string> interfaces;

    // Type positions inside the declaration, first use of each name only
    std::vector<TypeReference> referenced_types;
};

// Everything extracted from one file
struct FileFacts {
    FileKind kind = FileKind::Other;
    std::optional<std::string> namespace_name;
    std::vector<UsingDirective> usings;
    std::vector<TypeDeclaration> types;
};

// A file could not be read or parsed
class ExtractError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source of per-file facts. Implementations must be safe to call from
// several builder workers at once.
class FactExtractor {
public:
    virtual ~FactExtractor() = default;

    // Throws ExtractError when the file cannot be read
    virtual FileFacts extract(const std::string &path) = 0;
};

} // namespace relocator
