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

#include "relocator/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace relocator {

CSharpSyntax::CSharpSyntax() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    if (!ts_parser_set_language(parser_, tree_sitter_c_sharp())) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

CSharpSyntax::~CSharpSyntax() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

CSharpSyntax::CSharpSyntax(CSharpSyntax &&other) noexcept
    : parser_(other.parser_), tree_(other.tree_), source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

CSharpSyntax &CSharpSyntax::operator=(CSharpSyntax &&other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool CSharpSyntax::parse(const std::string &source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

TSNode CSharpSyntax::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string CSharpSyntax::node_text(TSNode node) const {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void CSharpSyntax::visit_nodes(TSNode node, const std::function<bool(TSNode)> &visitor) const {
    // Explicit stack, deep syntax trees would overflow recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!visitor(current))
            continue;

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

// ============ Name helpers ============

namespace {

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string remove_whitespace(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            out.push_back(c);
    }
    return out;
}

std::string last_segment(const std::string &name) {
    size_t pos = name.rfind('.');
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

bool is_type_declaration(const char *type) {
    return strcmp(type, "class_declaration") == 0 || strcmp(type, "interface_declaration") == 0 ||
           strcmp(type, "struct_declaration") == 0 || strcmp(type, "record_declaration") == 0 ||
           strcmp(type, "record_struct_declaration") == 0 ||
           strcmp(type, "enum_declaration") == 0 || strcmp(type, "delegate_declaration") == 0;
}

TypeKind type_kind_of(const char *type) {
    if (strcmp(type, "interface_declaration") == 0)
        return TypeKind::Interface;
    if (strcmp(type, "struct_declaration") == 0)
        return TypeKind::Struct;
    if (strcmp(type, "record_declaration") == 0 || strcmp(type, "record_struct_declaration") == 0)
        return TypeKind::Record;
    if (strcmp(type, "enum_declaration") == 0)
        return TypeKind::Enum;
    if (strcmp(type, "delegate_declaration") == 0)
        return TypeKind::Delegate;
    return TypeKind::Class;
}

bool is_object_type(const std::string &name) {
    return name == "object" || name == "Object" || name == "System.Object";
}

} // namespace

std::string strip_type_name(const std::string &name) {
    std::string result = remove_whitespace(name);
    if (result.compare(0, 8, "global::") == 0)
        result = result.substr(8);
    size_t generic = result.find('<');
    if (generic != std::string::npos)
        result = result.substr(0, generic);
    size_t paren = result.find('(');
    if (paren != std::string::npos)
        result = result.substr(0, paren);
    while (!result.empty() && (result.back() == '?' || result.back() == ']' || result.back() == '['))
        result.pop_back();
    return result;
}

bool looks_like_interface(const std::string &name) {
    std::string simple = last_segment(strip_type_name(name));
    return simple.size() >= 2 && simple[0] == 'I' &&
           std::isupper(static_cast<unsigned char>(simple[1]));
}

// ============ Fact extraction ============

namespace {

class FactCollector {
public:

    FactCollector(const CSharpSyntax &syntax, FileFacts &facts) : syntax_(syntax), facts_(facts) {}

    void collect() { walk_members(syntax_.root(), "", {}); }

private:

    const CSharpSyntax &syntax_;
    FileFacts &facts_;

    void walk_members(TSNode parent, std::string ns, const std::vector<std::string> &outer_types) {
        uint32_t count = ts_node_named_child_count(parent);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(parent, i);
            const char *type = ts_node_type(child);

            if (strcmp(type, "using_directive") == 0) {
                add_using(child);
            } else if (strcmp(type, "namespace_declaration") == 0) {
                std::string name = qualify_namespace(ns, child);
                TSNode body = ts_node_child_by_field_name(child, "body", 4);
                if (!ts_node_is_null(body))
                    walk_members(body, name, outer_types);
            } else if (strcmp(type, "file_scoped_namespace_declaration") == 0) {
                // Applies to every following member; newer grammars also nest them
                ns = qualify_namespace(ns, child);
                walk_members(child, ns, outer_types);
            } else if (is_type_declaration(type)) {
                add_type(child, ns, outer_types);
            } else if (strcmp(type, "declaration_list") == 0) {
                walk_members(child, ns, outer_types);
            }
        }
    }

    std::string qualify_namespace(const std::string &outer, TSNode decl) {
        TSNode name_node = ts_node_child_by_field_name(decl, "name", 4);
        std::string name = ts_node_is_null(name_node) ? "" : remove_whitespace(syntax_.node_text(name_node));
        std::string full = outer.empty() ? name : outer + "." + name;
        if (!facts_.namespace_name && !full.empty())
            facts_.namespace_name = full;
        return full;
    }

    void add_using(TSNode node) {
        std::string text = syntax_.node_text(node);
        size_t semi = text.rfind(';');
        if (semi != std::string::npos)
            text = text.substr(0, semi);

        std::istringstream words(text);
        std::string word;
        std::string rest;
        bool in_name = false;
        while (words >> word) {
            if (!in_name && (word == "global" || word == "using" || word == "static" ||
                             word == "unsafe"))
                continue;
            in_name = true;
            rest += word;
        }

        // Alias form: record the aliased target
        size_t eq = rest.find('=');
        if (eq != std::string::npos)
            rest = rest.substr(eq + 1);

        rest = strip_type_name(rest);
        if (rest.empty())
            return;

        UsingDirective directive;
        directive.namespace_name = rest;
        directive.line = ts_node_start_point(node).row + 1;
        facts_.usings.push_back(std::move(directive));
    }

    std::vector<std::string> modifiers_of(TSNode node) {
        std::vector<std::string> mods;
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (strcmp(ts_node_type(child), "modifier") == 0)
                mods.push_back(trim(syntax_.node_text(child)));
        }
        return mods;
    }

    static bool has(const std::vector<std::string> &mods, const char *mod) {
        return std::find(mods.begin(), mods.end(), mod) != mods.end();
    }

    static Accessibility accessibility_of(const std::vector<std::string> &mods, bool nested) {
        if (has(mods, "public"))
            return Accessibility::Public;
        if (has(mods, "protected"))
            return Accessibility::Protected;
        if (has(mods, "internal"))
            return Accessibility::Internal;
        if (has(mods, "private"))
            return Accessibility::Private;
        return nested ? Accessibility::Private : Accessibility::Internal;
    }

    std::string qualify_type(const std::string &name, const std::string &ns) {
        if (name.find('.') != std::string::npos || ns.empty())
            return name;
        return ns + "." + name;
    }

    // Collects simple type names from a type expression
    void collect_type_names(TSNode node, TypeUsageKind usage,
                            const std::optional<std::string> &member,
                            std::vector<TypeReference> &out) {
        const char *type = ts_node_type(node);

        if (strcmp(type, "identifier") == 0) {
            TypeReference ref;
            ref.name = syntax_.node_text(node);
            ref.usage = usage;
            ref.member_name = member;
            ref.line = ts_node_start_point(node).row + 1;
            out.push_back(std::move(ref));
            return;
        }
        if (strcmp(type, "predefined_type") == 0)
            return;
        if (strcmp(type, "qualified_name") == 0 || strcmp(type, "alias_qualified_name") == 0) {
            TSNode name = ts_node_child_by_field_name(node, "name", 4);
            if (!ts_node_is_null(name)) {
                collect_type_names(name, usage, member, out);
                return;
            }
        }
        if (strcmp(type, "type_argument_list") == 0)
            usage = TypeUsageKind::GenericArgument;

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            collect_type_names(ts_node_named_child(node, i), usage, member, out);
        }
    }

    std::optional<std::string> field_text(TSNode node, const char *field) {
        TSNode child =
            ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
        if (ts_node_is_null(child))
            return std::nullopt;
        return trim(syntax_.node_text(child));
    }

    // Usage kind and member name for a node carrying a type field
    std::pair<TypeUsageKind, std::optional<std::string>> usage_of(TSNode node) {
        const char *type = ts_node_type(node);

        if (strcmp(type, "variable_declaration") == 0) {
            TSNode parent = ts_node_parent(node);
            const char *parent_type = ts_node_is_null(parent) ? "" : ts_node_type(parent);
            std::optional<std::string> member;
            for (uint32_t i = 0; i < ts_node_named_child_count(node); ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (strcmp(ts_node_type(child), "variable_declarator") == 0) {
                    member = field_text(child, "name");
                    break;
                }
            }
            if (strcmp(parent_type, "field_declaration") == 0 ||
                strcmp(parent_type, "event_field_declaration") == 0)
                return {TypeUsageKind::Field, member};
            return {TypeUsageKind::LocalVariable, member};
        }
        if (strcmp(type, "property_declaration") == 0 || strcmp(type, "indexer_declaration") == 0 ||
            strcmp(type, "event_declaration") == 0)
            return {TypeUsageKind::Property, field_text(node, "name")};
        if (strcmp(type, "parameter") == 0)
            return {TypeUsageKind::MethodParameter, field_text(node, "name")};
        if (strcmp(type, "method_declaration") == 0 ||
            strcmp(type, "local_function_statement") == 0 ||
            strcmp(type, "delegate_declaration") == 0)
            return {TypeUsageKind::MethodReturn, field_text(node, "name")};
        return {TypeUsageKind::Other, std::nullopt};
    }

    // Base list entries as written
    std::vector<TSNode> base_entries(TSNode decl) {
        std::vector<TSNode> entries;
        uint32_t count = ts_node_named_child_count(decl);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(decl, i);
            if (strcmp(ts_node_type(child), "base_list") != 0)
                continue;
            uint32_t n = ts_node_named_child_count(child);
            for (uint32_t j = 0; j < n; ++j) {
                TSNode entry = ts_node_named_child(child, j);
                // record Foo(int X) : Base(X)
                if (strcmp(ts_node_type(entry), "primary_constructor_base_type") == 0 &&
                    ts_node_named_child_count(entry) > 0) {
                    entry = ts_node_named_child(entry, 0);
                }
                if (strcmp(ts_node_type(entry), "argument_list") == 0)
                    continue;
                entries.push_back(entry);
            }
        }
        return entries;
    }

    std::vector<TypeReference> referenced_type_names(TSNode decl) {
        std::vector<TypeReference> refs;

        syntax_.visit_nodes(decl, [&](TSNode node) {
            const char *type = ts_node_type(node);
            // Nested declarations report their own references
            if (!ts_node_eq(node, decl) && is_type_declaration(type))
                return false;

            if (strcmp(type, "base_list") == 0) {
                collect_type_names(node, TypeUsageKind::BaseType, std::nullopt, refs);
                return false;
            }

            if (strcmp(type, "attribute") == 0) {
                TSNode name = ts_node_child_by_field_name(node, "name", 4);
                if (!ts_node_is_null(name)) {
                    std::vector<TypeReference> attrs;
                    collect_type_names(name, TypeUsageKind::Attribute, std::nullopt, attrs);
                    for (const auto &attr : attrs) {
                        refs.push_back(attr);
                        TypeReference suffixed = attr;
                        suffixed.name += "Attribute";
                        refs.push_back(std::move(suffixed));
                    }
                }
                return true;
            }

            for (const char *field : {"type", "returns"}) {
                TSNode type_node =
                    ts_node_child_by_field_name(node, field, static_cast<uint32_t>(strlen(field)));
                if (ts_node_is_null(type_node))
                    continue;
                auto [usage, member] = usage_of(node);
                collect_type_names(type_node, usage, member, refs);
            }
            return true;
        });

        std::vector<TypeReference> unique;
        std::unordered_set<std::string> seen;
        for (auto &ref : refs) {
            if (ref.name == "var" || ref.name == "dynamic" || ref.name.empty())
                continue;
            if (seen.insert(ref.name).second)
                unique.push_back(std::move(ref));
        }
        return unique;
    }

    void add_type(TSNode node, const std::string &ns, const std::vector<std::string> &outer_types) {
        TSNode name_node = ts_node_child_by_field_name(node, "name", 4);
        if (ts_node_is_null(name_node))
            return;

        const char *node_type = ts_node_type(node);
        std::vector<std::string> mods = modifiers_of(node);

        TypeDeclaration decl;
        decl.kind = type_kind_of(node_type);
        decl.name = syntax_.node_text(name_node);
        decl.namespace_name = ns;

        std::string prefix = ns;
        for (const auto &outer : outer_types) {
            prefix = prefix.empty() ? outer : prefix + "." + outer;
        }
        decl.full_name = prefix.empty() ? decl.name : prefix + "." + decl.name;

        decl.accessibility = accessibility_of(mods, !outer_types.empty());
        decl.is_partial = has(mods, "partial");
        decl.is_static = has(mods, "static");
        decl.is_abstract = has(mods, "abstract");

        // Enum base lists name the underlying integral type
        if (decl.kind != TypeKind::Enum && decl.kind != TypeKind::Delegate) {
            bool base_allowed = decl.kind == TypeKind::Class || decl.kind == TypeKind::Record;
            bool first = true;
            for (TSNode entry : base_entries(node)) {
                std::string name = strip_type_name(syntax_.node_text(entry));
                if (name.empty() || is_object_type(name)) {
                    first = false;
                    continue;
                }
                std::string qualified = qualify_type(name, ns);
                if (first && base_allowed && !looks_like_interface(name)) {
                    decl.base_type = qualified;
                } else {
                    decl.interfaces.push_back(qualified);
                }
                first = false;
            }
        }

        for (auto &ref : referenced_type_names(node)) {
            if (ref.name != decl.name)
                decl.referenced_types.push_back(std::move(ref));
        }

        facts_.types.push_back(std::move(decl));

        TSNode body = ts_node_child_by_field_name(node, "body", 4);
        if (!ts_node_is_null(body)) {
            std::vector<std::string> nested = outer_types;
            nested.push_back(syntax_.node_text(name_node));
            walk_members(body, ns, nested);
        }
    }
};

std::string lower_extension(const std::string &path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

FileFacts CSharpParser::parse_source(const std::string &source) const {
    FileFacts facts;
    facts.kind = FileKind::Source;

    CSharpSyntax syntax;
    if (!syntax.parse(source)) {
        throw ExtractError("tree-sitter failed to parse source");
    }

    FactCollector collector(syntax, facts);
    collector.collect();
    return facts;
}

FileFacts CSharpParser::extract(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ExtractError("Cannot read file: " + path);
    }

    std::string ext = lower_extension(path);
    FileKind kind = file_kind_from_extension(ext);
    if (kind != FileKind::Source) {
        FileFacts facts;
        facts.kind = kind;
        return facts;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return parse_source(buffer.str());
    } catch (const ExtractError &e) {
        throw ExtractError(path + ": " + e.what());
    }
}

} // namespace relocator
