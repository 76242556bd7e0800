#include <cartograph/treesitter/tree_sitter_parser.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>

extern "C" {
#include <tree_sitter/api.h>
}

namespace cartograph::treesitter {

using extraction::ImportDecl;
using extraction::NameReference;
using extraction::Skeleton;
using model::Provenance;

namespace {

// ============================================================================
// Node helpers
// ============================================================================

struct Source {
    std::string_view text;

    std::string of(TSNode node) const {
        if (ts_node_is_null(node))
            return "";
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        if (start >= end || end > text.size())
            return "";
        return std::string(text.substr(start, end - start));
    }
};

bool is(TSNode node, const char* type) {
    return !ts_node_is_null(node) && std::strcmp(ts_node_type(node), type) == 0;
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

int lineOf(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

int endLineOf(TSNode node) {
    return static_cast<int>(ts_node_end_point(node).row) + 1;
}

template <typename Fn> void forEachNamedChild(TSNode node, Fn&& fn) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i)
        fn(ts_node_named_child(node, i));
}

std::string lastSegment(const std::string& dotted) {
    auto pos = dotted.rfind('.');
    return pos == std::string::npos ? dotted : dotted.substr(pos + 1);
}

std::string trim(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

// Strip string prefix letters and quotes from a Python string literal.
std::string unquote(std::string s) {
    size_t i = 0;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i])))
        ++i;
    s.erase(0, i);
    for (const char* q : {"\"\"\"", "'''", "\"", "'"}) {
        size_t n = std::strlen(q);
        if (s.size() >= 2 * n && s.compare(0, n, q) == 0 && s.compare(s.size() - n, n, q) == 0)
            return trim(s.substr(n, s.size() - 2 * n));
    }
    return trim(s);
}

// ============================================================================
// Python
// ============================================================================

constexpr std::array<std::string_view, 5> kEnumBases{"Enum", "IntEnum", "StrEnum", "Flag",
                                                     "IntFlag"};

class PythonWalker {
public:
    explicit PythonWalker(Source src) : src_(src) {}

    Skeleton walk(TSNode root) {
        walkBlock(root);
        collectReferences(root);
        return std::move(skeleton_);
    }

private:
    void walkBlock(TSNode block) {
        forEachNamedChild(block, [&](TSNode stmt) { statement(stmt); });
    }

    void statement(TSNode stmt) {
        if (is(stmt, "function_definition")) {
            skeleton_.functions.push_back(function(stmt, {}, {}));
        } else if (is(stmt, "class_definition")) {
            classDef(stmt, {});
        } else if (is(stmt, "decorated_definition")) {
            auto decorators = decoratorsOf(stmt);
            TSNode def = field(stmt, "definition");
            if (is(def, "function_definition"))
                skeleton_.functions.push_back(function(def, decorators, {}));
            else if (is(def, "class_definition"))
                classDef(def, decorators);
        } else if (is(stmt, "import_statement")) {
            importStatement(stmt);
        } else if (is(stmt, "import_from_statement")) {
            importFrom(stmt);
        } else if (is(stmt, "if_statement") || is(stmt, "try_statement") ||
                   is(stmt, "with_statement") || is(stmt, "else_clause") ||
                   is(stmt, "elif_clause") || is(stmt, "except_clause") ||
                   is(stmt, "finally_clause") || is(stmt, "block")) {
            // Conditional definitions and guarded imports at module level
            forEachNamedChild(stmt, [&](TSNode child) {
                if (is(child, "block"))
                    walkBlock(child);
                else
                    statement(child);
            });
        }
    }

    std::vector<std::string> decoratorsOf(TSNode decorated) {
        std::vector<std::string> out;
        forEachNamedChild(decorated, [&](TSNode child) {
            if (!is(child, "decorator"))
                return;
            TSNode expr = ts_node_named_child(child, 0);
            if (is(expr, "call"))
                expr = field(expr, "function");
            out.push_back("@" + src_.of(expr));
        });
        return out;
    }

    std::string docstringOf(TSNode def) {
        TSNode body = field(def, "body");
        if (ts_node_is_null(body) || ts_node_named_child_count(body) == 0)
            return "";
        TSNode first = ts_node_named_child(body, 0);
        if (!is(first, "expression_statement"))
            return "";
        TSNode str = ts_node_named_child(first, 0);
        return is(str, "string") ? unquote(src_.of(str)) : "";
    }

    model::FunctionRecord function(TSNode def, std::vector<std::string> decorators,
                                   const std::string& className) {
        model::FunctionRecord fn;
        fn.name = src_.of(field(def, "name"));
        fn.className = className;
        fn.isAsync = ts_node_child_count(def) > 0 && is(ts_node_child(def, 0), "async");
        fn.isStatic = std::find(decorators.begin(), decorators.end(), "@staticmethod") !=
                      decorators.end();
        fn.decorators = std::move(decorators);
        fn.docstring = docstringOf(def);
        fn.lineno = lineOf(def);
        fn.endLineno = endLineOf(def);

        bool allTyped = true;
        forEachNamedChild(field(def, "parameters"), [&](TSNode p) {
            model::Argument arg;
            if (is(p, "identifier")) {
                arg.name = src_.of(p);
            } else if (is(p, "typed_parameter")) {
                arg.name = src_.of(ts_node_named_child(p, 0));
                arg.type = src_.of(field(p, "type"));
            } else if (is(p, "default_parameter")) {
                arg.name = src_.of(field(p, "name"));
            } else if (is(p, "typed_default_parameter")) {
                arg.name = src_.of(field(p, "name"));
                arg.type = src_.of(field(p, "type"));
            } else {
                // *args, **kwargs and separators are not positional arguments
                return;
            }
            if (arg.type.empty())
                arg.type = "Any";
            if (arg.type == "Any" && arg.name != "self" && arg.name != "cls")
                allTyped = false;
            fn.arguments.push_back(std::move(arg));
        });

        TSNode ret = field(def, "return_type");
        if (!ts_node_is_null(ret)) {
            fn.returnType = src_.of(ret);
            fn.provenance.set("return_type", Provenance::Syntactic);
        }
        if (allTyped)
            fn.provenance.set("arguments", Provenance::Syntactic);
        for (const char* f : {"name", "decorators", "is_static", "is_async", "docstring"})
            fn.provenance.set(f, Provenance::Syntactic);
        return fn;
    }

    void classDef(TSNode def, const std::vector<std::string>& decorators) {
        model::ClassRecord cls;
        cls.name = src_.of(field(def, "name"));
        cls.docstring = docstringOf(def);
        cls.lineno = lineOf(def);
        cls.endLineno = endLineOf(def);
        cls.isFinal = std::any_of(decorators.begin(), decorators.end(), [](const auto& d) {
            return d == "@final" || d == "@typing.final";
        });

        std::string metaclass;
        forEachNamedChild(field(def, "superclasses"), [&](TSNode base) {
            if (is(base, "keyword_argument")) {
                if (src_.of(field(base, "name")) == "metaclass")
                    metaclass = src_.of(field(base, "value"));
            } else if (is(base, "identifier") || is(base, "attribute")) {
                cls.superclasses.push_back(src_.of(base));
            }
        });

        bool abstractMethod = false;
        bool singletonMarker = std::find(decorators.begin(), decorators.end(), "@singleton") !=
                               decorators.end();
        std::vector<std::string> assigned;
        forEachNamedChild(field(def, "body"), [&](TSNode stmt) {
            TSNode method{};
            std::vector<std::string> methodDecorators;
            if (is(stmt, "function_definition")) {
                method = stmt;
            } else if (is(stmt, "decorated_definition") &&
                       is(field(stmt, "definition"), "function_definition")) {
                method = field(stmt, "definition");
                methodDecorators = decoratorsOf(stmt);
            } else if (is(stmt, "expression_statement")) {
                TSNode assign = ts_node_named_child(stmt, 0);
                if (!is(assign, "assignment"))
                    return;
                TSNode left = field(assign, "left");
                if (!is(left, "identifier"))
                    return;
                auto name = src_.of(left);
                if (name == "_instance" || name == "__instance")
                    singletonMarker = true;
                TSNode type = field(assign, "type");
                if (!ts_node_is_null(type))
                    cls.attributes.push_back({name, src_.of(type), "public"});
                assigned.push_back(name);
            }
            if (ts_node_is_null(method))
                return;
            abstractMethod = abstractMethod ||
                             std::any_of(methodDecorators.begin(), methodDecorators.end(),
                                         [](const auto& d) {
                                             return lastSegment(d) == "abstractmethod";
                                         });
            auto fn = function(method, std::move(methodDecorators), cls.name);
            cls.methods.push_back(fn.name);
            cls.methodDetails.push_back(std::move(fn));
        });

        bool isEnum = false;
        bool abstractBase = lastSegment(metaclass) == "ABCMeta";
        bool protocol = false;
        for (const auto& base : cls.superclasses) {
            auto last = lastSegment(base);
            if (last == "ABC")
                abstractBase = true;
            if (last == "Protocol")
                protocol = true;
            if (std::find(kEnumBases.begin(), kEnumBases.end(), last) != kEnumBases.end())
                isEnum = true;
        }

        // Untagged "regular" leaves the kind open for inference
        if (protocol) {
            cls.kind = "interface";
            cls.provenance.set("type", Provenance::Syntactic);
        } else if (abstractBase || abstractMethod) {
            cls.kind = "abstract";
            cls.provenance.set("type", Provenance::Syntactic);
        } else if (!metaclass.empty() || singletonMarker) {
            cls.kind = "singleton";
            cls.provenance.set("type", Provenance::Syntactic);
        }
        for (const char* f : {"name", "is_final", "superclasses", "interfaces", "methods",
                              "attributes", "docstring"})
            cls.provenance.set(f, Provenance::Syntactic);

        if (isEnum) {
            model::EnumRecord en;
            en.name = cls.name;
            for (const auto& name : assigned) {
                if (!(name.size() > 1 && name[0] == '_'))
                    en.values.push_back(name);
            }
            en.docstring = cls.docstring;
            en.lineno = cls.lineno;
            for (const char* f : {"name", "values", "docstring"})
                en.provenance.set(f, Provenance::Syntactic);
            skeleton_.enums.push_back(std::move(en));
        }
        skeleton_.classes.push_back(std::move(cls));
    }

    void importStatement(TSNode stmt) {
        forEachNamedChild(stmt, [&](TSNode name) {
            ImportDecl decl;
            decl.lineno = lineOf(stmt);
            std::string local;
            if (is(name, "aliased_import")) {
                decl.module = src_.of(field(name, "name"));
                local = src_.of(field(name, "alias"));
            } else if (is(name, "dotted_name")) {
                decl.module = src_.of(name);
                local = decl.module.substr(0, decl.module.find('.'));
            } else {
                return;
            }
            decl.bindings.emplace_back(local, decl.module);
            locals_.insert(local);
            skeleton_.imports.push_back(std::move(decl));
        });
    }

    void importFrom(TSNode stmt) {
        ImportDecl decl;
        decl.fromImport = true;
        decl.lineno = lineOf(stmt);
        TSNode moduleNode = field(stmt, "module_name");
        if (is(moduleNode, "relative_import")) {
            forEachNamedChild(moduleNode, [&](TSNode part) {
                if (is(part, "import_prefix"))
                    decl.level = static_cast<int>(src_.of(part).size());
                else if (is(part, "dotted_name"))
                    decl.module = src_.of(part);
            });
        } else {
            decl.module = src_.of(moduleNode);
        }

        const uint32_t moduleStart = ts_node_start_byte(moduleNode);
        forEachNamedChild(stmt, [&](TSNode name) {
            if (ts_node_start_byte(name) == moduleStart)
                return;
            if (is(name, "wildcard_import")) {
                decl.bindings.emplace_back("*", "*");
            } else if (is(name, "aliased_import")) {
                auto local = src_.of(field(name, "alias"));
                decl.bindings.emplace_back(local, src_.of(field(name, "name")));
                locals_.insert(local);
            } else if (is(name, "dotted_name")) {
                auto imported = src_.of(name);
                decl.bindings.emplace_back(imported, imported);
                locals_.insert(imported);
            }
        });
        skeleton_.imports.push_back(std::move(decl));
    }

    void collectReferences(TSNode root) {
        if (locals_.empty())
            return;
        std::set<std::string> seen;
        std::function<void(TSNode)> visit = [&](TSNode node) {
            if (is(node, "import_statement") || is(node, "import_from_statement"))
                return;
            if (is(node, "identifier")) {
                auto name = src_.of(node);
                if (locals_.count(name) && seen.insert(name).second)
                    skeleton_.references.push_back(NameReference{name, lineOf(node)});
                return;
            }
            forEachNamedChild(node, visit);
        };
        visit(root);
    }

    Source src_;
    Skeleton skeleton_;
    std::unordered_set<std::string> locals_;
};

// ============================================================================
// Other grammars: node-type tables
// ============================================================================

struct LanguageConfig {
    std::string_view name;
    std::vector<std::string_view> classTypes;
    std::vector<std::string_view> functionTypes;
    std::vector<std::string_view> enumTypes;
    std::vector<std::string_view> extensionTypes;
    std::vector<std::string_view> identifierTypes;

    static bool matches(const std::vector<std::string_view>& types, const char* type) {
        return std::find(types.begin(), types.end(), std::string_view(type)) != types.end();
    }
};

const std::vector<LanguageConfig>& languageConfigs() {
    static const std::vector<LanguageConfig> configs = {
        {"javascript",
         {"class_declaration", "class"},
         {"function_declaration", "method_definition", "generator_function_declaration"},
         {},
         {},
         {"identifier", "property_identifier"}},
        {"typescript",
         {"class_declaration", "abstract_class_declaration", "interface_declaration"},
         {"function_declaration", "method_definition", "method_signature"},
         {"enum_declaration"},
         {},
         {"identifier", "type_identifier", "property_identifier"}},
        {"java",
         {"class_declaration", "interface_declaration", "record_declaration"},
         {"method_declaration", "constructor_declaration"},
         {"enum_declaration"},
         {},
         {"identifier"}},
        {"c",
         {"struct_specifier", "union_specifier"},
         {"function_definition"},
         {"enum_specifier"},
         {},
         {"identifier", "type_identifier", "field_identifier"}},
        {"cpp",
         {"class_specifier", "struct_specifier", "union_specifier"},
         {"function_definition"},
         {"enum_specifier"},
         {},
         {"identifier", "type_identifier", "field_identifier"}},
        {"go",
         {"type_spec"},
         {"function_declaration", "method_declaration"},
         {},
         {},
         {"identifier", "type_identifier", "field_identifier"}},
        {"rust",
         {"struct_item", "trait_item"},
         {"function_item"},
         {"enum_item"},
         {"impl_item"},
         {"identifier", "type_identifier"}},
        {"csharp",
         {"class_declaration", "interface_declaration", "struct_declaration",
          "record_declaration"},
         {"method_declaration", "constructor_declaration"},
         {"enum_declaration"},
         {},
         {"identifier"}},
    };
    return configs;
}

const LanguageConfig* configFor(std::string_view language) {
    if (language == "react")
        language = "javascript";
    else if (language == "c_header")
        language = "c";
    else if (language == "cpp_header")
        language = "cpp";
    for (const auto& cfg : languageConfigs()) {
        if (cfg.name == language)
            return &cfg;
    }
    return nullptr;
}

class GenericWalker {
public:
    GenericWalker(Source src, const LanguageConfig& config) : src_(src), config_(config) {}

    Skeleton walk(TSNode root) {
        visit(root, nullptr);
        return std::move(skeleton_);
    }

private:
    std::string nameOf(TSNode node) {
        TSNode name = field(node, "name");
        if (!ts_node_is_null(name))
            return src_.of(name);
        // C/C++ functions keep the name inside the declarator
        TSNode declarator = field(node, "declarator");
        std::function<TSNode(TSNode)> search = [&](TSNode n) -> TSNode {
            if (ts_node_is_null(n))
                return TSNode{};
            if (LanguageConfig::matches(config_.identifierTypes, ts_node_type(n)))
                return n;
            uint32_t count = ts_node_named_child_count(n);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode found = search(ts_node_named_child(n, i));
                if (!ts_node_is_null(found))
                    return found;
            }
            return TSNode{};
        };
        return src_.of(search(ts_node_is_null(declarator) ? node : declarator));
    }

    void visit(TSNode node, model::ClassRecord* owner) {
        const char* type = ts_node_type(node);

        if (LanguageConfig::matches(config_.functionTypes, type)) {
            model::FunctionRecord fn;
            fn.name = nameOf(node);
            fn.lineno = lineOf(node);
            fn.endLineno = endLineOf(node);
            fn.provenance.set("name", Provenance::Syntactic);
            if (!fn.name.empty()) {
                if (owner) {
                    fn.className = owner->name;
                    owner->methods.push_back(fn.name);
                    owner->methodDetails.push_back(std::move(fn));
                } else {
                    skeleton_.functions.push_back(std::move(fn));
                }
            }
            // Nested functions are not separate entities
            return;
        }

        if (LanguageConfig::matches(config_.classTypes, type)) {
            model::ClassRecord cls;
            cls.name = nameOf(node);
            cls.lineno = lineOf(node);
            cls.endLineno = endLineOf(node);
            if (std::strstr(type, "interface") != nullptr || std::strstr(type, "trait") != nullptr) {
                cls.kind = "interface";
                cls.provenance.set("type", Provenance::Syntactic);
            } else if (std::strstr(type, "abstract") != nullptr) {
                cls.kind = "abstract";
                cls.provenance.set("type", Provenance::Syntactic);
            }
            cls.provenance.set("name", Provenance::Syntactic);
            // Forward declarations (`struct Foo;`) carry no body
            if (!cls.name.empty() && !ts_node_is_null(field(node, "body"))) {
                forEachNamedChild(node, [&](TSNode child) { visit(child, &cls); });
                skeleton_.classes.push_back(std::move(cls));
                return;
            }
        }

        if (LanguageConfig::matches(config_.enumTypes, type)) {
            model::EnumRecord en;
            en.name = nameOf(node);
            en.lineno = lineOf(node);
            en.provenance.set("name", Provenance::Syntactic);
            if (!en.name.empty())
                skeleton_.enums.push_back(std::move(en));
            return;
        }

        if (LanguageConfig::matches(config_.extensionTypes, type)) {
            model::ExtensionRecord ext;
            ext.name = src_.of(field(node, "type"));
            ext.baseType = src_.of(field(node, "trait"));
            ext.provenance.set("name", Provenance::Syntactic);
            ext.provenance.set("base_type", Provenance::Syntactic);
            model::ClassRecord holder;
            holder.name = ext.name;
            forEachNamedChild(node, [&](TSNode child) { visit(child, &holder); });
            ext.methods = std::move(holder.methods);
            if (!ext.name.empty())
                skeleton_.extensions.push_back(std::move(ext));
            return;
        }

        forEachNamedChild(node, [&](TSNode child) { visit(child, owner); });
    }

    Source src_;
    const LanguageConfig& config_;
    Skeleton skeleton_;
};

bool blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

TreeSitterParser::TreeSitterParser(std::shared_ptr<GrammarLoader> loader)
    : loader_(loader ? std::move(loader) : std::make_shared<GrammarLoader>()) {}

bool TreeSitterParser::supports(std::string_view language) const {
    if (language != "python" && !configFor(language))
        return false;
    return static_cast<bool>(loader_->load(language));
}

Result<Skeleton> TreeSitterParser::parse(std::string_view contents, std::string_view language) {
    const LanguageConfig* config = configFor(language);
    if (language != "python" && !config)
        return Error{ErrorCode::NotSupported, fmt::format("No parser for '{}'", language)};

    auto langR = loader_->load(language);
    if (!langR)
        return Error{ErrorCode::NotSupported, langR.error().message};

    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser{ts_parser_new(),
                                                                  ts_parser_delete};
    if (!ts_parser_set_language(parser.get(), langR.value())) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Grammar for '{}' has an incompatible ABI version", language)};
    }

    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree{
        ts_parser_parse_string(parser.get(), nullptr, contents.data(),
                               static_cast<uint32_t>(contents.size())),
        ts_tree_delete};
    if (!tree)
        return Error{ErrorCode::MalformedInput, "Parser produced no tree"};

    TSNode root = ts_tree_root_node(tree.get());
    const Source src{contents};
    Skeleton skeleton = language == "python" ? PythonWalker{src}.walk(root)
                                             : GenericWalker{src, *config}.walk(root);

    if (ts_node_has_error(root)) {
        if (skeleton.empty() && !blank(contents)) {
            return Error{ErrorCode::MalformedInput,
                         fmt::format("Syntax errors with no recognizable {} constructs", language)};
        }
        skeleton.partial = true;
    }
    return skeleton;
}

} // namespace cartograph::treesitter
