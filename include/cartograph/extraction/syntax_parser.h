#pragma once

#include <cartograph/core/types.h>
#include <cartograph/model/entities.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cartograph::extraction {

/**
 * @brief One import statement.
 *
 * `import a.b as c` gives module `a.b`, level 0, binding {c, a.b}.
 * `from ..pkg import x` gives module `pkg`, level 2, binding {x, x}.
 */
struct ImportDecl {
    std::string module;
    int level = 0; // leading dots of a relative import
    bool fromImport = false;
    // (local name, imported name)
    std::vector<std::pair<std::string, std::string>> bindings;
    int lineno = 0;
};

/// Use of a name bound by an import, e.g. `utils.helper()` referencing `utils`.
struct NameReference {
    std::string name;
    int lineno = 0;
};

/**
 * @brief Structural skeleton of one source file.
 *
 * `functions` holds module-level functions only. Methods stay on their class
 * (`ClassRecord::methods` names, `ClassRecord::methodDetails` records with `className`
 * set).
 * Fields the parser determined carry a syntactic provenance tag; untagged fields hold
 * defaults that inference may fill.
 */
struct Skeleton {
    std::vector<model::FunctionRecord> functions;
    std::vector<model::ClassRecord> classes;
    std::vector<model::EnumRecord> enums;
    std::vector<model::ExtensionRecord> extensions;
    std::vector<ImportDecl> imports;
    std::vector<NameReference> references;
    // Parser recovered from local syntax errors
    bool partial = false;

    bool empty() const {
        return functions.empty() && classes.empty() && enums.empty() && extensions.empty() &&
               imports.empty();
    }
};

/**
 * @brief Deterministic, side-effect free syntax parser.
 *
 * parse() returns MalformedInput when the file cannot be parsed at all and
 * NotSupported when no grammar is available for the language. Called concurrently
 * from extraction workers.
 */
class SyntaxParser {
public:
    virtual ~SyntaxParser() = default;

    virtual bool supports(std::string_view language) const = 0;
    virtual Result<Skeleton> parse(std::string_view contents, std::string_view language) = 0;
};

} // namespace cartograph::extraction
