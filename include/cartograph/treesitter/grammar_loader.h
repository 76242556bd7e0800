#pragma once

#include <cartograph/core/types.h>

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Forward declaration
struct TSLanguage;

namespace cartograph::treesitter {

/**
 * @brief Discovers and loads tree-sitter grammars at runtime.
 *
 * Search order for a language:
 * - CARTOGRAPH_TS_<LANG>_LIB (full path to the shared library)
 * - paths added with addGrammarPath()
 * - $XDG_DATA_HOME/cartograph/grammars
 * - ~/.local/share/cartograph/grammars
 * - /usr/local/lib, /usr/lib, /usr/lib/x86_64-linux-gnu
 *
 * Loaded grammars stay resident until the loader is destroyed. Thread-safe.
 */
class GrammarLoader {
public:
    GrammarLoader() = default;
    ~GrammarLoader();

    GrammarLoader(const GrammarLoader&) = delete;
    GrammarLoader& operator=(const GrammarLoader&) = delete;

    /// Extra directory searched before the defaults.
    void addGrammarPath(std::filesystem::path dir);

    /// True when a grammar is known for the language tag (loaded or not).
    bool knows(std::string_view language) const;

    /**
     * @brief Load (or return the cached) grammar for a language tag.
     * @return NotSupported for unknown languages, NotFound when no library loads
     */
    Result<const TSLanguage*> load(std::string_view language);

    std::vector<std::filesystem::path> searchPaths() const;

private:
    struct GrammarSpec {
        std::string_view key;
        std::string_view env_var;
        std::string_view symbol;
        std::string_view lib_name; // core name, e.g. tree-sitter-python
    };

    static constexpr GrammarSpec kSpecs[] = {
        {"python", "CARTOGRAPH_TS_PYTHON_LIB", "tree_sitter_python", "tree-sitter-python"},
        {"javascript", "CARTOGRAPH_TS_JAVASCRIPT_LIB", "tree_sitter_javascript",
         "tree-sitter-javascript"},
        {"react", "CARTOGRAPH_TS_JAVASCRIPT_LIB", "tree_sitter_javascript",
         "tree-sitter-javascript"},
        {"typescript", "CARTOGRAPH_TS_TYPESCRIPT_LIB", "tree_sitter_typescript",
         "tree-sitter-typescript"},
        {"java", "CARTOGRAPH_TS_JAVA_LIB", "tree_sitter_java", "tree-sitter-java"},
        {"c", "CARTOGRAPH_TS_C_LIB", "tree_sitter_c", "tree-sitter-c"},
        {"c_header", "CARTOGRAPH_TS_C_LIB", "tree_sitter_c", "tree-sitter-c"},
        {"cpp", "CARTOGRAPH_TS_CPP_LIB", "tree_sitter_cpp", "tree-sitter-cpp"},
        {"cpp_header", "CARTOGRAPH_TS_CPP_LIB", "tree_sitter_cpp", "tree-sitter-cpp"},
        {"go", "CARTOGRAPH_TS_GO_LIB", "tree_sitter_go", "tree-sitter-go"},
        {"rust", "CARTOGRAPH_TS_RUST_LIB", "tree_sitter_rust", "tree-sitter-rust"},
        {"csharp", "CARTOGRAPH_TS_CSHARP_LIB", "tree_sitter_c_sharp", "tree-sitter-c-sharp"},
    };

    const GrammarSpec* findSpec(std::string_view language) const;
    std::vector<std::string> libraryCandidates(const GrammarSpec& spec) const;

    mutable std::mutex pathsMutex_;
    std::vector<std::filesystem::path> extraPaths_;
    std::mutex mutex_;
    // Keyed by grammar symbol so aliases share one handle
    std::unordered_map<std::string, std::pair<void*, const TSLanguage*>> loaded_;
};

} // namespace cartograph::treesitter
