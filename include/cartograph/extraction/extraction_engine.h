#pragma once

#include <cartograph/core/types.h>
#include <cartograph/extraction/inference_client.h>
#include <cartograph/extraction/syntax_parser.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/model/entities.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cartograph::extraction {

struct ExtractionOptions {
    std::size_t workers = 1;
    uint64_t maxFileSize = 512000;
    bool skipHidden = true;
    std::chrono::milliseconds inferenceTimeout{60000};
};

struct ExtractionStats {
    std::size_t files = 0;
    std::size_t parsed = 0;
    std::size_t parseFailures = 0;
    std::size_t oversized = 0;
    std::size_t functions = 0;
    std::size_t classes = 0;
    std::size_t enums = 0;
    std::size_t extensions = 0;
    std::size_t imports = 0;
    std::size_t references = 0;
    std::size_t dependencies = 0;
    std::size_t inferenceCalls = 0;
    std::size_t inferenceFailures = 0;

    ExtractionStats& operator+=(const ExtractionStats& other);
    nlohmann::json toJson() const;
};

/// Module name to candidate project paths (`a.b` -> `a/b.py`, `a/b/__init__.py`).
std::vector<std::string> moduleCandidates(std::string_view module);

/**
 * @brief Candidate paths for one import binding of `filePath`.
 *
 * Relative imports resolve against the importing file's directory (level 1) or its
 * ancestors. Returns an empty list when a relative import climbs above the root.
 */
std::vector<std::string> importCandidates(const std::string& filePath, const ImportDecl& decl,
                                          const std::string& binding = {});

/**
 * @brief Turns a project's files into graph entities.
 *
 * scanStructure() records the file tree. extractContent() parses every File node on a
 * worker pool, one atomic WriteBatch per file, recording cross-file edges as pending.
 * After all workers finish, resolvePending() materializes IMPORTS/REFERENCES between
 * existing Files and turns unresolved imports into Dependency nodes.
 *
 * Per-file problems (malformed syntax, unreadable or oversized files, inference
 * failures) become Report/Feedback nodes and never fail the stage; only store errors
 * are returned.
 */
class ExtractionEngine {
public:
    ExtractionEngine(graph::GraphStore& store, SyntaxParser& parser, InferenceClient* inference,
                     ExtractionOptions options = {});

    Result<ExtractionStats> scanStructure(const std::string& projectId,
                                          const std::filesystem::path& root);

    /// Extract every File node, then resolve pending edges.
    Result<ExtractionStats> extractContent(const std::string& projectId);

    Result<ExtractionStats> extractFile(const std::string& projectId,
                                        const model::FileRecord& file);

    Result<ExtractionStats> resolvePending(const std::string& projectId);

private:
    Result<std::string> readContents(const model::FileRecord& file) const;

    graph::GraphStore& store_;
    SyntaxParser& parser_;
    InferenceClient* inference_;
    ExtractionOptions options_;
};

} // namespace cartograph::extraction
