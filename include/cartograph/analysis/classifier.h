#pragma once

#include <cartograph/core/types.h>
#include <cartograph/extraction/inference_client.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/model/entities.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cartograph::analysis {

/// Structural facts about one file, gathered from its owned entities and edges.
struct FileFacts {
    std::size_t functions = 0;
    std::size_t classes = 0;
    // Enum classes and classes with no behavior beyond dunder methods
    std::size_t dataClasses = 0;
    std::vector<std::string> dependencies; // external module names
};

struct Classification {
    model::ComponentType type = model::ComponentType::Unknown;
    std::vector<std::string> signals; // names of the rules that fired
    model::Provenance provenance = model::Provenance::Syntactic;
    // Rules could not decide; inference should be consulted
    bool ambiguous = false;
};

/**
 * @brief Rule-based component type for one file.
 *
 * Language gives the base type, path segments (`/ui/`, `/model`, `/config/`, ...)
 * override it, then a logic file holding only data classes becomes data and UI or
 * persistence imports nudge a logic file towards ui or data. `unknown` results and
 * conflicting import signals are marked ambiguous.
 */
Classification classifyByRules(const model::FileRecord& file, const FileFacts& facts);

struct ClassificationStats {
    std::size_t files = 0;
    std::size_t ui = 0;
    std::size_t logic = 0;
    std::size_t data = 0;
    std::size_t config = 0;
    std::size_t unknown = 0;
    std::size_t inferred = 0;
    std::size_t inferenceFailures = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Assigns every File one Component.
 *
 * Writes `component:<path>` nodes and a CLASSIFIES_AS edge that replaces any earlier
 * classification of the file. Ambiguous files consult inference (`classify` task);
 * a failed call leaves the rule result and records a Feedback node.
 */
class Classifier {
public:
    Classifier(graph::GraphStore& store, extraction::InferenceClient* inference,
               std::chrono::milliseconds inferenceTimeout = std::chrono::milliseconds{60000});

    Result<ClassificationStats> classify(const std::string& projectId);

private:
    Result<std::map<std::string, FileFacts>> gatherFacts(const std::string& projectId);

    graph::GraphStore& store_;
    extraction::InferenceClient* inference_;
    std::chrono::milliseconds inferenceTimeout_;
};

} // namespace cartograph::analysis
