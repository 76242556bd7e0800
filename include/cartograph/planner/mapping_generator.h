#pragma once

#include <cartograph/core/types.h>
#include <cartograph/extraction/inference_client.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/model/entities.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cartograph::planner {

/// Target for a component type and source language, or nullopt when no rule applies.
std::optional<model::TargetComponentRecord> ruleTarget(model::ComponentType type,
                                                       std::string_view language);

/// Target for a class whose kind marks a legacy construct (singleton, abstract, ...).
std::optional<model::TargetComponentRecord> legacyClassTarget(std::string_view kind);

/**
 * @brief Target type for a source type annotation.
 *
 * Builtins map through a fixed table (`str` -> `string`, `list` -> `array`, ...);
 * generic forms map by their head (`List[int]` -> `array`, `Optional[str]` ->
 * `string`). Project types map to themselves.
 */
std::string mapDataType(std::string_view sourceType);

/**
 * @brief Project-supplied overrides, stored as `custom_mappings` on the Project.
 *
 * `{"components": {"<path or component type>": "name@version"}, "types": {"str": "text"}}`
 */
struct CustomMappings {
    std::map<std::string, std::string> components;
    std::map<std::string, std::string> types;

    static CustomMappings fromJson(const nlohmann::json& j);
    bool empty() const { return components.empty() && types.empty(); }
};

struct MappingStats {
    std::size_t components = 0;
    std::size_t classes = 0;
    std::size_t ruleBased = 0;
    std::size_t custom = 0;
    std::size_t inferred = 0;
    // Best-effort mappings with an UnmappableConstruct Feedback
    std::size_t unmapped = 0;
    std::size_t targets = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Derives a Mapping for every Component and every legacy-marked Class.
 *
 * Each Mapping (`mapping:<source key>`) carries the data-type table of its source and
 * TARGETS exactly one TargetComponent; the source links to it with MAPS_TO. Components
 * without a rule consult inference (`map` task). When that fails too the Mapping
 * falls back to a generic module target with `best_effort: true` and an
 * UnmappableConstruct Feedback is recorded; planning continues.
 */
class MappingGenerator {
public:
    MappingGenerator(graph::GraphStore& store, extraction::InferenceClient* inference,
                     std::chrono::milliseconds inferenceTimeout = std::chrono::milliseconds{60000});

    Result<MappingStats> generate(const std::string& projectId);

private:
    graph::GraphStore& store_;
    extraction::InferenceClient* inference_;
    std::chrono::milliseconds inferenceTimeout_;
};

} // namespace cartograph::planner
