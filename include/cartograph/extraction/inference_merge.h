#pragma once

#include <cartograph/extraction/syntax_parser.h>

#include <nlohmann/json.hpp>

#include <vector>

namespace cartograph::extraction {

/// Skeleton as sent to the inference capability (`context.skeleton`).
nlohmann::json skeletonToJson(const Skeleton& skeleton);

/// True when some field was left at an untagged default the parser could not settle.
bool needsInference(const Skeleton& skeleton);

/**
 * @brief Merge an inference response into a parsed skeleton.
 *
 * Entities are matched by qualified name. A field the parser tagged syntactic keeps
 * its value; a differing inferred value is recorded as a conflict. Untagged fields
 * take the inferred value and are tagged inferred. Entities only inference knows
 * about are added with every field tagged inferred. `references` in the response
 * (module names or project paths) are returned for cross-file resolution.
 */
std::vector<std::string> mergeInferred(Skeleton& skeleton, const nlohmann::json& inferred);

} // namespace cartograph::extraction
