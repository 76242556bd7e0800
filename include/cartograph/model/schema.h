#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cartograph::model {

/// Node labels of the project property graph.
enum class NodeLabel {
    Project,
    File,
    Function,
    Class,
    Enum,
    Extension,
    Component,
    Dependency,
    Mapping,
    TargetComponent,
    Strategy,
    Report,
    Feedback
};

/// Directed relationship kinds.
enum class Relation {
    Contains,     // Project -> File
    HasFunction,  // File -> Function
    HasClass,     // File -> Class
    HasEnum,      // File -> Enum
    HasExtension, // File -> Extension
    Imports,      // File -> File
    References,   // File -> File
    DependsOn,    // File -> Dependency
    ClassifiesAs, // File -> Component, functional
    MapsTo,       // Component/Function/Class -> Mapping
    Targets,      // Mapping -> TargetComponent
    PlannedIn,    // Component -> Strategy
    ReportedIn,   // Project -> Report
    FeedbackFor   // Project -> Feedback
};

/// Coarse component classification.
enum class ComponentType { Ui, Logic, Data, Config, Unknown };

/// Which producer supplied a field value.
enum class Provenance { Syntactic, Inferred };

const char* toString(NodeLabel label);
const char* toString(Relation relation);
const char* toString(ComponentType type);
const char* toString(Provenance provenance);

std::optional<NodeLabel> parseNodeLabel(std::string_view s);
std::optional<Relation> parseRelation(std::string_view s);
std::optional<ComponentType> parseComponentType(std::string_view s);

/// Relations whose endpoints are both File nodes.
bool isFileToFile(Relation relation);

/// HAS_* relation for an owned entity label, if any.
std::optional<Relation> ownershipRelation(NodeLabel label);

const std::vector<NodeLabel>& allNodeLabels();
const std::vector<Relation>& allRelations();

// Natural keys. Every node is unique per (project, label, key).
namespace keys {
std::string file(std::string_view path);
/// Module-level function `path#name`.
std::string function(std::string_view path, std::string_view qualifiedName);
std::string classKey(std::string_view path, std::string_view name);
std::string enumKey(std::string_view path, std::string_view name);
std::string extension(std::string_view path, std::string_view name);
std::string dependency(std::string_view name);
std::string component(std::string_view filePath);
std::string mapping(std::string_view sourceKey);
std::string targetComponent(std::string_view name, std::string_view version);
std::string strategy(std::string_view componentKey);
/// Per-subject anomaly report, merged on re-run instead of duplicated.
std::string report(std::string_view type, std::string_view subject);
/// Path portion of an entity key (`path#...` -> `path`).
std::string filePathOf(std::string_view entityKey);
} // namespace keys

} // namespace cartograph::model
