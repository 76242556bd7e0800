#pragma once

#include <cartograph/model/schema.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cartograph::model {

/// Pipeline state stored on the Project node.
enum class ProjectStatus {
    Uploaded,
    StructureAnalyzed,
    ContentAnalyzed,
    Classified,
    Mapped,
    Strategized,
    Done,
    Failed,
    NeedsFeedback
};

/// Typed read of `j[key]`; a missing, null or mistyped value yields `fallback`.
template <typename T> T property(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.is_object())
        return fallback;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return fallback;
    try {
        return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

const char* toString(ProjectStatus status);
std::optional<ProjectStatus> parseProjectStatus(std::string_view s);

/**
 * @brief Per-field provenance plus recorded disagreements between producers.
 *
 * Serialized as `_provenance: {field: "syntactic"|"inferred"}` and
 * `_conflicts: [{field, syntactic, inferred, chosen}]` inside the property bag.
 */
struct FieldProvenance {
    std::map<std::string, Provenance> fields;
    nlohmann::json conflicts = nlohmann::json::array();

    void set(const std::string& field, Provenance p) { fields[field] = p; }
    std::optional<Provenance> get(const std::string& field) const;
    void recordConflict(const std::string& field, const nlohmann::json& syntactic,
                        const nlohmann::json& inferred);

    void writeTo(nlohmann::json& props) const;
    static FieldProvenance readFrom(const nlohmann::json& props);
};

struct Argument {
    std::string name;
    std::string type = "Any";
};

struct Attribute {
    std::string name;
    std::string type = "Any";
    std::string visibility = "public";
};

struct ProjectRecord {
    std::string id;
    std::string rootPath;
    std::string storagePath;
    ProjectStatus status = ProjectStatus::Uploaded;
    // Status the project held before entering needs_feedback
    std::optional<ProjectStatus> resumeStatus;
    double progress = 0.0;
    std::string currentStep;
    std::string createdAt;
    std::string updatedAt;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toProperties() const;
    static ProjectRecord fromProperties(const std::string& id, const nlohmann::json& props);
};

struct FileRecord {
    std::string path; // relative to project root, '/' separated
    std::string absolutePath;
    std::string language = "unknown";
    std::string extension;
    uint64_t size = 0;
    // Set when the parser rejected the file; no derived entities exist
    bool parseFailed = false;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toProperties() const;
    static FileRecord fromProperties(const nlohmann::json& props);
};

struct FunctionRecord {
    std::string name;
    std::string className; // empty for module-level functions
    std::string returnType = "Any";
    std::vector<Argument> arguments;
    std::vector<std::string> decorators;
    bool isStatic = false;
    bool isAsync = false;
    std::string docstring;
    int lineno = 0;
    int endLineno = 0;
    FieldProvenance provenance;
    nlohmann::json extra = nlohmann::json::object();

    std::string qualifiedName() const;
    nlohmann::json toProperties() const;
    static FunctionRecord fromProperties(const nlohmann::json& props);
};

struct ClassRecord {
    std::string name;
    // Open tag: regular, singleton, abstract, interface, ...
    std::string kind = "regular";
    bool isStatic = false;
    bool isFinal = false;
    std::vector<std::string> superclasses;
    std::vector<std::string> interfaces;
    std::vector<std::string> methods; // method names
    // Full method records, kept on the class rather than as Function nodes
    std::vector<FunctionRecord> methodDetails;
    std::vector<Attribute> attributes;
    std::string docstring;
    int lineno = 0;
    int endLineno = 0;
    FieldProvenance provenance;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toProperties() const;
    static ClassRecord fromProperties(const nlohmann::json& props);
};

struct EnumRecord {
    std::string name;
    std::vector<std::string> values;
    std::string docstring;
    int lineno = 0;
    FieldProvenance provenance;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toProperties() const;
    static EnumRecord fromProperties(const nlohmann::json& props);
};

struct ExtensionRecord {
    std::string name;
    std::string baseType;
    std::vector<std::string> methods;
    FieldProvenance provenance;
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toProperties() const;
    static ExtensionRecord fromProperties(const nlohmann::json& props);
};

struct DependencyRecord {
    std::string name;
    std::string version;
    std::string type = "external"; // external | internal

    nlohmann::json toProperties() const;
    static DependencyRecord fromProperties(const nlohmann::json& props);
};

struct ComponentRecord {
    std::string filePath;
    ComponentType type = ComponentType::Unknown;
    std::vector<std::string> signals;
    Provenance provenance = Provenance::Syntactic;

    nlohmann::json toProperties() const;
    static ComponentRecord fromProperties(const nlohmann::json& props);
};

struct TargetComponentRecord {
    std::string name;
    std::string version;
    std::string type;

    std::string key() const { return keys::targetComponent(name, version); }
    nlohmann::json toProperties() const;
    static TargetComponentRecord fromProperties(const nlohmann::json& props);
};

struct MappingRecord {
    std::string sourceKey; // Component (or Function/Class) natural key
    std::string targetKey; // TargetComponent natural key
    std::map<std::string, std::string> dataTypeMapping;
    bool isCustom = false;
    bool bestEffort = false;
    Provenance provenance = Provenance::Syntactic;

    nlohmann::json toProperties() const;
    static MappingRecord fromProperties(const nlohmann::json& props);
};

struct StrategyRecord {
    std::string componentKey;
    int64_t priority = 0;
    std::vector<std::string> actions;

    nlohmann::json toProperties() const;
    static StrategyRecord fromProperties(const nlohmann::json& props);
};

/// Report and Feedback share a shape. Records keyed by subject are rewritten
/// in place on re-runs: `createdAt` keeps the first write, `lastSeen` the latest,
/// and `occurrences` counts the writes.
struct ReportRecord {
    std::string id;
    std::string type;   // e.g. "error", "cycle", "structure_analysis"
    std::string issue;  // free text
    std::string errorKind; // e.g. "MalformedInputError", may be empty
    nlohmann::json details = nlohmann::json::object();
    std::string createdAt;
    std::string lastSeen;
    int64_t occurrences = 1;

    nlohmann::json toProperties() const;
    static ReportRecord fromProperties(const std::string& id, const nlohmann::json& props);
};

} // namespace cartograph::model
