#include <cartograph/model/schema.h>

#include <array>
#include <utility>

namespace cartograph::model {

namespace {

constexpr std::array<std::pair<NodeLabel, const char*>, 13> kLabels{{
    {NodeLabel::Project, "Project"},
    {NodeLabel::File, "File"},
    {NodeLabel::Function, "Function"},
    {NodeLabel::Class, "Class"},
    {NodeLabel::Enum, "Enum"},
    {NodeLabel::Extension, "Extension"},
    {NodeLabel::Component, "Component"},
    {NodeLabel::Dependency, "Dependency"},
    {NodeLabel::Mapping, "Mapping"},
    {NodeLabel::TargetComponent, "TargetComponent"},
    {NodeLabel::Strategy, "Strategy"},
    {NodeLabel::Report, "Report"},
    {NodeLabel::Feedback, "Feedback"},
}};

constexpr std::array<std::pair<Relation, const char*>, 14> kRelations{{
    {Relation::Contains, "CONTAINS"},
    {Relation::HasFunction, "HAS_FUNCTION"},
    {Relation::HasClass, "HAS_CLASS"},
    {Relation::HasEnum, "HAS_ENUM"},
    {Relation::HasExtension, "HAS_EXTENSION"},
    {Relation::Imports, "IMPORTS"},
    {Relation::References, "REFERENCES"},
    {Relation::DependsOn, "DEPENDS_ON"},
    {Relation::ClassifiesAs, "CLASSIFIES_AS"},
    {Relation::MapsTo, "MAPS_TO"},
    {Relation::Targets, "TARGETS"},
    {Relation::PlannedIn, "PLANNED_IN"},
    {Relation::ReportedIn, "REPORTED_IN"},
    {Relation::FeedbackFor, "FEEDBACK_FOR"},
}};

constexpr std::array<std::pair<ComponentType, const char*>, 5> kComponentTypes{{
    {ComponentType::Ui, "ui"},
    {ComponentType::Logic, "logic"},
    {ComponentType::Data, "data"},
    {ComponentType::Config, "config"},
    {ComponentType::Unknown, "unknown"},
}};

template <typename E, size_t N>
const char* lookupName(const std::array<std::pair<E, const char*>, N>& table, E value) {
    for (const auto& [e, name] : table) {
        if (e == value)
            return name;
    }
    return "unknown";
}

template <typename E, size_t N>
std::optional<E> lookupValue(const std::array<std::pair<E, const char*>, N>& table,
                             std::string_view s) {
    for (const auto& [e, name] : table) {
        if (s == name)
            return e;
    }
    return std::nullopt;
}

std::string join(std::string_view a, char sep, std::string_view b) {
    std::string out;
    out.reserve(a.size() + b.size() + 1);
    out.append(a);
    out.push_back(sep);
    out.append(b);
    return out;
}

} // namespace

const char* toString(NodeLabel label) {
    return lookupName(kLabels, label);
}

const char* toString(Relation relation) {
    return lookupName(kRelations, relation);
}

const char* toString(ComponentType type) {
    return lookupName(kComponentTypes, type);
}

const char* toString(Provenance provenance) {
    return provenance == Provenance::Syntactic ? "syntactic" : "inferred";
}

std::optional<NodeLabel> parseNodeLabel(std::string_view s) {
    return lookupValue(kLabels, s);
}

std::optional<Relation> parseRelation(std::string_view s) {
    return lookupValue(kRelations, s);
}

std::optional<ComponentType> parseComponentType(std::string_view s) {
    return lookupValue(kComponentTypes, s);
}

bool isFileToFile(Relation relation) {
    return relation == Relation::Imports || relation == Relation::References;
}

std::optional<Relation> ownershipRelation(NodeLabel label) {
    switch (label) {
        case NodeLabel::Function: return Relation::HasFunction;
        case NodeLabel::Class: return Relation::HasClass;
        case NodeLabel::Enum: return Relation::HasEnum;
        case NodeLabel::Extension: return Relation::HasExtension;
        default: return std::nullopt;
    }
}

const std::vector<NodeLabel>& allNodeLabels() {
    static const std::vector<NodeLabel> labels = [] {
        std::vector<NodeLabel> out;
        for (const auto& [label, name] : kLabels)
            out.push_back(label);
        return out;
    }();
    return labels;
}

const std::vector<Relation>& allRelations() {
    static const std::vector<Relation> relations = [] {
        std::vector<Relation> out;
        for (const auto& [relation, name] : kRelations)
            out.push_back(relation);
        return out;
    }();
    return relations;
}

namespace keys {

std::string file(std::string_view path) {
    return std::string(path);
}

std::string function(std::string_view path, std::string_view qualifiedName) {
    return join(path, '#', qualifiedName);
}

std::string classKey(std::string_view path, std::string_view name) {
    return join(path, '#', name);
}

std::string enumKey(std::string_view path, std::string_view name) {
    return join(path, '#', name);
}

std::string extension(std::string_view path, std::string_view name) {
    return join(path, '#', name);
}

std::string dependency(std::string_view name) {
    return join("dep", ':', name);
}

std::string component(std::string_view filePath) {
    return join("component", ':', filePath);
}

std::string mapping(std::string_view sourceKey) {
    return join("mapping", ':', sourceKey);
}

std::string targetComponent(std::string_view name, std::string_view version) {
    return join("target", ':', join(name, '@', version));
}

std::string strategy(std::string_view componentKey) {
    return join("strategy", ':', componentKey);
}

std::string report(std::string_view type, std::string_view subject) {
    return join(join("report", ':', type), ':', subject);
}

std::string filePathOf(std::string_view entityKey) {
    auto pos = entityKey.find('#');
    return std::string(pos == std::string_view::npos ? entityKey : entityKey.substr(0, pos));
}

} // namespace keys

} // namespace cartograph::model
