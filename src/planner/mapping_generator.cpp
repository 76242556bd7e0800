#include <cartograph/graph/report_writer.h>
#include <cartograph/planner/mapping_generator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <unordered_map>
#include <vector>

namespace cartograph::planner {

using graph::NodeRef;
using graph::WriteBatch;
using model::ComponentType;
using model::NodeLabel;
using model::Provenance;
using model::Relation;
using nlohmann::json;

namespace {

struct TargetRule {
    ComponentType type;
    std::string_view language; // empty matches any
    std::string_view name;
    std::string_view version;
    std::string_view targetType;
};

// Language-specific rules come before the generic ones
constexpr std::array<TargetRule, 5> kTargetRules{{
    {ComponentType::Logic, "shell", "script", "1.0", "script"},
    {ComponentType::Logic, "", "service", "1.0", "service"},
    {ComponentType::Ui, "", "view", "1.0", "view"},
    {ComponentType::Data, "", "model", "1.0", "model"},
    {ComponentType::Config, "", "settings", "1.0", "settings"},
}};

constexpr std::array<std::pair<std::string_view, std::string_view>, 17> kTypeTable{{
    {"any", "object"},    {"str", "string"},   {"int", "integer"},  {"float", "number"},
    {"bool", "boolean"},  {"list", "array"},   {"dict", "map"},     {"none", "void"},
    {"tuple", "array"},   {"set", "array"},    {"frozenset", "array"}, {"bytes", "binary"},
    {"object", "object"}, {"sequence", "array"}, {"iterable", "array"}, {"mapping", "map"},
    {"complex", "number"},
}};

const model::TargetComponentRecord kFallbackTarget{"module", "1.0", "module"};

std::string trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

model::TargetComponentRecord parseTarget(std::string_view spec, std::string type) {
    auto at = spec.rfind('@');
    if (at == std::string_view::npos)
        return {std::string(spec), "1.0", std::move(type)};
    return {std::string(spec.substr(0, at)), std::string(spec.substr(at + 1)), std::move(type)};
}

std::optional<model::TargetComponentRecord> targetFromInference(const json& response) {
    auto it = response.find("target");
    if (it == response.end())
        it = response.find("target_component");
    if (it == response.end())
        return std::nullopt;
    if (it->is_string() && !it->get<std::string>().empty())
        return parseTarget(it->get<std::string>(),
                           model::property<std::string>(response, "type", "module"));
    if (it->is_object()) {
        auto name = model::property<std::string>(*it, "name", "");
        if (name.empty())
            return std::nullopt;
        return model::TargetComponentRecord{
            name, model::property<std::string>(*it, "version", "1.0"),
            model::property<std::string>(*it, "type", "module")};
    }
    return std::nullopt;
}

void collectTypes(const model::FunctionRecord& fn, std::set<std::string>& out) {
    out.insert(fn.returnType);
    for (const auto& arg : fn.arguments)
        out.insert(arg.type);
}

void collectTypes(const model::ClassRecord& cls, std::set<std::string>& out) {
    for (const auto& attr : cls.attributes)
        out.insert(attr.type);
    for (const auto& method : cls.methodDetails)
        collectTypes(method, out);
}

} // namespace

std::optional<model::TargetComponentRecord> ruleTarget(ComponentType type,
                                                       std::string_view language) {
    for (const auto& rule : kTargetRules) {
        if (rule.type != type || (!rule.language.empty() && rule.language != language))
            continue;
        return model::TargetComponentRecord{std::string(rule.name), std::string(rule.version),
                                            std::string(rule.targetType)};
    }
    return std::nullopt;
}

std::optional<model::TargetComponentRecord> legacyClassTarget(std::string_view kind) {
    if (kind == "singleton")
        return model::TargetComponentRecord{"provider", "1.0", "provider"};
    if (kind == "abstract" || kind == "interface")
        return model::TargetComponentRecord{"interface", "1.0", "interface"};
    return std::nullopt;
}

std::string mapDataType(std::string_view sourceType) {
    std::string type = trim(sourceType);
    if (type.empty())
        return "object";
    if (type.starts_with("typing."))
        type.erase(0, 7);

    std::string head = type;
    std::string args;
    if (auto open = type.find('['); open != std::string::npos && type.back() == ']') {
        head = trim(std::string_view(type).substr(0, open));
        args = type.substr(open + 1, type.size() - open - 2);
    }

    if (head == "Optional" && !args.empty())
        return mapDataType(args.substr(0, args.find(',')));
    if (head == "Union")
        return "object";

    const std::string key = lower(head);
    for (const auto& [from, to] : kTypeTable) {
        if (key == from)
            return std::string(to);
    }
    return type;
}

CustomMappings CustomMappings::fromJson(const json& j) {
    CustomMappings m;
    if (!j.is_object())
        return m;
    for (const char* section : {"components", "types"}) {
        auto it = j.find(section);
        if (it == j.end() || !it->is_object())
            continue;
        auto& dest = std::string_view(section) == "components" ? m.components : m.types;
        for (auto e = it->begin(); e != it->end(); ++e) {
            if (e->is_string())
                dest[e.key()] = e->get<std::string>();
        }
    }
    return m;
}

json MappingStats::toJson() const {
    return {{"components", components}, {"classes", classes},   {"rule_based", ruleBased},
            {"custom", custom},         {"inferred", inferred}, {"unmapped", unmapped},
            {"targets", targets}};
}

MappingGenerator::MappingGenerator(graph::GraphStore& store,
                                   extraction::InferenceClient* inference,
                                   std::chrono::milliseconds inferenceTimeout)
    : store_(store), inference_(inference), inferenceTimeout_(inferenceTimeout) {}

Result<MappingStats> MappingGenerator::generate(const std::string& projectId) {
    auto projectR = store_.getProject(projectId);
    if (!projectR)
        return projectR.error();
    const auto custom =
        CustomMappings::fromJson(projectR.value().extra.value("custom_mappings", json::object()));

    auto filesR = store_.findNodes(projectId, NodeLabel::File);
    if (!filesR)
        return filesR.error();
    std::unordered_map<std::string, std::string> languages;
    for (const auto& node : filesR.value())
        languages[node.key] =
            model::property<std::string>(node.properties, "file_type", "unknown");

    auto functionsR = store_.findNodes(projectId, NodeLabel::Function);
    if (!functionsR)
        return functionsR.error();
    auto classesR = store_.findNodes(projectId, NodeLabel::Class);
    if (!classesR)
        return classesR.error();

    std::unordered_map<std::string, std::set<std::string>> fileTypes;
    for (const auto& node : functionsR.value())
        collectTypes(model::FunctionRecord::fromProperties(node.properties),
                     fileTypes[model::keys::filePathOf(node.key)]);
    for (const auto& node : classesR.value())
        collectTypes(model::ClassRecord::fromProperties(node.properties),
                     fileTypes[model::keys::filePathOf(node.key)]);

    auto componentsR = store_.findNodes(projectId, NodeLabel::Component);
    if (!componentsR)
        return componentsR.error();

    MappingStats stats;
    std::set<std::string> targets;
    WriteBatch batch;

    auto typeMapping = [&](const std::set<std::string>& types, model::MappingRecord& m) {
        for (const auto& t : types) {
            if (auto it = custom.types.find(t); it != custom.types.end()) {
                m.dataTypeMapping[t] = it->second;
                m.isCustom = true;
            } else {
                m.dataTypeMapping[t] = mapDataType(t);
            }
        }
    };

    auto write = [&](const NodeRef& source, const model::MappingRecord& m,
                     const model::TargetComponentRecord& target) {
        const auto mappingKey = model::keys::mapping(source.key);
        batch.upsertNode(NodeLabel::TargetComponent, target.key(), target.toProperties());
        batch.upsertNode(NodeLabel::Mapping, mappingKey, m.toProperties());
        batch.upsertEdge(Relation::MapsTo, source, {NodeLabel::Mapping, mappingKey});
        batch.replaceEdge(Relation::Targets, {NodeLabel::Mapping, mappingKey},
                          {NodeLabel::TargetComponent, target.key()});
        targets.insert(target.key());
    };

    for (const auto& node : componentsR.value()) {
        auto component = model::ComponentRecord::fromProperties(node.properties);
        const auto& language = languages[component.filePath];
        const std::string typeName = model::toString(component.type);

        model::MappingRecord m;
        m.sourceKey = node.key;
        typeMapping(fileTypes[component.filePath], m);

        std::optional<model::TargetComponentRecord> target;
        for (const auto& selector : {component.filePath, typeName}) {
            if (auto it = custom.components.find(selector); it != custom.components.end()) {
                target = parseTarget(it->second, typeName);
                m.isCustom = true;
                ++stats.custom;
                break;
            }
        }
        if (!target) {
            target = ruleTarget(component.type, language);
            if (target)
                ++stats.ruleBased;
        }

        std::optional<Error> inferenceError;
        if (!target && inference_) {
            extraction::InferenceRequest request{
                "map",
                projectId,
                component.filePath,
                language,
                {{"component_type", typeName},
                 {"signals", component.signals},
                 {"types", std::vector<std::string>(fileTypes[component.filePath].begin(),
                                                    fileTypes[component.filePath].end())}}};
            auto inferR = inference_->infer(request, inferenceTimeout_);
            if (inferR) {
                target = targetFromInference(inferR.value());
                if (target) {
                    m.provenance = Provenance::Inferred;
                    ++stats.inferred;
                    if (auto types = inferR.value().find("data_type_mapping");
                        types != inferR.value().end() && types->is_object()) {
                        for (auto t = types->begin(); t != types->end(); ++t) {
                            if (t->is_string() && !custom.types.count(t.key()))
                                m.dataTypeMapping[t.key()] = t->get<std::string>();
                        }
                    }
                } else {
                    inferenceError = Error{ErrorCode::UnmappableConstruct,
                                           "Inference suggested no target component"};
                }
            } else {
                inferenceError = inferR.error();
            }
        }

        if (!target) {
            target = kFallbackTarget;
            m.bestEffort = true;
            ++stats.unmapped;
            std::string issue = fmt::format("No target component derivable for {} ({})",
                                            component.filePath, typeName);
            json details = {{"component", node.key},
                            {"path", component.filePath},
                            {"component_type", typeName},
                            {"fallback_target", kFallbackTarget.key()}};
            if (inferenceError)
                details["inference_error"] = inferenceError->message;
            spdlog::warn("{}", issue);
            graph::addFeedback(batch, projectId,
                               graph::makeReport("unmappable_construct", std::move(issue),
                                                 "map:" + node.key, std::move(details),
                                                 ErrorCode::UnmappableConstruct));
        }

        m.targetKey = target->key();
        write(node.ref(), m, *target);
        ++stats.components;
    }

    for (const auto& node : classesR.value()) {
        auto cls = model::ClassRecord::fromProperties(node.properties);
        auto target = legacyClassTarget(cls.kind);
        if (!target)
            continue;
        model::MappingRecord m;
        m.sourceKey = node.key;
        m.targetKey = target->key();
        if (cls.provenance.get("type") == Provenance::Inferred)
            m.provenance = Provenance::Inferred;
        std::set<std::string> types;
        collectTypes(cls, types);
        typeMapping(types, m);
        write(node.ref(), m, *target);
        ++stats.classes;
    }
    stats.targets = targets.size();

    graph::addReport(batch, projectId,
                     graph::makeReport("mapping",
                                       fmt::format("Mapped {} components and {} classes",
                                                   stats.components, stats.classes),
                                       projectId, stats.toJson()));
    auto applyR = store_.apply(projectId, batch);
    if (!applyR)
        return applyR.error();

    spdlog::info("Mapping of {}: {} components, {} classes, {} targets, {} unmapped", projectId,
                 stats.components, stats.classes, stats.targets, stats.unmapped);
    return stats;
}

} // namespace cartograph::planner
