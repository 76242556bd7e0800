#include <cartograph/analysis/classifier.h>
#include <cartograph/extraction/file_scanner.h>
#include <cartograph/graph/report_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <set>
#include <string_view>

namespace cartograph::analysis {

using graph::NodeRef;
using graph::WriteBatch;
using model::ComponentType;
using model::NodeLabel;
using model::Provenance;
using model::Relation;
using nlohmann::json;

namespace {

constexpr std::array<std::string_view, 6> kUiLanguages{"html", "css", "scss", "sass", "react",
                                                       "vue"};
constexpr std::array<std::string_view, 5> kConfigLanguages{"json", "yaml", "xml", "toml", "ini"};
constexpr std::array<std::string_view, 2> kDataLanguages{"sql", "csv"};

struct PathRule {
    std::string_view fragment;
    ComponentType type;
};

// First match wins
constexpr std::array<PathRule, 9> kPathRules{{
    {"/ui/", ComponentType::Ui},
    {"/view", ComponentType::Ui},
    {"/template", ComponentType::Ui},
    {"/data/", ComponentType::Data},
    {"/model", ComponentType::Data},
    {"/entity", ComponentType::Data},
    {"/config/", ComponentType::Config},
    {"/setting", ComponentType::Config},
    {"/conf/", ComponentType::Config},
}};

constexpr std::array<std::string_view, 11> kUiModules{
    "tkinter", "PyQt5", "PyQt6",     "PySide2", "PySide6", "kivy",
    "wx",      "react", "streamlit", "pygame",  "curses",
};
constexpr std::array<std::string_view, 10> kDataModules{
    "sqlalchemy", "sqlite3", "pandas",  "peewee", "pymongo",
    "psycopg2",   "mysql",   "redis",   "csv",    "pony",
};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table, std::string_view value) {
    return std::find(table.begin(), table.end(), value) != table.end();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isDunder(std::string_view name) {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

std::optional<ComponentType> inferredType(const json& response) {
    for (const char* key : {"component_type", "type"}) {
        auto it = response.find(key);
        if (it != response.end() && it->is_string()) {
            if (auto t = model::parseComponentType(it->get<std::string>());
                t && *t != ComponentType::Unknown)
                return t;
        }
    }
    return std::nullopt;
}

} // namespace

Classification classifyByRules(const model::FileRecord& file, const FileFacts& facts) {
    Classification c;
    const std::string& lang = file.language;

    if (contains(kUiLanguages, lang)) {
        c.type = ComponentType::Ui;
    } else if (contains(kConfigLanguages, lang)) {
        c.type = ComponentType::Config;
    } else if (contains(kDataLanguages, lang)) {
        c.type = ComponentType::Data;
    } else if (extraction::isSourceLanguage(lang)) {
        c.type = ComponentType::Logic;
    }
    c.signals.push_back("language:" + lang);

    const std::string path = "/" + lower(file.path);
    for (const auto& rule : kPathRules) {
        if (path.find(rule.fragment) != std::string::npos) {
            c.type = rule.type;
            c.signals.push_back(fmt::format("path:{}", rule.fragment));
            return c;
        }
    }

    if (c.type == ComponentType::Unknown)
        c.ambiguous = true;
    if (c.type != ComponentType::Logic)
        return c;

    if (facts.classes > 0 && facts.dataClasses == facts.classes && facts.functions == 0) {
        c.type = ComponentType::Data;
        c.signals.push_back("structure:data_holders");
        return c;
    }

    std::set<std::string> uiImports;
    std::set<std::string> dataImports;
    for (const auto& dep : facts.dependencies) {
        if (contains(kUiModules, dep))
            uiImports.insert(dep);
        else if (contains(kDataModules, dep))
            dataImports.insert(dep);
    }
    for (const auto& m : uiImports)
        c.signals.push_back("import:" + m);
    for (const auto& m : dataImports)
        c.signals.push_back("import:" + m);

    if (!uiImports.empty() && !dataImports.empty()) {
        c.ambiguous = true;
    } else if (!uiImports.empty()) {
        c.type = ComponentType::Ui;
    } else if (!dataImports.empty() && facts.functions == 0 && facts.classes == facts.dataClasses) {
        c.type = ComponentType::Data;
    }
    return c;
}

json ClassificationStats::toJson() const {
    return {{"files", files},   {"ui", ui},           {"logic", logic},
            {"data", data},     {"config", config},   {"unknown", unknown},
            {"inferred", inferred}, {"inference_failures", inferenceFailures}};
}

Classifier::Classifier(graph::GraphStore& store, extraction::InferenceClient* inference,
                       std::chrono::milliseconds inferenceTimeout)
    : store_(store), inference_(inference), inferenceTimeout_(inferenceTimeout) {}

Result<std::map<std::string, FileFacts>> Classifier::gatherFacts(const std::string& projectId) {
    std::map<std::string, FileFacts> facts;

    auto functionsR = store_.findNodes(projectId, NodeLabel::Function);
    if (!functionsR)
        return functionsR.error();
    for (const auto& node : functionsR.value())
        ++facts[model::keys::filePathOf(node.key)].functions;

    auto enumsR = store_.findNodes(projectId, NodeLabel::Enum);
    if (!enumsR)
        return enumsR.error();
    std::set<std::string> enumKeys;
    for (const auto& node : enumsR.value())
        enumKeys.insert(node.key);

    auto classesR = store_.findNodes(projectId, NodeLabel::Class);
    if (!classesR)
        return classesR.error();
    for (const auto& node : classesR.value()) {
        auto& f = facts[model::keys::filePathOf(node.key)];
        ++f.classes;
        auto cls = model::ClassRecord::fromProperties(node.properties);
        bool behaviorless = std::all_of(cls.methods.begin(), cls.methods.end(),
                                        [](const auto& m) { return isDunder(m); });
        if (enumKeys.count(node.key) || (behaviorless && !cls.attributes.empty()))
            ++f.dataClasses;
    }

    graph::EdgeFilter filter;
    filter.relation = Relation::DependsOn;
    auto depsR = store_.findEdges(projectId, filter);
    if (!depsR)
        return depsR.error();
    for (const auto& edge : depsR.value()) {
        auto& deps = facts[edge.from.key].dependencies;
        auto name = edge.to.key.substr(edge.to.key.find(':') + 1);
        if (std::find(deps.begin(), deps.end(), name) == deps.end())
            deps.push_back(std::move(name));
    }
    return facts;
}

Result<ClassificationStats> Classifier::classify(const std::string& projectId) {
    auto filesR = store_.findNodes(projectId, NodeLabel::File);
    if (!filesR)
        return filesR.error();
    auto factsR = gatherFacts(projectId);
    if (!factsR)
        return factsR.error();
    auto& facts = factsR.value();

    ClassificationStats stats;
    WriteBatch batch;
    for (const auto& node : filesR.value()) {
        auto file = model::FileRecord::fromProperties(node.properties);
        const auto& fileFacts = facts[node.key];
        auto c = classifyByRules(file, fileFacts);

        if (c.ambiguous && inference_) {
            extraction::InferenceRequest request{
                "classify",
                projectId,
                file.path,
                file.language,
                {{"rule_type", model::toString(c.type)},
                 {"signals", c.signals},
                 {"functions", fileFacts.functions},
                 {"classes", fileFacts.classes},
                 {"dependencies", fileFacts.dependencies}}};
            auto inferR = inference_->infer(request, inferenceTimeout_);
            std::optional<ComponentType> type;
            if (inferR)
                type = inferredType(inferR.value());
            if (type) {
                c.type = *type;
                c.provenance = Provenance::Inferred;
                c.signals.push_back("inference");
                ++stats.inferred;
            } else {
                ++stats.inferenceFailures;
                auto error = inferR ? Error{ErrorCode::InferenceUnavailable,
                                            "Inference returned no component type"}
                                    : inferR.error();
                spdlog::warn("Classification inference for {} failed: {}", file.path,
                             error.message);
                graph::addFeedback(batch, projectId,
                                   graph::makeReport("inference_failed", error.message,
                                                     "classify:" + file.path,
                                                     {{"path", file.path}, {"task", "classify"}},
                                                     error.code));
            }
        }

        model::ComponentRecord component;
        component.filePath = file.path;
        component.type = c.type;
        component.signals = c.signals;
        component.provenance = c.provenance;
        const auto componentKey = model::keys::component(file.path);
        batch.upsertNode(NodeLabel::Component, componentKey, component.toProperties());
        batch.replaceEdge(Relation::ClassifiesAs, node.ref(),
                          {NodeLabel::Component, componentKey});

        ++stats.files;
        switch (c.type) {
            case ComponentType::Ui: ++stats.ui; break;
            case ComponentType::Logic: ++stats.logic; break;
            case ComponentType::Data: ++stats.data; break;
            case ComponentType::Config: ++stats.config; break;
            case ComponentType::Unknown: ++stats.unknown; break;
        }
        spdlog::debug("Classified {} as {} ({} signals)", file.path, model::toString(c.type),
                      c.signals.size());
    }

    graph::addReport(batch, projectId,
                     graph::makeReport("classification",
                                       fmt::format("Classified {} files", stats.files), projectId,
                                       stats.toJson()));
    auto applyR = store_.apply(projectId, batch);
    if (!applyR)
        return applyR.error();

    spdlog::info("Classification of {}: {} ui, {} logic, {} data, {} config, {} unknown",
                 projectId, stats.ui, stats.logic, stats.data, stats.config, stats.unknown);
    return stats;
}

} // namespace cartograph::analysis
