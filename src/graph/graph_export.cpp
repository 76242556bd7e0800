#include <cartograph/graph/graph_export.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <set>
#include <system_error>
#include <utility>

namespace cartograph::graph {

using nlohmann::json;

namespace {

template <typename T> bool allowed(const std::vector<T>& filter, T value) {
    return filter.empty() || std::find(filter.begin(), filter.end(), value) != filter.end();
}

json refJson(const NodeRef& ref) {
    return {{"label", model::toString(ref.label)}, {"key", ref.key}};
}

Result<NodeRef> refFromJson(const json& j) {
    if (!j.is_object() || !j.contains("label") || !j.contains("key"))
        return Error{ErrorCode::InvalidData, "Edge endpoint needs label and key"};
    auto label = model::parseNodeLabel(model::property<std::string>(j, "label", ""));
    if (!label)
        return Error{ErrorCode::InvalidData, "Unknown node label " + j["label"].dump()};
    auto key = model::property<std::string>(j, "key", "");
    if (key.empty())
        return Error{ErrorCode::InvalidData, "Edge endpoint key must be a non-empty string"};
    return NodeRef{*label, std::move(key)};
}

std::string csvField(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

Result<void> writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorCode::PermissionDenied, "Cannot write " + path.string()};
    out << content;
    if (!out)
        return Error{ErrorCode::InternalError, "Short write to " + path.string()};
    return Result<void>();
}

} // namespace

Result<json> exportJson(GraphStore& store, const std::string& projectId,
                        const ExportFilter& filter) {
    auto project = store.getProject(projectId);
    if (!project)
        return project.error();

    auto nodes = store.findNodes(projectId, std::nullopt);
    if (!nodes)
        return nodes.error();
    auto edges = store.findEdges(projectId);
    if (!edges)
        return edges.error();

    json doc = {{"project", projectId}, {"nodes", json::array()}, {"edges", json::array()}};
    for (const auto& n : nodes.value()) {
        if (!allowed(filter.labels, n.label))
            continue;
        doc["nodes"].push_back(
            {{"label", model::toString(n.label)}, {"key", n.key}, {"properties", n.properties}});
    }
    for (const auto& e : edges.value()) {
        if (!allowed(filter.relations, e.relation) || !allowed(filter.labels, e.from.label) ||
            !allowed(filter.labels, e.to.label)) {
            continue;
        }
        doc["edges"].push_back({{"relation", model::toString(e.relation)},
                                {"from", refJson(e.from)},
                                {"to", refJson(e.to)},
                                {"properties", e.properties}});
    }
    spdlog::debug("Exported project {}: {} nodes, {} edges", projectId, doc["nodes"].size(),
                  doc["edges"].size());
    return doc;
}

Result<void> exportCsv(GraphStore& store, const std::string& projectId,
                       const std::filesystem::path& dir, const ExportFilter& filter) {
    auto doc = exportJson(store, projectId, filter);
    if (!doc)
        return doc.error();

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create " + dir.string() + ": " + ec.message()};

    std::string nodesCsv = "label,key,properties\n";
    for (const auto& n : doc.value()["nodes"]) {
        nodesCsv += csvField(n["label"].get<std::string>()) + "," +
                    csvField(n["key"].get<std::string>()) + "," + csvField(n["properties"].dump()) +
                    "\n";
    }
    std::string edgesCsv = "relation,from_label,from_key,to_label,to_key,properties\n";
    for (const auto& e : doc.value()["edges"]) {
        edgesCsv += csvField(e["relation"].get<std::string>()) + "," +
                    csvField(e["from"]["label"].get<std::string>()) + "," +
                    csvField(e["from"]["key"].get<std::string>()) + "," +
                    csvField(e["to"]["label"].get<std::string>()) + "," +
                    csvField(e["to"]["key"].get<std::string>()) + "," +
                    csvField(e["properties"].dump()) + "\n";
    }

    auto r = writeFile(dir / "nodes.csv", nodesCsv);
    if (!r)
        return r;
    return writeFile(dir / "edges.csv", edgesCsv);
}

Result<std::string> importJson(GraphStore& store, const json& doc,
                               const std::optional<std::string>& projectId) {
    if (!doc.is_object() || !doc.contains("nodes") || !doc["nodes"].is_array())
        return Error{ErrorCode::InvalidData, "Graph document needs a 'nodes' array"};
    if (doc.contains("edges") && !doc["edges"].is_array())
        return Error{ErrorCode::InvalidData, "Graph document 'edges' must be an array"};

    const std::string named = model::property<std::string>(doc, "project", "");
    std::string target = projectId.value_or(named);
    if (target.empty())
        return Error{ErrorCode::InvalidData, "Graph document names no project"};
    const std::string source = named.empty() ? target : named;

    auto remap = [&](NodeRef ref) {
        if (ref.label == NodeLabel::Project && ref.key == source)
            ref.key = target;
        return ref;
    };

    // Validate the whole document before anything is written
    WriteBatch batch;
    std::optional<json> projectProps;
    for (const auto& n : doc["nodes"]) {
        if (!n.is_object())
            return Error{ErrorCode::InvalidData, "Graph node is not an object: " + n.dump()};
        auto label = model::parseNodeLabel(model::property<std::string>(n, "label", ""));
        if (!label)
            return Error{ErrorCode::InvalidData, "Unknown node label in " + n.dump()};
        auto key = model::property<std::string>(n, "key", "");
        if (key.empty())
            return Error{ErrorCode::InvalidData, "Graph node without a key: " + n.dump()};
        json props = n.contains("properties") ? n["properties"] : json::object();
        if (!props.is_object())
            return Error{ErrorCode::InvalidData, "Node properties must be an object: " + n.dump()};
        if (*label == NodeLabel::Project) {
            if (key == source)
                projectProps = std::move(props);
            continue;
        }
        props["project_id"] = target;
        batch.upsertNode(*label, key, std::move(props));
    }
    if (doc.contains("edges")) {
        for (const auto& e : doc["edges"]) {
            if (!e.is_object())
                return Error{ErrorCode::InvalidData, "Graph edge is not an object: " + e.dump()};
            auto rel = model::parseRelation(model::property<std::string>(e, "relation", ""));
            if (!rel)
                return Error{ErrorCode::InvalidData, "Unknown relation in " + e.dump()};
            auto from = refFromJson(e.contains("from") ? e["from"] : json::object());
            if (!from)
                return from.error();
            auto to = refFromJson(e.contains("to") ? e["to"] : json::object());
            if (!to)
                return to.error();
            json props = e.contains("properties") ? e["properties"] : json::object();
            if (!props.is_object())
                return Error{ErrorCode::InvalidData,
                             "Edge properties must be an object: " + e.dump()};
            batch.upsertEdge(*rel, remap(from.value()), remap(to.value()), std::move(props));
        }
    }

    auto existing = store.getProject(target);
    if (!existing && existing.error().code != ErrorCode::NotFound)
        return existing.error();
    const bool created = !existing;
    if (created) {
        model::ProjectRecord rec;
        if (projectProps)
            rec = model::ProjectRecord::fromProperties(target, *projectProps);
        rec.id = target;
        auto createdR = store.createProject(rec);
        if (!createdR)
            return createdR.error();
    }

    auto r = store.apply(target, batch);
    if (!r) {
        if (created) {
            if (auto purged = store.purgeProject(target); !purged) {
                spdlog::warn("Could not remove partially imported project {}: {}", target,
                             purged.error().message);
            }
        }
        return r.error();
    }
    spdlog::info("Imported {} graph operations into project {}", batch.size(), target);
    return target;
}

} // namespace cartograph::graph
