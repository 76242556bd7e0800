#include <cartograph/core/uuid.h>
#include <cartograph/graph/connection_pool.h>
#include <cartograph/graph/database.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/graph/migration.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cartograph::graph {

using nlohmann::json;
using model::ProjectRecord;

// WriteBatch

WriteBatch& WriteBatch::upsertNode(NodeLabel label, std::string key, json properties) {
    ops_.emplace_back(NodeOp{label, std::move(key), std::move(properties)});
    return *this;
}

WriteBatch& WriteBatch::upsertEdge(Relation relation, NodeRef from, NodeRef to, json properties) {
    ops_.emplace_back(EdgeOp{relation, std::move(from), std::move(to), std::move(properties), false});
    return *this;
}

WriteBatch& WriteBatch::replaceEdge(Relation relation, NodeRef from, NodeRef to, json properties) {
    ops_.emplace_back(EdgeOp{relation, std::move(from), std::move(to), std::move(properties), true});
    return *this;
}

WriteBatch& WriteBatch::removeEdgesFrom(NodeRef from, Relation relation) {
    ops_.emplace_back(RemoveEdgesOp{std::move(from), relation});
    return *this;
}

WriteBatch& WriteBatch::addPending(PendingEdge edge) {
    ops_.emplace_back(PendingOp{std::move(edge)});
    return *this;
}

WriteBatch& WriteBatch::clearPending() {
    ops_.emplace_back(ClearPendingOp{});
    return *this;
}

namespace {

ConnectionPoolConfig toPoolConfig(const SqliteGraphStoreConfig& cfg) {
    ConnectionPoolConfig pcfg = cfg.pool;
    pcfg.enableForeignKeys = true;
    return pcfg;
}

Result<json> parseProperties(const std::string& text) {
    if (text.empty())
        return json::object();
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("Corrupt property bag: ") + e.what()};
    }
}

Result<NodeLabel> labelColumn(const std::string& s) {
    auto label = model::parseNodeLabel(s);
    if (!label)
        return Error{ErrorCode::InvalidData, "Unknown node label '" + s + "'"};
    return *label;
}

Result<Relation> relationColumn(const std::string& s) {
    auto rel = model::parseRelation(s);
    if (!rel)
        return Error{ErrorCode::InvalidData, "Unknown relation '" + s + "'"};
    return *rel;
}

bool matchesFilter(const json& props, const json& filter) {
    if (!filter.is_object())
        return true;
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        auto p = props.find(it.key());
        if (p == props.end() || *p != it.value())
            return false;
    }
    return true;
}

// Top-level keys: last write wins. `_provenance`: merged per field.
// `created_at` keeps the first value and `occurrences` accumulates.
void mergeProperties(json& existing, const json& incoming) {
    for (auto it = incoming.begin(); it != incoming.end(); ++it) {
        auto current = existing.find(it.key());
        if (it.key() == "created_at" && current != existing.end() && current->is_string() &&
            !current->get<std::string>().empty()) {
            continue;
        }
        if (it.key() == "occurrences" && it->is_number_integer() && current != existing.end() &&
            current->is_number_integer()) {
            *current = current->get<int64_t>() + it->get<int64_t>();
            continue;
        }
        if (it.key() == "_provenance" && it->is_object()) {
            auto& prov = existing["_provenance"];
            if (!prov.is_object())
                prov = json::object();
            prov.update(*it);
        } else {
            existing[it.key()] = *it;
        }
    }
}

std::string placeholders(std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) {
        out += (i == 0 ? "?" : ", ?");
    }
    return out;
}

std::string refText(const NodeRef& ref) {
    return std::string(model::toString(ref.label)) + " '" + ref.key + "'";
}

} // namespace

class SqliteGraphStore final : public GraphStore {
public:
    explicit SqliteGraphStore(ConnectionPool& pool) : pool_(&pool) {}

    static Result<std::unique_ptr<SqliteGraphStore>> createWithPath(const std::string& dbPath,
                                                                    const SqliteGraphStoreConfig& cfg) {
        // 1) Create and migrate the schema on a dedicated connection
        {
            Database db;
            auto rOpen = db.open(dbPath, ConnectionMode::Create);
            if (!rOpen)
                return rOpen.error();

            if (cfg.pool.enableWAL) {
                auto rWal = db.enableWAL();
                if (!rWal)
                    spdlog::warn("enableWAL failed during graph store init: {}", rWal.error().message);
            }
            auto rFK = db.execute("PRAGMA foreign_keys = ON");
            if (!rFK)
                return rFK.error();

            MigrationManager mm(db);
            auto rInit = mm.initialize();
            if (!rInit)
                return rInit.error();
            mm.registerMigrations(GraphSchemaMigrations::getAllMigrations());
            auto rMig = mm.migrate();
            if (!rMig)
                return rMig.error();
        }

        // 2) Pool for ongoing operations
        auto pool = std::make_unique<ConnectionPool>(dbPath, toPoolConfig(cfg));
        auto rInit = pool->initialize();
        if (!rInit)
            return rInit.error();

        auto store = std::make_unique<SqliteGraphStore>(*pool);
        store->ownedPool_ = std::move(pool);
        return store;
    }

    // Projects

    Result<ProjectRecord> createProject(const ProjectRecord& project) override {
        if (project.id.empty())
            return Error{ErrorCode::InvalidArgument, "Project id must not be empty"};

        ProjectRecord rec = project;
        auto now = core::isoNow();
        if (rec.createdAt.empty())
            rec.createdAt = now;
        rec.updatedAt = now;

        auto r = pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto existing = lookupNodeId(db, rec.id, NodeLabel::Project, rec.id);
                if (!existing)
                    return existing.error();
                if (existing.value())
                    return Error{ErrorCode::ConstraintViolation,
                                 "Project '" + rec.id + "' already exists"};
                auto up = upsertNodeTx(db, rec.id, NodeLabel::Project, rec.id, rec.toProperties());
                if (!up)
                    return up.error();
                return Result<void>();
            });
        });
        if (!r)
            return r.error();
        spdlog::debug("Created project {} rooted at {}", rec.id, rec.rootPath);
        return rec;
    }

    Result<ProjectRecord> getProject(const std::string& projectId) override {
        auto node = getNode(projectId, NodeLabel::Project, projectId);
        if (!node)
            return node.error();
        if (!node.value())
            return Error{ErrorCode::NotFound, "Project '" + projectId + "' not found"};
        return ProjectRecord::fromProperties(projectId, node.value()->properties);
    }

    Result<void> updateProject(const ProjectRecord& project) override {
        ProjectRecord rec = project;
        rec.updatedAt = core::isoNow();
        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                auto existing = lookupNodeId(db, rec.id, NodeLabel::Project, rec.id);
                if (!existing)
                    return existing.error();
                if (!existing.value())
                    return Error{ErrorCode::NotFound, "Project '" + rec.id + "' not found"};
                auto up = upsertNodeTx(db, rec.id, NodeLabel::Project, rec.id, rec.toProperties());
                if (!up)
                    return up.error();
                return Result<void>();
            });
        });
    }

    Result<std::vector<ProjectRecord>> listProjects() override {
        return pool_->withConnection([&](Database& db) -> Result<std::vector<ProjectRecord>> {
            auto stmtR = db.prepare("SELECT node_key, properties FROM graph_nodes "
                                    "WHERE label = 'Project' AND project_id = node_key "
                                    "ORDER BY created_at, id");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();

            std::vector<ProjectRecord> out;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto props = parseProperties(stmt.getString(1));
                if (!props)
                    return props.error();
                out.push_back(ProjectRecord::fromProperties(stmt.getString(0), props.value()));
            }
            return out;
        });
    }

    Result<void> purgeProject(const std::string& projectId) override {
        auto r = pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                for (const char* sql : {"DELETE FROM pending_edges WHERE project_id = ?",
                                        "DELETE FROM graph_edges WHERE project_id = ?",
                                        "DELETE FROM graph_nodes WHERE project_id = ?"}) {
                    auto stmtR = db.prepare(sql);
                    if (!stmtR)
                        return stmtR.error();
                    auto stmt = std::move(stmtR).value();
                    auto br = stmt.bind(1, projectId);
                    if (!br)
                        return br;
                    auto er = stmt.execute();
                    if (!er)
                        return er;
                }
                return Result<void>();
            });
        });
        if (r)
            spdlog::info("Purged project {}", projectId);
        return r;
    }

    // Writes

    Result<NodeId> upsertNode(const std::string& projectId, NodeLabel label, const std::string& key,
                              const json& properties) override {
        NodeId id = 0;
        auto r = pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                if (label != NodeLabel::Project) {
                    auto pr = requireProject(db, projectId);
                    if (!pr)
                        return pr;
                }
                auto up = upsertNodeTx(db, projectId, label, key, properties);
                if (!up)
                    return up.error();
                id = up.value();
                return Result<void>();
            });
        });
        if (!r)
            return r.error();
        return id;
    }

    Result<void> upsertEdge(const std::string& projectId, Relation relation, const NodeRef& from,
                            const NodeRef& to, const json& properties) override {
        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                return upsertEdgeTx(db, projectId, relation, from, to, properties, false);
            });
        });
    }

    Result<void> replaceEdge(const std::string& projectId, Relation relation, const NodeRef& from,
                             const NodeRef& to, const json& properties) override {
        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                return upsertEdgeTx(db, projectId, relation, from, to, properties, true);
            });
        });
    }

    Result<void> apply(const std::string& projectId, const WriteBatch& batch) override {
        if (batch.empty())
            return Result<void>();

        return pool_->withConnection([&](Database& db) -> Result<void> {
            return db.transaction([&]() -> Result<void> {
                bool createsProject = std::any_of(
                    batch.ops().begin(), batch.ops().end(), [&](const WriteBatch::Op& op) {
                        const auto* n = std::get_if<WriteBatch::NodeOp>(&op);
                        return n && n->label == NodeLabel::Project && n->key == projectId;
                    });
                if (!createsProject) {
                    auto pr = requireProject(db, projectId);
                    if (!pr)
                        return pr;
                }

                for (const auto& op : batch.ops()) {
                    Result<void> r;
                    if (const auto* n = std::get_if<WriteBatch::NodeOp>(&op)) {
                        auto up = upsertNodeTx(db, projectId, n->label, n->key, n->properties);
                        if (!up)
                            r = up.error();
                    } else if (const auto* e = std::get_if<WriteBatch::EdgeOp>(&op)) {
                        r = upsertEdgeTx(db, projectId, e->relation, e->from, e->to, e->properties,
                                         e->replace);
                    } else if (const auto* rm = std::get_if<WriteBatch::RemoveEdgesOp>(&op)) {
                        r = removeEdgesTx(db, projectId, rm->from, rm->relation, std::nullopt);
                    } else if (const auto* p = std::get_if<WriteBatch::PendingOp>(&op)) {
                        r = addPendingTx(db, projectId, p->edge);
                    } else {
                        r = clearPendingTx(db, projectId);
                    }
                    if (!r)
                        return r;
                }
                return Result<void>();
            });
        });
    }

    // Reads

    Result<std::optional<GraphNode>> getNode(const std::string& projectId, NodeLabel label,
                                             const std::string& key) override {
        return pool_->withConnection([&](Database& db) -> Result<std::optional<GraphNode>> {
            auto stmtR = db.prepare("SELECT id, label, node_key, properties, created_at, updated_at "
                                    "FROM graph_nodes WHERE project_id = ? AND label = ? "
                                    "AND node_key = ?");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bindAll(projectId, model::toString(label), key);
            if (!br)
                return br.error();

            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                return std::optional<GraphNode>{};
            auto node = readNode(stmt, projectId);
            if (!node)
                return node.error();
            return std::optional<GraphNode>(std::move(node).value());
        });
    }

    Result<std::vector<GraphNode>> findNodes(const std::string& projectId,
                                             std::optional<NodeLabel> label,
                                             const json& filter) override {
        return pool_->withConnection([&](Database& db) -> Result<std::vector<GraphNode>> {
            std::string sql = "SELECT id, label, node_key, properties, created_at, updated_at "
                              "FROM graph_nodes WHERE project_id = ?";
            if (label)
                sql += " AND label = ?";
            sql += " ORDER BY id";

            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, projectId);
            if (br && label)
                br = stmt.bind(2, model::toString(*label));
            if (!br)
                return br.error();

            std::vector<GraphNode> out;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto node = readNode(stmt, projectId);
                if (!node)
                    return node.error();
                if (matchesFilter(node.value().properties, filter))
                    out.push_back(std::move(node).value());
            }
            return out;
        });
    }

    Result<std::vector<GraphEdge>> findEdges(const std::string& projectId,
                                             const EdgeFilter& filter) override {
        return pool_->withConnection([&](Database& db) -> Result<std::vector<GraphEdge>> {
            std::string sql = "SELECT e.id, e.relation, s.label, s.node_key, d.label, d.node_key, "
                              "e.properties FROM graph_edges e "
                              "JOIN graph_nodes s ON s.id = e.src_node_id "
                              "JOIN graph_nodes d ON d.id = e.dst_node_id "
                              "WHERE e.project_id = ?";
            std::vector<std::string> params{projectId};
            if (filter.relation) {
                sql += " AND e.relation = ?";
                params.emplace_back(model::toString(*filter.relation));
            }
            if (filter.from) {
                sql += " AND s.label = ? AND s.node_key = ?";
                params.emplace_back(model::toString(filter.from->label));
                params.push_back(filter.from->key);
            }
            if (filter.to) {
                sql += " AND d.label = ? AND d.node_key = ?";
                params.emplace_back(model::toString(filter.to->label));
                params.push_back(filter.to->key);
            }
            if (filter.fromLabel) {
                sql += " AND s.label = ?";
                params.emplace_back(model::toString(*filter.fromLabel));
            }
            if (filter.toLabel) {
                sql += " AND d.label = ?";
                params.emplace_back(model::toString(*filter.toLabel));
            }
            sql += " ORDER BY e.id";

            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            for (std::size_t i = 0; i < params.size(); ++i) {
                auto br = stmt.bind(static_cast<int>(i + 1), params[i]);
                if (!br)
                    return br.error();
            }

            std::vector<GraphEdge> out;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto rel = relationColumn(stmt.getString(1));
                auto srcLabel = labelColumn(stmt.getString(2));
                auto dstLabel = labelColumn(stmt.getString(4));
                auto props = parseProperties(stmt.getString(6));
                if (!rel)
                    return rel.error();
                if (!srcLabel)
                    return srcLabel.error();
                if (!dstLabel)
                    return dstLabel.error();
                if (!props)
                    return props.error();

                GraphEdge edge;
                edge.id = stmt.getInt64(0);
                edge.relation = rel.value();
                edge.from = {srcLabel.value(), stmt.getString(3)};
                edge.to = {dstLabel.value(), stmt.getString(5)};
                edge.properties = std::move(props).value();
                out.push_back(std::move(edge));
            }
            return out;
        });
    }

    Result<std::vector<PatternMatch>> query(const std::string& projectId,
                                            const GraphPattern& pattern) override {
        if (pattern.minHops < 0 || pattern.maxHops < 1 || pattern.minHops > pattern.maxHops ||
            pattern.maxHops > kMaxTraversalHops) {
            return Error{ErrorCode::InvalidArgument,
                         "Traversal hops must satisfy 0 <= min <= max <= " +
                             std::to_string(kMaxTraversalHops)};
        }

        return pool_->withConnection([&](Database& db) -> Result<std::vector<PatternMatch>> {
            // UNION over (start, node, depth) keeps the recursion finite on cyclic graphs
            std::string sql = "WITH RECURSIVE walk(start_id, node_id, depth) AS ("
                              " SELECT n.id, n.id, 0 FROM graph_nodes n WHERE n.project_id = ?";
            std::vector<std::string> params{projectId};
            if (pattern.fromLabel) {
                sql += " AND n.label = ?";
                params.emplace_back(model::toString(*pattern.fromLabel));
            }
            if (pattern.fromKey) {
                sql += " AND n.node_key = ?";
                params.push_back(*pattern.fromKey);
            }
            sql += " UNION SELECT w.start_id, e.dst_node_id, w.depth + 1 FROM walk w"
                   " JOIN graph_edges e ON e.src_node_id = w.node_id"
                   " WHERE w.depth < " +
                   std::to_string(pattern.maxHops);
            if (!pattern.relations.empty()) {
                sql += " AND e.relation IN (" + placeholders(pattern.relations.size()) + ")";
                for (auto rel : pattern.relations)
                    params.emplace_back(model::toString(rel));
            }
            sql += ") SELECT s.label, s.node_key, d.label, d.node_key, MIN(w.depth) AS hops"
                   " FROM walk w JOIN graph_nodes s ON s.id = w.start_id"
                   " JOIN graph_nodes d ON d.id = w.node_id"
                   " WHERE w.depth >= " +
                   std::to_string(pattern.minHops);
            if (pattern.toLabel) {
                sql += " AND d.label = ?";
                params.emplace_back(model::toString(*pattern.toLabel));
            }
            sql += " GROUP BY w.start_id, w.node_id ORDER BY s.node_key, hops, d.node_key";
            if (pattern.limit > 0)
                sql += " LIMIT " + std::to_string(pattern.limit);

            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            for (std::size_t i = 0; i < params.size(); ++i) {
                auto br = stmt.bind(static_cast<int>(i + 1), params[i]);
                if (!br)
                    return br.error();
            }

            std::vector<PatternMatch> out;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto srcLabel = labelColumn(stmt.getString(0));
                auto dstLabel = labelColumn(stmt.getString(2));
                if (!srcLabel)
                    return srcLabel.error();
                if (!dstLabel)
                    return dstLabel.error();
                out.push_back({{srcLabel.value(), stmt.getString(1)},
                               {dstLabel.value(), stmt.getString(3)},
                               stmt.getInt(4)});
            }
            return out;
        });
    }

    Result<int64_t> countNodes(const std::string& projectId,
                               std::optional<NodeLabel> label) override {
        std::string sql = "SELECT COUNT(*) FROM graph_nodes WHERE project_id = ?";
        if (label)
            sql += " AND label = ?";
        return count(sql, projectId, label ? model::toString(*label) : nullptr);
    }

    Result<int64_t> countEdges(const std::string& projectId,
                               std::optional<Relation> relation) override {
        std::string sql = "SELECT COUNT(*) FROM graph_edges WHERE project_id = ?";
        if (relation)
            sql += " AND relation = ?";
        return count(sql, projectId, relation ? model::toString(*relation) : nullptr);
    }

    Result<std::vector<PendingEdge>> pendingEdges(const std::string& projectId) override {
        return pool_->withConnection([&](Database& db) -> Result<std::vector<PendingEdge>> {
            auto stmtR = db.prepare("SELECT src_label, src_key, relation, target, candidates, "
                                    "properties FROM pending_edges WHERE project_id = ? "
                                    "ORDER BY src_key, relation, target");
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, projectId);
            if (!br)
                return br.error();

            std::vector<PendingEdge> out;
            while (true) {
                auto step = stmt.step();
                if (!step)
                    return step.error();
                if (!step.value())
                    break;
                auto srcLabel = labelColumn(stmt.getString(0));
                auto rel = relationColumn(stmt.getString(2));
                auto candidates = parseProperties(stmt.getString(4));
                auto props = parseProperties(stmt.getString(5));
                if (!srcLabel)
                    return srcLabel.error();
                if (!rel)
                    return rel.error();
                if (!candidates)
                    return candidates.error();
                if (!props)
                    return props.error();

                PendingEdge p;
                p.source = {srcLabel.value(), stmt.getString(1)};
                p.relation = rel.value();
                p.target = stmt.getString(3);
                for (const auto& c : candidates.value()) {
                    if (c.is_string())
                        p.candidates.push_back(c.get<std::string>());
                }
                p.properties = std::move(props).value();
                out.push_back(std::move(p));
            }
            return out;
        });
    }

    Result<void> clearPending(const std::string& projectId) override {
        return pool_->withConnection(
            [&](Database& db) -> Result<void> { return clearPendingTx(db, projectId); });
    }

private:
    ConnectionPool* pool_{nullptr};                // Non-owning
    std::unique_ptr<ConnectionPool> ownedPool_;    // Owns pool when created from path

    Result<int64_t> count(const std::string& sql, const std::string& projectId, const char* arg) {
        return pool_->withConnection([&](Database& db) -> Result<int64_t> {
            auto stmtR = db.prepare(sql);
            if (!stmtR)
                return stmtR.error();
            auto stmt = std::move(stmtR).value();
            auto br = stmt.bind(1, projectId);
            if (br && arg)
                br = stmt.bind(2, arg);
            if (!br)
                return br.error();
            auto step = stmt.step();
            if (!step)
                return step.error();
            return step.value() ? stmt.getInt64(0) : int64_t{0};
        });
    }

    static Result<GraphNode> readNode(Statement& stmt, const std::string& projectId) {
        auto label = labelColumn(stmt.getString(1));
        if (!label)
            return label.error();
        auto props = parseProperties(stmt.getString(3));
        if (!props)
            return props.error();

        GraphNode node;
        node.id = stmt.getInt64(0);
        node.projectId = projectId;
        node.label = label.value();
        node.key = stmt.getString(2);
        node.properties = std::move(props).value();
        node.createdAt = stmt.getInt64(4);
        node.updatedAt = stmt.getInt64(5);
        return node;
    }

    static Result<std::optional<NodeId>> lookupNodeId(Database& db, const std::string& projectId,
                                                      NodeLabel label, const std::string& key) {
        auto stmtR = db.prepare(
            "SELECT id FROM graph_nodes WHERE project_id = ? AND label = ? AND node_key = ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(projectId, model::toString(label), key);
        if (!br)
            return br.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            return std::optional<NodeId>{};
        return std::optional<NodeId>(stmt.getInt64(0));
    }

    static Result<void> requireProject(Database& db, const std::string& projectId) {
        auto id = lookupNodeId(db, projectId, NodeLabel::Project, projectId);
        if (!id)
            return id.error();
        if (!id.value())
            return Error{ErrorCode::ConstraintViolation,
                         "Write to unknown project '" + projectId + "'"};
        return Result<void>();
    }

    static Result<NodeId> upsertNodeTx(Database& db, const std::string& projectId, NodeLabel label,
                                       const std::string& key, const json& properties) {
        if (key.empty())
            return Error{ErrorCode::ConstraintViolation,
                         std::string("Empty natural key for ") + model::toString(label)};
        if (!properties.is_object())
            return Error{ErrorCode::InvalidArgument, "Node properties must be a JSON object"};
        if (auto it = properties.find("project_id");
            it != properties.end() && (!it->is_string() || it->get<std::string>() != projectId)) {
            return Error{ErrorCode::ConstraintViolation,
                         "Node " + key + " carries a foreign project_id"};
        }

        auto stmtR = db.prepare("SELECT id, properties FROM graph_nodes "
                                "WHERE project_id = ? AND label = ? AND node_key = ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(projectId, model::toString(label), key);
        if (!br)
            return br.error();
        auto step = stmt.step();
        if (!step)
            return step.error();

        const int64_t now = core::unixNow();
        if (step.value()) {
            NodeId id = stmt.getInt64(0);
            auto merged = parseProperties(stmt.getString(1));
            if (!merged)
                return merged.error();
            json props = std::move(merged).value();
            mergeProperties(props, properties);
            props["project_id"] = projectId;

            auto updR = db.prepare(
                "UPDATE graph_nodes SET properties = ?, updated_at = ? WHERE id = ?");
            if (!updR)
                return updR.error();
            auto upd = std::move(updR).value();
            br = upd.bindAll(props.dump(), now, id);
            if (!br)
                return br.error();
            auto er = upd.execute();
            if (!er)
                return er.error();
            return id;
        }

        json props = properties;
        props["project_id"] = projectId;
        auto insR = db.prepare("INSERT INTO graph_nodes (project_id, label, node_key, properties, "
                               "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!insR)
            return insR.error();
        auto ins = std::move(insR).value();
        br = ins.bindAll(projectId, model::toString(label), key, props.dump(), now, now);
        if (!br)
            return br.error();
        auto er = ins.execute();
        if (!er)
            return er.error();
        return db.lastInsertRowId();
    }

    static Result<NodeId> requireNode(Database& db, const std::string& projectId,
                                      const NodeRef& ref) {
        auto id = lookupNodeId(db, projectId, ref.label, ref.key);
        if (!id)
            return id.error();
        if (!id.value())
            return Error{ErrorCode::ConstraintViolation,
                         "Edge endpoint " + refText(ref) + " does not exist"};
        return *id.value();
    }

    static Result<void> removeEdgesTx(Database& db, const std::string& projectId,
                                      const NodeRef& from, Relation relation,
                                      std::optional<NodeId> keepDst) {
        auto src = lookupNodeId(db, projectId, from.label, from.key);
        if (!src)
            return src.error();
        if (!src.value())
            return Result<void>();

        std::string sql = "DELETE FROM graph_edges WHERE src_node_id = ? AND relation = ?";
        if (keepDst)
            sql += " AND dst_node_id != ?";
        auto stmtR = db.prepare(sql);
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(*src.value(), model::toString(relation));
        if (br && keepDst)
            br = stmt.bind(3, *keepDst);
        if (!br)
            return br;
        return stmt.execute();
    }

    static Result<void> upsertEdgeTx(Database& db, const std::string& projectId, Relation relation,
                                     const NodeRef& from, const NodeRef& to, const json& properties,
                                     bool replace) {
        if (!properties.is_null() && !properties.is_object())
            return Error{ErrorCode::InvalidArgument, "Edge properties must be a JSON object"};
        if (model::isFileToFile(relation) &&
            (from.label != NodeLabel::File || to.label != NodeLabel::File)) {
            return Error{ErrorCode::ConstraintViolation,
                         std::string(model::toString(relation)) + " must connect File nodes"};
        }

        auto src = requireNode(db, projectId, from);
        if (!src)
            return src.error();
        auto dst = requireNode(db, projectId, to);
        if (!dst)
            return dst.error();

        if (replace) {
            auto rr = removeEdgesTx(db, projectId, from, relation, dst.value());
            if (!rr)
                return rr;
        }

        auto stmtR = db.prepare(
            "INSERT INTO graph_edges (project_id, src_node_id, dst_node_id, relation, properties, "
            "created_at) VALUES (?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(src_node_id, dst_node_id, relation) "
            "DO UPDATE SET properties = excluded.properties");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        std::string props = properties.is_object() ? properties.dump() : std::string("{}");
        auto br = stmt.bindAll(projectId, src.value(), dst.value(), model::toString(relation), props,
                               core::unixNow());
        if (!br)
            return br;
        return stmt.execute();
    }

    static Result<void> addPendingTx(Database& db, const std::string& projectId,
                                     const PendingEdge& edge) {
        json candidates = edge.candidates;
        auto stmtR = db.prepare("INSERT INTO pending_edges (project_id, src_label, src_key, "
                                "relation, target, candidates, properties) "
                                "VALUES (?, ?, ?, ?, ?, ?, ?) "
                                "ON CONFLICT(project_id, src_label, src_key, relation, target) "
                                "DO UPDATE SET candidates = excluded.candidates, "
                                "properties = excluded.properties");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bindAll(projectId, model::toString(edge.source.label), edge.source.key,
                               model::toString(edge.relation), edge.target, candidates.dump(),
                               edge.properties.is_object() ? edge.properties.dump()
                                                           : std::string("{}"));
        if (!br)
            return br;
        return stmt.execute();
    }

    static Result<void> clearPendingTx(Database& db, const std::string& projectId) {
        auto stmtR = db.prepare("DELETE FROM pending_edges WHERE project_id = ?");
        if (!stmtR)
            return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, projectId);
        if (!br)
            return br;
        return stmt.execute();
    }
};

Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const SqliteGraphStoreConfig& cfg) {
    auto s = SqliteGraphStore::createWithPath(dbPath, cfg);
    if (!s)
        return s.error();
    return std::unique_ptr<GraphStore>(std::move(s).value());
}

Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(ConnectionPool& pool) {
    return std::unique_ptr<GraphStore>(std::make_unique<SqliteGraphStore>(pool));
}

} // namespace cartograph::graph
