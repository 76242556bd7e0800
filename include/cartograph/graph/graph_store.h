#pragma once

#include <cartograph/core/types.h>
#include <cartograph/graph/connection_pool.h>
#include <cartograph/model/entities.h>
#include <cartograph/model/schema.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cartograph::graph {

using model::NodeLabel;
using model::Relation;

/// Natural-key reference to a node within one project.
struct NodeRef {
    NodeLabel label{NodeLabel::File};
    std::string key;

    bool operator==(const NodeRef& other) const {
        return label == other.label && key == other.key;
    }
};

struct GraphNode {
    NodeId id{0};
    std::string projectId;
    NodeLabel label{NodeLabel::File};
    std::string key;
    nlohmann::json properties = nlohmann::json::object();
    int64_t createdAt{0};
    int64_t updatedAt{0};

    NodeRef ref() const { return {label, key}; }
};

struct GraphEdge {
    NodeId id{0};
    Relation relation{Relation::Contains};
    NodeRef from;
    NodeRef to;
    nlohmann::json properties = nlohmann::json::object();
};

/**
 * @brief Tentative cross-file edge recorded during extraction.
 *
 * `target` is the raw reference text (module name or path); `candidates` lists the
 * project-relative paths that would satisfy it, in preference order.
 */
struct PendingEdge {
    NodeRef source;
    Relation relation{Relation::Imports};
    std::string target;
    std::vector<std::string> candidates;
    nlohmann::json properties = nlohmann::json::object();
};

/// Edge lookup filter; unset members match anything.
struct EdgeFilter {
    std::optional<Relation> relation;
    std::optional<NodeRef> from;
    std::optional<NodeRef> to;
    std::optional<NodeLabel> fromLabel;
    std::optional<NodeLabel> toLabel;
};

/**
 * @brief Variable-length traversal pattern.
 *
 * Matches (from)-[relations*minHops..maxHops]->(to). An empty relation list follows
 * every relation kind. Traversal is cycle-safe; each (from, to) pair is reported once
 * with its shortest hop count.
 */
struct GraphPattern {
    std::optional<NodeLabel> fromLabel;
    std::optional<std::string> fromKey;
    std::vector<Relation> relations;
    std::optional<NodeLabel> toLabel;
    int minHops = 1;
    int maxHops = 1;
    std::size_t limit = 0; // 0 = unlimited
};

struct PatternMatch {
    NodeRef from;
    NodeRef to;
    int hops{0};
};

/// Upper bound on GraphPattern::maxHops.
inline constexpr int kMaxTraversalHops = 32;

/**
 * @brief Ordered set of writes applied as one transaction.
 *
 * Extraction builds one batch per file so a file's node and all of its derived
 * entities land together or not at all.
 */
class WriteBatch {
public:
    struct NodeOp {
        NodeLabel label;
        std::string key;
        nlohmann::json properties;
    };
    struct EdgeOp {
        Relation relation;
        NodeRef from;
        NodeRef to;
        nlohmann::json properties;
        // Drop other edges of this relation leaving `from` first
        bool replace = false;
    };
    struct RemoveEdgesOp {
        NodeRef from;
        Relation relation;
    };
    struct PendingOp {
        PendingEdge edge;
    };
    struct ClearPendingOp {};

    using Op = std::variant<NodeOp, EdgeOp, RemoveEdgesOp, PendingOp, ClearPendingOp>;

    WriteBatch& upsertNode(NodeLabel label, std::string key,
                           nlohmann::json properties = nlohmann::json::object());
    WriteBatch& upsertEdge(Relation relation, NodeRef from, NodeRef to,
                           nlohmann::json properties = nlohmann::json::object());
    WriteBatch& replaceEdge(Relation relation, NodeRef from, NodeRef to,
                            nlohmann::json properties = nlohmann::json::object());
    WriteBatch& removeEdgesFrom(NodeRef from, Relation relation);
    WriteBatch& addPending(PendingEdge edge);
    WriteBatch& clearPending();

    const std::vector<Op>& ops() const { return ops_; }
    std::size_t size() const { return ops_.size(); }
    bool empty() const { return ops_.empty(); }

private:
    std::vector<Op> ops_;
};

/**
 * @brief Project-scoped property graph store.
 *
 * Every operation takes the owning project id; nodes are unique per
 * (project, label, natural key). Node upserts merge properties (last write wins per
 * top-level key, `_provenance` merged per field). Errors: StoreUnavailable when the
 * backend is busy or unreachable (retryable), ConstraintViolation for invariant
 * breaches such as an edge endpoint that does not exist.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // Projects
    virtual Result<model::ProjectRecord> createProject(const model::ProjectRecord& project) = 0;
    virtual Result<model::ProjectRecord> getProject(const std::string& projectId) = 0;
    virtual Result<void> updateProject(const model::ProjectRecord& project) = 0;
    virtual Result<std::vector<model::ProjectRecord>> listProjects() = 0;
    /// Remove the whole subgraph, pending edges included.
    virtual Result<void> purgeProject(const std::string& projectId) = 0;

    // Writes
    virtual Result<NodeId> upsertNode(const std::string& projectId, NodeLabel label,
                                      const std::string& key,
                                      const nlohmann::json& properties) = 0;
    virtual Result<void> upsertEdge(const std::string& projectId, Relation relation,
                                    const NodeRef& from, const NodeRef& to,
                                    const nlohmann::json& properties = nlohmann::json::object()) = 0;
    virtual Result<void> replaceEdge(const std::string& projectId, Relation relation,
                                     const NodeRef& from, const NodeRef& to,
                                     const nlohmann::json& properties = nlohmann::json::object()) = 0;
    virtual Result<void> apply(const std::string& projectId, const WriteBatch& batch) = 0;

    // Reads
    virtual Result<std::optional<GraphNode>> getNode(const std::string& projectId, NodeLabel label,
                                                     const std::string& key) = 0;
    /// Nodes ordered by insertion; `filter` keys must equal the node's property values.
    virtual Result<std::vector<GraphNode>>
    findNodes(const std::string& projectId, std::optional<NodeLabel> label,
              const nlohmann::json& filter = nlohmann::json::object()) = 0;
    virtual Result<std::vector<GraphEdge>> findEdges(const std::string& projectId,
                                                     const EdgeFilter& filter = {}) = 0;
    virtual Result<std::vector<PatternMatch>> query(const std::string& projectId,
                                                    const GraphPattern& pattern) = 0;
    virtual Result<int64_t> countNodes(const std::string& projectId,
                                       std::optional<NodeLabel> label = std::nullopt) = 0;
    virtual Result<int64_t> countEdges(const std::string& projectId,
                                       std::optional<Relation> relation = std::nullopt) = 0;

    // Tentative edges
    virtual Result<std::vector<PendingEdge>> pendingEdges(const std::string& projectId) = 0;
    virtual Result<void> clearPending(const std::string& projectId) = 0;
};

struct SqliteGraphStoreConfig {
    ConnectionPoolConfig pool;
};

/// SQLite store owning its pool; creates and migrates the schema at `dbPath`.
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(const std::string& dbPath,
                                                         const SqliteGraphStoreConfig& cfg = {});

/// SQLite store over an external, already migrated pool (non-owning).
Result<std::unique_ptr<GraphStore>> makeSqliteGraphStore(ConnectionPool& pool);

} // namespace cartograph::graph
