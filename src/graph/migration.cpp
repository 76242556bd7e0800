#include <cartograph/graph/migration.h>
#include <spdlog/spdlog.h>

namespace cartograph::graph {

// MigrationManager implementation
MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT,
            UNIQUE(version)
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }
    return 0;
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying graph schema migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            auto recordResult =
                recordMigration(version, migration.name, duration, false, result.error().message);
            if (!recordResult) {
                spdlog::warn("Could not record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;
        currentVersion = version;
    }

    spdlog::debug("Graph schema at version {}", currentVersion);
    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT OR REPLACE INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    int64_t ms = duration.count();

    auto bindResult = stmt.bindAll(version, name, seconds, ms, success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

// GraphSchemaMigrations implementation
std::vector<Migration> GraphSchemaMigrations::getAllMigrations() {
    return {createGraphSchema(), createPendingEdges()};
}

Migration GraphSchemaMigrations::createGraphSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create property graph schema";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS graph_nodes (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            project_id TEXT NOT NULL,
            label TEXT NOT NULL,
            node_key TEXT NOT NULL,
            properties TEXT NOT NULL DEFAULT '{}',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE(project_id, label, node_key)
        );

        CREATE INDEX IF NOT EXISTS idx_graph_nodes_project_label
            ON graph_nodes(project_id, label);

        CREATE TABLE IF NOT EXISTS graph_edges (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            project_id TEXT NOT NULL,
            src_node_id INTEGER NOT NULL REFERENCES graph_nodes(id) ON DELETE CASCADE,
            dst_node_id INTEGER NOT NULL REFERENCES graph_nodes(id) ON DELETE CASCADE,
            relation TEXT NOT NULL,
            properties TEXT NOT NULL DEFAULT '{}',
            created_at INTEGER NOT NULL,
            UNIQUE(src_node_id, dst_node_id, relation)
        );

        CREATE INDEX IF NOT EXISTS idx_graph_edges_src ON graph_edges(src_node_id, relation);
        CREATE INDEX IF NOT EXISTS idx_graph_edges_dst ON graph_edges(dst_node_id, relation);
        CREATE INDEX IF NOT EXISTS idx_graph_edges_project ON graph_edges(project_id, relation);

        -- Edges never cross projects
        CREATE TRIGGER IF NOT EXISTS trg_graph_edges_same_project
        BEFORE INSERT ON graph_edges
        WHEN (SELECT project_id FROM graph_nodes WHERE id = NEW.src_node_id) != NEW.project_id
          OR (SELECT project_id FROM graph_nodes WHERE id = NEW.dst_node_id) != NEW.project_id
        BEGIN
            SELECT RAISE(ABORT, 'cross-project edge');
        END;
    )";
    return m;
}

Migration GraphSchemaMigrations::createPendingEdges() {
    Migration m;
    m.version = 2;
    m.name = "Create pending edge table";
    m.upSQL = R"(
        CREATE TABLE IF NOT EXISTS pending_edges (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            project_id TEXT NOT NULL,
            src_label TEXT NOT NULL,
            src_key TEXT NOT NULL,
            relation TEXT NOT NULL,
            target TEXT NOT NULL,
            candidates TEXT NOT NULL DEFAULT '[]',
            properties TEXT NOT NULL DEFAULT '{}',
            UNIQUE(project_id, src_label, src_key, relation, target)
        );

        CREATE INDEX IF NOT EXISTS idx_pending_edges_project ON pending_edges(project_id);
    )";
    return m;
}

} // namespace cartograph::graph
