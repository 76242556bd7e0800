#pragma once

#include <cartograph/graph/database.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cartograph::graph {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Database migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version (0 when nothing applied)
     */
    Result<int> getCurrentVersion();

    /**
     * @brief Apply all pending migrations in version order
     */
    Result<void> migrate();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Built-in migrations for the graph schema
 */
class GraphSchemaMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: nodes and edges
    static Migration createGraphSchema();
    // Version 2: tentative cross-file edges awaiting resolution
    static Migration createPendingEdges();
};

} // namespace cartograph::graph
