#pragma once

#include <cartograph/core/types.h>

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cartograph::analysis {

/**
 * @brief In-memory directed graph over File keys.
 *
 * An edge `a -> b` means `a` depends on `b` (imports or references it). Nodes keep
 * the order in which they were first added; that order is the tie-break wherever a
 * result would otherwise be unordered.
 */
class DependencyGraph {
public:
    using Edge = std::pair<std::string, std::string>;

    /// Adds a node; returns false if it already existed.
    bool addNode(const std::string& key);
    /// Adds both endpoints as needed. Parallel edges collapse into one.
    void addEdge(const std::string& from, const std::string& to);
    void removeEdge(const std::string& from, const std::string& to);

    bool contains(const std::string& key) const { return index_.count(key) != 0; }
    bool hasEdge(const std::string& from, const std::string& to) const;
    const std::vector<std::string>& nodes() const { return keys_; }
    std::vector<std::string> successors(const std::string& key) const;
    std::vector<Edge> edges() const;
    std::size_t edgeCount() const;

    /**
     * @brief Nodes reachable from `start`, excluding `start` unless a cycle leads back.
     * @param maxDepth hop limit; negative means unbounded
     */
    std::set<std::string> closure(const std::string& start, int maxDepth = -1) const;

    /**
     * @brief Strongly connected components that contain a cycle.
     *
     * Each component has two or more members, or one member with a self edge. Members
     * are sorted and components are ordered by their lowest member.
     */
    std::vector<std::vector<std::string>> cycles() const;

    /**
     * @brief Copy with every cycle broken.
     *
     * Within each cycle the lowest key loses its edges to the other members, so it is
     * scheduled first. Repeats until no cycle remains. Removed edges are appended to
     * `removed` in removal order.
     */
    DependencyGraph withoutCycles(std::vector<Edge>* removed = nullptr) const;

    /**
     * @brief Kahn order with dependencies before their dependents.
     *
     * Among nodes that are ready at the same time the earliest added comes first.
     * @return InvalidState when the graph still has a cycle
     */
    Result<std::vector<std::string>> dependencyOrder() const;

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::set<std::size_t>> out_;
};

} // namespace cartograph::analysis
