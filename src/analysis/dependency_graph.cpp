#include <cartograph/analysis/dependency_graph.h>

#include <algorithm>
#include <deque>

namespace cartograph::analysis {

bool DependencyGraph::addNode(const std::string& key) {
    if (index_.count(key))
        return false;
    index_.emplace(key, keys_.size());
    keys_.push_back(key);
    out_.emplace_back();
    return true;
}

void DependencyGraph::addEdge(const std::string& from, const std::string& to) {
    addNode(from);
    addNode(to);
    out_[index_.at(from)].insert(index_.at(to));
}

void DependencyGraph::removeEdge(const std::string& from, const std::string& to) {
    auto f = index_.find(from);
    auto t = index_.find(to);
    if (f == index_.end() || t == index_.end())
        return;
    out_[f->second].erase(t->second);
}

bool DependencyGraph::hasEdge(const std::string& from, const std::string& to) const {
    auto f = index_.find(from);
    auto t = index_.find(to);
    return f != index_.end() && t != index_.end() && out_[f->second].count(t->second) != 0;
}

std::vector<std::string> DependencyGraph::successors(const std::string& key) const {
    std::vector<std::string> out;
    auto it = index_.find(key);
    if (it == index_.end())
        return out;
    for (auto s : out_[it->second])
        out.push_back(keys_[s]);
    return out;
}

std::vector<DependencyGraph::Edge> DependencyGraph::edges() const {
    std::vector<Edge> out;
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        for (auto s : out_[i])
            out.emplace_back(keys_[i], keys_[s]);
    }
    return out;
}

std::size_t DependencyGraph::edgeCount() const {
    std::size_t n = 0;
    for (const auto& succ : out_)
        n += succ.size();
    return n;
}

std::set<std::string> DependencyGraph::closure(const std::string& start, int maxDepth) const {
    std::set<std::string> reached;
    auto it = index_.find(start);
    if (it == index_.end() || maxDepth == 0)
        return reached;

    std::vector<bool> visited(keys_.size(), false);
    std::deque<std::pair<std::size_t, int>> queue{{it->second, 0}};
    while (!queue.empty()) {
        auto [node, depth] = queue.front();
        queue.pop_front();
        if (maxDepth >= 0 && depth >= maxDepth)
            continue;
        for (auto next : out_[node]) {
            if (visited[next])
                continue;
            visited[next] = true;
            reached.insert(keys_[next]);
            queue.emplace_back(next, depth + 1);
        }
    }
    return reached;
}

std::vector<std::vector<std::string>> DependencyGraph::cycles() const {
    // Iterative Tarjan; recursion depth would follow the longest import chain
    const std::size_t n = keys_.size();
    constexpr std::size_t kUnvisited = static_cast<std::size_t>(-1);
    std::vector<std::size_t> index(n, kUnvisited);
    std::vector<std::size_t> low(n, 0);
    std::vector<bool> onStack(n, false);
    std::vector<std::size_t> stack;
    std::vector<std::vector<std::size_t>> adjacency(n);
    for (std::size_t i = 0; i < n; ++i)
        adjacency[i].assign(out_[i].begin(), out_[i].end());

    std::vector<std::vector<std::string>> result;
    std::size_t counter = 0;
    for (std::size_t root = 0; root < n; ++root) {
        if (index[root] != kUnvisited)
            continue;
        std::vector<std::pair<std::size_t, std::size_t>> frames{{root, 0}};
        index[root] = low[root] = counter++;
        stack.push_back(root);
        onStack[root] = true;

        while (!frames.empty()) {
            const std::size_t u = frames.back().first;
            std::size_t& pos = frames.back().second;
            if (pos < adjacency[u].size()) {
                const std::size_t w = adjacency[u][pos++];
                if (index[w] == kUnvisited) {
                    index[w] = low[w] = counter++;
                    stack.push_back(w);
                    onStack[w] = true;
                    frames.emplace_back(w, 0);
                } else if (onStack[w]) {
                    low[u] = std::min(low[u], index[w]);
                }
                continue;
            }

            if (low[u] == index[u]) {
                std::vector<std::string> members;
                std::size_t w = 0;
                do {
                    w = stack.back();
                    stack.pop_back();
                    onStack[w] = false;
                    members.push_back(keys_[w]);
                } while (w != u);
                if (members.size() > 1 || out_[u].count(u)) {
                    std::sort(members.begin(), members.end());
                    result.push_back(std::move(members));
                }
            }
            frames.pop_back();
            if (!frames.empty()) {
                const std::size_t parent = frames.back().first;
                low[parent] = std::min(low[parent], low[u]);
            }
        }
    }

    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });
    return result;
}

DependencyGraph DependencyGraph::withoutCycles(std::vector<Edge>* removed) const {
    DependencyGraph acyclic = *this;
    for (auto found = acyclic.cycles(); !found.empty(); found = acyclic.cycles()) {
        for (const auto& members : found) {
            const std::string& lowest = members.front();
            for (const auto& other : members) {
                if (!acyclic.hasEdge(lowest, other))
                    continue;
                acyclic.removeEdge(lowest, other);
                if (removed)
                    removed->emplace_back(lowest, other);
            }
        }
    }
    return acyclic;
}

Result<std::vector<std::string>> DependencyGraph::dependencyOrder() const {
    const std::size_t n = keys_.size();
    std::vector<std::size_t> pendingDeps(n, 0);
    std::vector<std::vector<std::size_t>> dependents(n);
    for (std::size_t i = 0; i < n; ++i) {
        pendingDeps[i] = out_[i].size();
        for (auto dep : out_[i])
            dependents[dep].push_back(i);
    }

    // Ordered by insertion index for a stable tie-break
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (pendingDeps[i] == 0)
            ready.insert(i);
    }

    std::vector<std::string> order;
    order.reserve(n);
    while (!ready.empty()) {
        const std::size_t next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(keys_[next]);
        for (auto dependent : dependents[next]) {
            if (--pendingDeps[dependent] == 0)
                ready.insert(dependent);
        }
    }

    if (order.size() < n) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("Dependency graph has a cycle ({} of {} nodes ordered)",
                                 order.size(), n)};
    }
    return order;
}

} // namespace cartograph::analysis
