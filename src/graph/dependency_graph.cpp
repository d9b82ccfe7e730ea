#include "graph/dependency_graph.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace reqtree::graph {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

/// One resource on an explicit DFS stack, with the index of the next
/// requirement to explore.
struct Frame {
    const ResourceEntry* entry;
    size_t next;
};

/// The cycle closed by an edge back to `target`: the members of `path` from
/// `target` onwards, with `target` repeated at the end.
std::vector<std::string> cycle_from(const std::vector<std::string>& path,
                                    const std::string& target) {
    auto start = std::find(path.begin(), path.end(), target);
    std::vector<std::string> cycle(start, path.end());
    cycle.push_back(target);
    return cycle;
}

size_t write_lines(std::ostream& out, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        out << line << '\n';
    }
    return lines.size();
}

} // namespace

// ============================================================================
// DependencyGraph Implementation
// ============================================================================

DependencyGraph::DependencyGraph(const ResourceCatalog& catalog, GraphOptions options)
    : catalog_(catalog), options_(options) {}

size_t DependencyGraph::depth_bound() const {
    if (options_.max_depth > 0) {
        return options_.max_depth;
    }
    return std::max<size_t>(catalog_.size(), 1);
}

size_t DependencyGraph::path_bound() const {
    if (options_.max_paths > 0) {
        return options_.max_paths;
    }
    return std::max<size_t>(catalog_.size() * catalog_.size(), 1);
}

std::optional<GraphError> DependencyGraph::walk_chains(const std::string& root,
                                                       const PathVisitor& visit) const {
    const ResourceEntry* root_entry = catalog_.get(root);
    if (!root_entry) {
        return GraphError::unknown_resource(root);
    }

    const size_t bound = depth_bound();
    const size_t max_paths = path_bound();
    const bool first_only = options_.branch_policy == BranchPolicy::FirstRequirement;

    std::vector<Frame> stack;
    std::vector<std::string> path;
    std::unordered_set<std::string> on_path;
    size_t paths = 0;

    auto enter = [&](const ResourceEntry* entry) -> std::optional<GraphError> {
        stack.push_back({entry, 0});
        path.push_back(entry->id);
        on_path.insert(entry->id);

        if (++paths > max_paths) {
            return GraphError::too_many_paths(root, max_paths);
        }

        REQTREE_LOG_TRACE("graph", "chain step " << catalog::join_ids(path, " -> "));
        visit(path, entry->is_leaf());
        return std::nullopt;
    };

    if (auto error = enter(root_entry)) {
        return error;
    }

    while (!stack.empty()) {
        Frame& top = stack.back();
        const auto& reqs = top.entry->requirements;
        size_t limit = first_only ? std::min<size_t>(reqs.size(), 1) : reqs.size();

        if (top.next >= limit) {
            on_path.erase(top.entry->id);
            path.pop_back();
            stack.pop_back();
            continue;
        }

        const std::string& child_id = reqs[top.next++];
        const ResourceEntry* child = catalog_.get(child_id);
        if (!child) {
            return GraphError::missing_requirement(top.entry->id, child_id);
        }
        if (on_path.count(child_id)) {
            return GraphError::cyclic_dependency(cycle_from(path, child_id));
        }
        if (path.size() >= bound) {
            std::vector<std::string> too_long = path;
            too_long.push_back(child_id);
            return GraphError::depth_exceeded(std::move(too_long), bound);
        }

        if (auto error = enter(child)) {
            return error;
        }
    }

    return std::nullopt;
}

Result<std::vector<std::string>, GraphError>
DependencyGraph::direct_chains(const std::string& root) const {
    REQTREE_LOG_DEBUG("graph", "direct chains from " << root);

    std::vector<std::string> lines;
    auto error = walk_chains(root, [&](const std::vector<std::string>& path, bool /*is_leaf*/) {
        lines.push_back(catalog::join_ids(path, " -> "));
    });
    if (error) {
        REQTREE_LOG_DEBUG("graph", "direct chains from " << root << " failed: " << *error);
        return *error;
    }
    return lines;
}

Result<std::vector<std::string>, GraphError>
DependencyGraph::collapsed_chains(const std::string& root) const {
    REQTREE_LOG_DEBUG("graph", "collapsed chains from " << root);

    std::vector<std::string> lines;
    auto error = walk_chains(root, [&](const std::vector<std::string>& path, bool is_leaf) {
        if (is_leaf) {
            lines.push_back(catalog::join_ids(path, " <- "));
        }
    });
    if (error) {
        REQTREE_LOG_DEBUG("graph", "collapsed chains from " << root << " failed: " << *error);
        return *error;
    }
    return lines;
}

Result<std::vector<std::string>, GraphError>
DependencyGraph::install_order(const std::string& root) const {
    REQTREE_LOG_DEBUG("graph", "install order for " << root);

    const ResourceEntry* root_entry = catalog_.get(root);
    if (!root_entry) {
        return GraphError::unknown_resource(root);
    }

    std::vector<std::string> order;
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> visiting;
    std::vector<std::string> path;
    std::vector<Frame> stack;

    stack.push_back({root_entry, 0});
    path.push_back(root);
    visiting.insert(root);

    while (!stack.empty()) {
        Frame& top = stack.back();
        const auto& reqs = top.entry->requirements;

        if (top.next < reqs.size()) {
            const std::string& child_id = reqs[top.next++];
            if (visited.count(child_id)) {
                continue;
            }
            if (visiting.count(child_id)) {
                auto error = GraphError::cyclic_dependency(cycle_from(path, child_id));
                REQTREE_LOG_DEBUG("graph", "install order for " << root << " failed: " << error);
                return error;
            }

            const ResourceEntry* child = catalog_.get(child_id);
            if (!child) {
                auto error = GraphError::missing_requirement(top.entry->id, child_id);
                REQTREE_LOG_DEBUG("graph", "install order for " << root << " failed: " << error);
                return error;
            }

            REQTREE_LOG_TRACE("graph", "visit " << child_id << " from " << top.entry->id);
            visiting.insert(child_id);
            path.push_back(child_id);
            stack.push_back({child, 0});
        } else {
            // Post-order: every requirement of this resource is already emitted
            const std::string& id = top.entry->id;
            order.push_back(id);
            visiting.erase(id);
            visited.insert(id);
            path.pop_back();
            stack.pop_back();
        }
    }

    REQTREE_LOG_DEBUG("graph", "install order for " << root << ": " << order.size() << " resources");
    return order;
}

std::vector<std::vector<std::string>> DependencyGraph::cycles() const {
    enum class Mark { Unseen, Visiting, Done };

    std::unordered_map<std::string, Mark> marks;
    std::vector<std::vector<std::string>> found;

    for (const auto& start : catalog_.entries()) {
        if (marks[start.id] != Mark::Unseen) {
            continue;
        }

        std::vector<Frame> stack;
        std::vector<std::string> path;
        stack.push_back({&start, 0});
        path.push_back(start.id);
        marks[start.id] = Mark::Visiting;

        while (!stack.empty()) {
            Frame& top = stack.back();
            const auto& reqs = top.entry->requirements;

            if (top.next >= reqs.size()) {
                marks[top.entry->id] = Mark::Done;
                path.pop_back();
                stack.pop_back();
                continue;
            }

            const std::string& child_id = reqs[top.next++];
            const ResourceEntry* child = catalog_.get(child_id);
            if (!child) {
                continue;
            }

            Mark& mark = marks[child_id];
            if (mark == Mark::Visiting) {
                found.push_back(cycle_from(path, child_id));
            } else if (mark == Mark::Unseen) {
                mark = Mark::Visiting;
                path.push_back(child_id);
                stack.push_back({child, 0});
            }
        }
    }

    REQTREE_LOG_DEBUG("graph", "cycle scan over " << catalog_.size() << " resources: "
                                                  << found.size() << " cycles");
    return found;
}

// ============================================================================
// Stream Writers
// ============================================================================

Result<size_t, GraphError> DependencyGraph::show_resource_entry(const std::string& id,
                                                                std::ostream& out) const {
    auto text = catalog_.describe(id);
    if (is_err(text)) {
        return unwrap_err(text);
    }
    out << unwrap(text);
    return static_cast<size_t>(std::count(unwrap(text).begin(), unwrap(text).end(), '\n'));
}

Result<size_t, GraphError> DependencyGraph::list_direct_dependencies(const std::string& root,
                                                                     std::ostream& out) const {
    auto lines = direct_chains(root);
    if (is_err(lines)) {
        return unwrap_err(lines);
    }
    return write_lines(out, unwrap(lines));
}

Result<size_t, GraphError> DependencyGraph::list_dependency_tree(const std::string& root,
                                                                 std::ostream& out) const {
    auto lines = collapsed_chains(root);
    if (is_err(lines)) {
        return unwrap_err(lines);
    }
    return write_lines(out, unwrap(lines));
}

Result<size_t, GraphError>
DependencyGraph::list_dependency_tree_top_down(const std::string& root, std::ostream& out) const {
    auto order = install_order(root);
    if (is_err(order)) {
        return unwrap_err(order);
    }
    return write_lines(out, unwrap(order));
}

} // namespace reqtree::graph
