//! # Dependency Graph
//!
//! Read-only traversals over a `ResourceCatalog`'s requires-relation.
//!
//! ## Queries
//!
//! | Query                      | Output (one line each)                    |
//! |----------------------------|-------------------------------------------|
//! | `direct_chains()`          | `c`, `c -> b`, `c -> b -> a`              |
//! | `collapsed_chains()`       | `c <- b <- a`                             |
//! | `install_order()`          | `a`, `b`, `c` (dependencies first)        |
//! | `cycles()`                 | every cycle found in the whole catalog    |
//!
//! The `list_*` and `show_*` variants write those lines to a stream and
//! return the number of lines written. They compute the full result first,
//! so a failed query writes nothing.
//!
//! ## Branching
//!
//! A resource with several requirements gives several chains. With
//! `BranchPolicy::AllBranches` every branch is walked depth-first in
//! declaration order; with `BranchPolicy::FirstRequirement` only the first
//! requirement of each resource is followed. On single-requirement chains
//! both policies give the same output.
//!
//! ## Termination
//!
//! - A chain that revisits a resource on its own path fails with
//!   CyclicDependency.
//! - A chain longer than the depth bound fails with TraversalDepthExceeded.
//! - `install_order()` tracks visiting/visited sets: diamonds are emitted
//!   once, cycles fail with CyclicDependency.

#ifndef REQTREE_GRAPH_DEPENDENCY_GRAPH_HPP
#define REQTREE_GRAPH_DEPENDENCY_GRAPH_HPP

#include "catalog/resource_catalog.hpp"
#include "common.hpp"
#include "graph/graph_error.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace reqtree::graph {

using catalog::ResourceCatalog;
using catalog::ResourceEntry;

/// How chain walks treat resources with more than one requirement.
enum class BranchPolicy {
    AllBranches,      ///< Walk every requirement, depth-first, in declaration order
    FirstRequirement, ///< Follow only the first requirement of each resource
};

/**
 * Options for chain walks
 */
struct GraphOptions {
    BranchPolicy branch_policy = BranchPolicy::AllBranches;

    // Longest allowed chain, in resources. 0 = catalog size.
    size_t max_depth = 0;

    // Most paths a chain walk may visit, one per direct chain line.
    // 0 = catalog size squared.
    size_t max_paths = 0;
};

/**
 * Dependency graph view over a catalog
 *
 * Holds no traversal state: every query allocates its own and the catalog
 * is only read, so one graph may serve concurrent readers.
 */
class DependencyGraph {
public:
    explicit DependencyGraph(const ResourceCatalog& catalog, GraphOptions options = {});

    /// Progressive chains joined by " -> ", one per visited path, root first.
    Result<std::vector<std::string>, GraphError> direct_chains(const std::string& root) const;

    /// One " <- "-joined line per complete root-to-leaf chain.
    Result<std::vector<std::string>, GraphError> collapsed_chains(const std::string& root) const;

    /// Everything reachable from `root`, dependencies first, `root` last.
    Result<std::vector<std::string>, GraphError> install_order(const std::string& root) const;

    /**
     * Find cycles across the whole catalog
     *
     * Explores every resource in catalog order and reports each back edge
     * as a cycle (first member repeated at the end). Requirements naming
     * absent resources are skipped; see ResourceCatalog::dangling_references().
     */
    std::vector<std::vector<std::string>> cycles() const;

    // Stream writers. Each returns the number of lines written.
    Result<size_t, GraphError> show_resource_entry(const std::string& id, std::ostream& out) const;
    Result<size_t, GraphError> list_direct_dependencies(const std::string& root,
                                                        std::ostream& out) const;
    Result<size_t, GraphError> list_dependency_tree(const std::string& root,
                                                    std::ostream& out) const;
    Result<size_t, GraphError> list_dependency_tree_top_down(const std::string& root,
                                                             std::ostream& out) const;

    const ResourceCatalog& catalog() const {
        return catalog_;
    }

    const GraphOptions& options() const {
        return options_;
    }

    /// Effective depth bound for chain walks.
    size_t depth_bound() const;

    /// Effective path bound for chain walks.
    size_t path_bound() const;

private:
    const ResourceCatalog& catalog_;
    GraphOptions options_;

    // Called with the current path on every step of a chain walk.
    using PathVisitor = std::function<void(const std::vector<std::string>& path, bool is_leaf)>;

    std::optional<GraphError> walk_chains(const std::string& root, const PathVisitor& visit) const;
};

} // namespace reqtree::graph

#endif // REQTREE_GRAPH_DEPENDENCY_GRAPH_HPP
