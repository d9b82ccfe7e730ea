//! # Graph Errors
//!
//! Structured failures reported by the catalog and the dependency graph.
//! Every query returns `Result<T, GraphError>`; nothing is thrown.
//!
//! | Kind                     | Raised when                                         |
//! |--------------------------|-----------------------------------------------------|
//! | `UnknownResource`        | root or a referenced requirement is not cataloged   |
//! | `CyclicDependency`       | a traversal reaches a resource already on its path  |
//! | `TraversalDepthExceeded` | a chain walk exceeds the depth or path bound        |
//! | `DuplicateResource`      | a resource id is added twice                        |
//! | `InvalidResource`        | an entry fails validation (empty id or requirement) |

#ifndef REQTREE_GRAPH_GRAPH_ERROR_HPP
#define REQTREE_GRAPH_GRAPH_ERROR_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace reqtree::graph {

enum class ErrorKind {
    UnknownResource,
    CyclicDependency,
    TraversalDepthExceeded,
    DuplicateResource,
    InvalidResource,
};

/// Returns the stable name of an error kind (e.g., "CyclicDependency").
const char* error_kind_name(ErrorKind kind);

/**
 * A failed catalog or graph query
 */
struct GraphError {
    ErrorKind kind;
    std::string message;

    // Resource at fault: the unknown id, the cycle entry point, ...
    std::string resource;

    // Cycle members (first member repeated at the end) or the offending path
    std::vector<std::string> path;

    static GraphError unknown_resource(const std::string& id);
    static GraphError missing_requirement(const std::string& owner, const std::string& missing);
    static GraphError cyclic_dependency(std::vector<std::string> cycle);
    static GraphError depth_exceeded(std::vector<std::string> path, size_t bound);
    static GraphError too_many_paths(const std::string& root, size_t bound);
    static GraphError duplicate_resource(const std::string& id);
    static GraphError invalid_resource(const std::string& id, const std::string& reason);

    /// "error[Kind]: message"
    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const GraphError& error);

} // namespace reqtree::graph

#endif // REQTREE_GRAPH_GRAPH_ERROR_HPP
