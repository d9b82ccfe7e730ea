#include "graph/graph_error.hpp"

#include "catalog/resource.hpp"

#include <sstream>

namespace reqtree::graph {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnknownResource:
        return "UnknownResource";
    case ErrorKind::CyclicDependency:
        return "CyclicDependency";
    case ErrorKind::TraversalDepthExceeded:
        return "TraversalDepthExceeded";
    case ErrorKind::DuplicateResource:
        return "DuplicateResource";
    case ErrorKind::InvalidResource:
        return "InvalidResource";
    }
    return "Unknown";
}

GraphError GraphError::unknown_resource(const std::string& id) {
    return {ErrorKind::UnknownResource, "Unknown resource: " + id, id, {}};
}

GraphError GraphError::missing_requirement(const std::string& owner, const std::string& missing) {
    return {ErrorKind::UnknownResource,
            "Unknown resource: " + missing + " (required by " + owner + ")",
            missing,
            {owner, missing}};
}

GraphError GraphError::cyclic_dependency(std::vector<std::string> cycle) {
    std::string entry = cycle.empty() ? std::string() : cycle.front();
    std::string message = "Circular dependency detected: " + catalog::join_ids(cycle, " -> ");
    return {ErrorKind::CyclicDependency, std::move(message), std::move(entry), std::move(cycle)};
}

GraphError GraphError::depth_exceeded(std::vector<std::string> path, size_t bound) {
    std::ostringstream oss;
    oss << "Traversal depth exceeded " << bound << " at: " << catalog::join_ids(path, " -> ");
    std::string last = path.empty() ? std::string() : path.back();
    return {ErrorKind::TraversalDepthExceeded, oss.str(), std::move(last), std::move(path)};
}

GraphError GraphError::too_many_paths(const std::string& root, size_t bound) {
    std::ostringstream oss;
    oss << "More than " << bound << " dependency paths from " << root;
    return {ErrorKind::TraversalDepthExceeded, oss.str(), root, {}};
}

GraphError GraphError::duplicate_resource(const std::string& id) {
    return {ErrorKind::DuplicateResource, "Duplicate resource: " + id, id, {}};
}

GraphError GraphError::invalid_resource(const std::string& id, const std::string& reason) {
    std::string label = id.empty() ? std::string("<unnamed>") : id;
    return {ErrorKind::InvalidResource, "Invalid resource " + label + ": " + reason, id, {}};
}

std::string GraphError::to_string() const {
    return std::string("error[") + error_kind_name(kind) + "]: " + message;
}

std::ostream& operator<<(std::ostream& os, const GraphError& error) {
    return os << error.to_string();
}

} // namespace reqtree::graph
