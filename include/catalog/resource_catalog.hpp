//! # Resource Catalog
//!
//! Owns every `ResourceEntry` and answers identifier-keyed lookups.
//!
//! ## Lifecycle
//!
//! 1. Populate with `add()` (or load a catalog file, see `catalog_parser.hpp`)
//! 2. Construct a `DependencyGraph` over it
//! 3. Issue read-only queries
//!
//! Entries keep insertion order and requirement lists keep declaration order,
//! so every listing derived from the catalog is reproducible.
//!
//! ## Describe Format
//!
//! ```text
//! Resource: a
//! Name: A
//! Short Description: Resource A
//! Long Description: The first resource in the alphabetical order
//! Category: example
//! Requirements: []
//! ```

#ifndef REQTREE_CATALOG_RESOURCE_CATALOG_HPP
#define REQTREE_CATALOG_RESOURCE_CATALOG_HPP

#include "catalog/resource.hpp"
#include "common.hpp"
#include "graph/graph_error.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace reqtree::catalog {

using graph::GraphError;

/**
 * Mapping from resource identifier to entry
 *
 * Pointers returned by `add()`, `get()` and `lookup()` stay valid until the
 * next `add()`.
 */
class ResourceCatalog {
public:
    ResourceCatalog() = default;

    /**
     * Insert an entry
     *
     * @return The stored entry, or DuplicateResource / InvalidResource
     */
    Result<const ResourceEntry*, GraphError> add(ResourceEntry entry);

    /**
     * Find an entry by identifier
     *
     * @return The entry, or nullptr when absent
     */
    const ResourceEntry* get(const std::string& id) const;

    /// Same as get(), failing with UnknownResource when absent.
    Result<const ResourceEntry*, GraphError> lookup(const std::string& id) const;

    bool contains(const std::string& id) const {
        return index_.count(id) != 0;
    }

    /**
     * Declared requirements of `id`, verbatim
     *
     * A leaf yields an empty vector. Fails with UnknownResource if `id` is absent.
     */
    Result<std::vector<std::string>, GraphError> direct_requirements(const std::string& id) const;

    /**
     * Render the six-line description of `id`
     *
     * Fails with UnknownResource if `id` is absent.
     */
    Result<std::string, GraphError> describe(const std::string& id) const;

    /// Resources that directly require `id`, in catalog order.
    std::vector<std::string> required_by(const std::string& id) const;

    /// Every requirement naming an absent resource, in catalog order.
    std::vector<DanglingReference> dangling_references() const;

    /// All identifiers in insertion order.
    std::vector<std::string> ids() const;

    const std::vector<ResourceEntry>& entries() const {
        return entries_;
    }

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

private:
    std::vector<ResourceEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace reqtree::catalog

#endif // REQTREE_CATALOG_RESOURCE_CATALOG_HPP
