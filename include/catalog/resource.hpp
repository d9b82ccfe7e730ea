//! # Resource Entry
//!
//! The unit stored by the resource catalog: a named resource with
//! descriptive metadata and an ordered list of direct requirements.
//!
//! ## Fields
//!
//! | Field          | Catalog file key | Description                        |
//! |----------------|------------------|------------------------------------|
//! | `id`           | `id`             | Unique identifier                  |
//! | `name`         | `name`           | Display name                       |
//! | `sdesc`        | `sdesc`          | Short description                  |
//! | `ldesc`        | `ldesc`          | Long description                   |
//! | `category`     | `category`       | Category label                     |
//! | `requirements` | `requires`       | Direct requirements, in order      |

#ifndef REQTREE_CATALOG_RESOURCE_HPP
#define REQTREE_CATALOG_RESOURCE_HPP

#include <string>
#include <string_view>
#include <vector>

namespace reqtree::catalog {

/**
 * A single resource definition
 */
struct ResourceEntry {
    std::string id;
    std::string name;
    std::string sdesc;
    std::string ldesc;
    std::string category;

    // Direct requirements in declaration order (may be empty)
    std::vector<std::string> requirements;

    bool is_leaf() const {
        return requirements.empty();
    }
};

/**
 * A requirement naming a resource that is not in the catalog
 */
struct DanglingReference {
    std::string resource; // Resource declaring the requirement
    std::string missing;  // Identifier that could not be found

    bool operator==(const DanglingReference& other) const = default;
};

/// Joins identifiers with `separator` ("a, b", "a -> b", ...).
std::string join_ids(const std::vector<std::string>& ids, std::string_view separator);

} // namespace reqtree::catalog

#endif // REQTREE_CATALOG_RESOURCE_HPP
