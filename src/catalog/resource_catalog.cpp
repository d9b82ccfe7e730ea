#include "catalog/resource_catalog.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <sstream>

namespace reqtree::catalog {

// ============================================================================
// Helper Functions
// ============================================================================

std::string join_ids(const std::vector<std::string>& ids, std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0)
            result += separator;
        result += ids[i];
    }
    return result;
}

// ============================================================================
// ResourceCatalog Implementation
// ============================================================================

Result<const ResourceEntry*, GraphError> ResourceCatalog::add(ResourceEntry entry) {
    if (entry.id.empty()) {
        return GraphError::invalid_resource(entry.id, "empty identifier");
    }
    if (index_.count(entry.id)) {
        return GraphError::duplicate_resource(entry.id);
    }
    for (const auto& req : entry.requirements) {
        if (req.empty()) {
            return GraphError::invalid_resource(entry.id, "empty requirement identifier");
        }
    }

    REQTREE_LOG_TRACE("catalog", "add " << entry.id << " requires ["
                                        << join_ids(entry.requirements, ", ") << "]");

    index_.emplace(entry.id, entries_.size());
    entries_.push_back(std::move(entry));
    const ResourceEntry* stored = &entries_.back();
    return stored;
}

const ResourceEntry* ResourceCatalog::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

Result<const ResourceEntry*, GraphError> ResourceCatalog::lookup(const std::string& id) const {
    if (const ResourceEntry* entry = get(id)) {
        return entry;
    }
    return GraphError::unknown_resource(id);
}

Result<std::vector<std::string>, GraphError>
ResourceCatalog::direct_requirements(const std::string& id) const {
    const ResourceEntry* entry = get(id);
    if (!entry) {
        return GraphError::unknown_resource(id);
    }
    return entry->requirements;
}

Result<std::string, GraphError> ResourceCatalog::describe(const std::string& id) const {
    const ResourceEntry* entry = get(id);
    if (!entry) {
        return GraphError::unknown_resource(id);
    }

    std::ostringstream oss;
    oss << "Resource: " << entry->id << "\n";
    oss << "Name: " << entry->name << "\n";
    oss << "Short Description: " << entry->sdesc << "\n";
    oss << "Long Description: " << entry->ldesc << "\n";
    oss << "Category: " << entry->category << "\n";
    oss << "Requirements: [" << join_ids(entry->requirements, ", ") << "]\n";
    return oss.str();
}

std::vector<std::string> ResourceCatalog::required_by(const std::string& id) const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        const auto& reqs = entry.requirements;
        if (std::find(reqs.begin(), reqs.end(), id) != reqs.end()) {
            result.push_back(entry.id);
        }
    }
    return result;
}

std::vector<DanglingReference> ResourceCatalog::dangling_references() const {
    std::vector<DanglingReference> result;
    for (const auto& entry : entries_) {
        for (const auto& req : entry.requirements) {
            if (!contains(req)) {
                result.push_back({entry.id, req});
            }
        }
    }
    return result;
}

std::vector<std::string> ResourceCatalog::ids() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.id);
    }
    return result;
}

} // namespace reqtree::catalog
