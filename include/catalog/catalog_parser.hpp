//! # Catalog File Parser
//!
//! Loads a resource catalog from a TOML subset (`catalog.toml`).
//!
//! ## Format
//!
//! ```toml
//! # Comments run to end of line
//! [[resource]]
//! id = "b"
//! name = "B"
//! sdesc = "Resource B"
//! ldesc = "The second resource, dependent on A"
//! category = "example"
//! requires = ["a"]
//! ```
//!
//! Unknown keys and unknown sections are skipped with a warning. A
//! `[[resource]]` without `id`, or with an `id` already seen, is an error.

#ifndef REQTREE_CATALOG_CATALOG_PARSER_HPP
#define REQTREE_CATALOG_CATALOG_PARSER_HPP

#include "catalog/resource_catalog.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace reqtree::catalog {

/// Default catalog file name looked up in the current directory.
constexpr const char* DEFAULT_CATALOG_FILE = "catalog.toml";

/**
 * Parser for catalog files
 * Handles:
 * - Array sections: [[resource]]
 * - Key-value pairs: key = "value"
 * - String arrays: key = ["value1", "value2"] (may span lines)
 * - Comments: # ...
 */
class CatalogParser {
public:
    explicit CatalogParser(const std::string& content);

    /**
     * Parse the content into a catalog
     */
    std::optional<ResourceCatalog> parse();

    /**
     * Get error message if parsing failed ("Line N: message")
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_inline_whitespace();
    void skip_comment();
    void skip_trivia();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::string parse_string();
    std::vector<std::string> parse_string_array();
    void skip_value();

    // Reads key-value pairs up to the next section header. A null `entry`
    // discards them (unknown sections).
    bool parse_section_body(ResourceEntry* entry, const std::string& section);

    void set_error(const std::string& message);
    void set_error(int line, const std::string& message);
};

/**
 * Load a catalog file
 *
 * @param path Path to the catalog file
 * @return The catalog, or an error message naming the file
 */
Result<ResourceCatalog, std::string> load_catalog(const fs::path& path);

/**
 * Load `catalog.toml` from the current directory
 */
Result<ResourceCatalog, std::string> load_catalog_from_current_dir();

} // namespace reqtree::catalog

#endif // REQTREE_CATALOG_CATALOG_PARSER_HPP
