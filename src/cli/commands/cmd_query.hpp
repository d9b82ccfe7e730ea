//! # Query Commands Interface
//!
//! | Function       | Command                | Description                        |
//! |----------------|------------------------|------------------------------------|
//! | `run_show()`   | `reqtree show <id>`    | Six-line resource description      |
//! | `run_chains()` | `reqtree chains <id>`  | Progressive dependency chains      |
//! | `run_tree()`   | `reqtree tree <id>`    | Collapsed dependency chains        |
//! | `run_order()`  | `reqtree order <id>`   | Install order, dependencies first  |
//! | `run_rdeps()`  | `reqtree rdeps <id>`   | Direct reverse dependencies        |
//! | `run_list()`   | `reqtree list`         | Every identifier in catalog order  |
//! | `run_check()`  | `reqtree check`        | Dangling requirements and cycles   |
//!
//! Query output goes to `out`; diagnostics go to stderr.

#ifndef REQTREE_CLI_CMD_QUERY_HPP
#define REQTREE_CLI_CMD_QUERY_HPP

#include "catalog/resource_catalog.hpp"
#include "common.hpp"
#include "graph/dependency_graph.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace reqtree::cli {

/**
 * Options shared by every query command
 */
struct QueryOptions {
    fs::path catalog_path;              // Empty = ./catalog.toml
    reqtree::graph::GraphOptions graph; // Branch policy and bounds
    std::vector<std::string> args;      // Positional arguments after the command
};

/**
 * Parse the arguments following the command name
 *
 * Logging options are skipped; parse_log_options() handles them.
 *
 * @return Options, or a usage error message
 */
Result<QueryOptions, std::string> parse_query_args(int argc, char* argv[], int first);

/**
 * Load the catalog named by `options`
 *
 * Reports failures to stderr.
 */
std::optional<catalog::ResourceCatalog> load_catalog_or_report(const QueryOptions& options);

int run_show(const QueryOptions& options, std::ostream& out);
int run_chains(const QueryOptions& options, std::ostream& out);
int run_tree(const QueryOptions& options, std::ostream& out);
int run_order(const QueryOptions& options, std::ostream& out);
int run_rdeps(const QueryOptions& options, std::ostream& out);
int run_list(const QueryOptions& options, std::ostream& out);

/**
 * Validate the whole catalog
 *
 * Prints one `dangling:` line per missing requirement, one `cycle:` line per
 * cycle, then a summary. Returns 1 if any problem was found.
 */
int run_check(const QueryOptions& options, std::ostream& out);

} // namespace reqtree::cli

#endif // REQTREE_CLI_CMD_QUERY_HPP
