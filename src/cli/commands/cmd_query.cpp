//! # Query Commands
//!
//! Implements the catalog query commands.
//!
//! ## Output
//!
//! ```text
//! $ reqtree chains c
//! c
//! c -> b
//! c -> b -> a
//!
//! $ reqtree tree c
//! c <- b <- a
//!
//! $ reqtree order c
//! a
//! b
//! c
//! ```

#include "cmd_query.hpp"

#include "catalog/catalog_parser.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>

namespace reqtree::cli {

using graph::DependencyGraph;
using graph::GraphError;

// ============================================================================
// Helper Functions
// ============================================================================

static int report_error(const std::string& command, const GraphError& error) {
    REQTREE_LOG_DEBUG("cli", command << " failed on " << error.resource << " ("
                                     << catalog::join_ids(error.path, " -> ") << ")");
    std::cerr << error << "\n";
    return 1;
}

/**
 * Shared driver for commands taking a single resource id
 */
template <typename Query>
static int run_rooted(const std::string& command, const QueryOptions& options, Query query) {
    if (options.args.size() != 1) {
        std::cerr << "Usage: reqtree " << command << " <id> [options]\n";
        return 1;
    }

    auto catalog = load_catalog_or_report(options);
    if (!catalog) {
        return 1;
    }

    DependencyGraph graph(*catalog, options.graph);
    const std::string& root = options.args[0];

    Result<size_t, GraphError> written = query(graph, root);
    if (is_err(written)) {
        return report_error(command, unwrap_err(written));
    }

    REQTREE_LOG_DEBUG("cli", command << " " << root << ": " << unwrap(written) << " lines");
    return 0;
}

Result<QueryOptions, std::string> parse_query_args(int argc, char* argv[], int first) {
    QueryOptions options;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--catalog=")) {
            options.catalog_path = arg.substr(10);
            if (options.catalog_path.empty()) {
                return std::string("Missing path for --catalog");
            }
        } else if (arg == "--first-only") {
            options.graph.branch_policy = graph::BranchPolicy::FirstRequirement;
        } else if (arg.starts_with("--max-depth=")) {
            auto depth = parse_count(arg.substr(12));
            if (!depth) {
                return "Invalid value for --max-depth: " + arg.substr(12);
            }
            options.graph.max_depth = *depth;
        } else if (arg.starts_with("--max-paths=")) {
            auto paths = parse_count(arg.substr(12));
            if (!paths) {
                return "Invalid value for --max-paths: " + arg.substr(12);
            }
            options.graph.max_paths = *paths;
        } else if (log::is_log_option(arg)) {
            // Consumed by parse_log_options()
        } else if (arg.size() > 1 && arg[0] == '-') {
            return "Unknown option: " + arg;
        } else {
            options.args.push_back(arg);
        }
    }

    return options;
}

std::optional<catalog::ResourceCatalog> load_catalog_or_report(const QueryOptions& options) {
    auto loaded = options.catalog_path.empty() ? catalog::load_catalog_from_current_dir()
                                               : catalog::load_catalog(options.catalog_path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return std::nullopt;
    }
    return std::move(unwrap(loaded));
}

// ============================================================================
// Command Implementations
// ============================================================================

int run_show(const QueryOptions& options, std::ostream& out) {
    return run_rooted("show", options, [&](const DependencyGraph& graph, const std::string& id) {
        return graph.show_resource_entry(id, out);
    });
}

int run_chains(const QueryOptions& options, std::ostream& out) {
    return run_rooted("chains", options, [&](const DependencyGraph& graph, const std::string& id) {
        return graph.list_direct_dependencies(id, out);
    });
}

int run_tree(const QueryOptions& options, std::ostream& out) {
    return run_rooted("tree", options, [&](const DependencyGraph& graph, const std::string& id) {
        return graph.list_dependency_tree(id, out);
    });
}

int run_order(const QueryOptions& options, std::ostream& out) {
    return run_rooted("order", options, [&](const DependencyGraph& graph, const std::string& id) {
        return graph.list_dependency_tree_top_down(id, out);
    });
}

int run_rdeps(const QueryOptions& options, std::ostream& out) {
    return run_rooted("rdeps", options,
                      [&](const DependencyGraph& graph,
                          const std::string& id) -> Result<size_t, GraphError> {
                          if (!graph.catalog().contains(id)) {
                              return GraphError::unknown_resource(id);
                          }
                          auto dependents = graph.catalog().required_by(id);
                          for (const auto& dependent : dependents) {
                              out << dependent << "\n";
                          }
                          return dependents.size();
                      });
}

int run_list(const QueryOptions& options, std::ostream& out) {
    if (!options.args.empty()) {
        std::cerr << "Usage: reqtree list [options]\n";
        return 1;
    }

    auto catalog = load_catalog_or_report(options);
    if (!catalog) {
        return 1;
    }

    for (const auto& id : catalog->ids()) {
        out << id << "\n";
    }
    return 0;
}

int run_check(const QueryOptions& options, std::ostream& out) {
    if (!options.args.empty()) {
        std::cerr << "Usage: reqtree check [options]\n";
        return 1;
    }

    auto catalog = load_catalog_or_report(options);
    if (!catalog) {
        return 1;
    }

    DependencyGraph graph(*catalog, options.graph);
    auto dangling = catalog->dangling_references();
    auto cycles = graph.cycles();

    for (const auto& ref : dangling) {
        out << "dangling: " << ref.resource << " -> " << ref.missing << "\n";
    }
    for (const auto& cycle : cycles) {
        out << "cycle: " << catalog::join_ids(cycle, " -> ") << "\n";
    }
    out << catalog->size() << " resources, " << dangling.size() << " dangling references, "
        << cycles.size() << " cycles\n";

    if (!dangling.empty() || !cycles.empty()) {
        REQTREE_LOG_WARN("cli", "catalog check found " << dangling.size()
                                                       << " dangling references and "
                                                       << cycles.size() << " cycles");
        return 1;
    }
    return 0;
}

} // namespace reqtree::cli
