//! # CLI Command Dispatcher
//!
//! Parses command-line arguments and routes to the matching command handler.
//!
//! ## Architecture
//!
//! ```text
//! reqtree_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ show           → run_show()
//!   ├─ chains         → run_chains()
//!   ├─ tree           → run_tree()
//!   ├─ order          → run_order()
//!   ├─ rdeps          → run_rdeps()
//!   ├─ list           → run_list()
//!   └─ check          → run_check()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                         |
//! |------|-------------------------------------------------|
//! | 0    | Success                                         |
//! | 1    | Usage error, unreadable catalog or failed query |

#include "commands/cmd_query.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace reqtree::cli {

int reqtree_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage(std::cout);
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage(std::cout);
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version(std::cout);
        return 0;
    }

    auto parsed = parse_query_args(argc, argv, 2);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'reqtree --help' for usage information.\n";
        return 1;
    }
    const QueryOptions& options = unwrap(parsed);

    REQTREE_LOG_DEBUG("cli", "command " << command << " with " << options.args.size()
                                        << " arguments");

    if (command == "show") {
        return run_show(options, std::cout);
    }

    if (command == "chains") {
        return run_chains(options, std::cout);
    }

    if (command == "tree") {
        return run_tree(options, std::cout);
    }

    if (command == "order") {
        return run_order(options, std::cout);
    }

    if (command == "rdeps") {
        return run_rdeps(options, std::cout);
    }

    if (command == "list") {
        return run_list(options, std::cout);
    }

    if (command == "check") {
        return run_check(options, std::cout);
    }

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::cerr << "Run 'reqtree --help' for usage information.\n";
    return 1;
}

} // namespace reqtree::cli

// Entry point wrapper (outside namespace)
int reqtree_main(int argc, char* argv[]) {
    return reqtree::cli::reqtree_main(argc, argv);
}
