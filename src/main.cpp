//! # reqtree Entry Point
//!
//! Delegates to the CLI driver, which handles command parsing and execution.
//!
//! ## Usage
//!
//! ```bash
//! reqtree show c                  # Describe a resource
//! reqtree chains c                # Progressive dependency chains
//! reqtree tree c                  # Collapsed dependency chain
//! reqtree order c                 # Install order
//! reqtree check --catalog=x.toml  # Validate a catalog file
//! ```

#include "cli/driver.hpp"
#include "log/log.hpp"

int main(int argc, char* argv[]) {
    int code = reqtree_main(argc, argv);
    reqtree::log::Logger::instance().flush();
    return code;
}
