//! # CLI Utilities Interface
//!
//! | Function          | Description                         |
//! |-------------------|-------------------------------------|
//! | `parse_count()`   | Parse a non-negative decimal count  |
//! | `print_usage()`   | Print CLI help text                 |
//! | `print_version()` | Print tool version                  |

#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace reqtree::cli {

// Number parsing for --max-depth / --max-paths
std::optional<size_t> parse_count(std::string_view text);

// Help text
void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace reqtree::cli
