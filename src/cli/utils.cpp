#include "utils.hpp"

#include "common.hpp"

#include <charconv>
#include <system_error>

namespace reqtree::cli {

std::optional<size_t> parse_count(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

void print_usage(std::ostream& out) {
    out << "reqtree " << VERSION << "\n\n";
    out << "Usage: reqtree <command> [args] [options]\n\n";
    out << "Commands:\n";
    out << "  show <id>     Describe a resource\n";
    out << "  chains <id>   List progressive dependency chains\n";
    out << "  tree <id>     List collapsed dependency chains\n";
    out << "  order <id>    List install order (dependencies first)\n";
    out << "  rdeps <id>    List resources that directly require <id>\n";
    out << "  list          List every resource in the catalog\n";
    out << "  check         Report dangling requirements and cycles\n";
    out << "\nOptions:\n";
    out << "  --help, -h            Show this help\n";
    out << "  --version, -V         Show version\n";
    out << "  --catalog=<path>      Catalog file (default: ./catalog.toml)\n";
    out << "  --first-only          Follow only the first requirement in chains\n";
    out << "  --max-depth=<n>       Longest chain allowed (default: catalog size)\n";
    out << "  --max-paths=<n>       Most chains a query may visit (default: catalog size squared)\n";
    out << "  -v, -vv, -vvv         Log at info, debug, trace\n";
    out << "  -q, --quiet           Log errors only\n";
    out << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>   Per-module levels, e.g. graph=trace,*=warn\n";
    out << "  --log-file=<path>     Also write log records to <path>\n";
    out << "  --log-format=<fmt>    text or json\n";
}

void print_version(std::ostream& out) {
    out << "reqtree " << VERSION << "\n";
}

} // namespace reqtree::cli
