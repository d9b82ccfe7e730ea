#include "catalog/catalog_parser.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

namespace reqtree::catalog {

// ============================================================================
// CatalogParser
// ============================================================================

CatalogParser::CatalogParser(const std::string& content) : content_(content), pos_(0), line_(1) {}

char CatalogParser::advance() {
    if (is_eof())
        return '\0';
    char c = content_[pos_++];
    if (c == '\n')
        line_++;
    return c;
}

void CatalogParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void CatalogParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void CatalogParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void CatalogParser::skip_trivia() {
    while (true) {
        skip_whitespace();
        if (peek() != '#')
            break;
        skip_comment();
    }
}

std::string CatalogParser::parse_identifier() {
    std::string result;
    while (!is_eof()) {
        char c = peek();
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.')
            break;
        result += advance();
    }
    return result;
}

std::string CatalogParser::parse_string() {
    if (peek() != '"') {
        set_error("Expected string");
        return "";
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return "";
    }
    advance(); // Skip closing quote

    return result;
}

std::vector<std::string> CatalogParser::parse_string_array() {
    std::vector<std::string> result;

    if (peek() != '[') {
        set_error("Expected array");
        return result;
    }
    advance(); // Skip '['

    while (true) {
        skip_trivia();

        if (is_eof()) {
            set_error("Expected closing bracket");
            return result;
        }
        if (peek() == ']')
            break;

        if (peek() != '"') {
            set_error("Expected string in array");
            return result;
        }
        result.push_back(parse_string());
        if (!error_message_.empty())
            return result;

        skip_trivia();
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            set_error("Expected ',' or ']' in array");
            return result;
        }
    }
    advance(); // Skip ']'

    return result;
}

void CatalogParser::skip_value() {
    if (peek() == '"') {
        parse_string();
    } else if (peek() == '[') {
        parse_string_array();
    } else {
        // Numbers and booleans
        while (!is_eof() && peek() != '\n' && peek() != '#') {
            advance();
        }
    }
}

void CatalogParser::set_error(const std::string& message) {
    set_error(line_, message);
}

void CatalogParser::set_error(int line, const std::string& message) {
    // First error wins
    if (error_message_.empty()) {
        error_message_ = "Line " + std::to_string(line) + ": " + message;
    }
}

bool CatalogParser::parse_section_body(ResourceEntry* entry, const std::string& section) {
    while (true) {
        skip_trivia();
        if (is_eof() || peek() == '[')
            return true;

        int key_line = line_;
        std::string key = parse_identifier();
        if (key.empty()) {
            set_error("Expected key");
            return false;
        }
        skip_inline_whitespace();

        if (peek() != '=') {
            set_error("Expected '=' after key");
            return false;
        }
        advance();
        skip_inline_whitespace();

        if (!entry) {
            skip_value();
        } else if (key == "id") {
            entry->id = parse_string();
        } else if (key == "name") {
            entry->name = parse_string();
        } else if (key == "sdesc") {
            entry->sdesc = parse_string();
        } else if (key == "ldesc") {
            entry->ldesc = parse_string();
        } else if (key == "category") {
            entry->category = parse_string();
        } else if (key == "requires") {
            entry->requirements = parse_string_array();
        } else {
            REQTREE_LOG_WARN("loader", "Line " << key_line << ": ignoring unknown key '" << key
                                               << "' in [[" << section << "]]");
            skip_value();
        }

        if (!error_message_.empty())
            return false;

        skip_inline_whitespace();
        skip_comment();
        if (!is_eof() && peek() != '\n' && peek() != '\r') {
            set_error("Unexpected content after value of '" + key + "'");
            return false;
        }
    }
}

std::optional<ResourceCatalog> CatalogParser::parse() {
    ResourceCatalog catalog;

    while (true) {
        skip_trivia();
        if (is_eof())
            break;

        if (peek() != '[') {
            set_error("Expected section header");
            return std::nullopt;
        }

        int section_line = line_;
        advance(); // Skip '['

        bool is_array = false;
        if (peek() == '[') {
            is_array = true;
            advance();
        }

        std::string section = parse_identifier();

        if (peek() != ']') {
            set_error("Expected ']' after section name");
            return std::nullopt;
        }
        advance();
        if (is_array) {
            if (peek() != ']') {
                set_error("Expected ']]' after section name");
                return std::nullopt;
            }
            advance();
        }

        if (section == "resource" && is_array) {
            ResourceEntry entry;
            if (!parse_section_body(&entry, section))
                return std::nullopt;

            if (entry.id.empty()) {
                set_error(section_line, "[[resource]] without 'id'");
                return std::nullopt;
            }

            auto added = catalog.add(std::move(entry));
            if (is_err(added)) {
                set_error(section_line, unwrap_err(added).message);
                return std::nullopt;
            }
        } else {
            REQTREE_LOG_WARN("loader", "Line " << section_line << ": skipping unknown section '"
                                               << section << "'");
            if (!parse_section_body(nullptr, section))
                return std::nullopt;
        }
    }

    if (!error_message_.empty()) {
        return std::nullopt;
    }

    return catalog;
}

// ============================================================================
// Loading
// ============================================================================

Result<ResourceCatalog, std::string> load_catalog(const fs::path& path) {
    if (!fs::exists(path)) {
        return "Catalog file not found: " + path.string();
    }

    std::ifstream file(path);
    if (!file) {
        return "Cannot open catalog file: " + path.string();
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    CatalogParser parser(content);
    auto catalog = parser.parse();
    if (!catalog) {
        return path.string() + ": " + parser.get_error();
    }

    REQTREE_LOG_INFO("loader", "Loaded " << catalog->size() << " resources from " << path.string());
    for (const auto& dangling : catalog->dangling_references()) {
        REQTREE_LOG_WARN("loader", dangling.resource << " requires unknown resource "
                                                     << dangling.missing);
    }

    return std::move(*catalog);
}

Result<ResourceCatalog, std::string> load_catalog_from_current_dir() {
    return load_catalog(fs::current_path() / DEFAULT_CATALOG_FILE);
}

} // namespace reqtree::catalog
