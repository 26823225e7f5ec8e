#include "recorder/imports.h"
#include <cctype>

namespace testsieve {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == delimiter) {
            parts.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(trim(current));
    return parts;
}

std::string first_word(const std::string& text) {
    size_t end = 0;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) ++end;
    return text.substr(0, end);
}

bool is_dotted_name(const std::string& name) {
    if (name.empty() || name.front() == '.' || name.back() == '.') return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') return false;
    }
    return !std::isdigit(static_cast<unsigned char>(name.front()));
}

// Source with string literals and comments removed, joined into logical
// lines (bracketed and backslash-continued lines become one).
std::vector<std::string> logical_lines(const std::string& source) {
    std::vector<std::string> lines;
    std::string current;
    char quote = 0;
    bool triple = false;
    int depth = 0;

    for (size_t i = 0; i < source.size(); ++i) {
        char c = source[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (triple) {
                if (c == quote && i + 2 < source.size() && source[i + 1] == quote && source[i + 2] == quote) {
                    quote = 0;
                    i += 2;
                }
            } else if (c == quote || c == '\n') {
                quote = 0;
            }
            continue;
        }

        if (c == '#') {
            while (i + 1 < source.size() && source[i + 1] != '\n') ++i;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            triple = i + 2 < source.size() && source[i + 1] == c && source[i + 2] == c;
            if (triple) i += 2;
            current += "\"\"";
            continue;
        }
        if (c == '\\' && i + 1 < source.size() && source[i + 1] == '\n') {
            current.push_back(' ');
            ++i;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') ++depth;
        if ((c == ')' || c == ']' || c == '}') && depth > 0) --depth;
        if (c == '\n') {
            if (depth > 0) {
                current.push_back(' ');
                continue;
            }
            lines.push_back(std::move(current));
            current.clear();
            continue;
        }
        current.push_back(c == '\r' ? ' ' : c);
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

void parse_import(const std::string& rest, std::vector<ImportStatement>& out) {
    for (const auto& part : split(rest, ',')) {
        std::string name = first_word(part);
        if (is_dotted_name(name)) out.push_back({name, 0, {}});
    }
}

void parse_from(const std::string& rest, std::vector<ImportStatement>& out) {
    size_t pos = rest.find(" import ");
    if (pos == std::string::npos) return;

    std::string source = trim(rest.substr(0, pos));
    ImportStatement statement;
    size_t dots = 0;
    while (dots < source.size() && source[dots] == '.') ++dots;
    statement.level = static_cast<int>(dots);
    statement.module = trim(source.substr(dots));
    if (!statement.module.empty() && !is_dotted_name(statement.module)) return;
    if (statement.level == 0 && statement.module.empty()) return;

    std::string names = trim(rest.substr(pos + 8));
    if (!names.empty() && names.front() == '(') names.erase(0, 1);
    if (!names.empty() && names.back() == ')') names.pop_back();
    for (const auto& part : split(names, ',')) {
        std::string name = first_word(part);
        if (name == "*" || is_dotted_name(name)) statement.names.push_back(name);
    }
    out.push_back(std::move(statement));
}

}  // namespace

std::vector<ImportStatement> scan_imports(const std::string& source) {
    std::vector<ImportStatement> imports;
    for (const auto& line : logical_lines(source)) {
        for (const auto& statement : split(line, ';')) {
            if (statement.rfind("import ", 0) == 0) {
                parse_import(statement.substr(7), imports);
            } else if (statement.rfind("from ", 0) == 0) {
                parse_from(" " + statement.substr(5), imports);
            }
        }
    }
    return imports;
}

}  // namespace testsieve
