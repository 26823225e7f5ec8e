#include "fingerprint/block.h"
#include "common/hashing.h"
#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace testsieve {

namespace {

struct LineInfo {
    bool logical_start = false;
    bool has_code = false;
    int indent = 0;
    char last_code = 0;
};

// One logical statement, possibly spanning several physical lines.
struct Statement {
    int first_line = 0;
    int last_line = 0;
    int indent = 0;
    bool opens_suite = false;
};

struct Region {
    std::string name;
    int header_indent = 0;
    int body_start = 0;
    int body_end = 0;
    int parent = -1;
};

std::vector<std::string> split_lines(const std::string& source) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : source) {
        if (c == '\n') {
            if (!current.empty() && current.back() == '\r') current.pop_back();
            lines.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

int measure_indent(const std::string& line) {
    int width = 0;
    for (char c : line) {
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
    }
    return width;
}

bool is_closing_match(char open, char close) {
    return (open == '(' && close == ')') || (open == '[' && close == ']') ||
           (open == '{' && close == '}');
}

// Tracks strings, brackets and line continuations across the whole source.
// Returns nullopt when the source cannot be tokenized.
std::optional<std::vector<LineInfo>> scan_lines(const std::vector<std::string>& lines) {
    std::vector<LineInfo> infos(lines.size());
    char quote = 0;
    bool triple = false;
    bool continuation = false;
    std::vector<char> brackets;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        LineInfo& info = infos[i];
        info.logical_start = quote == 0 && brackets.empty() && !continuation;
        info.indent = measure_indent(line);
        continuation = false;
        bool escaped_newline = false;

        for (size_t j = 0; j < line.size(); ++j) {
            char c = line[j];
            if (quote) {
                if (!std::isspace(static_cast<unsigned char>(c))) {
                    info.has_code = true;
                    info.last_code = c;
                }
                if (c == '\\') {
                    if (j + 1 == line.size()) escaped_newline = true;
                    ++j;
                } else if (triple) {
                    if (c == quote && j + 2 < line.size() && line[j + 1] == quote &&
                        line[j + 2] == quote) {
                        quote = 0;
                        j += 2;
                    }
                } else if (c == quote) {
                    quote = 0;
                }
                continue;
            }

            if (c == '#') break;
            if (std::isspace(static_cast<unsigned char>(c))) continue;

            info.has_code = true;
            info.last_code = c;
            if (c == '"' || c == '\'') {
                quote = c;
                triple = j + 2 < line.size() && line[j + 1] == c && line[j + 2] == c;
                if (triple) j += 2;
            } else if (c == '(' || c == '[' || c == '{') {
                brackets.push_back(c);
            } else if (c == ')' || c == ']' || c == '}') {
                if (brackets.empty() || !is_closing_match(brackets.back(), c)) {
                    return std::nullopt;
                }
                brackets.pop_back();
            } else if (c == '\\') {
                if (j + 1 != line.size()) return std::nullopt;
                continuation = true;
            }
        }

        if (quote && !triple && !escaped_newline) return std::nullopt;
    }

    if (quote || !brackets.empty() || continuation) return std::nullopt;
    return infos;
}

std::vector<Statement> group_statements(const std::vector<LineInfo>& infos) {
    std::vector<Statement> statements;
    for (size_t i = 0; i < infos.size(); ++i) {
        if (!infos[i].logical_start || !infos[i].has_code) continue;
        Statement stmt;
        stmt.first_line = static_cast<int>(i) + 1;
        stmt.indent = infos[i].indent;
        char last = infos[i].last_code;
        size_t end = i;
        for (size_t k = i + 1; k < infos.size() && !infos[k].logical_start; ++k) {
            end = k;
            if (infos[k].last_code) last = infos[k].last_code;
        }
        stmt.last_line = static_cast<int>(end) + 1;
        stmt.opens_suite = last == ':';
        statements.push_back(stmt);
    }
    return statements;
}

bool check_indentation(const std::vector<Statement>& statements) {
    std::vector<int> stack{0};
    bool expect_indent = false;
    for (const auto& stmt : statements) {
        if (expect_indent) {
            if (stmt.indent <= stack.back()) return false;
            stack.push_back(stmt.indent);
            expect_indent = false;
        } else if (stmt.indent > stack.back()) {
            return false;
        } else {
            while (stmt.indent < stack.back()) stack.pop_back();
            if (stmt.indent != stack.back()) return false;
        }
        expect_indent = stmt.opens_suite;
    }
    return !expect_indent;
}

// Name of the function defined by the statement, if it is a function header.
std::optional<std::string> function_name(const std::string& line) {
    std::istringstream iss(line);
    std::string keyword;
    iss >> keyword;
    if (keyword == "async") iss >> keyword;
    if (keyword != "def") return std::nullopt;

    std::string rest;
    std::getline(iss, rest);
    size_t pos = rest.find_first_not_of(" \t");
    if (pos == std::string::npos) return std::nullopt;
    size_t end = pos;
    while (end < rest.size() &&
           (std::isalnum(static_cast<unsigned char>(rest[end])) || rest[end] == '_' ||
            static_cast<unsigned char>(rest[end]) >= 0x80)) {
        ++end;
    }
    if (end == pos) return std::nullopt;
    return rest.substr(pos, end - pos);
}

std::vector<Region> find_regions(const std::vector<std::string>& lines,
                                 const std::vector<Statement>& statements) {
    std::vector<Region> regions;
    std::vector<int> open;

    for (const auto& stmt : statements) {
        while (!open.empty() && stmt.indent <= regions[open.back()].header_indent) {
            open.pop_back();
        }
        for (int idx : open) {
            Region& region = regions[idx];
            if (region.body_start == 0) region.body_start = stmt.first_line;
            region.body_end = stmt.last_line;
        }

        if (!stmt.opens_suite) continue;
        auto name = function_name(lines[stmt.first_line - 1]);
        if (!name) continue;

        Region region;
        region.name = *name;
        region.header_indent = stmt.indent;
        region.parent = open.empty() ? -1 : open.back();
        regions.push_back(std::move(region));
        open.push_back(static_cast<int>(regions.size()) - 1);
    }
    return regions;
}

std::string leading_whitespace(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t\f");
    return pos == std::string::npos ? line : line.substr(0, pos);
}

// Text of [start, end] with the bodies of the direct child regions replaced
// by a single placeholder line each.
std::string region_text(const std::vector<std::string>& lines,
                        const std::vector<Region>& regions,
                        int owner, int start, int end) {
    std::string text;
    int line_no = start;
    size_t child = 0;
    std::vector<const Region*> children;
    for (const auto& r : regions) {
        if (r.parent == owner && r.body_start >= start && r.body_end <= end) {
            children.push_back(&r);
        }
    }

    while (line_no <= end) {
        if (child < children.size() && children[child]->body_start == line_no) {
            text += leading_whitespace(lines[line_no - 1]);
            text += "...\n";
            line_no = children[child]->body_end + 1;
            ++child;
            continue;
        }
        text += lines[line_no - 1];
        text += '\n';
        ++line_no;
    }
    return text;
}

Block make_block(std::string name, int start, int end, std::string code) {
    Block block;
    block.name = std::move(name);
    block.start = start;
    block.end = end;
    block.code = strip_comment_lines(code);
    block.checksum = crc32_signed(block.code);
    return block;
}

}  // namespace

std::string strip_comment_lines(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        size_t next = eol == std::string::npos ? text.size() : eol + 1;
        size_t first = text.find_first_not_of(" \t\f\r", pos);
        bool comment = first != std::string::npos && first < next && text[first] == '#';
        if (!comment) result.append(text, pos, next - pos);
        pos = next;
    }
    return result;
}

std::vector<Block> parse_blocks(const std::string& source) {
    auto lines = split_lines(source);
    auto infos = scan_lines(lines);
    if (!infos) return {};

    auto statements = group_statements(*infos);
    if (!check_indentation(statements)) return {};

    auto regions = find_regions(lines, statements);
    int total = std::max(1, static_cast<int>(lines.size()));
    if (lines.empty()) lines.emplace_back();

    std::vector<Block> blocks;
    blocks.reserve(regions.size() + 1);
    blocks.push_back(make_block(MODULE_BLOCK_NAME, 1, total,
                                region_text(lines, regions, -1, 1, total)));
    for (size_t i = 0; i < regions.size(); ++i) {
        const Region& r = regions[i];
        blocks.push_back(make_block(r.name, r.body_start, r.body_end,
                                    region_text(lines, regions, static_cast<int>(i),
                                                r.body_start, r.body_end)));
    }
    return blocks;
}

std::vector<Block> whole_file_block(const std::string& source) {
    Block block;
    block.name = MODULE_BLOCK_NAME;
    block.start = 1;
    block.end = std::max(1, static_cast<int>(split_lines(source).size()));
    block.code = source;
    block.checksum = crc32_signed(source);
    return {block};
}

}  // namespace testsieve
