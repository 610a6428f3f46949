#include <shebang/formatter.hpp>

#include <algorithm>
#include <iterator>

namespace shebang {

namespace {

// Shebang whitespace: the kernel splits on space and tab only
bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

// Split [begin, end) of text on runs of blanks
std::vector<std::string> split_blanks(const std::string& text, size_t begin, size_t end) {
    std::vector<std::string> tokens;
    size_t pos = begin;
    while (pos < end) {
        while (pos < end && is_blank(text[pos])) {
            pos++;
        }
        size_t token_start = pos;
        while (pos < end && !is_blank(text[pos])) {
            pos++;
        }
        if (pos > token_start) {
            tokens.push_back(text.substr(token_start, pos - token_start));
        }
    }
    return tokens;
}

}  // namespace

std::string ShebangLine::to_string() const {
    std::string line = "#!" + interpreter;
    for (const auto& arg : arguments) {
        line += ' ';
        line += arg;
    }
    return line;
}

std::optional<ShebangLine> ShebangFormatter::parse(const std::string& text) {
    if (text.size() < 2 || text[0] != '#' || text[1] != '!') {
        return std::nullopt;
    }

    size_t line_end = text.find_first_of("\r\n", 2);
    if (line_end == std::string::npos) {
        line_end = text.size();
    }

    // An unterminated head longer than the scan window is not a shebang
    if (line_end > std::min(text.size(), MAX_SHEBANG_SCAN)) {
        return std::nullopt;
    }

    auto tokens = split_blanks(text, 2, line_end);
    if (tokens.empty()) {
        return std::nullopt;
    }

    ShebangLine line;
    line.interpreter = std::move(tokens.front());
    line.arguments.assign(std::make_move_iterator(tokens.begin() + 1),
                          std::make_move_iterator(tokens.end()));
    line.line_end = line_end;
    return line;
}

std::optional<std::string> ShebangFormatter::format_shebang(const std::string& text) {
    auto line = parse(text);
    if (!line) {
        return std::nullopt;
    }
    return line->to_string() + text.substr(line->line_end);
}

std::string ShebangFormatter::format(const std::string& text) {
    auto formatted = format_shebang(text);
    if (!formatted) {
        return text;
    }
    return std::move(*formatted);
}

}  // namespace shebang
