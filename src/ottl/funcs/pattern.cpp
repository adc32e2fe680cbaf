#include "pattern.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>

namespace ottl {
namespace funcs {

namespace {

RegexPtr compile(const std::string& pattern, const std::string& source, bool dot_matches_newline) {
    RE2::Options options;
    options.set_log_errors(false);
    options.set_dot_nl(dot_matches_newline);
    auto re = std::make_shared<const RE2>(pattern, options);
    if (!re->ok()) {
        throw ConfigError("invalid pattern \"" + source + "\": " + re->error());
    }
    return re;
}

void appendLiteral(std::string& out, char c) {
    out += RE2::QuoteMeta(re2::StringPiece(&c, 1));
}

} // namespace

RegexPtr compileRegex(const std::string& pattern) {
    return compile(pattern, pattern, false);
}

RegexPtr compileGlob(const std::string& glob) {
    std::string re;
    for (size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        switch (c) {
            case '*':
                re += ".*";
                break;
            case '?':
                re += '.';
                break;
            case '\\':
                if (i + 1 >= glob.size()) {
                    throw ConfigError("invalid glob pattern \"" + glob + "\": trailing backslash");
                }
                appendLiteral(re, glob[++i]);
                break;
            case '[': {
                size_t end = glob.find(']', i + 1);
                if (end == std::string::npos || end == i + 1) {
                    throw ConfigError("invalid glob pattern \"" + glob + "\": unterminated character class");
                }
                re += '[';
                size_t j = i + 1;
                if (glob[j] == '!') {
                    re += '^';
                    ++j;
                }
                for (; j < end; ++j) {
                    char k = glob[j];
                    if (k == '\\' || k == '[' || k == ']' || k == '^') {
                        re += '\\';
                    }
                    re += k;
                }
                re += ']';
                i = end;
                break;
            }
            default:
                appendLiteral(re, c);
        }
    }
    return compile(re, glob, true);
}

bool containsMatch(const RE2& re, const std::string& text) {
    return RE2::PartialMatch(text, re);
}

bool matchesWhole(const RE2& re, const std::string& text) {
    return RE2::FullMatch(text, re);
}

bool nextMatch(const RE2& re, const std::string& input, size_t pos, Captures& match) {
    match.assign(static_cast<size_t>(re.NumberOfCapturingGroups()) + 1, re2::StringPiece());
    return re.Match(input, pos, input.size(), RE2::UNANCHORED, match.data(), static_cast<int>(match.size()));
}

size_t utf8Width(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return 1;
    }
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t width = 1;
    if (lead >= 0xF0) {
        width = 4;
    } else if (lead >= 0xE0) {
        width = 3;
    } else if (lead >= 0xC0) {
        width = 2;
    }
    return std::min(width, text.size() - pos);
}

std::string expandCaptures(const std::string& replacement, const Captures& match) {
    std::string out;
    for (size_t i = 0; i < replacement.size(); ++i) {
        char c = replacement[i];
        if (c != '$' || i + 1 >= replacement.size()) {
            out += c;
            continue;
        }
        char next = replacement[i + 1];
        if (next == '$') {
            out += '$';
            ++i;
            continue;
        }
        size_t start = i + 1;
        bool braced = next == '{';
        if (braced) {
            ++start;
        }
        size_t end = start;
        // Numbers past the group count name no group; stop accumulating there
        size_t group = 0;
        bool present = true;
        while (end < replacement.size() && std::isdigit(static_cast<unsigned char>(replacement[end]))) {
            if (present) {
                group = group * 10 + static_cast<size_t>(replacement[end] - '0');
                present = group < match.size();
            }
            ++end;
        }
        if (end == start || (braced && (end >= replacement.size() || replacement[end] != '}'))) {
            out += c;
            continue;
        }
        if (present && !match[group].empty()) {
            out.append(match[group].data(), match[group].size());
        }
        i = braced ? end : end - 1;
    }
    return out;
}

bool isReplacementFormat(const std::string& format) {
    size_t first = format.find("%s");
    return first != std::string::npos && format.find("%s", first + 2) == std::string::npos;
}

std::string applyReplacementFormat(const std::string& format, const std::string& value) {
    size_t pos = format.find("%s");
    if (pos == std::string::npos) {
        return format;
    }
    return format.substr(0, pos) + value + format.substr(pos + 2);
}

std::string truncateUtf8(const std::string& value, size_t limit) {
    if (value.size() <= limit) {
        return value;
    }
    size_t cut = limit;
    // Back up over continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

} // namespace funcs
} // namespace ottl
