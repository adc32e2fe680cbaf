#ifndef OTTL_FUNCS_PATTERN_HPP
#define OTTL_FUNCS_PATTERN_HPP

#include <re2/re2.h>
#include <memory>
#include <string>
#include <vector>

namespace ottl {
namespace funcs {

using RegexPtr = std::shared_ptr<const RE2>;

// Group 0 is the whole match; unmatched groups are empty
using Captures = std::vector<re2::StringPiece>;

// Compiles an RE2 regular expression. Invalid patterns raise ConfigError.
RegexPtr compileRegex(const std::string& pattern);

// Compiles a glob into a regular expression: `*` matches any run, `?` one
// character, `[...]` a class (`[!...]` negated), `\` escapes the next
// character. Invalid globs raise ConfigError.
RegexPtr compileGlob(const std::string& glob);

// True when `re` matches somewhere in `text`
bool containsMatch(const RE2& re, const std::string& text);

// True when `re` matches the whole of `text`
bool matchesWhole(const RE2& re, const std::string& text);

// Expands `$1`, `${1}` and `$$` in `replacement` for one match. Groups the
// pattern does not have expand to nothing.
std::string expandCaptures(const std::string& replacement, const Captures& match);

// Finds the first match of `re` in `input` starting at byte `pos` and
// fills `match`. Returns false when there is none.
bool nextMatch(const RE2& re, const std::string& input, size_t pos, Captures& match);

// Length in bytes of the UTF-8 sequence starting at `pos`, at least 1
size_t utf8Width(const std::string& text, size_t pos);

// Rewrites every match of `re` in `input` with `replace(match)`. An empty
// match right after the previous match is skipped.
template <typename Replace>
std::string replaceEachMatch(const RE2& re, const std::string& input, Replace replace) {
    std::string out;
    Captures match;
    size_t last = 0;
    size_t pos = 0;
    bool matched = false;
    while (pos <= input.size() && nextMatch(re, input, pos, match)) {
        size_t start = static_cast<size_t>(match[0].data() - input.data());
        size_t end = start + match[0].size();
        if (!(match[0].empty() && matched && start == last)) {
            out.append(input, last, start - last);
            out += replace(match);
            last = end;
            matched = true;
        }
        if (end > pos) {
            pos = end;
        } else {
            pos = end + utf8Width(input, end);
        }
    }
    if (last < input.size()) {
        out.append(input, last, std::string::npos);
    }
    return out;
}

// Validates a replacement format; it must contain exactly one `%s`
bool isReplacementFormat(const std::string& format);

// Substitutes `value` for the `%s` of `format`
std::string applyReplacementFormat(const std::string& format, const std::string& value);

// Cuts `value` to at most `limit` bytes without splitting a UTF-8 sequence
std::string truncateUtf8(const std::string& value, size_t limit);

} // namespace funcs
} // namespace ottl

#endif // OTTL_FUNCS_PATTERN_HPP
