#include "arcfortune/segmentation/SentenceSplitter.h"
#include "arcfortune/Utility.h"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace arcfortune {
namespace segmentation {

namespace {

constexpr std::array<std::string_view, 5> kAbbreviations{"mr", "mrs", "ms", "dr", "st"};

bool is_terminal(char c) { return c == '.' || c == '!' || c == '?'; }

// Byte length of a closing quote/bracket starting at pos, 0 if none.
std::size_t closing_length(const std::string& text, std::size_t pos) {
    const char c = text[pos];
    if (c == '"' || c == '\'' || c == ')' || c == ']') return 1;
    const std::string_view rest(text.data() + pos, text.size() - pos);
    if (rest.substr(0, 3) == "\xE2\x80\x9D" || rest.substr(0, 3) == "\xE2\x80\x99") return 3;  // ” ’
    if (rest.substr(0, 2) == "\xC2\xBB") return 2;                                          // »
    return 0;
}

bool follows_abbreviation(const std::string& text, std::size_t dot) {
    std::size_t w = dot;
    while (w > 0 && std::isalpha(static_cast<unsigned char>(text[w - 1]))) --w;
    if (w == dot) return false;
    std::string word;
    for (std::size_t k = w; k < dot; ++k) word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[k]))));
    for (auto abbr : kAbbreviations) {
        if (word == abbr) return true;
    }
    return false;
}

void emit(const std::string& text, std::size_t start, std::size_t end, std::vector<std::string>& out) {
    if (end <= start) return;
    std::string unit = text.substr(start, end - start);
    if (!trim(unit).empty()) out.push_back(std::move(unit));
}

}  // namespace

std::vector<std::string> RuleSentenceSplitter::split(const std::string& text) const {
    std::vector<std::string> units;
    const std::size_t n = text.size();
    std::size_t start = 0;
    std::size_t i = 0;

    while (i < n) {
        const char c = text[i];

        if (is_terminal(c)) {
            std::size_t j = i + 1;
            while (j < n) {
                if (is_terminal(text[j])) {
                    ++j;
                    continue;
                }
                const std::size_t len = closing_length(text, j);
                if (len == 0) break;
                j += len;
            }
            if (c == '.' && j == i + 1 && follows_abbreviation(text, i)) {
                ++i;
                continue;
            }
            emit(text, start, j, units);
            start = j;
            i = j;
            continue;
        }

        if (c == '\n') {
            std::size_t k = i + 1;
            while (k < n && (text[k] == ' ' || text[k] == '\t' || text[k] == '\r')) ++k;
            if (k < n && text[k] == '\n') {
                // Blank line: paragraph boundary.
                emit(text, start, i, units);
                start = k + 1;
                i = k + 1;
                continue;
            }
        }
        ++i;
    }

    emit(text, start, n, units);
    return units;
}

}  // namespace segmentation
}  // namespace arcfortune
