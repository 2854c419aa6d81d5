#include "glob_match.hpp"

#include <cstddef>
#include <utility>

namespace redis_bridge {
namespace {

constexpr std::size_t npos = std::string_view::npos;

struct ClassResult {
    bool matched{false};
    std::size_t end{npos}; // index just past ']', npos if unterminated
};

// pattern[open] == '['
ClassResult match_class(std::string_view pattern, std::size_t open, char ch) noexcept {
    std::size_t i = open + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '^' || pattern[i] == '!')) {
        negate = true;
        ++i;
    }
    const auto c = static_cast<unsigned char>(ch);
    bool matched = false;
    while (i < pattern.size()) {
        if (pattern[i] == ']')
            return {matched != negate, i + 1};
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            matched |= (pattern[i + 1] == ch);
            i += 2;
        } else if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            auto lo = static_cast<unsigned char>(pattern[i]);
            auto hi = static_cast<unsigned char>(pattern[i + 2]);
            if (lo > hi)
                std::swap(lo, hi);
            matched |= (c >= lo && c <= hi);
            i += 3;
        } else {
            matched |= (pattern[i] == ch);
            ++i;
        }
    }
    return {};
}

} // namespace

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
    std::size_t p = 0;
    std::size_t s = 0;
    // Resume point of the last '*': pattern index after the run, text index it currently covers up to.
    std::size_t star_p = npos;
    std::size_t star_s = 0;

    while (s < text.size()) {
        bool advanced = false;
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                while (p < pattern.size() && pattern[p] == '*')
                    ++p;
                if (p == pattern.size())
                    return true;
                star_p = p;
                star_s = s;
                continue;
            }
            if (pc == '?') {
                ++p;
                advanced = true;
            } else if (pc == '[') {
                auto r = match_class(pattern, p, text[s]);
                if (r.end == npos) {
                    if (text[s] == '[') {
                        ++p;
                        advanced = true;
                    }
                } else if (r.matched) {
                    p = r.end;
                    advanced = true;
                }
            } else if (pc == '\\' && p + 1 < pattern.size()) {
                if (pattern[p + 1] == text[s]) {
                    p += 2;
                    advanced = true;
                }
            } else if (pc == text[s]) {
                ++p;
                advanced = true;
            }
        }
        if (advanced) {
            ++s;
            continue;
        }
        if (star_p == npos)
            return false;
        p = star_p;
        s = ++star_s;
    }
    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

} // namespace redis_bridge
