#include "GlobMatch.h"

namespace Courier::Core::IO {

bool matchGlob(std::string_view str, std::string_view pattern) {
    size_t s = 0, p = 0;
    size_t starIdx = std::string_view::npos, matchIdx = 0;

    while (s < str.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == str[s])) {
            // Match single character or exact match
            ++s;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            // Star matches zero or more characters
            starIdx = p;
            matchIdx = s;
            ++p;
        } else if (starIdx != std::string_view::npos) {
            // Backtrack to last star
            p = starIdx + 1;
            ++matchIdx;
            s = matchIdx;
        } else {
            return false;
        }
    }

    // Skip remaining stars in pattern
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.size();
}

} // namespace Courier::Core::IO
