#pragma once
#include <string>
#include <string_view>

namespace Courier::Core::IO {

// Simple glob pattern matching
// Supports: * (any sequence), ? (single char)
bool matchGlob(std::string_view str, std::string_view pattern);

// True when the text carries the wildcard marker that switches copies into glob mode
inline bool hasWildcard(std::string_view text) {
    return text.find('*') != std::string_view::npos;
}

} // namespace Courier::Core::IO
