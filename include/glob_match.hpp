#pragma once
#include <string_view>

namespace redis_bridge {

/**
 * Anchored, case-sensitive glob match of `text` against `pattern`.
 *
 *  - `*` matches any run of characters (including none)
 *  - `?` matches exactly one character
 *  - `[abc]`, `[a-z]` match one listed character; `[^...]` / `[!...]` negate
 *  - `\x` matches `x` literally, inside or outside a class
 *
 * An unterminated `[` is matched as a literal character.
 */
bool glob_match(std::string_view pattern, std::string_view text) noexcept;

} // namespace redis_bridge
