#pragma once

#include <string>
#include <string_view>

namespace sortkv {

// Lower-case hex encoding of every byte ("\x00a" -> "0061").
[[nodiscard]] std::string to_hex(std::string_view bytes);

// Inverse of to_hex(); accepts upper or lower case.
// Throws std::invalid_argument on odd length or non-hex characters.
[[nodiscard]] std::string from_hex(std::string_view hex);

// Printable rendering: bytes outside 0x20..0x7e (and the backslash) become
// \xNN escapes.
[[nodiscard]] std::string escape_bytes(std::string_view bytes);

} // namespace sortkv
