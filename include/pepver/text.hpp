#pragma once

#include <string>

namespace pepver {

// ASCII-only lowercase; other bytes pass through unchanged
std::string to_lower(const std::string& s);

// Whitespace as Python's \s sees it in the ASCII range:
// \t \n \v \f \r, space, and the separators 0x1C-0x1F
bool is_space(char c);

} // namespace pepver
