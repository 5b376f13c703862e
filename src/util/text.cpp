#include <pepver/text.hpp>
#include <algorithm>

namespace pepver {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) -> char {
                       if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
                       return c;
                   });
    return out;
}

bool is_space(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u == ' ' || (u >= 0x09 && u <= 0x0D) || (u >= 0x1C && u <= 0x1F);
}

} // namespace pepver
