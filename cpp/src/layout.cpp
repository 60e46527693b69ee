/**
 * @file layout.cpp
 * @brief Row name conversion.
 */

#include "../include/ofc/layout.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ofc {

const char* row_name(Row row) {
    static const char* names[] = {"top", "middle", "bottom"};
    return names[static_cast<int>(row)];
}

const char* row_display_name(Row row) {
    static const char* names[] = {"Top Row", "Middle Row", "Bottom Row"};
    return names[static_cast<int>(row)];
}

Row parse_row(const std::string& name) {
    std::string s = name;
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (Row row : ALL_ROWS) {
        if (s == row_name(row)) return row;
    }
    throw std::invalid_argument("Invalid position: " + name);
}

} // namespace ofc
