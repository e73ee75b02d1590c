#pragma once

#include <string>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact stamp (YYYYMMDD-HHMMSS) used in session ids and debug log names.
std::string now_stamp();

// ASCII lower-casing for names, levels and modes.
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
