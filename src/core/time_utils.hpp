#pragma once

#include <string>

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (session still active).
// Returns "1h05m", "14m22s", "8s", or "-" if start is empty, "?" on parse failure.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// Format an ISO timestamp for display as "YYYY-MM-DD HH:MM:SS".
// Fractional seconds and a trailing zone designator are ignored.
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
