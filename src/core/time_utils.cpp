#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

// Parses the leading YYYY-MM-DDTHH:MM:SS; anything after the seconds is ignored.
static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s.substr(0, 19));
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm;
    if (!parse_iso(start_time, &start_tm)) return "?";
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t = std::time(nullptr);
    if (!end_time.empty()) {
        struct tm end_tm;
        if (!parse_iso(end_time, &end_tm)) return "?";
        end_t = mktime(&end_tm);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    if (seconds < 0) seconds = 0;
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) return fmt::format("{}h{:02}m", hours, mins);
    if (mins > 0) return fmt::format("{}m{}s", mins, secs);
    return fmt::format("{}s", secs);
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf;
    if (!parse_iso(iso_time, &tm_buf)) return "?";

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}
