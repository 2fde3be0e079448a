#include "time_utils.hpp"

std::string format_local_time(std::time_t t, const char* pattern) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), pattern, &tm) == 0)
        return {};
    return std::string(buf);
}

std::string timestamp() {
    return format_local_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string format_age(std::chrono::system_clock::time_point then,
                       std::chrono::system_clock::time_point now) {
    long long secs = std::chrono::duration_cast<std::chrono::seconds>(now - then).count();
    if (secs < 0)
        secs = 0;
    if (secs < 60)
        return std::to_string(secs) + "s";
    if (secs < 3600)
        return std::to_string(secs / 60) + "m";
    if (secs < 86400)
        return std::to_string(secs / 3600) + "h";
    return std::to_string(secs / 86400) + "d";
}
