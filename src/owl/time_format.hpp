#ifndef TIME_FORMAT_HPP
#define TIME_FORMAT_HPP

#include <cstdint>
#include <string>

// Timestamp presentation for the live view
class TimeFormat
{
   public:
    // Accepts "en", "it", "de", with or without a region ("en_US", "de-AT")
    static bool isSupportedLocale(const std::string& locale);

    // Relative time such as "just now", "5 minutes ago", "in 2 hours".
    // Throws std::invalid_argument for an unsupported locale.
    static std::string timeAgo(int64_t then, int64_t now, const std::string& locale = "en");

    // Local time as YYYY-MM-DDTHH:MM:SS
    static std::string isoLocal(int64_t epoch_seconds);
};

#endif  // TIME_FORMAT_HPP
