#pragma once

/**
 * @brief Timestamp helper (UTC, ISO-8601)
 */
class TimestampHelper {
public:
    static std::string now() {
        return format(std::chrono::system_clock::now());
    }

    /** Millisecond precision, e.g. 2024-05-01T08:30:00.125Z */
    static std::string format(std::chrono::system_clock::time_point tp) {
        auto ms = std::chrono::floor<std::chrono::milliseconds>(tp);
        auto dp = std::chrono::floor<std::chrono::days>(ms);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{ms - dp};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count() << "."
            << std::setw(3) << hms.subseconds().count() << "Z";
        return oss.str();
    }
};
