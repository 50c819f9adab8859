#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace matchmaking::domain {

/**
 * @brief Временная метка (UTC)
 *
 * Проставляется хранилищем (createdAt/updatedAt) и жизненным циклом (respondedAt).
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Парсинг ISO 8601 и формата PostgreSQL timestamptz
     *
     * Принимает "2026-01-15T10:30:00Z" и "2026-01-15 10:30:00.123456+00".
     * Дробные секунды и смещение отбрасываются, значение трактуется как UTC.
     */
    static Timestamp fromString(const std::string& str) {
        std::string normalized = str.substr(0, 19);
        if (normalized.size() > 10 && normalized[10] == ' ') {
            normalized[10] = 'T';
        }

        std::tm tm = {};
        std::istringstream ss(normalized);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        return Timestamp(tp);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }
};

} // namespace matchmaking::domain
