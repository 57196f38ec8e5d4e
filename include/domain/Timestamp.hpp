#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Временная метка с точностью до миллисекунд
 *
 * Миллисекунды - это точность, с которой метка переживает
 * сохранение в БД и обратное чтение.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief ISO 8601 в UTC: "2025-09-10T12:00:00.123Z"
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << (toMillis() % 1000 + 1000) % 1000
           << 'Z';
        return ss.str();
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }

private:
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    }
};

} // namespace ledger::domain
