#include "domain/Money.hpp"
#include "domain/LedgerError.hpp"

#include <cctype>
#include <limits>

namespace ledger::domain {

namespace {

[[noreturn]] void throwInvalid(const std::string& text) {
    throw LedgerException(LedgerErrorCode::INVALID_AMOUNT, "Invalid amount: '" + text + "'");
}

bool accumulate(int64_t& value, char digit) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    int d = digit - '0';
    if (value > (max - d) / 10) {
        return false;
    }
    value = value * 10 + d;
    return true;
}

[[noreturn]] void throwOverflow(int64_t lhs, char op, int64_t rhs) {
    throw LedgerException(
        LedgerErrorCode::INVALID_AMOUNT,
        "Amount overflow: " + Money(lhs).toString() + " " + op + " " + Money(rhs).toString());
}

} // namespace

Money Money::fromUnits(int64_t units) {
    int64_t minorUnits = 0;
    if (__builtin_mul_overflow(units, int64_t{100}, &minorUnits)) {
        throw LedgerException(
            LedgerErrorCode::INVALID_AMOUNT,
            "Amount overflow: " + std::to_string(units) + " units");
    }
    return Money(minorUnits);
}

Money Money::operator+(const Money& other) const {
    int64_t result = 0;
    if (__builtin_add_overflow(minor, other.minor, &result)) {
        throwOverflow(minor, '+', other.minor);
    }
    return Money(result);
}

Money Money::operator-(const Money& other) const {
    int64_t result = 0;
    if (__builtin_sub_overflow(minor, other.minor, &result)) {
        throwOverflow(minor, '-', other.minor);
    }
    return Money(result);
}

Money Money::parse(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    if (begin == end) {
        throwInvalid(text);
    }

    bool negative = false;
    if (text[begin] == '+' || text[begin] == '-') {
        negative = text[begin] == '-';
        ++begin;
    }

    int64_t value = 0;
    size_t intDigits = 0;
    size_t pos = begin;
    for (; pos < end && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos, ++intDigits) {
        if (!accumulate(value, text[pos])) throwInvalid(text);
    }

    size_t fracDigits = 0;
    if (pos < end && text[pos] == '.') {
        ++pos;
        for (; pos < end && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos, ++fracDigits) {
            if (fracDigits == 2 || !accumulate(value, text[pos])) throwInvalid(text);
        }
        if (fracDigits == 0) throwInvalid(text);
    }

    if (pos != end || intDigits + fracDigits == 0) {
        throwInvalid(text);
    }

    for (size_t i = fracDigits; i < 2; ++i) {
        if (!accumulate(value, '0')) throwInvalid(text);
    }

    return Money(negative ? -value : value);
}

std::string Money::toString() const {
    // abs через uint64_t, чтобы не споткнуться на INT64_MIN
    uint64_t magnitude = minor < 0
        ? static_cast<uint64_t>(-(minor + 1)) + 1
        : static_cast<uint64_t>(minor);

    std::string fraction = std::to_string(magnitude % 100);
    if (fraction.size() < 2) fraction.insert(0, "0");

    return (minor < 0 ? "-" : "") + std::to_string(magnitude / 100) + "." + fraction;
}

} // namespace ledger::domain
