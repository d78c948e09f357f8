#include "value.h"

#include <charconv>
#include <cmath>

std::optional<double> ParseNumber(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars не пропускает пробелы и не понимает hex в general-формате
    double result = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result,
                                     std::chars_format::general);
    if (ec != std::errc() || ptr != text.data() + text.size() || !std::isfinite(result)) {
        return std::nullopt;
    }
    return result;
}

std::string FormatNumber(double number) {
    if (number == 0) {
        return "0";
    }
    if (!std::isfinite(number)) {
        return std::isnan(number) ? "NaN" : (number > 0 ? "inf" : "-inf");
    }
    // fixed notation of DBL_MAX needs 309 digits
    char buffer[400];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), number, std::chars_format::fixed);
    if (ec != std::errc()) {
        return std::to_string(number);
    }
    return std::string(buffer, ptr);
}

Value ParseLiteral(const std::string& text) {
    if (auto number = ParseNumber(text)) {
        return *number;
    }
    return text;
}

double ToNumber(const Value& value) {
    if (std::holds_alternative<double>(value)) {
        return std::get<double>(value);
    }
    return ParseNumber(std::get<std::string>(value)).value_or(0.0);
}

std::string ToText(const Value& value) {
    if (std::holds_alternative<double>(value)) {
        return FormatNumber(std::get<double>(value));
    }
    return std::get<std::string>(value);
}

bool IsTruthy(const Value& value) {
    if (std::holds_alternative<double>(value)) {
        return std::get<double>(value) != 0;
    }
    return !std::get<std::string>(value).empty();
}

bool ValuesEqual(const Value& lhs, const Value& rhs) {
    if (lhs.index() != rhs.index()) {
        return ToText(lhs) == ToText(rhs);
    }
    if (std::holds_alternative<double>(lhs)) {
        return std::get<double>(lhs) == std::get<double>(rhs);
    }
    return std::get<std::string>(lhs) == std::get<std::string>(rhs);
}

int CompareNumeric(const Value& lhs, const Value& rhs) {
    double left = ToNumber(lhs);
    double right = ToNumber(rhs);
    if (left < right) {
        return -1;
    }
    return left > right ? 1 : 0;
}

Value Concatenate(const Value& lhs, const Value& rhs) {
    return ToText(lhs) + ToText(rhs);
}
