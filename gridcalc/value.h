#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Значение ячейки или выражения: число или текст.
// Пустая ячейка читается как текст "" (0 в числовом контексте).
using Value = std::variant<double, std::string>;

inline const std::string ERROR_SENTINEL = "#ERROR";

// Strict number syntax: optional sign, digits, optional fraction and exponent.
// No surrounding whitespace, non-finite results are rejected.
std::optional<double> ParseNumber(std::string_view text);

// Shortest round-trip digits in fixed notation, "5" rather than "5.0".
std::string FormatNumber(double number);

// Literal cell text becomes a number when it parses as one, text otherwise.
Value ParseLiteral(const std::string& text);

double ToNumber(const Value& value);
std::string ToText(const Value& value);
bool IsTruthy(const Value& value);

// "=" and "<>": same alternative compares natively, mixed alternatives compare as text.
bool ValuesEqual(const Value& lhs, const Value& rhs);

// "<", ">", "<=", ">=" always compare numerically; returns -1, 0 or 1.
int CompareNumeric(const Value& lhs, const Value& rhs);

// "&" always produces text.
Value Concatenate(const Value& lhs, const Value& rhs);
