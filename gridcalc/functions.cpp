#include "functions.h"

#include "http_fetcher.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

using namespace std::literals;

namespace {

const size_t UNLIMITED = std::numeric_limits<size_t>::max();
const double MAX_ROUND_PLACES = 308.0;
// 2**53, above it every double is a whole number
const double EXACT_INTEGER_LIMIT = 9007199254740992.0;

std::string ToUpper(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

std::string ToLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

FormulaError IndexError(std::string message) {
    return FormulaError(FormulaError::Category::Index, std::move(message));
}

double RequireWhole(std::string_view name, const Value& value) {
    double number = RequireNumber(name, value);
    if (number < 0 || std::floor(number) != number) {
        throw IndexError(std::string(name) + ": " + FormatNumber(number) + " is not a valid position");
    }
    return number;
}

// Number of characters, saturates at the largest size_t
size_t RequireCount(std::string_view name, const Value& value) {
    double number = RequireWhole(name, value);
    if (number >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(number);
}

// Offset into a text of the given length, the end itself included
size_t RequirePosition(std::string_view name, const Value& value, std::string_view text) {
    double number = RequireWhole(name, value);
    if (number > static_cast<double>(text.size())) {
        throw IndexError(std::string(name) + ": start " + FormatNumber(number) + " is past the end of \""
                         + std::string(text) + "\"");
    }
    return static_cast<size_t>(number);
}

Value Bool(bool value) {
    return value ? 1.0 : 0.0;
}

FunctionBody Aggregate(std::string name, std::function<double(const std::vector<double>&)> reduce) {
    return Eager([name = std::move(name), reduce = std::move(reduce)](const std::vector<Value>& args) -> Value {
        CheckArity(name, args.size(), 1, UNLIMITED);
        std::vector<double> numbers;
        numbers.reserve(args.size());
        for (const Value& arg : args) {
            numbers.push_back(ToNumber(arg));
        }
        return reduce(numbers);
    });
}

FunctionBody UnaryText(std::string name, std::function<std::string(std::string_view)> transform) {
    return Eager([name = std::move(name), transform = std::move(transform)](const std::vector<Value>& args) -> Value {
        CheckArity(name, args.size(), 1, 1);
        return transform(ToText(args[0]));
    });
}

Value Round(const std::vector<Value>& args) {
    CheckArity("ROUND"sv, args.size(), 1, 2);
    double value = RequireNumber("ROUND"sv, args[0]);
    double places = args.size() == 2 ? std::trunc(RequireNumber("ROUND"sv, args[1])) : 0.0;
    // 10**places должно оставаться конечным
    places = std::clamp(places, -MAX_ROUND_PLACES, MAX_ROUND_PLACES);
    double multiplier = std::pow(10.0, places);
    double scaled = value * multiplier;
    if (!std::isfinite(scaled) || std::fabs(scaled) >= EXACT_INTEGER_LIMIT) {
        // дробной части уже нет
        return value;
    }
    double result = std::round(scaled) / multiplier;
    if (!std::isfinite(result)) {
        throw FormulaError(FormulaError::Category::Div0, "ROUND: result is not finite");
    }
    return result;
}

Value Left(const std::vector<Value>& args) {
    CheckArity("LEFT"sv, args.size(), 2, 2);
    std::string text = ToText(args[0]);
    size_t count = RequireCount("LEFT"sv, args[1]);
    return text.substr(0, count);
}

Value Right(const std::vector<Value>& args) {
    CheckArity("RIGHT"sv, args.size(), 2, 2);
    std::string text = ToText(args[0]);
    size_t count = std::min(RequireCount("RIGHT"sv, args[1]), text.size());
    return text.substr(text.size() - count);
}

Value Mid(const std::vector<Value>& args) {
    CheckArity("MID"sv, args.size(), 3, 3);
    std::string text = ToText(args[0]);
    size_t start = RequirePosition("MID"sv, args[1], text);
    size_t length = RequireCount("MID"sv, args[2]);
    return text.substr(start, length);
}

Value Find(const std::vector<Value>& args) {
    CheckArity("FIND"sv, args.size(), 2, 3);
    std::string needle = ToText(args[0]);
    std::string haystack = ToText(args[1]);
    size_t start = args.size() == 3 ? RequirePosition("FIND"sv, args[2], haystack) : 0;
    size_t found = haystack.find(needle, start);
    if (found == std::string::npos) {
        throw IndexError("FIND: \"" + needle + "\" not found in \"" + haystack + "\"");
    }
    return static_cast<double>(found);
}

Value Concat(const std::vector<Value>& args) {
    CheckArity("CONCAT"sv, args.size(), 1, UNLIMITED);
    std::string result;
    for (const Value& arg : args) {
        result += ToText(arg);
    }
    return result;
}

// Only the selected branch is evaluated
Value If(const ArgumentList& args) {
    CheckArity("IF"sv, args.Size(), 3, 3);
    return IsTruthy(args.Evaluate(0)) ? args.Evaluate(1) : args.Evaluate(2);
}

Value And(const std::vector<Value>& args) {
    CheckArity("AND"sv, args.size(), 1, UNLIMITED);
    return Bool(std::all_of(args.begin(), args.end(), IsTruthy));
}

Value Or(const std::vector<Value>& args) {
    CheckArity("OR"sv, args.size(), 1, UNLIMITED);
    return Bool(std::any_of(args.begin(), args.end(), IsTruthy));
}

Value Not(const std::vector<Value>& args) {
    CheckArity("NOT"sv, args.size(), 1, 1);
    return Bool(!IsTruthy(args[0]));
}

}  // namespace

FunctionBody Eager(EagerFunctionBody body) {
    return [body = std::move(body)](const ArgumentList& args) {
        return body(args.Expand());
    };
}

FunctionRegistry::FunctionRegistry(std::vector<FunctionDefinition> functions) {
    for (auto& function : functions) {
        functions_[ToUpper(function.name)] = std::move(function.body);
    }
}

const FunctionBody* FunctionRegistry::Find(std::string_view name) const {
    auto it = functions_.find(ToUpper(name));
    if (it == functions_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool FunctionRegistry::Contains(std::string_view name) const {
    return Find(name) != nullptr;
}

std::vector<std::string> FunctionRegistry::GetNames() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void CheckArity(std::string_view name, size_t count, size_t min_count, size_t max_count) {
    if (count >= min_count && count <= max_count) {
        return;
    }
    std::string expected;
    if (min_count == max_count) {
        expected = "exactly " + std::to_string(min_count);
    } else if (max_count == UNLIMITED) {
        expected = "at least " + std::to_string(min_count);
    } else {
        expected = std::to_string(min_count) + " to " + std::to_string(max_count);
    }
    throw FormulaError(FormulaError::Category::Arity,
                       std::string(name) + " expects " + expected + " argument(s), got " + std::to_string(count));
}

double RequireNumber(std::string_view name, const Value& value) {
    if (std::holds_alternative<double>(value)) {
        return std::get<double>(value);
    }
    const std::string& text = std::get<std::string>(value);
    if (text.empty()) {
        return 0;
    }
    if (auto number = ParseNumber(text)) {
        return *number;
    }
    throw FormulaError(FormulaError::Category::Value,
                       std::string(name) + ": \"" + text + "\" is not a number");
}

std::vector<FunctionDefinition> BuiltinFunctions(std::shared_ptr<HttpFetcher> fetcher) {
    std::vector<FunctionDefinition> functions;

    functions.push_back({"SUM", Aggregate("SUM", [](const std::vector<double>& numbers) {
        return std::accumulate(numbers.begin(), numbers.end(), 0.0);
    })});
    functions.push_back({"AVERAGE", Aggregate("AVERAGE", [](const std::vector<double>& numbers) {
        return std::accumulate(numbers.begin(), numbers.end(), 0.0) / static_cast<double>(numbers.size());
    })});
    functions.push_back({"MIN", Aggregate("MIN", [](const std::vector<double>& numbers) {
        return *std::min_element(numbers.begin(), numbers.end());
    })});
    functions.push_back({"MAX", Aggregate("MAX", [](const std::vector<double>& numbers) {
        return *std::max_element(numbers.begin(), numbers.end());
    })});

    functions.push_back({"ABS", Eager([](const std::vector<Value>& args) -> Value {
        CheckArity("ABS"sv, args.size(), 1, 1);
        return std::abs(RequireNumber("ABS"sv, args[0]));
    })});
    functions.push_back({"SQRT", Eager([](const std::vector<Value>& args) -> Value {
        CheckArity("SQRT"sv, args.size(), 1, 1);
        double number = RequireNumber("SQRT"sv, args[0]);
        if (number < 0) {
            throw FormulaError(FormulaError::Category::Value, "SQRT of negative number");
        }
        return std::sqrt(number);
    })});
    functions.push_back({"ROUND", Eager(Round)});

    functions.push_back({"LEN", Eager([](const std::vector<Value>& args) -> Value {
        CheckArity("LEN"sv, args.size(), 1, 1);
        return static_cast<double>(ToText(args[0]).size());
    })});
    functions.push_back({"UPPER", UnaryText("UPPER", ToUpper)});
    functions.push_back({"LOWER", UnaryText("LOWER", ToLower)});
    functions.push_back({"TRIM", UnaryText("TRIM", [](std::string_view text) {
        auto begin = std::find_if_not(text.begin(), text.end(), IsSpace);
        auto end = std::find_if_not(text.rbegin(), text.rend(), IsSpace).base();
        return begin < end ? std::string(begin, end) : std::string();
    })});

    functions.push_back({"LEFT", Eager(Left)});
    functions.push_back({"RIGHT", Eager(Right)});
    functions.push_back({"MID", Eager(Mid)});
    functions.push_back({"FIND", Eager(Find)});
    functions.push_back({"CONCAT", Eager(Concat)});

    functions.push_back({"IF", If});
    functions.push_back({"AND", Eager(And)});
    functions.push_back({"OR", Eager(Or)});
    functions.push_back({"NOT", Eager(Not)});

    functions.push_back({"GET", Eager([fetcher = std::move(fetcher)](const std::vector<Value>& args) -> Value {
        CheckArity("GET"sv, args.size(), 1, 1);
        if (!fetcher) {
            throw FormulaError(FormulaError::Category::Network, "GET: no HTTP transport configured");
        }
        return fetcher->Fetch(ToText(args[0]));
    })});

    return functions;
}

std::shared_ptr<const FunctionRegistry> MakeBuiltinRegistry(std::shared_ptr<HttpFetcher> fetcher) {
    return std::make_shared<const FunctionRegistry>(BuiltinFunctions(std::move(fetcher)));
}
