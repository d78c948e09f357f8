#pragma once

#include "common.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class HttpFetcher;

// Arguments of a function call. Nothing is evaluated until asked for, so a
// function decides which of its arguments are computed at all.
class ArgumentList {
public:
    virtual ~ArgumentList() = default;

    virtual size_t Size() const = 0;
    // Throws FormulaError, a range argument is a Value error here
    virtual Value Evaluate(size_t index) const = 0;
    // All arguments, ranges expanded row-major in place
    virtual std::vector<Value> Expand() const = 0;
};

using FunctionBody = std::function<Value(const ArgumentList& args)>;
using EagerFunctionBody = std::function<Value(const std::vector<Value>& args)>;

// Wraps a function over already evaluated, range-expanded arguments
FunctionBody Eager(EagerFunctionBody body);

struct FunctionDefinition {
    std::string name;
    FunctionBody body;
};

// Immutable name -> function table. Names are case-insensitive.
class FunctionRegistry {
public:
    explicit FunctionRegistry(std::vector<FunctionDefinition> functions);

    // nullptr for an unknown name
    const FunctionBody* Find(std::string_view name) const;
    bool Contains(std::string_view name) const;
    std::vector<std::string> GetNames() const;

private:
    std::unordered_map<std::string, FunctionBody> functions_;
};

// Throws FormulaError::Category::Arity unless min_count <= count <= max_count
void CheckArity(std::string_view name, size_t count, size_t min_count, size_t max_count);

// Numeric argument: numbers as is, empty text is 0, other text must parse.
// Throws FormulaError::Category::Value
double RequireNumber(std::string_view name, const Value& value);

// SUM, AVERAGE, MIN, MAX, ABS, SQRT, ROUND, LEN, UPPER, LOWER, TRIM, LEFT,
// RIGHT, MID, FIND, CONCAT, IF, AND, OR, NOT, GET
std::vector<FunctionDefinition> BuiltinFunctions(std::shared_ptr<HttpFetcher> fetcher);

std::shared_ptr<const FunctionRegistry> MakeBuiltinRegistry(std::shared_ptr<HttpFetcher> fetcher);
