#pragma once

#include "common.h"
#include "functions.h"

#include <functional>
#include <string_view>
#include <vector>

// Returns the cached value of a cell, never parses or evaluates anything
using CellResolver = std::function<Value(Position)>;

class Evaluator {
public:
    static const int DEFAULT_MAX_DEPTH = 256;

    Evaluator(const FunctionRegistry& registry, CellResolver resolver, Size bounds,
              int max_depth = DEFAULT_MAX_DEPTH);

    // Throw FormulaError::Category::Ref for positions outside the grid
    Value ResolveCell(Position pos) const;
    std::vector<Value> ResolveRange(const CellRange& range) const;

    // Throws FormulaError::Category::Name for unknown functions
    Value Call(std::string_view name, const ArgumentList& args) const;

    // Throws FormulaError::Category::Depth past the nesting limit
    void CheckDepth(int depth) const;

    Size GetBounds() const;

private:
    const FunctionRegistry& registry_;
    CellResolver resolver_;
    Size bounds_;
    int max_depth_;
};
