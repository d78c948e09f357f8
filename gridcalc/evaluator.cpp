#include "evaluator.h"

#include <utility>

Evaluator::Evaluator(const FunctionRegistry& registry, CellResolver resolver, Size bounds, int max_depth)
    : registry_(registry), resolver_(std::move(resolver)), bounds_(bounds), max_depth_(max_depth) {
}

Value Evaluator::ResolveCell(Position pos) const {
    if (!bounds_.Contains(pos)) {
        throw FormulaError(FormulaError::Category::Ref, "reference " + pos.ToString() + " is outside the grid");
    }
    return resolver_(pos);
}

std::vector<Value> Evaluator::ResolveRange(const CellRange& range) const {
    CellRange normalized = range.Normalized();
    if (!bounds_.Contains(normalized.first) || !bounds_.Contains(normalized.last)) {
        throw FormulaError(FormulaError::Category::Ref, "range " + range.ToString() + " is outside the grid");
    }

    std::vector<Value> values;
    values.reserve(static_cast<size_t>(normalized.last.row - normalized.first.row + 1)
                   * (normalized.last.col - normalized.first.col + 1));
    for (int row = normalized.first.row; row <= normalized.last.row; ++row) {
        for (int col = normalized.first.col; col <= normalized.last.col; ++col) {
            values.push_back(resolver_({row, col}));
        }
    }
    return values;
}

Value Evaluator::Call(std::string_view name, const ArgumentList& args) const {
    const FunctionBody* function = registry_.Find(name);
    if (!function) {
        throw FormulaError(FormulaError::Category::Name, "unknown function " + std::string(name));
    }
    return (*function)(args);
}

void Evaluator::CheckDepth(int depth) const {
    if (depth > max_depth_) {
        throw FormulaError(FormulaError::Category::Depth,
                           "formula nesting exceeds " + std::to_string(max_depth_) + " levels");
    }
}

Size Evaluator::GetBounds() const {
    return bounds_;
}
