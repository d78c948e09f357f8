#include "formula.h"

#include "FormulaAST.h"

#include <algorithm>
#include <sstream>

namespace {

const char FORMULA_SIGN = '=';

class Formula : public FormulaInterface {
public:
    explicit Formula(std::string expression);
    explicit Formula(FormulaAST ast);

    Result Evaluate(const Evaluator& evaluator) const override;
    std::string GetExpression() const override;
    const std::vector<CellRange>& GetReferences() const override;
    std::vector<Position> GetReferencedCells(Size bounds) const override;

private:
    FormulaAST ast_;
};

Formula::Formula(std::string expression)
    : ast_(ParseFormulaAST(expression)) {
}

Formula::Formula(FormulaAST ast)
    : ast_(std::move(ast)) {
}

FormulaInterface::Result Formula::Evaluate(const Evaluator& evaluator) const {
    try {
        return ast_.Execute(evaluator);
    } catch (const FormulaError& fe) {
        return fe;
    }
}

std::string Formula::GetExpression() const {
    std::ostringstream out;
    ast_.PrintFormula(out);
    return out.str();
}

const std::vector<CellRange>& Formula::GetReferences() const {
    return ast_.GetReferences();
}

std::vector<Position> Formula::GetReferencedCells(Size bounds) const {
    std::vector<Position> cells;
    for (const CellRange& reference : ast_.GetReferences()) {
        CellRange range = reference.Normalized();
        int last_row = std::min(range.last.row, bounds.rows - 1);
        int last_col = std::min(range.last.col, bounds.cols - 1);
        for (int row = range.first.row; row <= last_row; ++row) {
            for (int col = range.first.col; col <= last_col; ++col) {
                cells.push_back({row, col});
            }
        }
    }
    std::sort(cells.begin(), cells.end());
    cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
    return cells;
}

}  // namespace

std::unique_ptr<FormulaInterface> ParseFormula(std::string expression) {
    return std::make_unique<Formula>(std::move(expression));
}

std::string AdjustFormulaReferences(const std::string& text, int row_offset, int col_offset) {
    if (text.size() < 2 || text.front() != FORMULA_SIGN) {
        return text;
    }
    try {
        Formula shifted(ParseFormulaAST(text.substr(1)).Shifted(row_offset, col_offset));
        return FORMULA_SIGN + shifted.GetExpression();
    } catch (const FormulaException&) {
        return text;
    }
}
