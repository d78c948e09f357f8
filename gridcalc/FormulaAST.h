#pragma once

#include "common.h"

#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class Evaluator;

namespace ASTImpl {
class Expr;
}

class ParsingError : public std::runtime_error {
public:
    ParsingError(const std::string& message, size_t position)
        : std::runtime_error(message), position_(position) {
    }

    size_t GetPosition() const {
        return position_;
    }

private:
    size_t position_;
};

class FormulaAST {
public:
    explicit FormulaAST(std::unique_ptr<ASTImpl::Expr> root_expr, std::vector<CellRange> references = {});

    FormulaAST(FormulaAST&&);
    FormulaAST& operator=(FormulaAST&&);
    ~FormulaAST();

    // Throws FormulaError
    Value Execute(const Evaluator& evaluator) const;

    // (op lhs rhs) form, for debugging
    void Print(std::ostream& out) const;
    // Formula text with only the parentheses precedence requires
    void PrintFormula(std::ostream& out) const;

    // Cell and range references in the order they are written
    const std::vector<CellRange>& GetReferences() const;

    // Copy with every reference moved by the offsets, clamped at row/column 0
    FormulaAST Shifted(int row_offset, int col_offset) const;

private:
    std::unique_ptr<ASTImpl::Expr> root_expr_;
    std::vector<CellRange> references_;
};

// Throw FormulaException
FormulaAST ParseFormulaAST(std::istream& in);
FormulaAST ParseFormulaAST(const std::string& in_str);
