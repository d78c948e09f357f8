#include "FormulaAST.h"

#include "FormulaBaseListener.h"
#include "FormulaLexer.h"
#include "FormulaParser.h"
#include "evaluator.h"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <cmath>
#include <exception>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ASTImpl {

// Grammar precedence, loosest first
enum ExprPrecedence {
    EP_EQUALITY,
    EP_COMPARISON,
    EP_ADDITIVE,
    EP_CONCAT,
    EP_MULTIPLICATIVE,
    EP_POWER,
    EP_UNARY,
    EP_ATOM,
};

class Expr {
public:
    virtual ~Expr() = default;
    virtual void Print(std::ostream& out) const = 0;
    virtual void DoPrintFormula(std::ostream& out, ExprPrecedence precedence) const = 0;
    virtual Value Evaluate(const Evaluator& evaluator, int depth) const = 0;
    virtual std::unique_ptr<Expr> Shift(int row_offset, int col_offset) const = 0;

    // higher is tighter
    virtual ExprPrecedence GetPrecedence() const = 0;

    // Only a range node returns its range; ranges are function arguments, not values
    virtual const CellRange* GetRange() const {
        return nullptr;
    }

    // A child looser than its parent always needs parentheses. A child of the
    // same precedence needs them on the side its parent does not associate to:
    // A-(B+C) and (A**B)**C, but not (A-B)+C or A**(B**C).
    void PrintFormula(std::ostream& out, ExprPrecedence parent_precedence,
                      bool parens_on_tie = false) const {
        auto precedence = GetPrecedence();
        bool parens_needed = precedence < parent_precedence
                             || (parens_on_tie && precedence == parent_precedence);
        if (parens_needed) {
            out << '(';
        }

        DoPrintFormula(out, precedence);

        if (parens_needed) {
            out << ')';
        }
    }
};

namespace {

Position ShiftPosition(Position pos, int row_offset, int col_offset) {
    return {std::clamp(pos.row + row_offset, 0, Position::MAX_ROWS - 1),
            std::clamp(pos.col + col_offset, 0, Position::MAX_COLS - 1)};
}

CellRange ShiftRange(const CellRange& range, int row_offset, int col_offset) {
    return {ShiftPosition(range.first, row_offset, col_offset),
            ShiftPosition(range.last, row_offset, col_offset)};
}

double CheckFinite(double result, std::string_view what) {
    if (std::isfinite(result)) {
        return result;
    }
    throw FormulaError(FormulaError::Category::Div0, std::string(what) + " result is not finite");
}

class BinaryOpExpr final : public Expr {
public:
    enum Type {
        Add,
        Subtract,
        Multiply,
        Divide,
        Modulo,
        Power,
        Concat,
        Less,
        LessEqual,
        Greater,
        GreaterEqual,
        Equal,
        NotEqual,
    };

public:
    explicit BinaryOpExpr(Type type, std::unique_ptr<Expr> lhs, std::unique_ptr<Expr> rhs)
        : type_(type)
        , lhs_(std::move(lhs))
        , rhs_(std::move(rhs)) {
    }

    void Print(std::ostream& out) const override {
        out << '(' << GetSymbol() << ' ';
        lhs_->Print(out);
        out << ' ';
        rhs_->Print(out);
        out << ')';
    }

    void DoPrintFormula(std::ostream& out, ExprPrecedence precedence) const override {
        bool right_associative = type_ == Power;
        lhs_->PrintFormula(out, precedence, right_associative);
        out << GetSymbol();
        rhs_->PrintFormula(out, precedence, !right_associative);
    }

    ExprPrecedence GetPrecedence() const override {
        switch (type_) {
            case Equal:
            case NotEqual:
                return EP_EQUALITY;
            case Less:
            case LessEqual:
            case Greater:
            case GreaterEqual:
                return EP_COMPARISON;
            case Add:
            case Subtract:
                return EP_ADDITIVE;
            case Concat:
                return EP_CONCAT;
            case Multiply:
            case Divide:
            case Modulo:
                return EP_MULTIPLICATIVE;
            case Power:
                return EP_POWER;
        }
        assert(false);
        return EP_ATOM;
    }

    Value Evaluate(const Evaluator& evaluator, int depth) const override {
        evaluator.CheckDepth(depth);
        Value left = lhs_->Evaluate(evaluator, depth + 1);
        Value right = rhs_->Evaluate(evaluator, depth + 1);

        switch (type_) {
            case Equal:
                return ValuesEqual(left, right) ? 1.0 : 0.0;
            case NotEqual:
                return ValuesEqual(left, right) ? 0.0 : 1.0;
            case Less:
                return CompareNumeric(left, right) < 0 ? 1.0 : 0.0;
            case LessEqual:
                return CompareNumeric(left, right) <= 0 ? 1.0 : 0.0;
            case Greater:
                return CompareNumeric(left, right) > 0 ? 1.0 : 0.0;
            case GreaterEqual:
                return CompareNumeric(left, right) >= 0 ? 1.0 : 0.0;
            case Concat:
                return Concatenate(left, right);
            default:
                return EvaluateArithmetic(ToNumber(left), ToNumber(right));
        }
    }

    std::unique_ptr<Expr> Shift(int row_offset, int col_offset) const override {
        return std::make_unique<BinaryOpExpr>(type_, lhs_->Shift(row_offset, col_offset),
                                              rhs_->Shift(row_offset, col_offset));
    }

private:
    std::string_view GetSymbol() const {
        switch (type_) {
            case Add:
                return "+";
            case Subtract:
                return "-";
            case Multiply:
                return "*";
            case Divide:
                return "/";
            case Modulo:
                return "%";
            case Power:
                return "**";
            case Concat:
                return "&";
            case Less:
                return "<";
            case LessEqual:
                return "<=";
            case Greater:
                return ">";
            case GreaterEqual:
                return ">=";
            case Equal:
                return "=";
            case NotEqual:
                return "<>";
        }
        assert(false);
        return "";
    }

    double EvaluateArithmetic(double left, double right) const {
        switch (type_) {
            case Add:
                return CheckFinite(left + right, "addition");
            case Subtract:
                return CheckFinite(left - right, "subtraction");
            case Multiply:
                return CheckFinite(left * right, "multiplication");
            case Divide:
                if (right == 0) {
                    throw FormulaError(FormulaError::Category::Div0, "division by zero");
                }
                return CheckFinite(left / right, "division");
            case Modulo:
                if (right == 0) {
                    throw FormulaError(FormulaError::Category::Div0, "modulo by zero");
                }
                return CheckFinite(std::fmod(left, right), "modulo");
            case Power:
                return CheckFinite(std::pow(left, right), "power");
            default:
                assert(false);
                return 0;
        }
    }

    Type type_;
    std::unique_ptr<Expr> lhs_;
    std::unique_ptr<Expr> rhs_;
};

class UnaryOpExpr final : public Expr {
public:
    enum Type : char {
        UnaryPlus = '+',
        UnaryMinus = '-',
    };

public:
    explicit UnaryOpExpr(Type type, std::unique_ptr<Expr> operand)
        : type_(type)
        , operand_(std::move(operand)) {
    }

    void Print(std::ostream& out) const override {
        out << '(' << static_cast<char>(type_) << ' ';
        operand_->Print(out);
        out << ')';
    }

    void DoPrintFormula(std::ostream& out, ExprPrecedence precedence) const override {
        out << static_cast<char>(type_);
        operand_->PrintFormula(out, precedence);
    }

    ExprPrecedence GetPrecedence() const override {
        return EP_UNARY;
    }

    Value Evaluate(const Evaluator& evaluator, int depth) const override {
        evaluator.CheckDepth(depth);
        double operand = ToNumber(operand_->Evaluate(evaluator, depth + 1));
        switch (type_) {
            case UnaryPlus:
                return operand;
            case UnaryMinus:
                return -operand;
        }
        assert(false);
        return operand;
    }

    std::unique_ptr<Expr> Shift(int row_offset, int col_offset) const override {
        return std::make_unique<UnaryOpExpr>(type_, operand_->Shift(row_offset, col_offset));
    }

private:
    Type type_;
    std::unique_ptr<Expr> operand_;
};

class NumberExpr final : public Expr {
public:
    explicit NumberExpr(double value)
        : value_(value) {
    }

    void Print(std::ostream& out) const override {
        out << FormatNumber(value_);
    }

    void DoPrintFormula(std::ostream& out, ExprPrecedence /* precedence */) const override {
        out << FormatNumber(value_);
    }

    ExprPrecedence GetPrecedence() const override {
        return EP_ATOM;
    }

    Value Evaluate(const Evaluator& /* evaluator */, int /* depth */) const override {
        return value_;
    }

    std::unique_ptr<Expr> Shift(int /* row_offset */, int /* col_offset */) const override {
        return std::make_unique<NumberExpr>(value_);
    }

private:
    double value_;
};

class StringExpr final : public Expr {
public:
    explicit StringExpr(std::string value)
        : value_(std::move(value)) {
    }

    void Print(std::ostream& out) const override {
        DoPrintFormula(out, EP_ATOM);
    }

    // embedded quotes are doubled back
    void DoPrintFormula(std::ostream& out, ExprPrecedence /* precedence */) const override {
        out << '"';
        for (char c : value_) {
            if (c == '"') {
                out << '"';
            }
            out << c;
        }
        out << '"';
    }

    ExprPrecedence GetPrecedence() const override {
        return EP_ATOM;
    }

    Value Evaluate(const Evaluator& /* evaluator */, int /* depth */) const override {
        return value_;
    }

    std::unique_ptr<Expr> Shift(int /* row_offset */, int /* col_offset */) const override {
        return std::make_unique<StringExpr>(value_);
    }

private:
    std::string value_;
};

class CellExpr final : public Expr {
public:
    explicit CellExpr(Position pos)
        : pos_(pos) {
    }

    void Print(std::ostream& out) const override {
        out << pos_.ToString();
    }

    void DoPrintFormula(std::ostream& out, ExprPrecedence /* precedence */) const override {
        Print(out);
    }

    ExprPrecedence GetPrecedence() const override {
        return EP_ATOM;
    }

    Value Evaluate(const Evaluator& evaluator, int /* depth */) const override {
        return evaluator.ResolveCell(pos_);
    }

    std::unique_ptr<Expr> Shift(int row_offset, int col_offset) const override {
        return std::make_unique<CellExpr>(ShiftPosition(pos_, row_offset, col_offset));
    }

private:
    Position pos_;
};

class RangeExpr final : public Expr {
public:
    explicit RangeExpr(CellRange range)
        : range_(range) {
    }

    void Print(std::ostream& out) const override {
        out << range_.first.ToString() << ':' << range_.last.ToString();
    }

    void DoPrintFormula(std::ostream& out, ExprPrecedence /* precedence */) const override {
        Print(out);
    }

    ExprPrecedence GetPrecedence() const override {
        return EP_ATOM;
    }

    Value Evaluate(const Evaluator& /* evaluator */, int /* depth */) const override {
        throw FormulaError(FormulaError::Category::Value,
                           "range " + range_.first.ToString() + ':' + range_.last.ToString()
                               + " cannot be evaluated directly");
    }

    std::unique_ptr<Expr> Shift(int row_offset, int col_offset) const override {
        return std::make_unique<RangeExpr>(ShiftRange(range_, row_offset, col_offset));
    }

    const CellRange* GetRange() const override {
        return &range_;
    }

private:
    CellRange range_;
};

class CallExpr final : public Expr {
public:
    CallExpr(std::string name, std::vector<std::unique_ptr<Expr>> args)
        : name_(std::move(name))
        , args_(std::move(args)) {
    }

    void Print(std::ostream& out) const override {
        out << '(' << name_;
        for (const auto& arg : args_) {
            out << ' ';
            arg->Print(out);
        }
        out << ')';
    }

    void DoPrintFormula(std::ostream& out, ExprPrecedence /* precedence */) const override {
        out << name_ << '(';
        bool first = true;
        for (const auto& arg : args_) {
            if (!first) {
                out << ',';
            }
            first = false;
            arg->PrintFormula(out, EP_EQUALITY);
        }
        out << ')';
    }

    ExprPrecedence GetPrecedence() const override {
        return EP_ATOM;
    }

    Value Evaluate(const Evaluator& evaluator, int depth) const override {
        evaluator.CheckDepth(depth);
        Arguments arguments(args_, evaluator, depth + 1);
        return evaluator.Call(name_, arguments);
    }

    std::unique_ptr<Expr> Shift(int row_offset, int col_offset) const override {
        std::vector<std::unique_ptr<Expr>> args;
        args.reserve(args_.size());
        for (const auto& arg : args_) {
            args.push_back(arg->Shift(row_offset, col_offset));
        }
        return std::make_unique<CallExpr>(name_, std::move(args));
    }

private:
    class Arguments final : public ArgumentList {
    public:
        Arguments(const std::vector<std::unique_ptr<Expr>>& args, const Evaluator& evaluator, int depth)
            : args_(args)
            , evaluator_(evaluator)
            , depth_(depth) {
        }

        size_t Size() const override {
            return args_.size();
        }

        Value Evaluate(size_t index) const override {
            return args_.at(index)->Evaluate(evaluator_, depth_);
        }

        std::vector<Value> Expand() const override {
            std::vector<Value> values;
            values.reserve(args_.size());
            for (const auto& arg : args_) {
                if (const CellRange* range = arg->GetRange()) {
                    auto range_values = evaluator_.ResolveRange(*range);
                    std::move(range_values.begin(), range_values.end(), std::back_inserter(values));
                } else {
                    values.push_back(arg->Evaluate(evaluator_, depth_));
                }
            }
            return values;
        }

    private:
        const std::vector<std::unique_ptr<Expr>>& args_;
        const Evaluator& evaluator_;
        int depth_;
    };

    std::string name_;
    std::vector<std::unique_ptr<Expr>> args_;
};

size_t StartOf(antlr4::ParserRuleContext* ctx) {
    return ctx->getStart()->getStartIndex();
}

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

// "Quote""Test" -> Quote"Test
std::string DecodeStringLiteral(const std::string& token) {
    assert(token.size() >= 2 && token.front() == '"' && token.back() == '"');
    std::string result;
    result.reserve(token.size() - 2);
    for (size_t i = 1; i + 1 < token.size(); ++i) {
        result.push_back(token[i]);
        if (token[i] == '"') {
            ++i;
        }
    }
    return result;
}

class ParseASTListener final : public FormulaBaseListener {
public:
    std::unique_ptr<Expr> MoveRoot() {
        assert(args_.size() == 1);
        auto root = std::move(args_.front());
        args_.clear();

        return root;
    }

    std::vector<CellRange> MoveReferences() {
        return std::move(references_);
    }

public:
    void exitUnaryOp(FormulaParser::UnaryOpContext* ctx) override {
        assert(args_.size() >= 1);

        auto operand = std::move(args_.back());

        UnaryOpExpr::Type type;
        if (ctx->SUB()) {
            type = UnaryOpExpr::UnaryMinus;
        } else {
            assert(ctx->ADD() != nullptr);
            type = UnaryOpExpr::UnaryPlus;
        }

        auto node = std::make_unique<UnaryOpExpr>(type, std::move(operand));
        args_.back() = std::move(node);
    }

    void exitLiteral(FormulaParser::LiteralContext* ctx) override {
        double value = 0;
        auto valueStr = ctx->NUMBER()->getSymbol()->getText();
        std::istringstream in(valueStr);
        in >> value;
        if (!in) {
            throw ParsingError("Invalid number: " + valueStr, StartOf(ctx));
        }

        auto node = std::make_unique<NumberExpr>(value);
        args_.push_back(std::move(node));
    }

    void exitStringLiteral(FormulaParser::StringLiteralContext* ctx) override {
        args_.push_back(std::make_unique<StringExpr>(DecodeStringLiteral(ctx->STRING()->getText())));
    }

    void exitCell(FormulaParser::CellContext* ctx) override {
        Position pos = ToPosition(ctx->CELL());
        args_.push_back(std::make_unique<CellExpr>(pos));
        references_.push_back({pos, pos});
    }

    void exitRange(FormulaParser::RangeContext* ctx) override {
        CellRange range{ToPosition(ctx->CELL(0)), ToPosition(ctx->CELL(1))};
        args_.push_back(std::make_unique<RangeExpr>(range));
        references_.push_back(range);
    }

    void exitCall(FormulaParser::CallContext* ctx) override {
        size_t count = ctx->expr().size();
        assert(args_.size() >= count);

        std::vector<std::unique_ptr<Expr>> call_args;
        call_args.reserve(count);
        auto first = args_.end() - static_cast<std::ptrdiff_t>(count);
        std::move(first, args_.end(), std::back_inserter(call_args));
        args_.erase(first, args_.end());

        args_.push_back(std::make_unique<CallExpr>(ToUpper(ctx->NAME()->getText()), std::move(call_args)));
    }

    void exitBinaryOp(FormulaParser::BinaryOpContext* ctx) override {
        assert(args_.size() >= 2);

        auto rhs = std::move(args_.back());
        args_.pop_back();

        auto lhs = std::move(args_.back());

        BinaryOpExpr::Type type;
        if (ctx->ADD()) {
            type = BinaryOpExpr::Add;
        } else if (ctx->SUB()) {
            type = BinaryOpExpr::Subtract;
        } else if (ctx->MUL()) {
            type = BinaryOpExpr::Multiply;
        } else if (ctx->DIV()) {
            type = BinaryOpExpr::Divide;
        } else if (ctx->MOD()) {
            type = BinaryOpExpr::Modulo;
        } else if (ctx->POW()) {
            type = BinaryOpExpr::Power;
        } else if (ctx->CONCAT()) {
            type = BinaryOpExpr::Concat;
        } else if (ctx->LT()) {
            type = BinaryOpExpr::Less;
        } else if (ctx->LE()) {
            type = BinaryOpExpr::LessEqual;
        } else if (ctx->GT()) {
            type = BinaryOpExpr::Greater;
        } else if (ctx->GE()) {
            type = BinaryOpExpr::GreaterEqual;
        } else if (ctx->EQ()) {
            type = BinaryOpExpr::Equal;
        } else {
            assert(ctx->NE() != nullptr);
            type = BinaryOpExpr::NotEqual;
        }

        auto node = std::make_unique<BinaryOpExpr>(type, std::move(lhs), std::move(rhs));
        args_.back() = std::move(node);
    }

    void visitErrorNode(antlr4::tree::ErrorNode* node) override {
        throw ParsingError("Error when parsing: " + node->getSymbol()->getText(),
                           node->getSymbol()->getStartIndex());
    }

private:
    static Position ToPosition(antlr4::tree::TerminalNode* cell) {
        Position pos = Position::FromString(cell->getText());
        if (!pos.IsValid()) {
            throw ParsingError("Invalid cell reference: " + cell->getText(), cell->getSymbol()->getStartIndex());
        }
        return pos;
    }

    std::vector<std::unique_ptr<Expr>> args_;
    std::vector<CellRange> references_;
};

// Both the lexer and the parser stop at the first error
class BailErrorListener : public antlr4::BaseErrorListener {
public:
    explicit BailErrorListener(std::string stage)
        : stage_(std::move(stage)) {
    }

    void syntaxError(antlr4::Recognizer* recognizer, antlr4::Token* offendingSymbol,
                     size_t /* line */, size_t charPositionInLine, const std::string& msg,
                     std::exception_ptr /* e */
                     ) override {
        size_t position = charPositionInLine;
        if (offendingSymbol) {
            position = offendingSymbol->getStartIndex();
        } else if (auto* lexer = dynamic_cast<antlr4::Lexer*>(recognizer)) {
            // у лексера нет токена, charPositionInLine считается от начала строки
            position = lexer->tokenStartCharIndex;
        }
        throw ParsingError("Error when " + stage_ + ": " + msg, position);
    }

private:
    std::string stage_;
};

bool IsOperator(size_t token_type) {
    switch (token_type) {
        case FormulaLexer::POW:
        case FormulaLexer::ADD:
        case FormulaLexer::SUB:
        case FormulaLexer::MUL:
        case FormulaLexer::DIV:
        case FormulaLexer::MOD:
        case FormulaLexer::CONCAT:
        case FormulaLexer::LE:
        case FormulaLexer::GE:
        case FormulaLexer::NE:
        case FormulaLexer::LT:
        case FormulaLexer::GT:
        case FormulaLexer::EQ:
            return true;
        default:
            return false;
    }
}

// Upper bound of the tree depth taken from the tokens alone. The parser, the
// tree walker and the AST destructor all recurse once per level, so anything
// deeper than max_nesting is rejected before parsing starts.
void CheckNesting(const std::vector<antlr4::Token*>& tokens, int max_nesting) {
    struct Group {
        int operators = 0;  // in the current argument
        int inner = 0;      // deepest closed group in the current argument
        int done = 0;       // deepest finished argument
    };
    std::vector<Group> groups(1);
    int open_levels = 0;  // sum of operators + 1 over the open groups

    auto fail = [max_nesting](const antlr4::Token* token) {
        throw ParsingError("Error when parsing: formula nesting exceeds " + std::to_string(max_nesting) + " levels",
                           token->getStartIndex());
    };

    for (const antlr4::Token* token : tokens) {
        const std::string text = token->getText();
        Group& group = groups.back();
        if (IsOperator(token->getType())) {
            ++group.operators;
            ++open_levels;
            if (open_levels > max_nesting || group.operators + group.inner > max_nesting) {
                fail(token);
            }
        } else if (text == "(") {
            groups.emplace_back();
            ++open_levels;
            if (open_levels > max_nesting) {
                fail(token);
            }
        } else if (text == ",") {
            group.done = std::max(group.done, group.operators + group.inner);
            open_levels -= group.operators;
            group.operators = 0;
            group.inner = 0;
        } else if (text == ")" && groups.size() > 1) {
            int depth = std::max(group.done, group.operators + group.inner) + 1;
            open_levels -= group.operators + 1;
            groups.pop_back();
            Group& outer = groups.back();
            outer.inner = std::max(outer.inner, depth);
            if (outer.operators + outer.inner > max_nesting) {
                fail(token);
            }
        }
    }
}

}  // namespace
}  // namespace ASTImpl

FormulaAST ParseFormulaAST(std::istream& in) {
    using namespace antlr4;

    ANTLRInputStream input(in);

    FormulaLexer lexer(&input);
    ASTImpl::BailErrorListener lexer_error_listener("lexing");
    lexer.removeErrorListeners();
    lexer.addErrorListener(&lexer_error_listener);

    CommonTokenStream tokens(&lexer);
    tokens.fill();
    ASTImpl::CheckNesting(tokens.getTokens(), Evaluator::DEFAULT_MAX_DEPTH);

    FormulaParser parser(&tokens);
    ASTImpl::BailErrorListener parser_error_listener("parsing");
    parser.removeErrorListeners();
    parser.addErrorListener(&parser_error_listener);

    tree::ParseTree* tree = parser.main();
    ASTImpl::ParseASTListener listener;
    tree::ParseTreeWalker::DEFAULT.walk(&listener, tree);

    auto root = listener.MoveRoot();
    return FormulaAST(std::move(root), listener.MoveReferences());
}

FormulaAST ParseFormulaAST(const std::string& in_str) {
    std::istringstream in(in_str);
    try {
        return ParseFormulaAST(in);
    } catch (const ParsingError& exc) {
        throw FormulaException(exc.what(), exc.GetPosition());
    } catch (const std::exception& exc) {
        std::throw_with_nested(FormulaException(exc.what(), 0));
    }
}

void FormulaAST::Print(std::ostream& out) const {
    root_expr_->Print(out);
}

void FormulaAST::PrintFormula(std::ostream& out) const {
    root_expr_->PrintFormula(out, ASTImpl::EP_EQUALITY);
}

Value FormulaAST::Execute(const Evaluator& evaluator) const {
    return root_expr_->Evaluate(evaluator, 1);
}

const std::vector<CellRange>& FormulaAST::GetReferences() const {
    return references_;
}

FormulaAST FormulaAST::Shifted(int row_offset, int col_offset) const {
    std::vector<CellRange> references;
    references.reserve(references_.size());
    for (const auto& range : references_) {
        references.push_back(ASTImpl::ShiftRange(range, row_offset, col_offset));
    }
    return FormulaAST(root_expr_->Shift(row_offset, col_offset), std::move(references));
}

FormulaAST::FormulaAST(std::unique_ptr<ASTImpl::Expr> root_expr, std::vector<CellRange> references)
    : root_expr_(std::move(root_expr))
    , references_(std::move(references)) {
}

FormulaAST::FormulaAST(FormulaAST&&) = default;
FormulaAST& FormulaAST::operator=(FormulaAST&&) = default;
FormulaAST::~FormulaAST() = default;
