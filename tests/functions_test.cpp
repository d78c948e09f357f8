#include "evaluator.h"
#include "formula.h"
#include "functions.h"
#include "http_fetcher.h"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

class FakeHttpFetcher : public HttpFetcher {
public:
    std::string Fetch(const std::string& url) override {
        urls.push_back(url);
        return "body of " + url;
    }

    std::vector<std::string> urls;
};

class FunctionsTest : public ::testing::Test {
protected:
    FunctionsTest()
        : fetcher_(std::make_shared<FakeHttpFetcher>())
        , registry_(BuiltinFunctions(fetcher_))
        , evaluator_(registry_, [this](Position pos) { return Resolve(pos); }, {10, 10}) {
    }

    void Set(std::string_view cell, Value value) {
        cells_[Position::FromString(cell)] = std::move(value);
    }

    FormulaInterface::Result Evaluate(const std::string& expression) const {
        return ParseFormula(expression)->Evaluate(evaluator_);
    }

    double Number(const std::string& expression) const {
        auto result = Evaluate(expression);
        if (auto* error = std::get_if<FormulaError>(&result)) {
            ADD_FAILURE() << expression << ": " << *error;
            return 0;
        }
        const Value& value = std::get<Value>(result);
        EXPECT_TRUE(std::holds_alternative<double>(value)) << expression << ": " << ToText(value);
        return ToNumber(value);
    }

    std::string Text(const std::string& expression) const {
        auto result = Evaluate(expression);
        if (auto* error = std::get_if<FormulaError>(&result)) {
            ADD_FAILURE() << expression << ": " << *error;
            return {};
        }
        const Value& value = std::get<Value>(result);
        EXPECT_TRUE(std::holds_alternative<std::string>(value)) << expression;
        return ToText(value);
    }

    FormulaError::Category ErrorOf(const std::string& expression) const {
        auto result = Evaluate(expression);
        if (auto* error = std::get_if<FormulaError>(&result)) {
            return error->GetCategory();
        }
        ADD_FAILURE() << expression << " evaluated to " << ToText(std::get<Value>(result));
        return FormulaError::Category::Circular;
    }

    std::shared_ptr<FakeHttpFetcher> fetcher_;
    FunctionRegistry registry_;
    Evaluator evaluator_;

private:
    Value Resolve(Position pos) const {
        auto it = cells_.find(pos);
        return it == cells_.end() ? Value(std::string()) : it->second;
    }

    std::map<Position, Value> cells_;
};

using Category = FormulaError::Category;

}  // namespace

TEST(FunctionRegistry, CaseInsensitiveLookup) {
    FunctionRegistry registry({{"Twice", Eager([](const std::vector<Value>& args) -> Value {
                                    return ToNumber(args.at(0)) * 2;
                                })}});
    EXPECT_TRUE(registry.Contains("TWICE"));
    EXPECT_TRUE(registry.Contains("twice"));
    EXPECT_EQ(registry.Find("thrice"), nullptr);
    EXPECT_EQ(registry.GetNames(), std::vector<std::string>{"TWICE"});
}

TEST(FunctionRegistry, BuiltinNames) {
    auto registry = MakeBuiltinRegistry(nullptr);
    std::vector<std::string> expected = {"ABS",   "AND", "AVERAGE", "CONCAT", "FIND",  "GET",   "IF",
                                         "LEFT",  "LEN", "LOWER",   "MAX",    "MID",   "MIN",   "NOT",
                                         "OR",    "RIGHT", "ROUND", "SQRT",   "SUM",   "TRIM",  "UPPER"};
    EXPECT_EQ(registry->GetNames(), expected);
}

TEST_F(FunctionsTest, Arithmetic) {
    EXPECT_DOUBLE_EQ(Number("1+2*3"), 7);
    EXPECT_DOUBLE_EQ(Number("(1+2)*3"), 9);
    EXPECT_DOUBLE_EQ(Number("7-2-1"), 4);
    EXPECT_DOUBLE_EQ(Number("2**3**2"), 512);
    EXPECT_DOUBLE_EQ(Number("2^3"), 8);
    EXPECT_DOUBLE_EQ(Number("-2**2"), 4);
    EXPECT_DOUBLE_EQ(Number("5%3"), 2);
    EXPECT_DOUBLE_EQ(Number("-5%3"), -2);
    EXPECT_DOUBLE_EQ(Number("+\"4\""), 4);
}

TEST_F(FunctionsTest, ConcatenationBindsTighterThanAddition) {
    EXPECT_DOUBLE_EQ(Number("1+2&3"), 24);
    EXPECT_EQ(Text("\"a\"&1*2"), "a2");
}

TEST_F(FunctionsTest, Comparison) {
    EXPECT_DOUBLE_EQ(Number("1<2"), 1);
    EXPECT_DOUBLE_EQ(Number("2<=1"), 0);
    EXPECT_DOUBLE_EQ(Number("\"abc\"=\"abc\""), 1);
    EXPECT_DOUBLE_EQ(Number("\"abc\"=\"ABC\""), 0);
    EXPECT_DOUBLE_EQ(Number("\"1\"=1"), 1);
    EXPECT_DOUBLE_EQ(Number("\"a\"<\"b\""), 0);
    EXPECT_DOUBLE_EQ(Number("1<>2"), 1);
    EXPECT_DOUBLE_EQ(Number("1+1=2"), 1);
}

TEST_F(FunctionsTest, QuoteEscaping) {
    EXPECT_EQ(Text("\"Quote\"\"Test\""), "Quote\"Test");
}

TEST_F(FunctionsTest, EmptyCellCoercion) {
    EXPECT_DOUBLE_EQ(Number("A1+1"), 1);
    EXPECT_EQ(Text("A1&\"x\""), "x");
}

TEST_F(FunctionsTest, ArithmeticErrors) {
    EXPECT_EQ(ErrorOf("1/0"), Category::Div0);
    EXPECT_EQ(ErrorOf("1%0"), Category::Div0);
    EXPECT_EQ(ErrorOf("10**400"), Category::Div0);
}

TEST_F(FunctionsTest, Aggregates) {
    Set("A1", 1.0);
    Set("A2", std::string("2"));
    Set("B1", 4.0);
    EXPECT_DOUBLE_EQ(Number("SUM(A1:A3)"), 3);
    EXPECT_DOUBLE_EQ(Number("SUM(A1:B2, 10)"), 17);
    EXPECT_DOUBLE_EQ(Number("sum(B2:A1)"), 7);
    EXPECT_DOUBLE_EQ(Number("AVERAGE(2,4)"), 3);
    EXPECT_DOUBLE_EQ(Number("AVERAGE(A1:A2)"), 1.5);
    EXPECT_DOUBLE_EQ(Number("MIN(3,-1,2)"), -1);
    EXPECT_DOUBLE_EQ(Number("MAX(A1:B1)"), 4);
    EXPECT_EQ(ErrorOf("SUM()"), Category::Arity);
}

TEST_F(FunctionsTest, ScalarNumeric) {
    EXPECT_DOUBLE_EQ(Number("ABS(-2)"), 2);
    EXPECT_DOUBLE_EQ(Number("SQRT(16)"), 4);
    EXPECT_DOUBLE_EQ(Number("ROUND(2.5)"), 3);
    EXPECT_DOUBLE_EQ(Number("ROUND(3.14159, 2)"), 3.14);
    EXPECT_DOUBLE_EQ(Number("ROUND(1234, -2)"), 1200);
    EXPECT_EQ(ErrorOf("SQRT(-1)"), Category::Value);
    EXPECT_EQ(ErrorOf("ABS(\"abc\")"), Category::Value);
    EXPECT_EQ(ErrorOf("ROUND(1,2,3)"), Category::Arity);
}

TEST_F(FunctionsTest, RoundWithExtremePlaces) {
    EXPECT_DOUBLE_EQ(Number("ROUND(1.5,400)"), 1.5);
    EXPECT_DOUBLE_EQ(Number("ROUND(0,400)"), 0);
    EXPECT_DOUBLE_EQ(Number("ROUND(1.25,20)"), 1.25);
    EXPECT_DOUBLE_EQ(Number("ROUND(123,-400)"), 0);
    EXPECT_DOUBLE_EQ(Number("ROUND(10**20+0.5)"), 1e20);
}

TEST_F(FunctionsTest, Strings) {
    EXPECT_DOUBLE_EQ(Number("LEN(\"abc\")"), 3);
    EXPECT_DOUBLE_EQ(Number("LEN(12.5)"), 4);
    EXPECT_EQ(Text("UPPER(\"aB1\")"), "AB1");
    EXPECT_EQ(Text("LOWER(\"aB1\")"), "ab1");
    EXPECT_EQ(Text("TRIM(\"  a b  \")"), "a b");
    EXPECT_EQ(Text("TRIM(\"   \")"), "");
    EXPECT_EQ(Text("CONCAT(\"a\",1,\"b\")"), "a1b");
    EXPECT_EQ(ErrorOf("LEN()"), Category::Arity);
    EXPECT_EQ(ErrorOf("LEN(1,2)"), Category::Arity);
}

TEST_F(FunctionsTest, ExtractionIsZeroBased) {
    EXPECT_DOUBLE_EQ(Number("FIND(\"lo\",\"Hello\")"), 3);
    EXPECT_DOUBLE_EQ(Number("FIND(\"l\",\"Hello\",3)"), 3);
    EXPECT_DOUBLE_EQ(Number("FIND(\"\",\"Hello\")"), 0);
    EXPECT_EQ(Text("LEFT(\"Hello\",2)"), "He");
    EXPECT_EQ(Text("LEFT(\"Hi\",10)"), "Hi");
    EXPECT_EQ(Text("RIGHT(\"Hello\",3)"), "llo");
    EXPECT_EQ(Text("RIGHT(\"Hi\",10)"), "Hi");
    EXPECT_EQ(Text("MID(\"Hello\",1,3)"), "ell");
    EXPECT_EQ(Text("MID(\"Hello\",5,3)"), "");
}

TEST_F(FunctionsTest, HugeCountsTakeTheWholeText) {
    EXPECT_EQ(Text("LEFT(\"abc\",10**300)"), "abc");
    EXPECT_EQ(Text("LEFT(\"abc\",10**20)"), "abc");
    EXPECT_EQ(Text("RIGHT(\"abc\",10**20)"), "abc");
    EXPECT_EQ(Text("MID(\"abc\",0,10**20)"), "abc");
    EXPECT_EQ(Text("MID(\"abc\",1,10**300)"), "bc");
}

TEST_F(FunctionsTest, ExtractionErrors) {
    EXPECT_EQ(ErrorOf("FIND(\"x\",\"Hello\")"), Category::Index);
    EXPECT_EQ(ErrorOf("FIND(\"l\",\"Hello\",9)"), Category::Index);
    EXPECT_EQ(ErrorOf("LEFT(\"Hello\",-1)"), Category::Index);
    EXPECT_EQ(ErrorOf("LEFT(\"Hello\",1.5)"), Category::Index);
    EXPECT_EQ(ErrorOf("MID(\"Hello\",6,1)"), Category::Index);
    EXPECT_EQ(ErrorOf("LEFT(\"Hello\",\"two\")"), Category::Value);
    EXPECT_EQ(ErrorOf("MID(\"Hello\",1)"), Category::Arity);
}

TEST_F(FunctionsTest, HugeStartIsPastTheEnd) {
    EXPECT_EQ(ErrorOf("MID(\"abc\",10**20,1)"), Category::Index);
    EXPECT_EQ(ErrorOf("MID(\"abc\",10**300,1)"), Category::Index);
    EXPECT_EQ(ErrorOf("FIND(\"a\",\"abc\",10**20)"), Category::Index);
    EXPECT_EQ(ErrorOf("MID(\"abc\",4,1)"), Category::Index);
}

TEST_F(FunctionsTest, Logical) {
    EXPECT_EQ(Text("IF(1,\"yes\",\"no\")"), "yes");
    EXPECT_EQ(Text("IF(\"\",\"yes\",\"no\")"), "no");
    EXPECT_DOUBLE_EQ(Number("AND(1,2)"), 1);
    EXPECT_DOUBLE_EQ(Number("AND(1,0)"), 0);
    EXPECT_DOUBLE_EQ(Number("OR(0,\"x\")"), 1);
    EXPECT_DOUBLE_EQ(Number("OR(0,\"\")"), 0);
    EXPECT_DOUBLE_EQ(Number("NOT(0)"), 1);
    EXPECT_EQ(ErrorOf("IF(1,2)"), Category::Arity);
    EXPECT_EQ(ErrorOf("NOT(1,2)"), Category::Arity);
}

TEST_F(FunctionsTest, IfEvaluatesOnlyTheTakenBranch) {
    EXPECT_EQ(Text("IF(1,\"local\",GET(\"http://else\"))"), "local");
    EXPECT_EQ(Text("IF(0,GET(\"http://then\"),\"local\")"), "local");
    EXPECT_TRUE(fetcher_->urls.empty());

    EXPECT_EQ(Text("IF(1,GET(\"http://then\"),GET(\"http://else\"))"), "body of http://then");
    EXPECT_EQ(fetcher_->urls, std::vector<std::string>{"http://then"});
}

TEST_F(FunctionsTest, IfErrorInUntakenBranchIsIgnored) {
    EXPECT_DOUBLE_EQ(Number("IF(1,1,1/0)"), 1);
}

TEST_F(FunctionsTest, Get) {
    EXPECT_EQ(Text("GET(\"http://example.com/x\")"), "body of http://example.com/x");
    EXPECT_EQ(ErrorOf("GET()"), Category::Arity);
}

TEST(Functions, GetWithoutTransport) {
    FunctionRegistry registry(BuiltinFunctions(nullptr));
    Evaluator evaluator(registry, [](Position) { return Value(std::string()); }, {10, 10});
    auto result = ParseFormula("GET(\"http://example.com\")")->Evaluate(evaluator);
    ASSERT_TRUE(std::holds_alternative<FormulaError>(result));
    EXPECT_EQ(std::get<FormulaError>(result).GetCategory(), Category::Network);
}

TEST_F(FunctionsTest, UnknownFunction) {
    EXPECT_EQ(ErrorOf("FOO(1)"), Category::Name);
}

TEST_F(FunctionsTest, BareRangeIsNotAValue) {
    EXPECT_EQ(ErrorOf("A1:A2"), Category::Value);
    EXPECT_EQ(ErrorOf("A1:A2+1"), Category::Value);
    EXPECT_EQ(ErrorOf("IF(1,A1:A2,0)"), Category::Value);
}

TEST_F(FunctionsTest, ReferenceOutsideTheGrid) {
    EXPECT_EQ(ErrorOf("K1+1"), Category::Ref);
    EXPECT_EQ(ErrorOf("SUM(A1:A11)"), Category::Ref);
}

TEST_F(FunctionsTest, NestingDepthIsBounded) {
    EXPECT_DOUBLE_EQ(Number(std::string(100, '-') + "1"), 1);

    Evaluator shallow(registry_, [](Position) { return Value(std::string()); }, {10, 10}, 4);
    auto result = ParseFormula(std::string(8, '-') + "1")->Evaluate(shallow);
    ASSERT_TRUE(std::holds_alternative<FormulaError>(result));
    EXPECT_EQ(std::get<FormulaError>(result).GetCategory(), Category::Depth);

    result = ParseFormula("ABS(ABS(ABS(ABS(ABS(1)))))")->Evaluate(shallow);
    ASSERT_TRUE(std::holds_alternative<FormulaError>(result));
    EXPECT_EQ(std::get<FormulaError>(result).GetCategory(), Category::Depth);
}
