#pragma once

#include "common.h"
#include "formula.h"

#include <memory>
#include <optional>
#include <string>

class Evaluator;

class Impl {
public:
    virtual ~Impl() = default;

    virtual Value GetValue() const = 0;
    virtual std::optional<std::string> GetText() const = 0;

    virtual std::optional<FormulaError> GetError() const {
        return std::nullopt;
    }
    virtual std::shared_ptr<const FormulaInterface> GetFormula() const {
        return nullptr;
    }

    // Only formulas have anything to compute
    virtual void Recalculate(const Evaluator& /* evaluator */) {
    }
    virtual void MarkError(FormulaError /* error */) {
    }
};

// Ячейка, в которую ещё ничего не записывали
class EmptyImpl : public Impl {
public:
    Value GetValue() const override;
    std::optional<std::string> GetText() const override;
};

class TextImpl : public Impl {
public:
    explicit TextImpl(std::string text);
    Value GetValue() const override;
    std::optional<std::string> GetText() const override;

private:
    std::string text_;
    Value value_;
};

class FormulaImpl : public Impl {
public:
    FormulaImpl(std::string text, std::shared_ptr<const FormulaInterface> formula,
                Value value = std::string(), std::optional<FormulaError> error = std::nullopt);

    Value GetValue() const override;
    std::optional<std::string> GetText() const override;
    std::optional<FormulaError> GetError() const override;
    std::shared_ptr<const FormulaInterface> GetFormula() const override;

    void Recalculate(const Evaluator& evaluator) override;
    void MarkError(FormulaError error) override;

private:
    std::string text_;  // как ввёл пользователь, вместе с '='
    std::shared_ptr<const FormulaInterface> formula_;
    Value value_;  // кешированное значение
    std::optional<FormulaError> error_;
};

class Cell : public CellInterface {
public:
    Cell();
    ~Cell();

    void SetLiteral(std::string text);
    void SetFormula(std::string text, std::shared_ptr<const FormulaInterface> formula);
    // Записанная пустая строка, не то же самое, что незаписанная ячейка
    void Clear();

    void Recalculate(const Evaluator& evaluator);
    void MarkError(FormulaError error);

    CellData GetData() const;
    void SetData(const CellData& data);

    std::shared_ptr<const FormulaInterface> GetFormula() const;

    Value GetValue() const override;
    std::string GetText() const override;
    std::optional<FormulaError> GetError() const override;
    std::string GetDisplayText() const override;
    bool IsFormula() const override;

private:
    std::unique_ptr<Impl> impl_;
};
