#include "cell.h"

#include "evaluator.h"

#include <cassert>
#include <string>
#include <optional>

using std::make_unique;

Value EmptyImpl::GetValue() const {
    return std::string();
}

std::optional<std::string> EmptyImpl::GetText() const {
    return std::nullopt;
}

TextImpl::TextImpl(std::string text)
    : text_(std::move(text)), value_(ParseLiteral(text_)) {
}

Value TextImpl::GetValue() const {
    return value_;
}

std::optional<std::string> TextImpl::GetText() const {
    return text_;
}

FormulaImpl::FormulaImpl(std::string text, std::shared_ptr<const FormulaInterface> formula, Value value,
                         std::optional<FormulaError> error)
    : text_(std::move(text)), formula_(std::move(formula)), value_(std::move(value)), error_(std::move(error)) {
    assert(formula_);
}

Value FormulaImpl::GetValue() const {
    return value_;
}

std::optional<std::string> FormulaImpl::GetText() const {
    return text_;
}

std::optional<FormulaError> FormulaImpl::GetError() const {
    return error_;
}

std::shared_ptr<const FormulaInterface> FormulaImpl::GetFormula() const {
    return formula_;
}

void FormulaImpl::Recalculate(const Evaluator& evaluator) {
    auto result = formula_->Evaluate(evaluator);
    if (std::holds_alternative<Value>(result)) {
        value_ = std::get<Value>(std::move(result));
        error_.reset();
    } else {
        MarkError(std::get<FormulaError>(std::move(result)));
    }
}

void FormulaImpl::MarkError(FormulaError error) {
    value_ = ERROR_SENTINEL;
    error_ = std::move(error);
}

Cell::Cell()
    : impl_(make_unique<EmptyImpl>()) {
}

Cell::~Cell() = default;

void Cell::SetLiteral(std::string text) {
    impl_ = make_unique<TextImpl>(std::move(text));
}

void Cell::SetFormula(std::string text, std::shared_ptr<const FormulaInterface> formula) {
    impl_ = make_unique<FormulaImpl>(std::move(text), std::move(formula));
}

void Cell::Clear() {
    SetLiteral(std::string());
}

void Cell::Recalculate(const Evaluator& evaluator) {
    impl_->Recalculate(evaluator);
}

void Cell::MarkError(FormulaError error) {
    impl_->MarkError(std::move(error));
}

CellData Cell::GetData() const {
    return {impl_->GetText(), impl_->GetFormula(), impl_->GetValue(), impl_->GetError()};
}

void Cell::SetData(const CellData& data) {
    if (!data.raw_input) {
        impl_ = make_unique<EmptyImpl>();
    } else if (data.formula) {
        impl_ = make_unique<FormulaImpl>(*data.raw_input, data.formula, data.cached_value, data.last_error);
    } else {
        impl_ = make_unique<TextImpl>(*data.raw_input);
    }
}

std::shared_ptr<const FormulaInterface> Cell::GetFormula() const {
    return impl_->GetFormula();
}

Value Cell::GetValue() const {
    return impl_->GetValue();
}

std::string Cell::GetText() const {
    return impl_->GetText().value_or(std::string());
}

std::optional<FormulaError> Cell::GetError() const {
    return impl_->GetError();
}

std::string Cell::GetDisplayText() const {
    if (impl_->GetError()) {
        return ERROR_SENTINEL;
    }
    return ToText(impl_->GetValue());
}

bool Cell::IsFormula() const {
    return impl_->GetFormula() != nullptr;
}
