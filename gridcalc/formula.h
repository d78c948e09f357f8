#pragma once

#include "common.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

class Evaluator;

// Формула, позволяющая вычислять и обновлять арифметическое выражение.
class FormulaInterface {
public:
    using Result = std::variant<Value, FormulaError>;

    virtual ~FormulaInterface() = default;

    // Вычисляет формулу. Ячейки и функции берутся из evaluator.
    // Ошибка вычисления возвращается, а не выбрасывается.
    virtual Result Evaluate(const Evaluator& evaluator) const = 0;

    // Возвращает выражение без '=' и без лишних скобок.
    virtual std::string GetExpression() const = 0;

    // Ссылки в том виде, в каком они записаны, в порядке появления
    virtual const std::vector<CellRange>& GetReferences() const = 0;

    // Все ячейки, которые читает формула: диапазоны раскрыты, ячейки за
    // пределами bounds отброшены, список отсортирован и без повторов.
    virtual std::vector<Position> GetReferencedCells(Size bounds) const = 0;
};

// Парсит выражение без '=' и возвращает объект формулы.
// Бросает FormulaException, если формула синтаксически некорректна.
std::unique_ptr<FormulaInterface> ParseFormula(std::string expression);

// Moves every reference in a "=..." text by the offsets, the way copy/paste
// relocates a formula. Literals and unparsable formulas come back unchanged.
std::string AdjustFormulaReferences(const std::string& text, int row_offset, int col_offset);
