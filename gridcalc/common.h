#pragma once

#include "value.h"

#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class FormulaInterface;

// Позиция ячейки. Индексация с нуля.
struct Position {
    int row = 0;
    int col = 0;

    bool operator==(Position rhs) const;
    bool operator!=(Position rhs) const;
    bool operator<(Position rhs) const;

    bool IsValid() const;
    std::string ToString() const;

    // Accepts "A1" notation, column letters are case-insensitive.
    static Position FromString(std::string_view str);

    static const int MAX_ROWS = 16384;
    static const int MAX_COLS = 16384;
    static const Position NONE;

    struct Hasher {
        size_t operator()(Position pos) const;
    };
};

struct Size {
    int rows = 0;
    int cols = 0;

    bool operator==(Size rhs) const;
    bool Contains(Position pos) const;
};

// A cell reference or a rectangular range as written in a formula.
// Corners keep their written orientation; Normalized() orders them.
struct CellRange {
    Position first;
    Position last;

    bool IsSingleCell() const;
    CellRange Normalized() const;
    std::string ToString() const;

    bool operator==(const CellRange& rhs) const;
};

// "A", "B", ..., "Z", "AA", ...
std::string ColumnLabel(int col);
// -1 for anything that is not a column label
int ColumnIndex(std::string_view letters);

// Описывает ошибку вычисления формулы.
class FormulaError {
public:
    enum class Category {
        Ref,       // reference outside the grid
        Value,     // value cannot be used where it appears
        Div0,      // division by zero or non-finite arithmetic
        Arity,     // wrong number of arguments
        Name,      // unknown function
        Index,     // string position out of range or not found
        Network,   // GET failed
        Depth,     // formula nesting deeper than the evaluation limit
        Circular,  // formula takes part in a cycle found while rebuilding
    };

    explicit FormulaError(Category category, std::string message = {});

    Category GetCategory() const;
    const std::string& GetMessage() const;

    bool operator==(const FormulaError& rhs) const;

    std::string_view ToString() const;

private:
    Category category_;
    std::string message_;
};

std::ostream& operator<<(std::ostream& output, const FormulaError& fe);
std::ostream& operator<<(std::ostream& output, FormulaError::Category category);

// Исключение, выбрасываемое при попытке обратиться к позиции вне таблицы
class InvalidPositionException : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Исключение, выбрасываемое при попытке задать синтаксически некорректную формулу
class FormulaException : public std::runtime_error {
public:
    FormulaException(const std::string& message, size_t position);

    // 0-based offset in the formula text following '='
    size_t GetPosition() const;

private:
    size_t position_;
};

// Исключение, выбрасываемое при попытке задать формулу, которая приводит к
// циклической зависимости между ячейками
class CircularDependencyException : public std::runtime_error {
public:
    explicit CircularDependencyException(std::vector<Position> cycle);

    // The cycle starts and ends with the edited cell.
    const std::vector<Position>& GetCycle() const;

private:
    std::vector<Position> cycle_;
};

// Stored state of one cell. A formula cell keeps its parsed formula and the
// result of the last evaluation; a failed evaluation caches ERROR_SENTINEL.
struct CellData {
    std::optional<std::string> raw_input;
    std::shared_ptr<const FormulaInterface> formula;
    Value cached_value = std::string();
    std::optional<FormulaError> last_error;
};

// Everything undo/redo needs to put a cell back exactly as it was.
struct CellSnapshot {
    bool exists = false;
    CellData data;
    std::vector<Position> precedents;
};

// One record of the persisted sheet: the displayed value and the formula text.
struct ExportedCell {
    Position pos;
    std::string value;
    std::optional<std::string> formula;
};

class CellInterface {
public:
    virtual ~CellInterface() = default;

    // Кешированное значение. Для ячейки с ошибкой вычисления это ERROR_SENTINEL
    virtual Value GetValue() const = 0;
    // Текст ячейки в том виде, в каком его задал пользователь
    virtual std::string GetText() const = 0;
    // Ошибка последнего вычисления формулы, если она была
    virtual std::optional<FormulaError> GetError() const = 0;
    // Сырой вид значения для внешних потребителей: "#ERROR" для ячейки с ошибкой
    virtual std::string GetDisplayText() const = 0;
    virtual bool IsFormula() const = 0;
};

class SheetInterface {
public:
    virtual ~SheetInterface() = default;

    // Parses, updates dependencies, checks for cycles and recalculates as one
    // step. Throws InvalidPositionException, FormulaException or
    // CircularDependencyException; the sheet is left untouched in that case.
    virtual void SetCell(Position pos, std::string text) = 0;

    // nullptr for a cell that has never been written
    virtual const CellInterface* GetCell(Position pos) const = 0;
    virtual CellData GetCellData(Position pos) const = 0;

    // Equivalent to setting the literal empty string
    virtual void ClearCell(Position pos) = 0;

    virtual CellSnapshot Snapshot(Position pos) const = 0;
    virtual void Restore(Position pos, const CellSnapshot& snapshot) = 0;

    // Bulk load without dependency tracking or recalculation.
    // RebuildDependencies() must be called before the next SetCell().
    virtual void LoadCell(Position pos, std::string value, std::optional<std::string> formula) = 0;
    virtual void RebuildDependencies() = 0;
    virtual std::vector<ExportedCell> ExportCells() const = 0;

    // Re-evaluates the cell and everything that depends on it
    virtual void Recalculate(Position pos) = 0;

    virtual std::vector<Position> GetPrecedents(Position pos) const = 0;
    virtual std::vector<Position> GetDependents(Position pos) const = 0;

    virtual Size GetSize() const = 0;
    virtual Size GetPrintableSize() const = 0;

    virtual void PrintValues(std::ostream& output) const = 0;
    virtual void PrintTexts(std::ostream& output) const = 0;

    virtual int GetColumnWidth(int col) const = 0;
    virtual void SetColumnWidth(int col, int width) = 0;
    virtual const std::map<int, int>& GetColumnWidths() const = 0;
    virtual int GetDefaultColumnWidth() const = 0;
    virtual void AutoResizeColumn(int col) = 0;
    virtual void AutoResizeAllColumns() = 0;
};
