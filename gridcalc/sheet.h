#pragma once

#include "cell.h"
#include "common.h"
#include "dependency_graph.h"
#include "evaluator.h"
#include "functions.h"

#include <iosfwd>
#include <map>
#include <memory>
#include <string_view>
#include <unordered_map>

struct SheetOptions {
    Size size{100, 26};
    int default_column_width = 8;
    int max_depth = Evaluator::DEFAULT_MAX_DEPTH;
    // nullptr: builtin functions with GET over libcurl
    std::shared_ptr<const FunctionRegistry> registry;
    // one line per rejected edit and per failed evaluation
    std::ostream* diagnostics = nullptr;
};

class Sheet : public SheetInterface {
public:
    explicit Sheet(SheetOptions options = {});
    ~Sheet();

    Sheet(const Sheet&) = delete;
    Sheet& operator=(const Sheet&) = delete;

    void SetCell(Position pos, std::string text) override;

    const CellInterface* GetCell(Position pos) const override;
    CellData GetCellData(Position pos) const override;

    void ClearCell(Position pos) override;

    CellSnapshot Snapshot(Position pos) const override;
    void Restore(Position pos, const CellSnapshot& snapshot) override;

    void LoadCell(Position pos, std::string value, std::optional<std::string> formula) override;
    void RebuildDependencies() override;
    std::vector<ExportedCell> ExportCells() const override;

    void Recalculate(Position pos) override;

    std::vector<Position> GetPrecedents(Position pos) const override;
    std::vector<Position> GetDependents(Position pos) const override;

    Size GetSize() const override;
    Size GetPrintableSize() const override;

    void PrintValues(std::ostream& output) const override;
    void PrintTexts(std::ostream& output) const override;

    int GetColumnWidth(int col) const override;
    void SetColumnWidth(int col, int width) override;
    const std::map<int, int>& GetColumnWidths() const override;
    int GetDefaultColumnWidth() const override;
    void AutoResizeColumn(int col) override;
    void AutoResizeAllColumns() override;

private:
    void ValidatePosition(Position pos) const;
    void ValidateColumn(int col) const;

    Value ResolveCell(Position pos) const;
    std::shared_ptr<const FormulaInterface> ParseCellFormula(Position pos, const std::string& text) const;

    // Evaluates cells in the given order, a failure stays on its cell
    void RecalculateCells(const std::vector<Position>& order);
    std::vector<Position> SortedPositions() const;

    void WidenColumn(int col, size_t content_width);
    void Report(std::string_view message) const;

    SheetOptions options_;
    std::shared_ptr<const FunctionRegistry> registry_;
    std::unordered_map<Position, Cell, Position::Hasher> table_;
    DependencyGraph graph_;
    Evaluator evaluator_;
    std::map<int, int> column_widths_;
};

std::unique_ptr<SheetInterface> CreateSheet(SheetOptions options = {});
