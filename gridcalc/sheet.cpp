#include "sheet.h"

#include "http_fetcher.h"

#include <algorithm>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

using namespace std::literals;

namespace {

const char FORMULA_SIGN = '=';
const int MIN_COLUMN_WIDTH = 3;
const int MAX_COLUMN_WIDTH = 50;

bool IsFormulaText(const std::string& text) {
    return !text.empty() && text.front() == FORMULA_SIGN;
}

std::shared_ptr<const FunctionRegistry> DefaultRegistry(std::shared_ptr<const FunctionRegistry> registry) {
    if (registry) {
        return registry;
    }
    return MakeBuiltinRegistry(std::make_shared<CurlHttpFetcher>());
}

size_t ContentWidth(const Cell& cell) {
    return std::max(cell.GetText().size(), cell.GetDisplayText().size());
}

}  // namespace

Sheet::Sheet(SheetOptions options)
    : options_(std::move(options))
    , registry_(DefaultRegistry(options_.registry))
    , evaluator_(*registry_, [this](Position pos) { return ResolveCell(pos); }, options_.size, options_.max_depth) {
}

Sheet::~Sheet() = default;

void Sheet::SetCell(Position pos, std::string text) {
    ValidatePosition(pos);

    std::shared_ptr<const FormulaInterface> formula;
    std::vector<Position> precedents;
    if (IsFormulaText(text)) {
        formula = ParseCellFormula(pos, text);
        precedents = formula->GetReferencedCells(options_.size);
    }

    auto cycle = graph_.TryChangeCell(pos, precedents);
    if (!cycle.empty()) {
        CircularDependencyException exc(std::move(cycle));
        Report(pos.ToString() + ": "s + exc.what());
        throw exc;
    }

    Cell& cell = table_[pos];
    if (formula) {
        cell.SetFormula(std::move(text), std::move(formula));
    } else {
        cell.SetLiteral(std::move(text));
    }

    RecalculateCells(graph_.TopologicalOrder(graph_.CollectAffected(pos)));
    WidenColumn(pos.col, ContentWidth(table_.at(pos)));
}

const CellInterface* Sheet::GetCell(Position pos) const {
    ValidatePosition(pos);
    auto it = table_.find(pos);
    if (it == table_.end()) {
        return nullptr;
    }
    return &it->second;
}

CellData Sheet::GetCellData(Position pos) const {
    ValidatePosition(pos);
    auto it = table_.find(pos);
    if (it == table_.end()) {
        return {};
    }
    return it->second.GetData();
}

void Sheet::ClearCell(Position pos) {
    ValidatePosition(pos);
    if (!table_.count(pos)) {
        return;
    }
    SetCell(pos, std::string());
}

CellSnapshot Sheet::Snapshot(Position pos) const {
    ValidatePosition(pos);
    CellSnapshot snapshot;
    auto it = table_.find(pos);
    if (it != table_.end()) {
        snapshot.exists = true;
        snapshot.data = it->second.GetData();
    }
    const auto& precedents = graph_.GetPrecedents(pos);
    snapshot.precedents.assign(precedents.begin(), precedents.end());
    return snapshot;
}

void Sheet::Restore(Position pos, const CellSnapshot& snapshot) {
    ValidatePosition(pos);

    auto cycle = graph_.TryChangeCell(pos, snapshot.precedents);
    if (!cycle.empty()) {
        CircularDependencyException exc(std::move(cycle));
        Report(pos.ToString() + ": "s + exc.what());
        throw exc;
    }

    if (snapshot.exists) {
        table_[pos].SetData(snapshot.data);
    } else {
        table_.erase(pos);
    }

    // сама ячейка восстанавливается как есть, пересчитываются только зависимые
    auto order = graph_.TopologicalOrder(graph_.CollectAffected(pos));
    order.erase(std::remove(order.begin(), order.end(), pos), order.end());
    RecalculateCells(order);
}

void Sheet::LoadCell(Position pos, std::string value, std::optional<std::string> formula) {
    ValidatePosition(pos);
    if (formula && IsFormulaText(*formula)) {
        auto parsed = ParseCellFormula(pos, *formula);
        table_[pos].SetData({std::move(formula), std::move(parsed), ParseLiteral(value), std::nullopt});
    } else {
        table_[pos].SetLiteral(std::move(value));
    }
}

void Sheet::RebuildDependencies() {
    graph_.Clear();

    auto positions = SortedPositions();
    std::set<Position> circular;
    for (const auto& pos : positions) {
        auto formula = table_.at(pos).GetFormula();
        if (!formula) {
            continue;
        }
        auto cycle = graph_.TryChangeCell(pos, formula->GetReferencedCells(options_.size));
        if (!cycle.empty()) {
            // ячейка остаётся без рёбер, граф ацикличен
            circular.insert(pos);
            Report(pos.ToString() + ": "s + CircularDependencyException(std::move(cycle)).what());
        }
    }

    for (const auto& pos : graph_.TopologicalOrder({positions.begin(), positions.end()})) {
        if (circular.count(pos)) {
            table_.at(pos).MarkError(FormulaError(FormulaError::Category::Circular,
                                                  "formula takes part in a circular dependency"));
            continue;
        }
        RecalculateCells({pos});
    }
}

std::vector<ExportedCell> Sheet::ExportCells() const {
    std::vector<ExportedCell> cells;
    for (const auto& pos : SortedPositions()) {
        const Cell& cell = table_.at(pos);
        CellData data = cell.GetData();
        if (!data.raw_input) {
            continue;
        }
        if (cell.IsFormula()) {
            cells.push_back({pos, cell.GetDisplayText(), std::move(data.raw_input)});
        } else {
            cells.push_back({pos, std::move(*data.raw_input), std::nullopt});
        }
    }
    return cells;
}

void Sheet::Recalculate(Position pos) {
    ValidatePosition(pos);
    RecalculateCells(graph_.TopologicalOrder(graph_.CollectAffected(pos)));
}

std::vector<Position> Sheet::GetPrecedents(Position pos) const {
    ValidatePosition(pos);
    const auto& precedents = graph_.GetPrecedents(pos);
    return {precedents.begin(), precedents.end()};
}

std::vector<Position> Sheet::GetDependents(Position pos) const {
    ValidatePosition(pos);
    const auto& dependents = graph_.GetDependents(pos);
    return {dependents.begin(), dependents.end()};
}

Size Sheet::GetSize() const {
    return options_.size;
}

Size Sheet::GetPrintableSize() const {
    Size size{0, 0};
    for (const auto& [pos, cell] : table_) {
        if (cell.GetText().empty()) {
            continue;
        }
        size.rows = std::max(size.rows, pos.row + 1);
        size.cols = std::max(size.cols, pos.col + 1);
    }
    return size;
}

void Sheet::PrintValues(std::ostream& output) const {
    Size size = GetPrintableSize();
    for (int i = 0; i < size.rows; ++i) {
        for (int k = 0; k < size.cols; ++k) {
            if (auto it = table_.find({i, k}); it != table_.end()) {
                output << it->second.GetDisplayText();
            }
            if (k != size.cols - 1) {
                output << '\t';
            }
        }
        output << '\n';
    }
}

void Sheet::PrintTexts(std::ostream& output) const {
    Size size = GetPrintableSize();
    for (int i = 0; i < size.rows; ++i) {
        for (int k = 0; k < size.cols; ++k) {
            if (auto it = table_.find({i, k}); it != table_.end()) {
                output << it->second.GetText();
            }
            if (k != size.cols - 1) {
                output << '\t';
            }
        }
        output << '\n';
    }
}

int Sheet::GetColumnWidth(int col) const {
    auto it = column_widths_.find(col);
    return it == column_widths_.end() ? options_.default_column_width : it->second;
}

void Sheet::SetColumnWidth(int col, int width) {
    ValidateColumn(col);
    if (width <= 0) {
        throw std::invalid_argument("column width must be positive, got " + std::to_string(width));
    }
    column_widths_[col] = width;
}

const std::map<int, int>& Sheet::GetColumnWidths() const {
    return column_widths_;
}

int Sheet::GetDefaultColumnWidth() const {
    return options_.default_column_width;
}

void Sheet::AutoResizeColumn(int col) {
    ValidateColumn(col);
    size_t content_width = 0;
    for (const auto& [pos, cell] : table_) {
        if (pos.col == col) {
            content_width = std::max(content_width, ContentWidth(cell));
        }
    }
    WidenColumn(col, content_width);
}

void Sheet::AutoResizeAllColumns() {
    std::vector<size_t> content_widths(options_.size.cols, 0);
    for (const auto& [pos, cell] : table_) {
        content_widths[pos.col] = std::max(content_widths[pos.col], ContentWidth(cell));
    }
    for (int col = 0; col < options_.size.cols; ++col) {
        WidenColumn(col, content_widths[col]);
    }
}

void Sheet::ValidatePosition(Position pos) const {
    if (!pos.IsValid() || !options_.size.Contains(pos)) {
        throw InvalidPositionException("Invalid position " + pos.ToString());
    }
}

void Sheet::ValidateColumn(int col) const {
    if (col < 0 || col >= options_.size.cols) {
        throw InvalidPositionException("Invalid column " + std::to_string(col));
    }
}

Value Sheet::ResolveCell(Position pos) const {
    auto it = table_.find(pos);
    if (it == table_.end()) {
        return std::string();
    }
    return it->second.GetValue();
}

std::shared_ptr<const FormulaInterface> Sheet::ParseCellFormula(Position pos, const std::string& text) const {
    try {
        return ParseFormula(text.substr(1));
    } catch (const FormulaException& exc) {
        Report(pos.ToString() + ": "s + exc.what() + " at " + std::to_string(exc.GetPosition()));
        throw;
    }
}

void Sheet::RecalculateCells(const std::vector<Position>& order) {
    for (const auto& pos : order) {
        auto it = table_.find(pos);
        if (it == table_.end()) {
            continue;
        }
        it->second.Recalculate(evaluator_);
        if (auto error = it->second.GetError()) {
            Report(pos.ToString() + ": "s + std::string(error->ToString()) + " " + error->GetMessage());
        }
    }
}

std::vector<Position> Sheet::SortedPositions() const {
    std::vector<Position> positions;
    positions.reserve(table_.size());
    for (const auto& [pos, _] : table_) {
        positions.push_back(pos);
    }
    std::sort(positions.begin(), positions.end());
    return positions;
}

void Sheet::WidenColumn(int col, size_t content_width) {
    int needed = static_cast<int>(std::max(content_width, ColumnLabel(col).size()));
    needed = std::clamp(needed, MIN_COLUMN_WIDTH, MAX_COLUMN_WIDTH);
    if (needed > GetColumnWidth(col)) {
        column_widths_[col] = needed;
    }
}

void Sheet::Report(std::string_view message) const {
    if (options_.diagnostics) {
        *options_.diagnostics << "gridcalc: " << message << '\n';
    }
}

std::unique_ptr<SheetInterface> CreateSheet(SheetOptions options) {
    return std::make_unique<Sheet>(std::move(options));
}
