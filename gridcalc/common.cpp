#include "common.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <tuple>

const Position Position::NONE = {-1, -1};

namespace {
const int LETTERS = 26;
const int MAX_POSITION_LENGTH = 17;
const int MAX_POS_LETTER_COUNT = 3;

std::string CycleToString(const std::vector<Position>& cycle) {
    std::string result = "circular dependency:";
    for (size_t i = 0; i < cycle.size(); ++i) {
        result += i == 0 ? " " : " -> ";
        result += cycle[i].ToString();
    }
    return result;
}
}  // namespace

bool Position::operator==(const Position rhs) const {
    return row == rhs.row && col == rhs.col;
}

bool Position::operator!=(const Position rhs) const {
    return !(*this == rhs);
}

bool Position::operator<(const Position rhs) const {
    return std::tie(row, col) < std::tie(rhs.row, rhs.col);
}

bool Position::IsValid() const {
    return row >= 0 && col >= 0 && row < MAX_ROWS && col < MAX_COLS;
}

std::string Position::ToString() const {
    if (!IsValid()) {
        return "";
    }
    return ColumnLabel(col) + std::to_string(row + 1);
}

Position Position::FromString(std::string_view str) {
    if (str.size() > MAX_POSITION_LENGTH) {
        return NONE;
    }
    auto letters_end = std::find_if(str.begin(), str.end(), [](char c) {
        return !std::isalpha(static_cast<unsigned char>(c));
    });
    size_t letter_count = letters_end - str.begin();
    if (letter_count == 0 || letter_count > MAX_POS_LETTER_COUNT || letter_count == str.size()) {
        return NONE;
    }

    std::string_view digits = str.substr(letter_count);
    if (!std::all_of(digits.begin(), digits.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        })) {
        return NONE;
    }

    int row = 0;
    for (char c : digits) {
        row = row * 10 + (c - '0');
        if (row > MAX_ROWS) {
            return NONE;
        }
    }
    Position pos{row - 1, ColumnIndex(str.substr(0, letter_count))};
    return pos.IsValid() ? pos : NONE;
}

size_t Position::Hasher::operator()(Position pos) const {
    return static_cast<size_t>(pos.row) * Position::MAX_COLS + static_cast<size_t>(pos.col);
}

bool Size::operator==(Size rhs) const {
    return rows == rhs.rows && cols == rhs.cols;
}

bool Size::Contains(Position pos) const {
    return pos.row >= 0 && pos.col >= 0 && pos.row < rows && pos.col < cols;
}

bool CellRange::IsSingleCell() const {
    return first == last;
}

CellRange CellRange::Normalized() const {
    return {{std::min(first.row, last.row), std::min(first.col, last.col)},
            {std::max(first.row, last.row), std::max(first.col, last.col)}};
}

std::string CellRange::ToString() const {
    if (IsSingleCell()) {
        return first.ToString();
    }
    return first.ToString() + ':' + last.ToString();
}

bool CellRange::operator==(const CellRange& rhs) const {
    return first == rhs.first && last == rhs.last;
}

std::string ColumnLabel(int col) {
    std::string result;
    ++col;
    while (col > 0) {
        result.push_back(static_cast<char>('A' + (col - 1) % LETTERS));
        col = (col - 1) / LETTERS;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

int ColumnIndex(std::string_view letters) {
    if (letters.empty()) {
        return -1;
    }
    int col = 0;
    for (char c : letters) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            return -1;
        }
        col = col * LETTERS + (std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
        if (col > Position::MAX_COLS) {
            return -1;
        }
    }
    return col - 1;
}

FormulaError::FormulaError(Category category, std::string message)
    : category_(category), message_(std::move(message)) {
}

FormulaError::Category FormulaError::GetCategory() const {
    return category_;
}

const std::string& FormulaError::GetMessage() const {
    return message_;
}

bool FormulaError::operator==(const FormulaError& rhs) const {
    return category_ == rhs.category_;
}

std::string_view FormulaError::ToString() const {
    switch (category_) {
        case Category::Ref:
            return "#REF!";
        case Category::Value:
            return "#VALUE!";
        case Category::Div0:
            return "#ARITHM!";
        case Category::Arity:
            return "#ARITY!";
        case Category::Name:
            return "#NAME?";
        case Category::Index:
            return "#INDEX!";
        case Category::Network:
            return "#NETWORK!";
        case Category::Depth:
            return "#DEPTH!";
        case Category::Circular:
            return "#CIRCULAR!";
    }
    return "";
}

std::ostream& operator<<(std::ostream& output, const FormulaError& fe) {
    output << fe.ToString();
    if (!fe.GetMessage().empty()) {
        output << ' ' << fe.GetMessage();
    }
    return output;
}

std::ostream& operator<<(std::ostream& output, FormulaError::Category category) {
    return output << FormulaError(category).ToString();
}

FormulaException::FormulaException(const std::string& message, size_t position)
    : std::runtime_error(message), position_(position) {
}

size_t FormulaException::GetPosition() const {
    return position_;
}

CircularDependencyException::CircularDependencyException(std::vector<Position> cycle)
    : std::runtime_error(CycleToString(cycle)), cycle_(std::move(cycle)) {
}

const std::vector<Position>& CircularDependencyException::GetCycle() const {
    return cycle_;
}
