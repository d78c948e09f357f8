#pragma once

#include "common.h"

#include <set>
#include <unordered_map>
#include <vector>

// Граф зависимостей между ячейками. Рёбра хранятся по адресам,
// ячейки друг на друга не ссылаются.
class DependencyGraph {
public:
    using PositionSet = std::set<Position>;

    // Replaces the precedents of pos and keeps dependents the exact inverse.
    // Returns the previous precedents for Restore.
    PositionSet SetPrecedents(Position pos, const std::vector<Position>& precedents);
    void Restore(Position pos, const PositionSet& previous);

    // Path pos -> ... -> pos along dependents, empty if pos is not on a cycle
    std::vector<Position> FindCycle(Position pos) const;

    // SetPrecedents + FindCycle, rolled back if a cycle appears.
    // Returns the cycle, empty on success.
    std::vector<Position> TryChangeCell(Position pos, const std::vector<Position>& precedents);

    // pos and all of its transitive dependents
    PositionSet CollectAffected(Position pos) const;

    // Every cell comes after its precedents inside the set, independent cells
    // in address order
    std::vector<Position> TopologicalOrder(const PositionSet& cells) const;

    const PositionSet& GetPrecedents(Position pos) const;
    const PositionSet& GetDependents(Position pos) const;

    void Clear();

private:
    using Edges = std::unordered_map<Position, PositionSet, Position::Hasher>;

    bool DfsForCycle(Position pos, Position target, std::set<Position>& visited,
                     std::vector<Position>& path) const;
    static const PositionSet& Find(const Edges& edges, Position pos);

    Edges cell_to_precedents_;
    Edges cell_to_dependents_;
};
