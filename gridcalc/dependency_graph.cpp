#include "dependency_graph.h"

#include <map>

namespace {

const DependencyGraph::PositionSet EMPTY_SET;

}  // namespace

DependencyGraph::PositionSet DependencyGraph::SetPrecedents(Position pos, const std::vector<Position>& precedents) {
    PositionSet previous = Find(cell_to_precedents_, pos);
    for (const auto& cell : previous) {
        auto it = cell_to_dependents_.find(cell);
        if (it != cell_to_dependents_.end()) {
            it->second.erase(pos);
            if (it->second.empty()) {
                cell_to_dependents_.erase(it);
            }
        }
    }

    if (precedents.empty()) {
        cell_to_precedents_.erase(pos);
    } else {
        cell_to_precedents_[pos] = {precedents.begin(), precedents.end()};
    }
    for (const auto& cell : precedents) {
        cell_to_dependents_[cell].insert(pos);
    }
    return previous;
}

void DependencyGraph::Restore(Position pos, const PositionSet& previous) {
    SetPrecedents(pos, {previous.begin(), previous.end()});
}

std::vector<Position> DependencyGraph::FindCycle(Position pos) const {
    std::set<Position> visited;
    std::vector<Position> path{pos};
    if (DfsForCycle(pos, pos, visited, path)) {
        return path;
    }
    return {};
}

bool DependencyGraph::DfsForCycle(Position pos, Position target, std::set<Position>& visited,
                                  std::vector<Position>& path) const {
    for (const auto& cell : GetDependents(pos)) {
        if (cell == target) {
            path.push_back(cell);
            return true;
        }
        if (!visited.insert(cell).second) {
            continue;
        }
        path.push_back(cell);
        if (DfsForCycle(cell, target, visited, path)) {
            return true;
        }
        path.pop_back();
    }
    return false;
}

std::vector<Position> DependencyGraph::TryChangeCell(Position pos, const std::vector<Position>& precedents) {
    PositionSet previous = SetPrecedents(pos, precedents);
    auto cycle = FindCycle(pos);
    if (!cycle.empty()) {
        Restore(pos, previous);
    }
    return cycle;
}

DependencyGraph::PositionSet DependencyGraph::CollectAffected(Position pos) const {
    PositionSet affected{pos};
    std::vector<Position> stack{pos};
    while (!stack.empty()) {
        Position current = stack.back();
        stack.pop_back();
        for (const auto& cell : GetDependents(current)) {
            if (affected.insert(cell).second) {
                stack.push_back(cell);
            }
        }
    }
    return affected;
}

// Kahn: std::set as the ready queue gives the smallest address first
std::vector<Position> DependencyGraph::TopologicalOrder(const PositionSet& cells) const {
    std::map<Position, int> in_degree;
    for (const auto& cell : cells) {
        int degree = 0;
        for (const auto& precedent : GetPrecedents(cell)) {
            if (precedent != cell && cells.count(precedent)) {
                ++degree;
            }
        }
        in_degree[cell] = degree;
    }

    std::set<Position> ready;
    for (const auto& [cell, degree] : in_degree) {
        if (degree == 0) {
            ready.insert(cell);
        }
    }

    std::vector<Position> order;
    order.reserve(cells.size());
    while (!ready.empty()) {
        Position cell = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(cell);
        for (const auto& dependent : GetDependents(cell)) {
            auto it = in_degree.find(dependent);
            if (it != in_degree.end() && dependent != cell && --it->second == 0) {
                ready.insert(dependent);
            }
        }
    }
    return order;
}

const DependencyGraph::PositionSet& DependencyGraph::GetPrecedents(Position pos) const {
    return Find(cell_to_precedents_, pos);
}

const DependencyGraph::PositionSet& DependencyGraph::GetDependents(Position pos) const {
    return Find(cell_to_dependents_, pos);
}

void DependencyGraph::Clear() {
    cell_to_precedents_.clear();
    cell_to_dependents_.clear();
}

const DependencyGraph::PositionSet& DependencyGraph::Find(const Edges& edges, Position pos) {
    auto it = edges.find(pos);
    return it == edges.end() ? EMPTY_SET : it->second;
}
