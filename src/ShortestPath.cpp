#include "ShortestPath.h"

#include <algorithm>
#include <deque>
#include <sstream>
#include <stdexcept>

namespace AIF {

PathTree::PathTree(const Position& source, PositionMap<double> costs,
                   PositionMap<std::pair<Position, Action>> predecessor)
    : _source(source),
      _costs(std::move(costs)),
      _predecessor(std::move(predecessor)) {}

std::optional<double> PathTree::Cost(const Position& target) const {
  const auto it = _costs.find(target);
  if (it == _costs.cend()) return std::nullopt;
  return it->second;
}

std::vector<Position> PathTree::CellsTo(const Position& target) const {
  if (!Reachable(target)) return {};
  std::vector<Position> cells = {target};
  Position current = target;
  while (current != _source) {
    current = _predecessor.at(current).first;
    cells.push_back(current);
  }
  std::reverse(cells.begin(), cells.end());
  return cells;
}

std::vector<Action> PathTree::ActionsTo(const Position& target) const {
  if (!Reachable(target)) return {};
  std::vector<Action> actions;
  Position current = target;
  while (current != _source) {
    const auto& [prev, action] = _predecessor.at(current);
    actions.push_back(action);
    current = prev;
  }
  std::reverse(actions.begin(), actions.end());
  return actions;
}

PathTree ShortestPathFasterAlgorithm::Solve(const Position& source) const {
  PositionMap<double> cost = {{source, 0.0}};
  PositionMap<std::pair<Position, Action>> predecessor;
  PositionMap<bool> queued = {{source, true}};
  std::deque<Position> q = {source};

  while (!q.empty()) {
    const Position u = q.front();
    q.pop_front();
    queued[u] = false;
    const double cost_u = cost.at(u);

    for (const auto& edge : Moves(u)) {
      if (edge.cost < 0.0) {
        std::ostringstream ss;
        ss << "Negative move cost " << edge.cost << " out of " << u;
        throw std::invalid_argument(ss.str());
      }
      const auto it = cost.find(edge.to);
      if (it != cost.cend() && it->second <= cost_u + edge.cost) continue;
      cost[edge.to] = cost_u + edge.cost;
      predecessor[edge.to] = {u, edge.action};

      if (!queued[edge.to]) {
        // Small label first
        if (!q.empty() && cost[edge.to] < cost.at(q.front()))
          q.push_front(edge.to);
        else
          q.push_back(edge.to);
        queued[edge.to] = true;
      }
    }
  }
  return PathTree(source, std::move(cost), std::move(predecessor));
}

}  // namespace AIF
