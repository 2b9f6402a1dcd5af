/**
 * @file csnake_model.cpp
 * @brief Реализация игровой логики "Змейки"
 *
 * Занятость клеток проверяется линейным проходом по телу: поле не
 * больше CSNAKE_MAX_FIELD_SIDE × CSNAKE_MAX_FIELD_SIDE, отдельное
 * множество занятых клеток не окупается.
 */

#include "csnake_model.hpp"

#include <algorithm>
#include <vector>

namespace csnake {

bool occupies(const GameState& state, const Position& p,
              bool include_tail) noexcept {
  auto end = state.body.end();
  if (!include_tail && !state.body.empty()) {
    --end;
  }
  return std::find(state.body.begin(), end, p) != end;
}

bool placeFood(GameState& state, RandomSource& rng) {
  const Grid& grid = state.grid;
  if (grid.cellCount() <= 0) {
    return false;
  }

  std::vector<bool> taken(static_cast<std::size_t>(grid.cellCount()), false);
  for (const auto& seg : state.body) {
    if (grid.contains(seg)) {
      taken[static_cast<std::size_t>(seg.y * grid.width + seg.x)] = true;
    }
  }

  std::vector<Position> free_cells;
  free_cells.reserve(taken.size());
  for (int y = 0; y < grid.height; ++y) {
    for (int x = 0; x < grid.width; ++x) {
      if (!taken[static_cast<std::size_t>(y * grid.width + x)]) {
        free_cells.emplace_back(x, y);
      }
    }
  }

  if (free_cells.empty()) {
    return false;
  }

  std::size_t index = rng.pick(free_cells.size());
  // Чужая реализация RandomSource может выйти за диапазон
  if (index >= free_cells.size()) {
    index %= free_cells.size();
  }
  state.food = free_cells[index];
  return true;
}

GameState makeInitialState(const Grid& grid, int initial_length,
                           RandomSource& rng) {
  GameState state;
  state.grid = grid;

  const Position head(grid.width / 2, grid.height / 2);
  const int length = std::clamp(initial_length, 1, head.x + 1);

  for (int i = 0; i < length; ++i) {
    state.body.emplace_back(head.x - i, head.y);
  }

  if (!placeFood(state, rng)) {
    state.won = true;
  }
  return state;
}

StepOutcome advance(GameState& state, Direction requested, RandomSource& rng) {
  if (state.finished() || state.body.empty()) {
    return StepOutcome::FINISHED;
  }

  const Direction heading = resolveHeading(state.heading, requested);
  const Position delta = offset(heading);
  const Position& old_head = state.body.front();
  const Position head(old_head.x + delta.x, old_head.y + delta.y);

  if (!state.grid.contains(head)) {
    state.alive = false;
    return StepOutcome::HIT_WALL;
  }

  // Хвост остаётся на месте только если змейка ест
  const bool eating = head == state.food;
  if (occupies(state, head, eating)) {
    state.alive = false;
    return StepOutcome::HIT_SELF;
  }

  state.heading = heading;
  state.body.push_front(head);

  if (!eating) {
    state.body.pop_back();
    return StepOutcome::MOVED;
  }

  state.score += 1;
  if (!placeFood(state, rng)) {
    state.won = true;
    return StepOutcome::FILLED_GRID;
  }
  return StepOutcome::ATE;
}

GameState step(GameState state, Direction requested, RandomSource& rng) {
  advance(state, requested, rng);
  return state;
}

const char* toString(StepOutcome outcome) noexcept {
  switch (outcome) {
    case StepOutcome::MOVED:
      return "moved";
    case StepOutcome::ATE:
      return "ate";
    case StepOutcome::HIT_WALL:
      return "hit wall";
    case StepOutcome::HIT_SELF:
      return "hit self";
    case StepOutcome::FILLED_GRID:
      return "filled grid";
    case StepOutcome::FINISHED:
      return "finished";
  }
  return "unknown";
}

const char* toString(Direction direction) noexcept {
  switch (direction) {
    case Direction::UP:
      return "up";
    case Direction::DOWN:
      return "down";
    case Direction::LEFT:
      return "left";
    case Direction::RIGHT:
      return "right";
  }
  return "unknown";
}

}  // namespace csnake
