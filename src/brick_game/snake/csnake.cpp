/**
 * @file csnake.cpp
 * @brief C API обёртка для C++ реализации csnake::SnakeGame
 *
 * Все функции объявлены как extern "C" и помечены noexcept: исключение,
 * пересекающее границу C/C++, привело бы к std::terminate().
 *
 * @note Реальная логика игры находится в csnake_internals.cpp и
 *       csnake_model.cpp.
 * @see csnake.h, csnake_internals.hpp, csnake_bgame.h
 */

#include "csnake.h"
#include "csnake_internals.hpp"

extern "C" {

SnakeConfig_t snake_default_config(void) noexcept {
  return csnake::SnakeGame::default_config();
}

SnakeConfigResult_t snake_validate_config(const SnakeConfig_t* config) noexcept {
  return csnake::SnakeGame::validate_config(config);
}

const char* snake_config_result_str(SnakeConfigResult_t result) noexcept {
  switch (result) {
    case SNAKE_CONFIG_OK:
      return "ok";
    case SNAKE_CONFIG_NULL:
      return "config is null";
    case SNAKE_CONFIG_BAD_SIZE:
      return "field size out of range";
    case SNAKE_CONFIG_BAD_LENGTH:
      return "initial length does not fit the field";
    case SNAKE_CONFIG_BAD_TICK:
      return "tick must be positive";
  }
  return "unknown";
}

void* snake_create(void) noexcept { return csnake::SnakeGame::create(nullptr); }

void* snake_create_ex(const SnakeConfig_t* config) noexcept {
  return csnake::SnakeGame::create(config);
}

void snake_destroy(void* game) noexcept { csnake::SnakeGame::destroy(game); }

void snake_handle_input(void* game, UserAction_t action, bool hold) noexcept {
  csnake::SnakeGame::handle_input(game, action, hold);
}

void snake_update(void* game) noexcept { csnake::SnakeGame::update(game); }

const GameInfo_t* snake_get_info(const void* game) noexcept {
  return csnake::SnakeGame::get_info(game);
}

GameInterface_t snake_get_interface(void) noexcept {
  GameInterface_t iface{};
  iface.create = snake_create_ex;
  iface.destroy = snake_destroy;
  iface.input = snake_handle_input;
  iface.update = snake_update;
  iface.get_info = snake_get_info;
  return iface;
}

}  // extern "C"
