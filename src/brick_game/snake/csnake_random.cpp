/**
 * @file csnake_random.cpp
 * @brief Реализация MtRandomSource
 */

#include "csnake_random.hpp"

#include <ctime>
#include <exception>
#include <functional>
#include <thread>

namespace csnake {

MtRandomSource::MtRandomSource() noexcept : gen_(entropySeed_()) {}

MtRandomSource::MtRandomSource(unsigned seed) noexcept : gen_(seed) {}

std::size_t MtRandomSource::pick(std::size_t bound) {
  if (bound <= 1) {
    return 0;
  }
  std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
  return dist(gen_);
}

unsigned MtRandomSource::entropySeed_() noexcept {
  const auto fallback = static_cast<unsigned>(
      std::time(nullptr) ^
      std::hash<std::thread::id>{}(std::this_thread::get_id()));

  try {
    std::random_device rd;
    // На некоторых платформах (MinGW) random_device детерминирован
    return rd.entropy() != 0 ? rd() : fallback;
  } catch (const std::exception&) {
    return fallback;
  }
}

}  // namespace csnake
