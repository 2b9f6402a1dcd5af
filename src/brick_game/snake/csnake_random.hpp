/**
 * @file csnake_random.hpp
 * @brief Источник случайных чисел для размещения еды
 *
 * Модель не создаёт генераторы сама: функции размещения еды получают
 * RandomSource по ссылке. Игровая сессия владеет MtRandomSource, тесты
 * подставляют собственную детерминированную реализацию.
 *
 * @author provemet
 */

#ifndef CSNAKE_RANDOM_HPP
#define CSNAKE_RANDOM_HPP

#include <cstddef>
#include <random>

namespace csnake {

/**
 * @brief Абстрактный источник равномерно распределённых индексов
 */
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  /**
   * @brief Вернуть случайный индекс из диапазона [0, bound)
   * @param bound Размер диапазона, больше нуля
   */
  virtual std::size_t pick(std::size_t bound) = 0;
};

/**
 * @brief Источник на основе std::mt19937
 *
 * Без зерна генератор инициализируется из std::random_device, а если
 * устройство недоступно или не даёт энтропии — из времени и
 * идентификатора потока.
 */
class MtRandomSource final : public RandomSource {
 public:
  MtRandomSource() noexcept;
  explicit MtRandomSource(unsigned seed) noexcept;

  std::size_t pick(std::size_t bound) override;

 private:
  static unsigned entropySeed_() noexcept;

  std::mt19937 gen_;
};

}  // namespace csnake

#endif  // CSNAKE_RANDOM_HPP
