/**
 * @file csnake_log.hpp
 * @brief Настройка логирования csnake на базе spdlog
 *
 * Модули пишут через глобальные функции spdlog (`spdlog::info(...)` и т.д.)
 * с тегом компонента в начале сообщения: `[SnakeGame]`, `[Controller]`,
 * `[CliView]`. Этот модуль только собирает логгер по умолчанию.
 *
 * Переменные окружения:
 * - `CSNAKE_LOG_LEVEL` — имя уровня spdlog (trace, debug, info, warning,
 *   error, critical, off)
 * - `CSNAKE_LOG_FILE`  — путь к файлу журнала
 *
 * @author provemet
 */

#ifndef CSNAKE_LOG_HPP
#define CSNAKE_LOG_HPP

#include <spdlog/spdlog.h>

#include <string>

namespace csnake {
namespace logging {

/// Параметры логгера по умолчанию
struct LogConfig {
  spdlog::level::level_enum level = spdlog::level::info;
  bool enable_console = true;  ///< цветной вывод в stdout
  bool enable_file = true;     ///< ротируемый файл журнала
  std::string file_path;       ///< пусто — путь по умолчанию
};

/**
 * @brief Накладывает CSNAKE_LOG_LEVEL и CSNAKE_LOG_FILE на конфигурацию
 *
 * Нераспознанное имя уровня игнорируется.
 */
LogConfig apply_environment(LogConfig config);

/**
 * @brief Разбирает имя уровня spdlog
 * @return false, если имя не распознано (`level` не меняется)
 */
bool parse_level(const std::string& name,
                 spdlog::level::level_enum& level) noexcept;

/**
 * @brief Путь к файлу журнала
 *
 * `override_path`, если не пуст, иначе `$XDG_DATA_HOME/csnake/csnake.log`,
 * иначе `$HOME/.local/share/csnake/csnake.log`, иначе `/tmp/csnake.log`.
 */
std::string resolve_log_file_path(const std::string& override_path);

/**
 * @brief Создаёт логгер "csnake" и делает его логгером по умолчанию
 * @return false, если файл журнала открыть не удалось (логгер всё равно
 *         установлен, но без файлового приёмника)
 */
bool init(const LogConfig& config) noexcept;

}  // namespace logging
}  // namespace csnake

#endif  // CSNAKE_LOG_HPP
