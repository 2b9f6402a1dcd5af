#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "csnake_log.hpp"

namespace fs = std::filesystem;
using csnake::logging::LogConfig;

// Сохраняет и восстанавливает переменную окружения на время теста
class EnvGuard {
 public:
  explicit EnvGuard(const char* name) : name_(name) {
    const char* value = std::getenv(name);
    if (value) {
      had_ = true;
      saved_ = value;
    }
  }
  ~EnvGuard() {
    if (had_) {
      setenv(name_, saved_.c_str(), 1);
    } else {
      unsetenv(name_);
    }
  }

 private:
  const char* name_;
  bool had_ = false;
  std::string saved_;
};

class LoggingTest : public ::testing::Test {
 protected:
  EnvGuard level_{"CSNAKE_LOG_LEVEL"};
  EnvGuard file_{"CSNAKE_LOG_FILE"};
  EnvGuard xdg_{"XDG_DATA_HOME"};
  EnvGuard home_{"HOME"};
  fs::path dir_;

  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("csnake_log_test_" +
            std::string(::testing::UnitTest::GetInstance()
                            ->current_test_info()
                            ->name()));
    fs::remove_all(dir_);
    unsetenv("CSNAKE_LOG_LEVEL");
    unsetenv("CSNAKE_LOG_FILE");
  }

  void TearDown() override {
    // Отпускаем файл до удаления каталога
    csnake::logging::init(LogConfig{spdlog::level::info, true, false, ""});
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }
};

TEST_F(LoggingTest, ParseLevel) {
  spdlog::level::level_enum level = spdlog::level::info;
  EXPECT_TRUE(csnake::logging::parse_level("debug", level));
  EXPECT_EQ(level, spdlog::level::debug);
  EXPECT_TRUE(csnake::logging::parse_level("off", level));
  EXPECT_EQ(level, spdlog::level::off);
  EXPECT_FALSE(csnake::logging::parse_level("loud", level));
  EXPECT_EQ(level, spdlog::level::off) << "Уровень не должен меняться";
}

TEST_F(LoggingTest, ApplyEnvironment) {
  LogConfig defaults;
  LogConfig unchanged = csnake::logging::apply_environment(defaults);
  EXPECT_EQ(unchanged.level, spdlog::level::info);
  EXPECT_TRUE(unchanged.file_path.empty());

  setenv("CSNAKE_LOG_LEVEL", "trace", 1);
  setenv("CSNAKE_LOG_FILE", "/tmp/x.log", 1);
  LogConfig config = csnake::logging::apply_environment(defaults);
  EXPECT_EQ(config.level, spdlog::level::trace);
  EXPECT_EQ(config.file_path, "/tmp/x.log");

  setenv("CSNAKE_LOG_LEVEL", "nonsense", 1);
  EXPECT_EQ(csnake::logging::apply_environment(defaults).level,
            spdlog::level::info);
}

TEST_F(LoggingTest, ResolvePath) {
  EXPECT_EQ(csnake::logging::resolve_log_file_path("/var/tmp/a.log"),
            "/var/tmp/a.log");

  setenv("XDG_DATA_HOME", "/data", 1);
  EXPECT_EQ(csnake::logging::resolve_log_file_path(""),
            "/data/csnake/csnake.log");

  unsetenv("XDG_DATA_HOME");
  setenv("HOME", "/home/player", 1);
  EXPECT_EQ(csnake::logging::resolve_log_file_path(""),
            "/home/player/.local/share/csnake/csnake.log");

  unsetenv("HOME");
  EXPECT_EQ(csnake::logging::resolve_log_file_path(""), "/tmp/csnake.log");
}

TEST_F(LoggingTest, InitWritesToFile) {
  LogConfig config;
  config.enable_console = false;
  config.level = spdlog::level::debug;
  config.file_path = (dir_ / "nested" / "game.log").string();

  ASSERT_TRUE(csnake::logging::init(config));
  spdlog::info("[Test] hello {}", 42);
  spdlog::trace("[Test] hidden");
  spdlog::default_logger()->flush();

  std::ifstream in(config.file_path);
  ASSERT_TRUE(in.is_open()) << "Каталог журнала должен создаваться";
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find("[Test] hello 42"), std::string::npos);
  EXPECT_EQ(content.str().find("hidden"), std::string::npos);
  EXPECT_EQ(spdlog::default_logger()->name(), "csnake");
}

TEST_F(LoggingTest, InitReportsUnwritableFile) {
  fs::create_directories(dir_);
  LogConfig config;
  config.enable_console = false;
  // Путь указывает на каталог: файл открыть нельзя
  config.file_path = dir_.string();

  EXPECT_FALSE(csnake::logging::init(config));
  ASSERT_NE(spdlog::default_logger(), nullptr);
  EXPECT_EQ(spdlog::default_logger()->name(), "csnake");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
