#include <gtest/gtest.h>

#include <deque>
#include <map>
#include <string>
#include <vector>

#include "csnake_controller.hpp"

extern "C" {
#include "csnake.h"
}

using csnake::Command;
using csnake::Controller;
using csnake::key_to_command;

// ---------- Поддельное представление: запоминает зоны и элементы ----------

struct FakeZone {
  int x, y, w, h;
};

struct FakeView {
  bool fail_init = false;
  bool active = false;
  int width = 0, height = 0, fps = 0;
  int renders = 0;
  std::map<std::string, FakeZone> zones;
  std::map<std::string, std::string> texts;
  std::map<std::string, int> numbers;
  std::vector<int> field;
  int field_w = 0, field_h = 0;
  std::deque<int> keys;
};

static FakeView g_fake;

static ViewHandle_t fake_init(int width, int height, int fps) {
  if (g_fake.fail_init) return nullptr;
  g_fake.active = true;
  g_fake.width = width;
  g_fake.height = height;
  g_fake.fps = fps;
  return &g_fake;
}

static ViewResult_t fake_configure_zone(ViewHandle_t handle, const char* id,
                                        int x, int y, int w, int h) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  g_fake.zones[id] = FakeZone{x, y, w, h};
  return VIEW_OK;
}

static ViewResult_t fake_draw_element(ViewHandle_t handle, const char* id,
                                      const ElementData_t* data) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!g_fake.zones.count(id)) return VIEW_INVALID_ID;
  switch (data->type) {
    case ELEMENT_TEXT:
      g_fake.texts[id] = data->content.text;
      break;
    case ELEMENT_NUMBER:
      g_fake.numbers[id] = data->content.number;
      break;
    case ELEMENT_MATRIX:
      g_fake.field_w = data->content.matrix.width;
      g_fake.field_h = data->content.matrix.height;
      g_fake.field.assign(data->content.matrix.data,
                          data->content.matrix.data +
                              g_fake.field_w * g_fake.field_h);
      break;
  }
  return VIEW_OK;
}

static ViewResult_t fake_render(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  ++g_fake.renders;
  return VIEW_OK;
}

static ViewResult_t fake_poll_input(ViewHandle_t handle, InputEvent_t* event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (g_fake.keys.empty()) return VIEW_NO_EVENT;
  event->key_code = g_fake.keys.front();
  event->key_state = 0;
  g_fake.keys.pop_front();
  return VIEW_OK;
}

static ViewResult_t fake_shutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  g_fake.active = false;
  return VIEW_OK;
}

static const ViewInterface fake_view = {
    VIEW_INTERFACE_VERSION, fake_init,       fake_configure_zone,
    fake_draw_element,      fake_render,     fake_poll_input,
    fake_shutdown};

class ControllerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    g_fake = FakeView{};
    config_ = snake_default_config();
    config_.seed = 3;
  }

  bool Init() { return controller_.init(&config_); }

  void Press(int key) { g_fake.keys.push_back(key); }

  int HeadIndex() const {
    for (size_t i = 0; i < g_fake.field.size(); ++i) {
      if (g_fake.field[i] == SNAKE_HEAD_CELL) return static_cast<int>(i);
    }
    return -1;
  }

  SnakeConfig_t config_{};
  Controller controller_{fake_view, snake_get_interface()};
};

/* ===== Клавиши ===== */

TEST(KeyMappingTest, Directions) {
  EXPECT_EQ(key_to_command('w'), Command::UP);
  EXPECT_EQ(key_to_command('a'), Command::LEFT);
  EXPECT_EQ(key_to_command('s'), Command::DOWN);
  EXPECT_EQ(key_to_command('d'), Command::RIGHT);
  EXPECT_EQ(key_to_command('D'), Command::RIGHT);
}

TEST(KeyMappingTest, ControlKeys) {
  EXPECT_EQ(key_to_command('p'), Command::PAUSE);
  EXPECT_EQ(key_to_command('q'), Command::QUIT);
  EXPECT_EQ(key_to_command('Q'), Command::QUIT);
  EXPECT_EQ(key_to_command(CSNAKE_ESCAPE), Command::QUIT);
  EXPECT_EQ(key_to_command('c'), Command::RESTART);
  EXPECT_EQ(key_to_command(CSNAKE_ENTER_KEY), Command::START);
  EXPECT_EQ(key_to_command(' '), Command::START);
  EXPECT_EQ(key_to_command('x'), Command::NONE);
  EXPECT_EQ(key_to_command(0), Command::NONE);
}

TEST(LayoutTest, FieldPanelAndStatus) {
  csnake::Layout l = csnake::make_layout(20, 20);
  EXPECT_EQ(l.field_w, 42);
  EXPECT_EQ(l.field_h, 22);
  EXPECT_EQ(l.panel_x, 44);
  EXPECT_EQ(l.status_y, 22);
  EXPECT_EQ(l.width, 54);
  EXPECT_EQ(l.height, 24);

  // Узкое поле: строка статуса не короче 40 символов
  EXPECT_EQ(csnake::make_layout(4, 4).width, 40);
}

/* ===== Инициализация ===== */

TEST_F(ControllerTest, InitConfiguresZonesAndDraws) {
  ASSERT_TRUE(Init());
  EXPECT_TRUE(g_fake.active);
  EXPECT_EQ(g_fake.width, 54);
  EXPECT_EQ(g_fake.height, 24);
  EXPECT_EQ(g_fake.fps, CSNAKE_DEFAULT_FPS);

  for (const char* zone : {"field", "labels", "score", "best", "status"}) {
    EXPECT_EQ(g_fake.zones.count(zone), 1u) << "Нет зоны " << zone;
  }

  EXPECT_EQ(g_fake.field_w, CSNAKE_FIELD_COLS);
  EXPECT_EQ(g_fake.field_h, CSNAKE_FIELD_ROWS);
  EXPECT_EQ(g_fake.numbers["score"], 0);
  EXPECT_EQ(g_fake.numbers["best"], 0);
  EXPECT_EQ(g_fake.texts["status"], csnake::status_text(SNAKE_STATUS_READY));
  EXPECT_GE(g_fake.renders, 1);
}

TEST_F(ControllerTest, InitFailsWithoutView) {
  g_fake.fail_init = true;
  EXPECT_FALSE(Init());
  EXPECT_FALSE(controller_.frame(true));
}

TEST_F(ControllerTest, InitFailsOnBadConfig) {
  config_.cols = 1;
  EXPECT_FALSE(Init());
  EXPECT_FALSE(g_fake.active) << "Представление не создаётся без сессии";
}

TEST_F(ControllerTest, ShutdownOnDestruction) {
  {
    Controller local(fake_view, snake_get_interface());
    ASSERT_TRUE(local.init(&config_));
    EXPECT_TRUE(g_fake.active);
  }
  EXPECT_FALSE(g_fake.active);
}

/* ===== Кадры ===== */

TEST_F(ControllerTest, DirectionKeyStartsAndTickMoves) {
  ASSERT_TRUE(Init());
  int head = HeadIndex();
  ASSERT_GE(head, 0);

  Press('d');
  ASSERT_TRUE(controller_.frame(false));
  EXPECT_EQ(controller_.info()->status, SNAKE_STATUS_RUNNING);
  EXPECT_EQ(HeadIndex(), head) << "Без тика змейка стоит";

  ASSERT_TRUE(controller_.frame(true));
  EXPECT_EQ(HeadIndex(), head + 1);
  EXPECT_EQ(g_fake.texts["status"],
            csnake::status_text(SNAKE_STATUS_RUNNING));
}

TEST_F(ControllerTest, PauseStopsTicks) {
  ASSERT_TRUE(Init());
  Press(CSNAKE_ENTER_KEY);
  ASSERT_TRUE(controller_.frame(true));
  int head = HeadIndex();

  Press('p');
  ASSERT_TRUE(controller_.frame(true));
  EXPECT_EQ(controller_.info()->status, SNAKE_STATUS_PAUSED);
  EXPECT_EQ(HeadIndex(), head);
  EXPECT_EQ(g_fake.texts["status"], "Paused. P-Resume Q-Quit");

  Press('p');
  ASSERT_TRUE(controller_.frame(true));
  EXPECT_EQ(HeadIndex(), head + 1);
}

TEST_F(ControllerTest, QuitEndsLoop) {
  ASSERT_TRUE(Init());
  Press('d');
  Press('q');
  Press('w');
  EXPECT_FALSE(controller_.frame(true));
  EXPECT_TRUE(controller_.quitRequested());
  EXPECT_EQ(g_fake.keys.size(), 1u) << "После выхода ввод не читается";
  EXPECT_FALSE(controller_.frame(true));
}

TEST_F(ControllerTest, LostScreenHonoursOnlyQuitAndRestart) {
  ASSERT_TRUE(Init());
  Press('d');
  ASSERT_TRUE(controller_.frame(false));

  // Голова в (10,10): десятый шаг вправо выходит за поле
  for (int i = 0; i < CSNAKE_FIELD_COLS / 2; ++i) {
    ASSERT_TRUE(controller_.frame(true));
  }
  ASSERT_EQ(controller_.info()->status, SNAKE_STATUS_LOST);
  EXPECT_EQ(g_fake.texts["status"], "You Lost! Press Q-Quit or C-Play Again");

  Press('p');
  Press('w');
  Press(CSNAKE_ENTER_KEY);
  ASSERT_TRUE(controller_.frame(true));
  EXPECT_EQ(controller_.info()->status, SNAKE_STATUS_LOST);

  Press('c');
  ASSERT_TRUE(controller_.frame(true));
  EXPECT_EQ(controller_.info()->status, SNAKE_STATUS_READY);
  EXPECT_EQ(g_fake.numbers["score"], 0);

  Press('s');
  ASSERT_TRUE(controller_.frame(false));
  EXPECT_EQ(controller_.info()->status, SNAKE_STATUS_RUNNING);
}

TEST_F(ControllerTest, QuitFromLostScreen) {
  ASSERT_TRUE(Init());
  Press('d');
  for (int i = 0; i < CSNAKE_FIELD_COLS / 2; ++i) {
    ASSERT_TRUE(controller_.frame(true));
  }
  ASSERT_EQ(controller_.info()->status, SNAKE_STATUS_LOST);

  Press(CSNAKE_ESCAPE);
  EXPECT_FALSE(controller_.frame(false));
}

TEST_F(ControllerTest, RunReturnsZeroOnQuit) {
  ASSERT_TRUE(Init());
  Press('q');
  EXPECT_EQ(controller_.run(), 0);
}

TEST(ControllerNoInitTest, RunWithoutInitFails) {
  Controller controller(fake_view, snake_get_interface());
  EXPECT_EQ(controller.info(), nullptr);
  EXPECT_EQ(controller.run(), 1);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
