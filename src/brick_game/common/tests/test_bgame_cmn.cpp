#include <gtest/gtest.h>

extern "C" {
#include "csnake_bgame_cmn.h"
}

/* ===== Поле ===== */

TEST(FieldTest, AllocateRejectsBadSize) {
  EXPECT_EQ(csnake_allocate_field(0, 10), nullptr);
  EXPECT_EQ(csnake_allocate_field(10, 0), nullptr);
  EXPECT_EQ(csnake_allocate_field(-1, 5), nullptr);
}

TEST(FieldTest, AllocateZeroedAndContiguous) {
  const int rows = 7;
  const int cols = 5;
  int** field = csnake_allocate_field(rows, cols);
  ASSERT_NE(field, nullptr);

  for (int y = 0; y < rows; ++y) {
    EXPECT_EQ(field[y], field[0] + y * cols) << "Строки должны идти подряд";
    for (int x = 0; x < cols; ++x) {
      EXPECT_EQ(field[y][x], SNAKE_EMPTY_CELL);
    }
  }

  // Запись через field[y][x] видна в row-major представлении
  field[3][2] = SNAKE_FOOD_CELL;
  EXPECT_EQ(field[0][3 * cols + 2], SNAKE_FOOD_CELL);

  csnake_free_field(field);
}

TEST(FieldTest, ClearResetsCells) {
  int** field = csnake_allocate_field(4, 4);
  ASSERT_NE(field, nullptr);
  field[0][0] = SNAKE_HEAD_CELL;
  field[3][3] = SNAKE_BODY_CELL;

  csnake_clear_field(field, 4, 4);
  for (int y = 0; y < 4; ++y)
    for (int x = 0; x < 4; ++x) EXPECT_EQ(field[y][x], SNAKE_EMPTY_CELL);

  csnake_free_field(field);
}

TEST(FieldTest, NullSafe) {
  csnake_free_field(nullptr);
  csnake_clear_field(nullptr, 3, 3);
  csnake_destroy_game_info(nullptr);
  EXPECT_FALSE(csnake_is_valid_field(nullptr, 3, 3));
  EXPECT_FALSE(csnake_is_valid_game_info(nullptr));
}

TEST(FieldTest, ValidFieldRejectsUnknownCell) {
  int** field = csnake_allocate_field(3, 3);
  ASSERT_NE(field, nullptr);
  EXPECT_TRUE(csnake_is_valid_field(field, 3, 3));

  field[1][1] = 7;
  EXPECT_FALSE(csnake_is_valid_field(field, 3, 3));
  field[1][1] = -1;
  EXPECT_FALSE(csnake_is_valid_field(field, 3, 3));

  csnake_free_field(field);
}

/* ===== GameInfo_t ===== */

TEST(GameInfoTest, CreateAndDestroy) {
  GameInfo_t info = csnake_create_game_info(20, 30);
  ASSERT_NE(info.field, nullptr);
  EXPECT_EQ(info.rows, 20);
  EXPECT_EQ(info.cols, 30);
  EXPECT_EQ(info.score, 0);
  EXPECT_EQ(info.high_score, 0);
  EXPECT_EQ(info.pause, 0);
  EXPECT_EQ(info.status, SNAKE_STATUS_READY);

  csnake_destroy_game_info(&info);
  EXPECT_EQ(info.field, nullptr);
  EXPECT_EQ(info.rows, 0);

  // Повторное освобождение безопасно
  csnake_destroy_game_info(&info);
}

TEST(GameInfoTest, Validation) {
  GameInfo_t info = csnake_create_game_info(5, 5);
  ASSERT_NE(info.field, nullptr);

  EXPECT_FALSE(csnake_is_valid_game_info(&info)) << "speed = 0 недопустима";
  info.speed = 66;
  EXPECT_TRUE(csnake_is_valid_game_info(&info));

  info.score = 3;
  EXPECT_FALSE(csnake_is_valid_game_info(&info)) << "score > high_score";
  info.high_score = 3;
  EXPECT_TRUE(csnake_is_valid_game_info(&info));

  info.pause = 2;
  EXPECT_FALSE(csnake_is_valid_game_info(&info));
  info.pause = 1;

  info.status = SNAKE_STATUS_WON + 1;
  EXPECT_FALSE(csnake_is_valid_game_info(&info));
  info.status = SNAKE_STATUS_LOST;
  EXPECT_TRUE(csnake_is_valid_game_info(&info));

  csnake_destroy_game_info(&info);
}

TEST(ActionTest, ValidActions) {
  EXPECT_TRUE(csnake_is_valid_action(Start));
  EXPECT_TRUE(csnake_is_valid_action(Down));
  EXPECT_TRUE(csnake_is_valid_action(Action));
  EXPECT_FALSE(csnake_is_valid_action(static_cast<UserAction_t>(Action + 1)));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
