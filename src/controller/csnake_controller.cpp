#include "csnake_controller.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <thread>

namespace csnake {

namespace {

constexpr int kPanelWidth = 10;
constexpr int kMinWidth = 40;
constexpr int kStatusHeight = 2;

const char kLabels[] = "SCORE\n\n\nBEST";

ElementData_t text_element(const char* text) noexcept {
  ElementData_t data{};
  data.type = ELEMENT_TEXT;
  data.content.text = text;
  return data;
}

ElementData_t number_element(int number) noexcept {
  ElementData_t data{};
  data.type = ELEMENT_NUMBER;
  data.content.number = number;
  return data;
}

}  // namespace

Command key_to_command(int key_code) noexcept {
  switch (key_code) {
    case 'a':
    case 'A':
      return Command::LEFT;
    case 'd':
    case 'D':
      return Command::RIGHT;
    case 'w':
    case 'W':
      return Command::UP;
    case 's':
    case 'S':
      return Command::DOWN;
    case 'p':
    case 'P':
      return Command::PAUSE;
    case 'c':
    case 'C':
      return Command::RESTART;
    case 'q':
    case 'Q':
    case CSNAKE_ESCAPE:
      return Command::QUIT;
    case CSNAKE_ENTER_KEY:
    case '\r':
    case ' ':
      return Command::START;
    default:
      return Command::NONE;
  }
}

const char* status_text(int status) noexcept {
  switch (status) {
    case SNAKE_STATUS_READY:
      return "Press an arrow key or Enter to start";
    case SNAKE_STATUS_RUNNING:
      return "Arrows-Move P-Pause Q-Quit";
    case SNAKE_STATUS_PAUSED:
      return "Paused. P-Resume Q-Quit";
    case SNAKE_STATUS_LOST:
      return "You Lost! Press Q-Quit or C-Play Again";
    case SNAKE_STATUS_WON:
      return "You Won! Press Q-Quit or C-Play Again";
    default:
      return "";
  }
}

/**
 * Поле в рамке слева, колонка счёта справа, строка статуса снизу:
 *
 *   +--------+  SCORE
 *   |        |      3
 *   |        |
 *   +--------+  BEST
 *   status .....    7
 */
Layout make_layout(int rows, int cols) noexcept {
  Layout l{};
  l.field_w = cols * 2 + 2;
  l.field_h = rows + 2;
  l.panel_x = l.field_w + 2;
  l.status_y = l.field_h;
  l.width = std::max(l.panel_x + kPanelWidth, kMinWidth);
  l.height = l.field_h + kStatusHeight;
  return l;
}

Controller::Controller(const ViewInterface& view,
                       const GameInterface_t& game) noexcept
    : view_(view), game_(game) {}

Controller::~Controller() noexcept {
  if (handle_) {
    view_.shutdown(handle_);
  }
  if (session_) {
    game_.destroy(session_);
  }
}

bool Controller::init(const SnakeConfig_t* config, int fps) noexcept {
  if (session_ || handle_) return false;
  if (!game_.create || !game_.destroy || !game_.input || !game_.update ||
      !game_.get_info || !view_.init) {
    spdlog::error("[Controller] Incomplete game or view interface");
    return false;
  }
  if (view_.version != VIEW_INTERFACE_VERSION) {
    spdlog::error("[Controller] View interface version {} (expected {})",
                  view_.version, VIEW_INTERFACE_VERSION);
    return false;
  }

  session_ = game_.create(config);
  if (!session_) {
    spdlog::error("[Controller] Failed to create game session");
    return false;
  }

  const GameInfo_t* info = game_.get_info(session_);
  if (!info) return false;
  const Layout layout = make_layout(info->rows, info->cols);

  fps_ = std::max(1, fps);
  handle_ = view_.init(layout.width, layout.height, fps_);
  if (!handle_) {
    spdlog::error("[Controller] Failed to initialize view");
    return false;
  }

  if (!configureZones_(layout)) {
    spdlog::error("[Controller] Failed to configure view zones");
    return false;
  }

  spdlog::info("[Controller] Ready: {}x{} field, tick {} ms", info->cols,
               info->rows, info->speed);
  draw_();
  return true;
}

bool Controller::configureZones_(const Layout& l) noexcept {
  return view_.configure_zone(handle_, "field", 0, 0, l.field_w, l.field_h) ==
             VIEW_OK &&
         view_.configure_zone(handle_, "labels", l.panel_x, 1, kPanelWidth,
                              4) == VIEW_OK &&
         view_.configure_zone(handle_, "score", l.panel_x, 2, kPanelWidth,
                              1) == VIEW_OK &&
         view_.configure_zone(handle_, "best", l.panel_x, 5, kPanelWidth, 1) ==
             VIEW_OK &&
         view_.configure_zone(handle_, "status", 0, l.status_y, l.width,
                              kStatusHeight) == VIEW_OK;
}

const GameInfo_t* Controller::info() const noexcept {
  return session_ ? game_.get_info(session_) : nullptr;
}

/**
 * На экране окончания игры работают только Q и C. Во время игры C
 * игнорируется, Q прерывает текущую партию и завершает цикл.
 */
void Controller::handleCommand_(Command cmd) noexcept {
  const GameInfo_t* current = info();
  if (!current) return;

  const bool finished = current->status == SNAKE_STATUS_LOST ||
                        current->status == SNAKE_STATUS_WON;

  if (cmd == Command::QUIT) {
    if (!finished) game_.input(session_, Terminate, false);
    quit_ = true;
    spdlog::info("[Controller] Quit, best score {}", current->high_score);
    return;
  }

  if (finished) {
    if (cmd == Command::RESTART) {
      game_.input(session_, Start, false);
      spdlog::info("[Controller] Play again");
    }
    return;
  }

  switch (cmd) {
    case Command::LEFT:
      game_.input(session_, Left, false);
      break;
    case Command::RIGHT:
      game_.input(session_, Right, false);
      break;
    case Command::UP:
      game_.input(session_, Up, false);
      break;
    case Command::DOWN:
      game_.input(session_, Down, false);
      break;
    case Command::PAUSE:
      game_.input(session_, Pause, false);
      break;
    case Command::START:
      game_.input(session_, Start, false);
      break;
    default:
      break;
  }
}

bool Controller::frame(bool tick) noexcept {
  if (!session_ || !handle_) return false;

  InputEvent_t event{};
  while (!quit_ && view_.poll_input(handle_, &event) == VIEW_OK) {
    handleCommand_(key_to_command(event.key_code));
  }
  if (quit_) return false;

  if (tick) {
    game_.update(session_);
  }
  draw_();
  return true;
}

void Controller::draw_() noexcept {
  const GameInfo_t* current = info();
  if (!current || !current->field) return;

  if (current->status != lastStatus_) {
    spdlog::debug("[Controller] Status {} -> {}", lastStatus_,
                  current->status);
    lastStatus_ = current->status;
  }

  ElementData_t field{};
  field.type = ELEMENT_MATRIX;
  field.content.matrix.data = current->field[0];
  field.content.matrix.width = current->cols;
  field.content.matrix.height = current->rows;

  const ElementData_t labels = text_element(kLabels);
  const ElementData_t score = number_element(current->score);
  const ElementData_t best = number_element(current->high_score);
  const ElementData_t status = text_element(status_text(current->status));

  if (view_.draw_element(handle_, "field", &field) != VIEW_OK ||
      view_.draw_element(handle_, "labels", &labels) != VIEW_OK ||
      view_.draw_element(handle_, "score", &score) != VIEW_OK ||
      view_.draw_element(handle_, "best", &best) != VIEW_OK ||
      view_.draw_element(handle_, "status", &status) != VIEW_OK) {
    spdlog::warn("[Controller] draw_element failed");
  }
  if (view_.render(handle_) != VIEW_OK) {
    spdlog::warn("[Controller] render failed");
  }
}

int Controller::run() noexcept {
  using clock = std::chrono::steady_clock;

  const GameInfo_t* current = info();
  if (!current || !handle_) return 1;

  const auto tick = std::chrono::milliseconds(current->speed);
  const auto frame_period = std::chrono::milliseconds(1000 / fps_);
  auto next_tick = clock::now() + tick;

  while (true) {
    const auto now = clock::now();
    const bool due = now >= next_tick;
    if (due) {
      next_tick += tick;
      // После долгой задержки не догоняем пропущенные тики
      if (next_tick < now) next_tick = now + tick;
    }

    if (!frame(due)) break;
    std::this_thread::sleep_for(frame_period);
  }
  return 0;
}

}  // namespace csnake
