#include "cli.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <new>
#include <string>
#include <unordered_map>

extern "C" {
#include "csnake_bgame.h"
}

// ncurses последним: его макросы move() и erase() ломают заголовки C++
#include <ncurses.h>

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

namespace {

enum ColorPairId : short {
  PAIR_FRAME = 1,
  PAIR_BODY,
  PAIR_HEAD,
  PAIR_FOOD,
  PAIR_TEXT
};

struct Zone {
  int x, y, w, h;
};

struct CliContext {
  int width;
  int height;
  int fps;
  bool colors;
  std::unordered_map<std::string, Zone> zones;
};

// ncurses глобален: допускается только один активный контекст
bool g_active = false;

void clear_zone(const Zone& z) {
  for (int row = 0; row < z.h; ++row) {
    mvhline(z.y + row, z.x, ' ', z.w);
  }
}

void draw_frame(const Zone& z) {
  mvaddch(z.y, z.x, ACS_ULCORNER);
  mvaddch(z.y, z.x + z.w - 1, ACS_URCORNER);
  mvaddch(z.y + z.h - 1, z.x, ACS_LLCORNER);
  mvaddch(z.y + z.h - 1, z.x + z.w - 1, ACS_LRCORNER);
  mvhline(z.y, z.x + 1, ACS_HLINE, z.w - 2);
  mvhline(z.y + z.h - 1, z.x + 1, ACS_HLINE, z.w - 2);
  mvvline(z.y + 1, z.x, ACS_VLINE, z.h - 2);
  mvvline(z.y + 1, z.x + z.w - 1, ACS_VLINE, z.h - 2);
}

void draw_text(const Zone& z, const char* text) {
  int row = 0;
  const char* line = text;
  while (line && row < z.h) {
    const char* end = std::strchr(line, '\n');
    int len = end ? static_cast<int>(end - line)
                  : static_cast<int>(std::strlen(line));
    mvaddnstr(z.y + row, z.x, line, std::min(len, z.w));
    ++row;
    line = end ? end + 1 : nullptr;
  }
}

void draw_cell(int y, int x, int value, bool colors) {
  const char* glyph = "  ";
  short pair = 0;
  switch (value) {
    case SNAKE_BODY_CELL:
      glyph = "[]";
      pair = PAIR_BODY;
      break;
    case SNAKE_HEAD_CELL:
      glyph = "@@";
      pair = PAIR_HEAD;
      break;
    case SNAKE_FOOD_CELL:
      glyph = "<>";
      pair = PAIR_FOOD;
      break;
    default:
      break;
  }

  if (colors && pair != 0) attron(COLOR_PAIR(pair));
  mvaddstr(y, x, glyph);
  if (colors && pair != 0) attroff(COLOR_PAIR(pair));
}

/**
 * Матрица рисуется внутри рамки зоны; клетки, не поместившиеся в зону,
 * отбрасываются.
 */
ViewResult_t draw_matrix(const Zone& z, const ElementData_t& data,
                         bool colors) {
  const int mw = data.content.matrix.width;
  const int mh = data.content.matrix.height;
  const int* cells = data.content.matrix.data;
  if (!cells || mw <= 0 || mh <= 0) return VIEW_BAD_DATA;
  if (z.w < 4 || z.h < 3) return VIEW_BAD_DATA;

  if (colors) attron(COLOR_PAIR(PAIR_FRAME));
  draw_frame(z);
  if (colors) attroff(COLOR_PAIR(PAIR_FRAME));

  const int visible_cols = std::min(mw, (z.w - 2) / 2);
  const int visible_rows = std::min(mh, z.h - 2);
  for (int row = 0; row < visible_rows; ++row) {
    for (int col = 0; col < visible_cols; ++col) {
      draw_cell(z.y + 1 + row, z.x + 1 + col * 2, cells[row * mw + col],
                colors);
    }
  }
  return VIEW_OK;
}

}  // namespace

// ---------- Реализация ViewInterface для ncurses ----------

static ViewHandle_t cli_init(int width, int height, int fps) {
  if (width <= 0 || height <= 0 || fps < 1 || g_active) return nullptr;

  CliContext* ctx = new (std::nothrow) CliContext{};
  if (!ctx) return nullptr;
  ctx->width = width;
  ctx->height = height;
  ctx->fps = fps;

  if (initscr() == nullptr) {
    delete ctx;
    return nullptr;
  }
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);
  curs_set(0);
  set_escdelay(25);

  ctx->colors = has_colors();
  if (ctx->colors) {
    start_color();
    init_pair(PAIR_FRAME, COLOR_WHITE, COLOR_BLACK);
    init_pair(PAIR_BODY, COLOR_BLACK, COLOR_WHITE);
    init_pair(PAIR_HEAD, COLOR_BLUE, COLOR_WHITE);
    init_pair(PAIR_FOOD, COLOR_BLACK, COLOR_GREEN);
    init_pair(PAIR_TEXT, COLOR_RED, COLOR_BLACK);
  }

  if (COLS < width || LINES < height) {
    spdlog::warn("[CliView] Terminal {}x{} is smaller than layout {}x{}",
                 COLS, LINES, width, height);
  }

  g_active = true;
  spdlog::debug("[CliView] Initialized {}x{} at {} fps, colors={}", width,
                height, fps, ctx->colors);
  return static_cast<ViewHandle_t>(ctx);
}

static ViewResult_t cli_configure_zone(ViewHandle_t handle,
                                       const char* element_id, int x, int y,
                                       int max_w, int max_h) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || std::strlen(element_id) == 0 ||
      std::strlen(element_id) > 31)
    return VIEW_BAD_DATA;
  if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

  CliContext* ctx = static_cast<CliContext*>(handle);
  try {
    ctx->zones[element_id] = Zone{x, y, max_w, max_h};
  } catch (const std::bad_alloc&) {
    return VIEW_ERROR;
  }
  return VIEW_OK;
}

static ViewResult_t cli_draw_element(ViewHandle_t handle,
                                     const char* element_id,
                                     const ElementData_t* data) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || !data) return VIEW_BAD_DATA;

  CliContext* ctx = static_cast<CliContext*>(handle);
  auto it = ctx->zones.find(element_id);
  if (it == ctx->zones.end()) return VIEW_INVALID_ID;
  const Zone& z = it->second;

  switch (data->type) {
    case ELEMENT_TEXT:
      if (!data->content.text) return VIEW_BAD_DATA;
      clear_zone(z);
      if (ctx->colors) attron(COLOR_PAIR(PAIR_TEXT) | A_BOLD);
      draw_text(z, data->content.text);
      if (ctx->colors) attroff(COLOR_PAIR(PAIR_TEXT) | A_BOLD);
      return VIEW_OK;

    case ELEMENT_NUMBER:
      clear_zone(z);
      mvprintw(z.y, z.x, "%*d", z.w, data->content.number);
      return VIEW_OK;

    case ELEMENT_MATRIX:
      return draw_matrix(z, *data, ctx->colors);
  }
  return VIEW_BAD_DATA;
}

static ViewResult_t cli_render(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  return refresh() == ERR ? VIEW_ERROR : VIEW_OK;
}

static ViewResult_t cli_poll_input(ViewHandle_t handle, InputEvent_t* event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!event) return VIEW_ERROR;

  int ch = getch();
  if (ch == ERR) return VIEW_NO_EVENT;

  InputEvent_t ev{};
  switch (ch) {
    case KEY_LEFT:
      ev.key_code = 'a';
      break;
    case KEY_RIGHT:
      ev.key_code = 'd';
      break;
    case KEY_UP:
      ev.key_code = 'w';
      break;
    case KEY_DOWN:
      ev.key_code = 's';
      break;
    case KEY_ENTER:
      ev.key_code = '\n';
      break;
    default:
      ev.key_code = ch;
      break;
  }
  *event = ev;
  return VIEW_OK;
}

static ViewResult_t cli_shutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;

  CliContext* ctx = static_cast<CliContext*>(handle);
  int rc = endwin();
  g_active = false;
  delete ctx;

  return rc == ERR ? VIEW_ERROR : VIEW_OK;
}

// Экспортируемый экземпляр CLI-View
extern "C" const ViewInterface cli_view = {
    VIEW_INTERFACE_VERSION, cli_init,       cli_configure_zone, cli_draw_element,
    cli_render,             cli_poll_input, cli_shutdown};
