#include "qt_view.hpp"

#include <QApplication>
#include <QCloseEvent>
#include <QKeyEvent>
#include <QMainWindow>
#include <QPainter>
#include <QWidget>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <new>
#include <queue>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

extern "C" {
#include "csnake_bgame.h"
}

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

namespace {

constexpr int kUnitWidth = 8;    // пикселей на символ по ширине
constexpr int kUnitHeight = 16;  // пикселей на символ по высоте
constexpr int kEscape = 27;

struct Zone {
  int x, y, w, h;
  std::string name;
};

// Копия элемента: данные ElementData_t живут только до render()
struct Element {
  ElementType_t type = ELEMENT_NUMBER;
  std::string text;
  int number = 0;
  std::vector<int> cells;
  int width = 0;
  int height = 0;
};

QColor getColorForValue(int value) {
  switch (value) {
    case SNAKE_BODY_CELL:
      return Qt::black;
    case SNAKE_HEAD_CELL:
      return Qt::darkGray;
    case SNAKE_FOOD_CELL:
      return Qt::green;
    default:
      return Qt::white;
  }
}

QRect toPixels(const Zone& z) {
  return QRect(z.x * kUnitWidth, z.y * kUnitHeight, z.w * kUnitWidth,
               z.h * kUnitHeight);
}

}  // namespace

class GameWidget : public QWidget {
 public:
  explicit GameWidget(QWidget* parent = nullptr) : QWidget(parent) {
    setFocusPolicy(Qt::StrongFocus);
  }

  void setElement(const std::string& id, Element element) {
    elements_[id] = std::move(element);
  }

  void setZones(const std::vector<Zone>& zones) { zones_ = zones; }

  void pushInput(int key_code) {
    InputEvent_t ev{};
    ev.key_code = key_code;
    inputQueue_.push(ev);
  }

  // Очередь событий клавиатуры для poll_input()
  bool popInput(InputEvent_t& out) {
    if (inputQueue_.empty()) return false;
    out = inputQueue_.front();
    inputQueue_.pop();
    return true;
  }

 protected:
  void paintEvent(QPaintEvent*) override {
    QPainter p(this);
    p.fillRect(rect(), Qt::white);

    for (const Zone& z : zones_) {
      auto it = elements_.find(z.name);
      if (it == elements_.end()) continue;

      const QRect area = toPixels(z);
      const Element& e = it->second;

      switch (e.type) {
        case ELEMENT_TEXT:
          p.setPen(Qt::red);
          p.drawText(area, Qt::AlignLeft | Qt::AlignTop | Qt::TextWordWrap,
                     QString::fromUtf8(e.text.c_str()));
          break;

        case ELEMENT_NUMBER:
          p.setPen(Qt::black);
          p.drawText(area, Qt::AlignRight | Qt::AlignTop,
                     QString::number(e.number));
          break;

        case ELEMENT_MATRIX:
          paintMatrix(p, area, e);
          break;
      }
    }
  }

  void keyPressEvent(QKeyEvent* event) override {
    int key_code = 0;

    switch (event->key()) {
      case Qt::Key_Left:
        key_code = 'a';
        break;
      case Qt::Key_Right:
        key_code = 'd';
        break;
      case Qt::Key_Up:
        key_code = 'w';
        break;
      case Qt::Key_Down:
        key_code = 's';
        break;
      case Qt::Key_Escape:
        key_code = kEscape;
        break;
      case Qt::Key_Return:
      case Qt::Key_Enter:
        key_code = '\n';
        break;
      default:
        key_code =
            event->text().isEmpty() ? 0 : event->text().at(0).toLatin1();
        break;
    }

    if (key_code != 0) pushInput(key_code);

    QWidget::keyPressEvent(event);
  }

 private:
  // Поле в рамке, клетка квадратная по меньшей стороне
  void paintMatrix(QPainter& p, const QRect& area, const Element& e) {
    if (e.width <= 0 || e.height <= 0 || e.cells.empty()) return;

    p.setPen(Qt::black);
    p.drawRect(area.adjusted(0, 0, -1, -1));

    const QRect inner = area.adjusted(kUnitWidth, kUnitHeight / 2,
                                      -kUnitWidth, -kUnitHeight / 2);
    const int cellSize =
        std::max(1, std::min(inner.width() / e.width, inner.height() / e.height));

    for (int row = 0; row < e.height; ++row) {
      for (int col = 0; col < e.width; ++col) {
        int value = e.cells[row * e.width + col];
        if (value == SNAKE_EMPTY_CELL) continue;
        QRect cell(inner.x() + col * cellSize, inner.y() + row * cellSize,
                   cellSize, cellSize);
        p.fillRect(cell.adjusted(1, 1, -1, -1), getColorForValue(value));
      }
    }
  }

  std::vector<Zone> zones_;
  std::unordered_map<std::string, Element> elements_;
  std::queue<InputEvent_t> inputQueue_;
};

// Закрытие окна превращается в клавишу выхода
class GameWindow : public QMainWindow {
 public:
  explicit GameWindow(GameWidget* widget) : widget_(widget) {
    setCentralWidget(widget_);
    setWindowTitle("Snake");
  }

 protected:
  void closeEvent(QCloseEvent* event) override {
    widget_->pushInput('q');
    event->accept();
  }

 private:
  GameWidget* widget_;
};

// Контекст Qt-View
struct QtViewContext {
  int width;
  int height;
  int fps;
  GameWindow* window;
  GameWidget* widget;
  std::vector<Zone> zones;
};

// ---------- Реализация ViewInterface для Qt ----------

static ViewHandle_t qt_init(int width, int height, int fps) {
  if (width <= 0 || height <= 0 || fps < 1) return nullptr;

  if (!QApplication::instance()) {
    spdlog::error("[QtView] QApplication must exist before init");
    return nullptr;
  }

  QtViewContext* ctx = new (std::nothrow) QtViewContext{};
  if (!ctx) return nullptr;
  ctx->width = width;
  ctx->height = height;
  ctx->fps = fps;

  ctx->widget = new GameWidget;
  ctx->window = new GameWindow(ctx->widget);
  ctx->window->resize(width * kUnitWidth, height * kUnitHeight);

  // Показываем окно, но не блокируем
  ctx->window->show();
  ctx->widget->setFocus();
  QApplication::processEvents();

  spdlog::debug("[QtView] Initialized {}x{} px", width * kUnitWidth,
                height * kUnitHeight);
  return static_cast<ViewHandle_t>(ctx);
}

static ViewResult_t qt_configure_zone(ViewHandle_t handle,
                                      const char* element_id, int x, int y,
                                      int max_w, int max_h) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || std::strlen(element_id) == 0) return VIEW_BAD_DATA;
  if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

  QtViewContext* ctx = static_cast<QtViewContext*>(handle);
  auto it = std::find_if(ctx->zones.begin(), ctx->zones.end(),
                         [&](const Zone& z) { return z.name == element_id; });
  Zone z{x, y, max_w, max_h, element_id};
  if (it != ctx->zones.end()) {
    *it = z;
  } else {
    ctx->zones.push_back(z);
  }
  ctx->widget->setZones(ctx->zones);

  return VIEW_OK;
}

static ViewResult_t qt_draw_element(ViewHandle_t handle,
                                    const char* element_id,
                                    const ElementData_t* data) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!element_id || !data) return VIEW_BAD_DATA;

  QtViewContext* ctx = static_cast<QtViewContext*>(handle);
  auto known = std::any_of(ctx->zones.begin(), ctx->zones.end(),
                           [&](const Zone& z) { return z.name == element_id; });
  if (!known) return VIEW_INVALID_ID;

  Element e;
  e.type = data->type;
  switch (data->type) {
    case ELEMENT_TEXT:
      if (!data->content.text) return VIEW_BAD_DATA;
      e.text = data->content.text;
      break;
    case ELEMENT_NUMBER:
      e.number = data->content.number;
      break;
    case ELEMENT_MATRIX: {
      const int* arr = data->content.matrix.data;
      e.width = data->content.matrix.width;
      e.height = data->content.matrix.height;
      if (!arr || e.width <= 0 || e.height <= 0) return VIEW_BAD_DATA;
      e.cells.assign(arr, arr + e.width * e.height);
      break;
    }
  }
  ctx->widget->setElement(element_id, std::move(e));

  return VIEW_OK;
}

static ViewResult_t qt_render(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;

  QtViewContext* ctx = static_cast<QtViewContext*>(handle);
  ctx->widget->update();  // явно запрашиваем перерисовку

  return VIEW_OK;
}

static ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t* event) {
  if (!handle) return VIEW_NOT_INITIALIZED;
  if (!event) return VIEW_ERROR;

  // Цикл событий Qt крутится здесь: контроллер владеет главным циклом
  QApplication::processEvents();

  QtViewContext* ctx = static_cast<QtViewContext*>(handle);
  InputEvent_t ev{};
  if (ctx->widget->popInput(ev)) {
    *event = ev;
    return VIEW_OK;
  }

  return VIEW_NO_EVENT;
}

static ViewResult_t qt_shutdown(ViewHandle_t handle) {
  if (!handle) return VIEW_NOT_INITIALIZED;

  QtViewContext* ctx = static_cast<QtViewContext*>(handle);
  if (ctx->window) {
    ctx->window->hide();
    delete ctx->window;  // удаляет и центральный виджет
  }
  delete ctx;

  return VIEW_OK;
}

// Экспортируемый экземпляр Qt-View
const ViewInterface qt_view = {VIEW_INTERFACE_VERSION, qt_init,
                               qt_configure_zone,      qt_draw_element,
                               qt_render,              qt_poll_input,
                               qt_shutdown};
