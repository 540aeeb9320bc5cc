#include "ui.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <raylib.h>
#define RAYGUI_IMPLEMENTATION
#include <raygui.h>

#include <Tracy.hpp>

static constexpr float INPUT_HEIGHT = 20.0f;
static constexpr float TEXT_HEIGHT = INPUT_HEIGHT - 4.0f;
static constexpr Vector2 TEXT_OFFSET = {4.0f, 2.0f};
static constexpr float TEXT_SPACING = 1.0f;
static constexpr float VERT_GAP = 6.0f;
static constexpr float PADDING_HORI = 10.0f;
static constexpr float LINE_HEIGHT = TEXT_HEIGHT + 4.0f;
static constexpr float BUTTON_WIDTH = 140.0f;
static constexpr float RESULTS_TOP =
    PADDING_HORI + 3 * (INPUT_HEIGHT + VERT_GAP);

static const Color HIGHLIGHT_COLORS[NUM_HIGHLIGHT_COLORS] = {GOLD, BLUE, RED};

static float MeasureWidth(const Font &font, std::string_view text) {
  if (text.empty()) {
    return 0.0f;
  }
  std::string s(text);
  return MeasureTextEx(font, s.c_str(), TEXT_HEIGHT, TEXT_SPACING).x;
}

static float DrawRun(const Font &font,
                     std::string_view text,
                     Vector2 pos,
                     Color color) {
  std::string s(text);
  DrawTextEx(font, s.c_str(), pos, TEXT_HEIGHT, TEXT_SPACING, color);
  return MeasureTextEx(font, s.c_str(), TEXT_HEIGHT, TEXT_SPACING).x +
         TEXT_SPACING;
}

struct UI_Messages {
  Font font = {};

  void Push(const std::string &message,
            double time = 3.0,
            Color color = SKYBLUE) {
    if (messages.size() == 8) {
      messages.pop_front();
    }

    auto start = GetTime();
    messages.push_back({message, start, start + time, color});
  }

  void PushError(const std::string &message) { Push(message, 6.0, RED); }

  void Draw() {
    auto cur = messages.begin();
    auto time = GetTime();
    while (cur != messages.end()) {
      if (cur->timeEnd <= time) {
        cur = messages.erase(cur);
      } else {
        ++cur;
      }
    }

    float y = GetScreenHeight();
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
      auto v = MeasureTextEx(font, it->message.c_str(), TEXT_HEIGHT,
                             TEXT_SPACING);
      y -= v.y + 8 + 4;
      float x = GetScreenWidth() - v.x - 8 - PADDING_HORI;
      DrawRectangle(x, y, v.x + 8, v.y + 8, it->color);
      DrawRectangleLines(x, y, v.x + 8, v.y + 8, BLACK);
      DrawTextEx(font, it->message.c_str(), {x + 4, y + 4}, TEXT_HEIGHT,
                 TEXT_SPACING, BLACK);
    }
  }

  struct Message {
    std::string message;
    double timeStart;
    double timeEnd;
    Color color;
  };

  std::deque<Message> messages;
};

struct PatternInputBox {
  Color GetBackgroundColor(const Session &session) const {
    return session.GetCompileError() ? Color{255, 200, 200, 255} : WHITE;
  }

  Color GetBorderColor(const Session &session) const {
    return session.GetCompileError() ? MAROON : DARKBLUE;
  }

  void Draw(const Session &session, const Font &font, const Rectangle &rect) {
    DrawRectangleRec(rect, GetBackgroundColor(session));
    DrawRectangleLinesEx(rect, 1.0f, GetBorderColor(session));

    auto &pattern = session.GetPattern();
    auto &text = pattern.str();
    Vector2 origin = {rect.x + TEXT_OFFSET.x, rect.y + TEXT_OFFSET.y};
    DrawTextEx(font, pattern.c_str(), origin, TEXT_HEIGHT, TEXT_SPACING,
               DARKBLUE);

    auto &error = session.GetCompileError();
    if (error && error->offError) {
      auto offError = std::min(*error->offError, text.size());
      auto x = origin.x + MeasureWidth(font, std::string_view(text).substr(
                                                 0, offError));
      float width = 8.0f;
      if (offError < text.size()) {
        width = std::max(width, MeasureWidth(font, text.substr(offError, 1)));
      }
      DrawLineEx({x, rect.y + rect.height - 3},
                 {x + width, rect.y + rect.height - 3}, 2.0f, RED);
    }

    // Blinking cursor
    if (std::fmod(GetTime(), 1.0) < 0.6) {
      auto x = origin.x +
               MeasureWidth(font, std::string_view(text).substr(
                                      0, pattern.offCursor));
      DrawLine(x + 1, rect.y + 3, x + 1, rect.y + rect.height - 3, BLACK);
    }
  }
};

struct UI_State {
  Font font = {};
  bool fontLoaded = false;
  UI_Messages messages;
  PatternInputBox inputBox;

  float scrollY = 0;
  float scrollVel = 0;
  uint32_t exportSerialSeen = 0;
};

static void CollectInput(Session &session, UI_State &ui) {
  bool ctrlHeld = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);

  auto charEntered = GetCharPressed();
  while (charEntered > 0) {
    if (!ctrlHeld) {
      session.Push(SessionEvent::InsertChar(charEntered));
    }
    charEntered = GetCharPressed();
  }

  auto keyPressed = GetKeyPressed();
  while (keyPressed != 0) {
    switch (keyPressed) {
      case KEY_BACKSPACE:
        session.Push(SessionEvent::Of(ctrlHeld ? SE_DeleteWord : SE_DeleteChar));
        break;
      case KEY_DELETE:
        session.Push(SessionEvent::Of(SE_DeleteForward));
        break;
      case KEY_LEFT:
        session.Push(
            SessionEvent::Of(ctrlHeld ? SE_CursorPrevWord : SE_CursorLeft));
        break;
      case KEY_RIGHT:
        session.Push(
            SessionEvent::Of(ctrlHeld ? SE_CursorNextWord : SE_CursorRight));
        break;
      case KEY_HOME:
        session.Push(SessionEvent::Of(SE_CursorHome));
        break;
      case KEY_END:
        session.Push(SessionEvent::Of(SE_CursorEnd));
        break;
      case KEY_S:
        if (ctrlHeld) {
          session.Push(SessionEvent::Export());
        }
        break;
      case KEY_F:
        if (ctrlHeld) {
          session.Push(SessionEvent::Of(SE_ToggleOnlyMatched));
        }
        break;
      case KEY_U:
        if (ctrlHeld) {
          session.Push(SessionEvent::Of(SE_ClearPattern));
        }
        break;
      case KEY_PAGE_DOWN:
        ui.scrollY += 200;
        break;
      case KEY_PAGE_UP:
        ui.scrollY = std::max(0.0f, ui.scrollY - 200);
        break;
      case KEY_ESCAPE:
        session.Push(SessionEvent::Of(SE_Quit));
        break;
    }
    keyPressed = GetKeyPressed();
  }

  if (WindowShouldClose()) {
    session.Push(SessionEvent::Of(SE_Quit));
  }
}

static void DrawHeader(Session &session, UI_State &ui) {
  auto width = (float)GetScreenWidth();
  float y = PADDING_HORI;

  DrawTextEx(ui.font,
             "Type a pattern.  Ctrl+S export   Ctrl+F only matching   "
             "Ctrl+U clear   Esc quit",
             {PADDING_HORI, y}, TEXT_HEIGHT, TEXT_SPACING, DARKGRAY);
  y += INPUT_HEIGHT + VERT_GAP;

  Rectangle rectInput = {PADDING_HORI, y,
                         width - 2 * PADDING_HORI - 2 * (BUTTON_WIDTH + 4),
                         INPUT_HEIGHT};
  ui.inputBox.Draw(session, ui.font, rectInput);

  Rectangle rectButton = {rectInput.x + rectInput.width + 4, y, BUTTON_WIDTH,
                          INPUT_HEIGHT};
  if (GuiButton(rectButton, "Export")) {
    session.Push(SessionEvent::Export());
  }
  rectButton.x += BUTTON_WIDTH + 4;
  if (GuiButton(rectButton, session.IsOnlyMatched() ? "Show all lines"
                                                    : "Only matching")) {
    session.Push(SessionEvent::Of(SE_ToggleOnlyMatched));
  }
  y += INPUT_HEIGHT + VERT_GAP;

  auto &display = session.GetDisplay();
  auto &error = session.GetCompileError();
  std::string status;
  Color statusColor = DARKGRAY;
  if (error) {
    status = error->offError
                 ? fmt::format("error at offset {}: {}", *error->offError,
                               error->message)
                 : fmt::format("error: {}", error->message);
    statusColor = MAROON;
  } else {
    status = fmt::format("{}/{} lines matched in {} file(s)",
                         display.numMatched, display.numLines,
                         display.documents.size());
    if (display.numErrors > 0) {
      status += fmt::format(", {} line(s) hit the match limit",
                            display.numErrors);
    }
  }
  if (auto &output = session.GetOutputPath()) {
    status += fmt::format("   output: {}", *output);
  }
  DrawTextEx(ui.font, status.c_str(), {PADDING_HORI, y}, TEXT_HEIGHT,
             TEXT_SPACING, statusColor);
}

static void DrawResults(const DisplayModel &display, UI_State &ui) {
  ZoneScoped;

  const float top = RESULTS_TOP;
  const float bottom = GetScreenHeight();
  const float viewportTop = top + ui.scrollY;
  const float viewportBottom = bottom + ui.scrollY;

  DrawRectangleLines(0, top, GetScreenWidth(), bottom - top, BLACK);

  float y = top + 4;
  bool bottomRendered = true;
  std::string_view lastSource;
  std::optional<std::string> tooltip;
  auto cursor = GetMousePosition();

  for (auto &line : display.lines) {
    if (line.source != lastSource && display.documents.size() > 1) {
      if (viewportTop <= y && y <= viewportBottom) {
        std::string source(line.source);
        DrawTextEx(ui.font, source.c_str(), {PADDING_HORI, y - ui.scrollY},
                   TEXT_HEIGHT, TEXT_SPACING, DARKGREEN);
      }
      y += LINE_HEIGHT;
    }
    lastSource = line.source;

    if (viewportTop <= y && y <= viewportBottom) {
      Vector2 pos = {PADDING_HORI, y - ui.scrollY};
      auto marker = line.matchError ? "!" : (line.matched ? "+" : " ");
      auto prefix = fmt::format("{} L#{}: ", marker, line.lineNumber);
      pos.x += DrawRun(ui.font, prefix, pos, line.matched ? BLACK : GRAY);

      Color plainColor = line.matched ? BLACK : GRAY;
      if (line.matchError) {
        plainColor = MAROON;
      }

      for (auto &segment : Render_Segments(line)) {
        Color color = segment.highlighted ? HIGHLIGHT_COLORS[segment.idxColor]
                                          : plainColor;
        auto width = DrawRun(ui.font, segment.text, pos, color);

        if (segment.highlighted) {
          Rectangle rectSegment = {pos.x, pos.y, width, LINE_HEIGHT};
          if (CheckCollisionPointRec(cursor, rectSegment)) {
            for (auto &span : line.spans) {
              if (span.idxGroup == segment.idxGroup) {
                tooltip = fmt::format(
                    "{}: '{}' [{}..{})", span.label,
                    line.text.substr(span.offStart,
                                     span.offEnd - span.offStart),
                    span.offStart, span.offEnd);
                break;
              }
            }
          }
        }
        pos.x += width;
      }
    }

    y += LINE_HEIGHT;
    if (y > viewportBottom) {
      bottomRendered = false;
      break;
    }
  }

  if (bottomRendered) {
    ui.scrollY = std::min(ui.scrollY, std::max(0.0f, y - top));
  }

  if (tooltip) {
    auto tm = MeasureTextEx(ui.font, tooltip->c_str(), TEXT_HEIGHT,
                            TEXT_SPACING);
    Vector2 pos = {cursor.x + 12, cursor.y + 12};
    DrawRectangle(pos.x, pos.y, tm.x + 8, tm.y + 4, LIGHTGRAY);
    DrawRectangleLines(pos.x, pos.y, tm.x + 8, tm.y + 4, DARKGRAY);
    DrawTextEx(ui.font, tooltip->c_str(), {pos.x + 4, pos.y + 2},
               TEXT_HEIGHT, TEXT_SPACING, BLACK);
  }
}

static void ReportExport(const Session &session, UI_State &ui) {
  if (session.GetExportSerial() == ui.exportSerialSeen) {
    return;
  }
  ui.exportSerialSeen = session.GetExportSerial();

  auto &report = session.GetLastExport();
  if (!report) {
    return;
  }
  if (report->status == Export_OK) {
    ui.messages.Push(fmt::format("Exported to {}: {}", report->path,
                                 report->message));
  } else {
    ui.messages.PushError(report->message);
  }
}

int UI_Run(Session &session, const Config &config) {
  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(1280, 720, "ire");
  SetTargetFPS(60);
  // Escape is a session event, not a window close
  SetExitKey(KEY_NULL);

  UI_State ui;
  if (FileExists(config.pathFont.c_str())) {
    ui.font = LoadFontEx(config.pathFont.c_str(), TEXT_HEIGHT, 0, 0x10000);
    ui.fontLoaded = true;
  } else {
    fmt::print(stderr, "[ui] font '{}' not found, using the default font\n",
               config.pathFont);
    ui.font = GetFontDefault();
  }
  ui.messages.font = ui.font;

  bool wasFocused = IsWindowFocused();

  while (true) {
    bool isFocused = IsWindowFocused();
    if (wasFocused && !isFocused) {
      SetTargetFPS(5);
    } else if (!wasFocused && isFocused) {
      SetTargetFPS(60);
    }
    wasFocused = isFocused;

    CollectInput(session, ui);
    session.ProcessEvents();
    if (session.GetState() == Session_Terminated) {
      break;
    }

    BeginDrawing();
    ClearBackground(RAYWHITE);

    DrawHeader(session, ui);
    ReportExport(session, ui);

    ui.scrollVel = ui.scrollVel - 400 * GetMouseWheelMove();
    if (ui.scrollVel != 0) {
      ui.scrollVel -= GetFrameTime() * 4.0f * ui.scrollVel;
    }
    ui.scrollY += ui.scrollVel * GetFrameTime();
    ui.scrollY = std::max(0.0f, ui.scrollY);
    if (ui.scrollY == 0.0f) {
      ui.scrollVel = 0.0f;
    }

    DrawResults(session.GetDisplay(), ui);

    ui.messages.Draw();
    FrameMark;
    EndDrawing();
  }

  if (ui.fontLoaded) {
    UnloadFont(ui.font);
  }
  CloseWindow();
  return EXIT_SUCCESS;
}
