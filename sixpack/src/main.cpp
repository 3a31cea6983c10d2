// c++ headers ------------------------------------------
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// external headers -------------------------------------
#include "raylib.h"
#include "raylib-cpp.hpp"

#include "imgui.h"
#include "imgui_impl_raylib.h"

#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"

// project headers --------------------------------------
#include "panelkit/aircraft.h"
#include "panelkit/frame_scheduler.h"
#include "panelkit/pointer_dispatcher.h"
#include "panelkit/pointer_node.h"

#include "airspeed.h"
#include "altimeter.h"
#include "attitude.h"
#include "heading.h"
#include "instrument.h"
#include "raylib_pointer_source.h"
#include "tachometer.h"
#include "text.h"
#include "turn_coordinator.h"
#include "vertical_speed.h"
#include "widgets.h"

//----------------------------------------------------------------------------------
// Configuration
//----------------------------------------------------------------------------------
struct PanelConfig final {
  int window_width = 1640;
  int window_height = 840;
  int target_fps = 60;
  /// Grid cell of one instrument, at least Instrument::kSize.
  float instrument_size = Instrument::kSize;
  int columns = 4;
  float margin = 10.0f;
  bool demo = CONFIG_DEMO_MODE != 0;

  /// Throws std::invalid_argument when the values cannot produce a panel.
  void Validate(int instrument_count) const {
    if (window_width <= 0 || window_height <= 0) {
      throw std::invalid_argument("PanelConfig: window size must be positive");
    }
    if (target_fps <= 0) {
      throw std::invalid_argument("PanelConfig: target FPS must be positive");
    }
    if (columns <= 0) {
      throw std::invalid_argument("PanelConfig: columns must be positive");
    }
    if (!(instrument_size >= Instrument::kSize) || !(margin >= 0.0f)) {
      throw std::invalid_argument("PanelConfig: instrument cells too small");
    }
    int const rows = (instrument_count + columns - 1) / columns;
    if (float(window_width) < margin * 2.0f + instrument_size * float(columns) ||
        float(window_height) < margin * 2.0f + instrument_size * float(rows)) {
      throw std::invalid_argument("PanelConfig: instruments do not fit the window");
    }
  }

  panelkit::Vec2 CellOrigin(int index) const {
    return panelkit::Vec2{
      margin + instrument_size * float(index % columns),
      margin + instrument_size * float(index / columns),
    };
  }
};

constexpr int kInstrumentCount = 7;

//----------------------------------------------------------------------------------
// Application
//----------------------------------------------------------------------------------
class App final {
public:
  explicit App(PanelConfig const& config)
    : config_(config),
      scheduler_([]() { return GetTime() * 1000.0; }),
      root_("panel"),
      dispatcher_(pointer_source_, root_),
      aircraft_(scheduler_) {
    root_.SetRect(panelkit::Vec2{ float(config_.window_width), float(config_.window_height) });

    InstrumentContext const context{
      .scheduler = scheduler_,
      .dispatcher = dispatcher_,
      .aircraft = aircraft_,
      .panel_node = root_,
    };

    // Classic six-pack order, tachometer last.
    instruments_.push_back(std::make_unique<AirspeedIndicator>(context, config_.CellOrigin(0)));
    instruments_.push_back(std::make_unique<AttitudeIndicator>(context, config_.CellOrigin(1)));
    instruments_.push_back(std::make_unique<Altimeter>(context, config_.CellOrigin(2)));
    instruments_.push_back(std::make_unique<Tachometer>(context, config_.CellOrigin(3)));
    instruments_.push_back(std::make_unique<TurnCoordinator>(context, config_.CellOrigin(4)));
    instruments_.push_back(std::make_unique<HeadingIndicator>(context, config_.CellOrigin(5)));
    instruments_.push_back(std::make_unique<VerticalSpeedIndicator>(context, config_.CellOrigin(6)));
    spdlog::info("mounted {} instruments", instruments_.size());

    this->SetupImGuiStyle();

    if (config_.demo) {
      this->SetDemo(true);
    }
  }

  ~App() {
    for (std::unique_ptr<Instrument>& instrument : instruments_) {
      instrument->Dispose();
    }
    instruments_.clear();
  }

  PANELKIT_DISALLOW_COPY_MOVE(App);

  void SetupImGuiStyle() {
    ImGuiStyle& style = ImGui::GetStyle();

    style.WindowRounding = 0.0f;
    style.FrameRounding = 4.0f;
    style.GrabRounding = 4.0f;
    style.PopupRounding = 4.0f;

    style.WindowPadding = ImVec2(12.0f, 12.0f);
    style.FramePadding = ImVec2(8.0f, 4.0f);
    style.ItemSpacing = ImVec2(8.0f, 6.0f);

    // Dark panel with amber accents.
    ImVec4* colors = style.Colors;
    colors[ImGuiCol_WindowBg] = ImVec4(0.08f, 0.08f, 0.09f, 0.92f);
    colors[ImGuiCol_Border] = ImVec4(0.30f, 0.30f, 0.32f, 0.50f);
    colors[ImGuiCol_FrameBg] = ImVec4(0.16f, 0.16f, 0.18f, 1.00f);
    colors[ImGuiCol_FrameBgHovered] = ImVec4(0.22f, 0.22f, 0.25f, 1.00f);
    colors[ImGuiCol_FrameBgActive] = ImVec4(0.28f, 0.28f, 0.32f, 1.00f);
    colors[ImGuiCol_TitleBgActive] = ImVec4(0.14f, 0.14f, 0.16f, 1.00f);
    colors[ImGuiCol_SliderGrab] = ImVec4(0.95f, 0.65f, 0.15f, 1.00f);
    colors[ImGuiCol_SliderGrabActive] = ImVec4(1.00f, 0.75f, 0.25f, 1.00f);
    colors[ImGuiCol_CheckMark] = ImVec4(0.95f, 0.65f, 0.15f, 1.00f);
    colors[ImGuiCol_Text] = ImVec4(0.92f, 0.92f, 0.90f, 1.00f);
    colors[ImGuiCol_TextDisabled] = ImVec4(0.52f, 0.52f, 0.50f, 1.00f);
  }

  void SetDemo(bool enabled) {
    demo_ = enabled;
    for (std::unique_ptr<Instrument>& instrument : instruments_) {
      if (enabled) {
        instrument->DemoStart();
      }
      else {
        instrument->DemoStop();
      }
    }
    spdlog::info("demo mode {}", enabled ? "on" : "off");
  }

  void Tick() {
    ImGui_ImplRaylib_ProcessEvents();

    ImGui_ImplRaylib_NewFrame();
    ImGui::NewFrame();

    if (IsKeyPressed(KEY_TAB)) {
      show_panel_ = !show_panel_;
    }

    // A knob being dragged keeps the mouse even over the control panel.
    ImGuiIO& io = ImGui::GetIO();
    bool const blocked = io.WantCaptureMouse && dispatcher_.capture_node() == nullptr;
    pointer_source_.Poll(blocked);

    scheduler_.RunFrame();
  }

  void Draw() {
    BeginDrawing();

    ClearBackground(Color{ 34, 36, 40, 255 });

    for (std::unique_ptr<Instrument> const& instrument : instruments_) {
      instrument->Draw();
    }

    if (show_panel_) {
      this->DrawControlPanel();
    }

    ImGui::Render();
    ImGui_ImplRaylib_RenderDrawData(ImGui::GetDrawData());

    EndDrawing();
  }

private:
  void DrawControlPanel() {
    // The free cell after the last instrument.
    panelkit::Vec2 const cell = config_.CellOrigin(int(instruments_.size()));
    ImGui::SetNextWindowPos(ImVec2(cell.x, cell.y), ImGuiCond_FirstUseEver);

    std::string const title = std::string(GetText(TextId::kControlPanel)) + "###control_panel";
    if (ImGui::Begin(title.c_str(), &show_panel_, ImGuiWindowFlags_AlwaysAutoResize)) {
      Language current_lang = GetCurrentLanguage();
      ImGui::TextUnformatted(GetText(TextId::kLanguage));
      ImGui::SameLine();
      if (ImGui::RadioButton("Deutsch", current_lang == Language::kGerman)) {
        SetCurrentLanguage(Language::kGerman);
      }
      ImGui::SameLine();
      if (ImGui::RadioButton("English", current_lang == Language::kEnglish)) {
        SetCurrentLanguage(Language::kEnglish);
      }

      bool demo = demo_;
      if (ImGui::Checkbox(GetText(TextId::kDemoMode), &demo)) {
        this->SetDemo(demo);
      }

      ImGui::Separator();
      AircraftFieldSliders(aircraft_);

      ImGui::Separator();
      ImGui::TextDisabled("%s", GetText(TextId::kControlsHint));
      ImGui::TextDisabled("%s", GetText(TextId::kTabToHide));
    }
    ImGui::End();
  }

  PanelConfig config_;

  panelkit::FrameScheduler scheduler_;
  RaylibPointerSource pointer_source_;
  panelkit::PointerNode root_;
  panelkit::PointerDispatcher dispatcher_;
  panelkit::Aircraft aircraft_;

  std::vector<std::unique_ptr<Instrument>> instruments_;

  bool show_panel_ = true;
  bool demo_ = false;
};

//----------------------------------------------------------------------------------
// Main Entry Point
//----------------------------------------------------------------------------------
int main() {
  spdlog::set_level(spdlog::level::info);
  spdlog::cfg::load_env_levels();

  try {
    PanelConfig const config;
    config.Validate(kInstrumentCount);

    // Initialization
    //--------------------------------------------------------------------------------
    raylib::Window window(config.window_width, config.window_height, "sixpack");
    SetTargetFPS(config.target_fps);
    spdlog::info("window created ({}x{})", config.window_width, config.window_height);

    ImGui::CreateContext();
    {
      ImGuiIO& io = ImGui::GetIO();
      io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
      io.IniFilename = nullptr;
    }
    ImGui::StyleColorsDark();
    ImGui_ImplRaylib_Init();

    SetCurrentLanguage(GetSystemLanguageOrEnglish());

    {
      App app(config);

      // Mainloop
      while (!WindowShouldClose()) {
        app.Tick();
        app.Draw();
      }
    }

    // De-Initialization
    //--------------------------------------------------------------------------------
    ImGui_ImplRaylib_Shutdown();
    ImGui::DestroyContext();
  }
  catch (std::exception const& e) {
    spdlog::error("fatal: {}", e.what());
    return 1;
  }

  spdlog::info("shut down");
  return 0;
}
