#pragma once

#include <cstdint>
#include <string>

#include <SDL.h>

#include "flowart/core/canvas.h"
#include "flowart/core/config.h"

namespace flowart::ui {

// Interactive preview: a control panel for the Configuration plus the last
// rendered raster shown as an SDL texture.
//
// Renders happen synchronously on the UI thread when requested (button or
// auto-render after an edit), always at preview size; the full-size
// configuration is what gets saved.
class ViewerApp {
 public:
  ViewerApp(Configuration cfg, SDL_Renderer* renderer);
  ~ViewerApp();

  ViewerApp(const ViewerApp&) = delete;
  ViewerApp& operator=(const ViewerApp&) = delete;

  // Called once per frame between ImGui::NewFrame() and ImGui::Render().
  void frame();

  void on_event(const SDL_Event& e);

 private:
  void draw_controls();
  void draw_preview();

  void render_preview();
  void upload_texture();
  void rebuild_lut();

  void save_image();
  void save_config();
  void load_config();

  Configuration cfg_;
  SDL_Renderer* renderer_{nullptr};
  SDL_Texture* texture_{nullptr};

  Canvas preview_;
  std::uint64_t preview_digest_{0};
  double last_render_ms_{0.0};

  // Preview edge in pixels (the longer canvas side is scaled to this).
  int preview_size_{512};
  bool auto_render_{true};
  bool dirty_{true};

  // Seed editing (Configuration::seed is optional).
  bool use_seed_{true};
  int seed_value_{1};

  // Palette source for rebuilt LUTs.
  int colormap_index_{0};
  double colormap_start_{0.0};
  double colormap_end_{1.0};
  int lut_size_{256};

  char image_path_[256] = "out/preview.png";
  char config_path_[256] = "out/preview.json";

  std::string status_;
  bool status_is_error_{false};
};

} // namespace flowart::ui
