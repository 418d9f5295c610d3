#include "ui/viewer_app.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>
#include <utility>

#include "flowart/core/colormap.h"
#include "flowart/core/config_json.h"
#include "flowart/core/errors.h"
#include "flowart/core/renderer.h"
#include "flowart/util/digest.h"
#include "flowart/util/image_io.h"
#include "flowart/util/log.h"

#include "ui/imgui_includes.h"
#include "ui/imgui_texture.h"

namespace flowart::ui {
namespace {

const char* kSeedingNames[] = {"grid", "random"};
const char* kAxisNames[] = {"x", "y", "field", "random"};

// Scales a full-size configuration down to preview size. Pixel-valued knobs
// shrink with the canvas so the preview keeps the look of the final image.
Configuration preview_config(const Configuration& cfg, int preview_size) {
  Configuration out = cfg;
  const int longest = std::max(cfg.width, cfg.height);
  if (longest <= preview_size || longest <= 0) return out;

  const double s = static_cast<double>(preview_size) / static_cast<double>(longest);
  out.width = std::max(1, static_cast<int>(std::lround(cfg.width * s)));
  out.height = std::max(1, static_cast<int>(std::lround(cfg.height * s)));
  out.cell_size = std::max(1, static_cast<int>(std::lround(cfg.cell_size * s)));
  out.step_size = cfg.step_size * s;
  out.width_start = cfg.width_start * s;
  out.width_end = cfg.width_end * s;
  return out;
}

} // namespace

ViewerApp::ViewerApp(Configuration cfg, SDL_Renderer* renderer) : cfg_(std::move(cfg)), renderer_(renderer) {
  if (cfg_.seed) {
    seed_value_ = static_cast<int>(*cfg_.seed);
  } else {
    use_seed_ = false;
  }
  const auto& names = colormap_names();
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == cfg_.palette_name) colormap_index_ = static_cast<int>(i);
  }
  if (!cfg_.color_lut.empty()) lut_size_ = static_cast<int>(cfg_.color_lut.size());
}

ViewerApp::~ViewerApp() {
  if (texture_) SDL_DestroyTexture(texture_);
}

void ViewerApp::on_event(const SDL_Event& e) {
  if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_F5) dirty_ = true;
}

void ViewerApp::frame() {
  if (dirty_ && auto_render_) render_preview();

  const ImGuiViewport* vp = ImGui::GetMainViewport();
  ImGui::SetNextWindowPos(vp->WorkPos, ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(360.0f, vp->WorkSize.y), ImGuiCond_Always);
  ImGui::Begin("Configuration", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize);
  draw_controls();
  ImGui::End();

  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + 360.0f, vp->WorkPos.y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(1.0f, vp->WorkSize.x - 360.0f), vp->WorkSize.y), ImGuiCond_Always);
  ImGui::Begin("Preview", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize);
  draw_preview();
  ImGui::End();
}

void ViewerApp::draw_controls() {
  bool changed = false;

  if (ImGui::CollapsingHeader("Canvas", ImGuiTreeNodeFlags_DefaultOpen)) {
    changed |= ImGui::InputInt("Width", &cfg_.width);
    changed |= ImGui::InputInt("Height", &cfg_.height);
    changed |= ImGui::SliderInt("Cell size", &cfg_.cell_size, 1, 100);
    changed |= ImGui::SliderDouble("Margin", &cfg_.margin_factor, 0.0, 0.45);
    ImGui::SliderInt("Preview size", &preview_size_, 128, 1024);
  }

  if (ImGui::CollapsingHeader("Field", ImGuiTreeNodeFlags_DefaultOpen)) {
    changed |= ImGui::SliderDouble("Noise scale", &cfg_.noise_scale, 2.0, 32.0);
    changed |= ImGui::SliderInt("Octaves", &cfg_.octaves, 1, 10);
    changed |= ImGui::SliderDouble("Swirl", &cfg_.swirl, 0.0, 1.0);
    changed |= ImGui::SliderInt("Quantize", &cfg_.quantize_steps, 0, 32);
    changed |= ImGui::Checkbox("Fixed seed", &use_seed_);
    if (use_seed_) {
      ImGui::SameLine();
      changed |= ImGui::InputInt("##seed", &seed_value_);
    }
  }

  if (ImGui::CollapsingHeader("Strokes", ImGuiTreeNodeFlags_DefaultOpen)) {
    int seeding = static_cast<int>(cfg_.seeding);
    if (ImGui::Combo("Seeding", &seeding, kSeedingNames, IM_ARRAYSIZE(kSeedingNames))) {
      cfg_.seeding = static_cast<SeedingMode>(seeding);
      changed = true;
    }
    changed |= ImGui::SliderDouble("Density", &cfg_.density, 0.0001, 0.02, "%.4f");
    changed |= ImGui::SliderInt("Max length", &cfg_.max_length, 0, 2000);
    changed |= ImGui::SliderDouble("Step size", &cfg_.step_size, 0.1, 20.0);
    changed |= ImGui::SliderDouble("Angle gain", &cfg_.angle_gain, 0.0, 1.0);
    changed |= ImGui::SliderDouble("Jitter", &cfg_.jitter, 0.0, 0.5);
    changed |= ImGui::SliderDouble("Width start", &cfg_.width_start, 0.0, 30.0);
    changed |= ImGui::SliderDouble("Width end", &cfg_.width_end, 0.0, 30.0);
  }

  if (ImGui::CollapsingHeader("Palette", ImGuiTreeNodeFlags_DefaultOpen)) {
    const auto& names = colormap_names();
    if (ImGui::BeginCombo("Colormap", names[static_cast<std::size_t>(colormap_index_)].c_str())) {
      for (std::size_t i = 0; i < names.size(); ++i) {
        const bool selected = static_cast<int>(i) == colormap_index_;
        if (ImGui::Selectable(names[i].c_str(), selected)) {
          colormap_index_ = static_cast<int>(i);
          rebuild_lut();
          changed = true;
        }
      }
      ImGui::EndCombo();
    }
    bool range_changed = false;
    range_changed |= ImGui::SliderDouble("Range start", &colormap_start_, 0.0, 1.0);
    range_changed |= ImGui::SliderDouble("Range end", &colormap_end_, 0.0, 1.0);
    range_changed |= ImGui::SliderInt("LUT size", &lut_size_, 1, 1024);
    if (range_changed) {
      rebuild_lut();
      changed = true;
    }

    int axis = static_cast<int>(cfg_.palette_axis);
    if (ImGui::Combo("Axis", &axis, kAxisNames, IM_ARRAYSIZE(kAxisNames))) {
      cfg_.palette_axis = static_cast<PaletteAxis>(axis);
      changed = true;
    }
    changed |= ImGui::SliderDouble("Within stroke", &cfg_.palette_within_stroke, 0.0, 1.0);

    float bg[3] = {cfg_.background.r / 255.0f, cfg_.background.g / 255.0f, cfg_.background.b / 255.0f};
    if (ImGui::ColorEdit3("Background", bg)) {
      cfg_.background = Rgb{static_cast<std::uint8_t>(bg[0] * 255.0f), static_cast<std::uint8_t>(bg[1] * 255.0f),
                            static_cast<std::uint8_t>(bg[2] * 255.0f)};
      changed = true;
    }
  }

  if (changed) dirty_ = true;

  ImGui::Separator();
  ImGui::Checkbox("Auto render", &auto_render_);
  ImGui::SameLine();
  if (ImGui::Button("Render (F5)")) render_preview();

  ImGui::Separator();
  ImGui::InputText("Image", image_path_, sizeof(image_path_));
  if (ImGui::Button("Save full-size PNG")) save_image();
  ImGui::InputText("Config", config_path_, sizeof(config_path_));
  if (ImGui::Button("Save JSON")) save_config();
  ImGui::SameLine();
  if (ImGui::Button("Load JSON")) load_config();

  if (!status_.empty()) {
    ImGui::Separator();
    const ImVec4 color = status_is_error_ ? ImVec4(1.0f, 0.4f, 0.4f, 1.0f) : ImVec4(0.6f, 1.0f, 0.6f, 1.0f);
    ImGui::PushTextWrapPos(0.0f);
    ImGui::TextColored(color, "%s", status_.c_str());
    ImGui::PopTextWrapPos();
  }
}

void ViewerApp::draw_preview() {
  if (!texture_ || preview_.empty()) {
    ImGui::TextUnformatted("No preview yet.");
    return;
  }
  ImGui::Text("%dx%d  %.1f ms  digest %s", preview_.width(), preview_.height(), last_render_ms_,
              digest64_to_hex(preview_digest_).c_str());

  const ImVec2 avail = ImGui::GetContentRegionAvail();
  const float sx = avail.x / static_cast<float>(preview_.width());
  const float sy = avail.y / static_cast<float>(preview_.height());
  const float scale = std::max(0.01f, std::min(sx, sy));
  ImGui::Image(imgui_texture_id_from_sdl_texture(texture_),
               ImVec2(preview_.width() * scale, preview_.height() * scale));
}

void ViewerApp::render_preview() {
  dirty_ = false;
  if (use_seed_) {
    cfg_.seed = seed_value_;
  } else {
    cfg_.seed.reset();
  }

  const auto t0 = std::chrono::steady_clock::now();
  try {
    RenderStats stats;
    preview_ = render(preview_config(cfg_, preview_size_), &stats);
    const auto t1 = std::chrono::steady_clock::now();
    last_render_ms_ = std::chrono::duration<double, std::milli>(t1 - t0).count();
    preview_digest_ = digest_canvas64(preview_);
    upload_texture();
    status_ = std::to_string(stats.strokes_drawn) + " strokes drawn, " + std::to_string(stats.strokes_skipped) +
              " skipped";
    status_is_error_ = false;
  } catch (const RenderError& e) {
    status_ = std::string(e.what()) + "\n[field=" + e.field() + ", value=" + e.value() + "]";
    status_is_error_ = true;
  }
}

void ViewerApp::upload_texture() {
  if (texture_) {
    int w = 0;
    int h = 0;
    SDL_QueryTexture(texture_, nullptr, nullptr, &w, &h);
    if (w != preview_.width() || h != preview_.height()) {
      SDL_DestroyTexture(texture_);
      texture_ = nullptr;
    }
  }
  if (!texture_) {
    texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGB24, SDL_TEXTUREACCESS_STATIC, preview_.width(),
                                 preview_.height());
    if (!texture_) {
      log::error(std::string("SDL_CreateTexture failed: ") + SDL_GetError());
      status_ = "Could not create preview texture";
      status_is_error_ = true;
      return;
    }
  }
  if (SDL_UpdateTexture(texture_, nullptr, preview_.pixels().data(), preview_.width() * 3) != 0) {
    log::error(std::string("SDL_UpdateTexture failed: ") + SDL_GetError());
  }
}

void ViewerApp::rebuild_lut() {
  const std::string& name = colormap_names()[static_cast<std::size_t>(colormap_index_)];
  cfg_.color_lut = sample_lut(name, colormap_start_, colormap_end_, lut_size_);
  cfg_.color_start = to_rgb8(evaluate_colormap(name, colormap_start_));
  cfg_.color_end = to_rgb8(evaluate_colormap(name, colormap_end_));
  cfg_.palette_name = name;
}

void ViewerApp::save_image() {
  try {
    write_png(image_path_, render(cfg_));
    status_ = std::string("Saved ") + image_path_;
    status_is_error_ = false;
  } catch (const std::exception& e) {
    status_ = std::string("Save failed: ") + e.what();
    status_is_error_ = true;
  }
}

void ViewerApp::save_config() {
  try {
    save_config_file(config_path_, cfg_);
    status_ = std::string("Saved ") + config_path_;
    status_is_error_ = false;
  } catch (const std::exception& e) {
    status_ = std::string("Save failed: ") + e.what();
    status_is_error_ = true;
  }
}

void ViewerApp::load_config() {
  try {
    cfg_ = load_config_file(config_path_);
    use_seed_ = cfg_.seed.has_value();
    if (cfg_.seed) seed_value_ = static_cast<int>(*cfg_.seed);
    status_ = std::string("Loaded ") + config_path_;
    status_is_error_ = false;
    dirty_ = true;
  } catch (const std::exception& e) {
    status_ = std::string("Load failed: ") + e.what();
    status_is_error_ = true;
  }
}

} // namespace flowart::ui
