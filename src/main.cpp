#include <SDL.h>

#include <string>
#include <utility>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "flowart/core/config_json.h"
#include "flowart/core/param_mapping.h"
#include "flowart/util/log.h"

#include "ui/viewer_app.h"

namespace {

// Preview start point when no --config is given.
const flowart::FeatureVector kStartVector = {0.1, 1.0, 0.2, 2.2, 2.267, 1.0, 0.25,
                                             0.264, 0.287, 0.814, 22.0, 0.4, 0.75, 0.1};

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

} // namespace

int main(int argc, char** argv) {
  try {
    flowart::log::set_level(flowart::log::Level::Info);

    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    flowart::Configuration cfg = config_path.empty()
                                     ? flowart::map_features_to_config(kStartVector, "expressive")
                                     : flowart::load_config_file(config_path);

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
      flowart::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Window* window = SDL_CreateWindow("flowart", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 1280, 800,
                                          SDL_WINDOW_RESIZABLE);
    if (!window) {
      flowart::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
      return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
      flowart::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
      return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    {
      flowart::ui::ViewerApp app(std::move(cfg), renderer);

      bool running = true;
      while (running) {
        SDL_Event e;
        while (SDL_PollEvent(&e)) {
          ImGui_ImplSDL2_ProcessEvent(&e);
          if (e.type == SDL_QUIT) running = false;
          if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_CLOSE &&
              e.window.windowID == SDL_GetWindowID(window))
            running = false;
          app.on_event(e);
        }

        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        app.frame();

        ImGui::Render();
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        // Dear ImGui's SDL_Renderer2 backend requires the renderer parameter (v1.91+).
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
      }
    }

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
  } catch (const std::exception& e) {
    flowart::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
