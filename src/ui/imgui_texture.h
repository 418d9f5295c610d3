#pragma once

#include <cstdint>
#include <type_traits>

#include <imgui.h>

// Dear ImGui's ImTextureID type is backend-defined: historically `void*`, newer
// versions default to an integer type (ImU64). The helpers below convert SDL
// textures to and from whichever definition is in use.

struct SDL_Texture;

namespace flowart::ui {

constexpr ImTextureID imgui_null_texture_id() {
  if constexpr (std::is_pointer_v<ImTextureID>) {
    return nullptr;
  } else {
    return static_cast<ImTextureID>(0);
  }
}

inline ImTextureID imgui_texture_id_from_sdl_texture(SDL_Texture* tex) {
  if (!tex) return imgui_null_texture_id();
  if constexpr (std::is_pointer_v<ImTextureID>) {
    return reinterpret_cast<ImTextureID>(tex);
  } else {
    return static_cast<ImTextureID>(reinterpret_cast<std::uintptr_t>(tex));
  }
}

} // namespace flowart::ui
