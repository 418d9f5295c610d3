#include <iostream>
#include <string_view>

#ifndef FLOWART_VERSION
#define FLOWART_VERSION "unknown"
#endif

#ifndef FLOWART_UI_UNAVAILABLE_REASON
#define FLOWART_UI_UNAVAILABLE_REASON "UI dependencies are unavailable in this build."
#endif

namespace {

constexpr const char* kStatusCodeUiUnavailable = "FLOWART-UI-001";
constexpr const char* kStatusCodeUiRequiredUnavailable = "FLOWART-UI-002";
constexpr int kExitCodeOk = 0;
constexpr int kExitCodeUiRequiredUnavailable = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (!arg) continue;
    if (flag == arg) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  const char* name = (exe && *exe) ? exe : "flowart";
  std::cout << "flowart preview launcher v" << FLOWART_VERSION << "\n\n";
  std::cout << "Usage: " << name << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive preview window.\n";
  std::cout << "Reason: " << FLOWART_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "To render in this build, use the command-line front end:\n";
  std::cout << "  flowart_cli --config data/configs/example.json --out out/example.png\n\n";
  std::cout << "To build the preview window, install the SDL2 and Dear ImGui development\n";
  std::cout << "packages (CMake config packages SDL2 and imgui) and reconfigure.\n";
  std::cout << "\nLauncher status codes:\n";
  std::cout << "  " << kStatusCodeUiUnavailable << " (exit " << kExitCodeOk
            << "): UI unavailable; informational fallback launch.\n";
  std::cout << "  " << kStatusCodeUiRequiredUnavailable << " (exit " << kExitCodeUiRequiredUnavailable
            << "): UI explicitly required via --require-ui but unavailable.\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << FLOWART_VERSION << "\n";
    return 0;
  }

  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  if (has_flag(argc, argv, "--require-ui")) {
    std::cerr << "[" << kStatusCodeUiRequiredUnavailable << "] "
              << "flowart preview window is unavailable in this build.\n";
    std::cerr << "Reason: " << FLOWART_UI_UNAVAILABLE_REASON << "\n";
    std::cerr << "Run with --help for details.\n";
    return kExitCodeUiRequiredUnavailable;
  }

  std::cerr << "[" << kStatusCodeUiUnavailable << "] "
            << "flowart preview window is unavailable in this build.\n";
  std::cerr << "Reason: " << FLOWART_UI_UNAVAILABLE_REASON << "\n";
  std::cerr << "Run with --help for details.\n";
  return kExitCodeOk;
}
