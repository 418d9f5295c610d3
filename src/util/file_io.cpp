#include "flowart/util/file_io.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace flowart {

namespace {

std::atomic<unsigned> g_temp_counter{0};

// Batch workers may write into the same directory concurrently, so the temp
// name carries a process-wide counter and the writing thread's id.
std::filesystem::path make_temp_sibling_path(const std::filesystem::path& target) {
  const auto dir = target.parent_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream name;
  name << target.filename().string() << ".tmp." << now << "." << g_temp_counter.fetch_add(1) << "."
       << std::hash<std::thread::id>{}(std::this_thread::get_id());
  return dir.empty() ? std::filesystem::path(name.str()) : (dir / name.str());
}

struct TempFileCleanup {
  std::filesystem::path path;
  bool active{true};
  explicit TempFileCleanup(std::filesystem::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
  void release() { active = false; }
};

std::filesystem::path resolve_existing_read_path(const std::filesystem::path& requested) {
  if (requested.empty() || requested.is_absolute()) return requested;

  std::error_code ec;
  if (std::filesystem::exists(requested, ec) && !ec) return requested;

  std::vector<std::filesystem::path> roots;

#ifdef FLOWART_SOURCE_DIR
  roots.emplace_back(FLOWART_SOURCE_DIR);
#endif

  ec.clear();
  std::filesystem::path cur = std::filesystem::current_path(ec);
  if (!ec && !cur.empty()) {
    for (int depth = 0; depth < 8; ++depth) {
      roots.push_back(cur);
      const auto parent = cur.parent_path();
      if (parent.empty() || parent == cur) break;
      cur = parent;
    }
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }

  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const std::filesystem::path requested(path);
  const std::filesystem::path resolved = resolve_existing_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != requested) {
      throw std::runtime_error("Failed to open file for reading: " + path +
                               " (resolved to: " + resolved.string() + ")");
    }
    throw std::runtime_error("Failed to open file for reading: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
  }
}

void write_file_atomic(const std::string& path, const std::string& bytes) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  const std::filesystem::path tmp = make_temp_sibling_path(p);
  TempFileCleanup cleanup(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    std::filesystem::remove(p, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, p, ec);
  }
  if (ec) {
    throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  }

  cleanup.release();
}

} // namespace flowart
