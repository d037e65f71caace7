#include "utils.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <fstream>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <gradebox/error.h>

namespace {

// keeps names unique even if mkdtemp would pick a name of a removed directory
std::atomic_long temp_dir_seq = 0;

} // namespace

TempDir::TempDir(const fs::path& root) {
  if (!CreateDirs(root)) throw SandboxError("creating temp dir", "cannot create " + root.string());
  std::string tmpl = (root / fmt::format("run-{}-XXXXXX", ++temp_dir_seq)).string();
  if (!mkdtemp(tmpl.data())) throw SandboxError("creating temp dir", strerror(errno));
  path_ = tmpl;
  spdlog::debug("Created temp dir {}", path_.c_str());
}

TempDir::~TempDir() {
  RemoveAll(path_);
}

bool CreateDirs(const fs::path& path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

void WriteFile(const fs::path& path, const std::vector<uint8_t>& data) {
  std::ofstream fout(path, std::ios::binary);
  fout.write(reinterpret_cast<const char*>(data.data()), data.size());
  fout.close();
  if (!fout) throw SandboxError("writing " + path.filename().string() + " to temp dir", strerror(errno));
}
