#ifndef GRADEBOX_UTILS_H_
#define GRADEBOX_UTILS_H_

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// A fresh directory under root, removed with everything in it on destruction.
// Throws SandboxError if it cannot be created.
class TempDir {
  fs::path path_;
 public:
  explicit TempDir(const fs::path& root);
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& Path() const { return path_; }
};

bool CreateDirs(const fs::path&);
bool RemoveAll(const fs::path&);
// throws SandboxError
void WriteFile(const fs::path&, const std::vector<uint8_t>&);

#endif  // GRADEBOX_UTILS_H_
