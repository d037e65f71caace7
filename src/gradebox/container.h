#ifndef GRADEBOX_CONTAINER_H_
#define GRADEBOX_CONTAINER_H_

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

// Engine arguments for one run with the command directory mounted read-only
std::vector<std::string> ContainerRunArgs(const std::string& image, const std::filesystem::path& dir);

// Write the command into a fresh temp directory, run one disposable
//   container of the image on it and return what the container printed on
//   stdout. Throws SandboxError; the temp directory is always removed.
std::vector<uint8_t> RunContainer(const std::string& image, const std::vector<uint8_t>& command);

#endif  // GRADEBOX_CONTAINER_H_
