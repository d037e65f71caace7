#include "image.h"

#include <regex>

#include <spdlog/spdlog.h>

#include <gradebox/config.h>
#include <gradebox/error.h>
#include "process.h"

namespace {

const char kBuildStep[] = "running image build";

// legacy builder / BuildKit
const std::regex kBuiltRegex(R"((?:Successfully built |writing image sha256:)([a-f0-9]+))");

} // namespace

std::optional<std::string> MatchBuiltImage(const std::string& line) {
  std::smatch match;
  if (!std::regex_search(line, match, kBuiltRegex)) return std::nullopt;
  return match[1].str();
}

std::string BuildImage() {
  spdlog::info("Invoking `{} build {}`; this may take a while", kContainerEngine, kBuildContext.c_str());
  std::optional<std::string> image_id;
  int status = RunAndStreamLines(
      {kContainerEngine, "build", kBuildContext.string()},
      [&](const std::string& line) {
        if (!image_id) image_id = MatchBuiltImage(line);
        spdlog::debug("[{}] {}", kContainerEngine, line);
      });
  if (!IsSuccess(status)) {
    throw SandboxError(kBuildStep, "build failed with " + DescribeStatus(status));
  }
  if (!image_id) {
    throw SandboxError(kBuildStep, "build output did not contain an image ID");
  }
  spdlog::info("Completed image build: image_id={}", *image_id);
  return *image_id;
}
