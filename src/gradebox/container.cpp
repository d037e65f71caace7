#include "container.h"

#include <spdlog/spdlog.h>

#include <gradebox/config.h>
#include <gradebox/error.h>
#include "process.h"
#include "utils.h"

std::vector<std::string> ContainerRunArgs(const std::string& image, const fs::path& dir) {
  return {
    kContainerEngine,
    "run",
    "--rm",
    "--memory=" + std::to_string(kMemoryLimitMiB) + "m",
    "--network=none",
    "--mount",
    "type=bind,source=" + dir.string() + ",destination=" + kContainerInputDir + ",readonly",
    image,
  };
}

std::vector<uint8_t> RunContainer(const std::string& image, const std::vector<uint8_t>& command) {
  TempDir dir(kTempRoot);
  WriteFile(dir.Path() / kCommandFileName, command);

  ProcessOutput output = RunAndCapture(ContainerRunArgs(image, dir.Path()));
  if (!IsSuccess(output.status)) {
    throw SandboxError("running " + kContainerEngine,
                       "got bad status " + DescribeStatus(output.status) + ". stderr: " + output.err);
  }
  spdlog::debug("Container finished: dir={} response_size={}", dir.Path().c_str(), output.out.size());
  return std::vector<uint8_t>(output.out.begin(), output.out.end());
}
