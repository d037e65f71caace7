#include <gradebox/error.h>

#include <random>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

SandboxError::SandboxError(const std::string& context, const std::string& cause) :
    std::runtime_error("while " + context + ": " + cause) {}

std::string ReportInternalError(const std::exception& err) {
  static thread_local std::mt19937 rng{std::random_device{}()};
  uint32_t id = std::uniform_int_distribution<uint32_t>()(rng);
  spdlog::error("Internal error: id={} error={}", id, err.what());
  return fmt::format(
      "The error has been logged under ID {}. Contact the administrator with this ID.", id);
}
