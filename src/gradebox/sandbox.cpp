#include <gradebox/sandbox.h>

#include <spdlog/spdlog.h>

#include "container.h"
#include "image.h"

template <class Decode>
auto Sandbox::Run_(Command cmd, Decode decode) const {
  spdlog::debug("Dispatching {} command", CommandName(cmd));
  return pool_.Submit([image_id = image_id_, cmd = std::move(cmd), decode]() {
    return decode(RunContainer(image_id, EncodeCommand(cmd)));
  });
}

Sandbox::Sandbox(WorkerPool& pool) : Sandbox(pool, pool.Submit(BuildImage).get()) {}

Sandbox::Sandbox(WorkerPool& pool, std::string image_id) :
    pool_(pool), image_id_(std::move(image_id)) {
  spdlog::debug("Getting versions from container");
  versions_ = Run_(VersionsCommand{}, DecodeRunnerVersions).get();
  for (size_t i = 0; i < versions_.size(); i++) {
    auto lang = LanguageFromOrdinal(i);
    spdlog::info("Version of {}: {}", lang ? LanguageName(*lang) : "(unknown)", versions_[i]);
  }
}

std::future<TestResponse> Sandbox::Test(const TestCommand& test) const {
  return Run_(test, DecodeRunnerTestResponse);
}

std::future<std::optional<std::string>> Sandbox::ValidateJudger(const std::string& judger) const {
  return Run_(ValidateJudgerCommand{judger}, DecodeRunnerValidateJudger);
}
