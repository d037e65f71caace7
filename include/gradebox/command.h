#ifndef INCLUDE_GRADEBOX_COMMAND_H_
#define INCLUDE_GRADEBOX_COMMAND_H_

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <utility>
#include <optional>

#include "language.h"
#include "result.h"

struct TestCommand {
  Language language;
  uint32_t time_limit; // ms, per case
  std::string code;
  std::string tests; // see FormatTestCorpus
  // replaces exact output comparison if set
  std::optional<std::string> custom_judger;
};

struct VersionsCommand {};

// check that a custom judger script loads, without running any submission
struct ValidateJudgerCommand {
  std::string judger;
};

using Command = std::variant<TestCommand, VersionsCommand, ValidateJudgerCommand>;

const char* CommandName(const Command&);

// All of these throw SandboxError.
std::vector<uint8_t> EncodeCommand(const Command&);
TestResponse DecodeRunnerTestResponse(const std::vector<uint8_t>&);
// index = language ordinal
std::vector<std::string> DecodeRunnerVersions(const std::vector<uint8_t>&);
// nullopt if the judger is valid, otherwise the reason
std::optional<std::string> DecodeRunnerValidateJudger(const std::vector<uint8_t>&);

// Test corpus text understood by the runner:
//   <input>\n--\n<expected output>\n===\n<input>\n--\n<expected output>...
using TestCase = std::pair<std::string, std::string>;
std::string FormatTestCorpus(const std::vector<TestCase>&);
std::vector<TestCase> ParseTestCorpus(const std::string&);

#endif  // INCLUDE_GRADEBOX_COMMAND_H_
