#include <memory>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <gradebox/config.h>
#include <gradebox/error.h>
#include <gradebox/logger.h>
#include <gradebox/sandbox.h>
#include "cli.h"

namespace {

const char kDefaultConfig[] = "/etc/gradebox.conf";

std::string image_id;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string build_context = ini[""]["build_context"] | "";
  std::string temp_root = ini[""]["temp_root"] | "";
  if (build_context.size()) kBuildContext = build_context;
  if (temp_root.size()) kTempRoot = temp_root;
  kContainerEngine = ini[""]["engine"] | kContainerEngine;
  kMemoryLimitMiB = ini[""]["memory_limit_mb"] | kMemoryLimitMiB;
  kWorkers = ini[""]["workers"] | kWorkers;
  image_id = ini[""]["image"] | image_id;
  return true;
}

void PrintResponse(const TestResponse& res) {
  std::cout << EncodeTestResponse(res) << '\n';
  std::cout << SimpleTestResponseDesc(Classify(res)) << '\n';
  if (auto invalid = std::get_if<InvalidProgram>(&res)) {
    std::cout << invalid->reason << '\n';
    return;
  }
  auto& cases = std::get<std::vector<CaseResult>>(res);
  for (size_t i = 0; i < cases.size(); i++) {
    std::cout << fmt::format("#{:<3} {:<22} {:>6} ms {:>8} KiB\n", i,
                             CaseResultKindDesc(cases[i].kind), cases[i].time, cases[i].memory_usage);
  }
}

int CmdDecode(const argparse::ArgumentParser& cmd) {
  std::string value = cmd.get<std::string>("value");
  try {
    // the cheap check must agree with the full one
    SimpleTestResponse simple = DecodeSimpleTestResponse(value);
    TestResponse res = DecodeTestResponse(value);
    if (simple != Classify(res)) {
      spdlog::warn("Tag of {} does not match its cases", value);
    }
    PrintResponse(res);
  } catch (const InvalidResultString& err) {
    std::cerr << err.what() << std::endl;
    return 1;
  }
  return 0;
}

int CmdVersions(const Sandbox& sandbox) {
  auto& versions = sandbox.Versions();
  for (size_t i = 0; i < versions.size(); i++) {
    auto lang = LanguageFromOrdinal(i);
    std::cout << "== " << (lang ? LanguageName(*lang) : "(unknown)") << '\n' << versions[i] << '\n';
  }
  return 0;
}

int CmdTest(const Sandbox& sandbox, const TestCommand& test) {
  size_t num_cases = ParseTestCorpus(test.tests).size();
  spdlog::info("Testing {} program against {} cases", LanguageName(test.language), num_cases);

  TestResponse res = sandbox.Test(test).get();
  if (auto cases = std::get_if<std::vector<CaseResult>>(&res); cases && cases->size() != num_cases) {
    spdlog::warn("Runner returned {} results for {} cases", cases->size(), num_cases);
  }
  PrintResponse(res);
  return 0;
}

int CmdValidateJudger(const Sandbox& sandbox, const std::string& judger) {
  auto err = sandbox.ValidateJudger(judger).get();
  if (err) {
    std::cout << "Invalid judger: " << *err << std::endl;
    return 1;
  }
  std::cout << "OK" << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();

  Cli cli(argc ? argv[0] : "gradebox");
  try {
    cli.Parse(std::vector<std::string>(argv, argv + argc));
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << cli.parser;
    return 1;
  }
  std::string subcommand = cli.Subcommand();
  if (subcommand.empty()) {
    std::cerr << cli.parser;
    return 1;
  }

  switch (cli.Verbosity()) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (auto config_file = cli.parser.present("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      return 1;
    }
  } else {
    ParseConfig(kDefaultConfig);
  }
  if (auto val = cli.parser.present<int>("--workers")) kWorkers = val.value();
  if (auto val = cli.parser.present("--image")) image_id = val.value();

  if (subcommand == "decode") return CmdDecode(cli.decode_cmd);

  // user input is read before any image is built
  TestCommand test;
  std::string judger;
  try {
    if (subcommand == "test") test = BuildTestCommand(cli.test_cmd);
    if (subcommand == "validate-judger") {
      judger = ReadInputFile(cli.validate_cmd.get<std::string>("judger"));
    }
  } catch (const InputError& err) {
    std::cerr << err.what() << std::endl;
    return 1;
  }

  WorkerPool pool(kWorkers);
  std::unique_ptr<Sandbox> sandbox;
  try {
    sandbox = image_id.empty() ? std::make_unique<Sandbox>(pool) : std::make_unique<Sandbox>(pool, image_id);
  } catch (const SandboxError& err) {
    spdlog::critical("Sandbox is unusable: {}", err.what());
    return 1;
  }

  try {
    if (subcommand == "versions") return CmdVersions(*sandbox);
    if (subcommand == "test") return CmdTest(*sandbox, test);
    return CmdValidateJudger(*sandbox, judger);
  } catch (const std::exception& err) {
    std::cerr << ReportInternalError(err) << std::endl;
    return 1;
  }
}
