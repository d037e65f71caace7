#include "cli.h"

#include <fstream>
#include <sstream>

#include <fmt/core.h>

namespace {

const char* const kSubcommands[] = {"versions", "test", "validate-judger", "decode"};

} // namespace

Cli::Cli(const std::string& program) :
    parser(program), versions_cmd("versions"), test_cmd("test"),
    validate_cmd("validate-judger"), decode_cmd("decode") {
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default /etc/gradebox.conf)");
  parser.add_argument("-v", "--verbose")
    .action([this](const auto &) { ++verbosity_; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-w", "--workers")
    .scan<'d', int>()
    .help("Number of threads running containers");
  parser.add_argument("--image")
    .help("Use an existing image instead of building one");

  versions_cmd.add_description("Print the toolchain version of every language");

  test_cmd.add_description("Run a program against a test corpus and print the stored verdict");
  test_cmd.add_argument("-l", "--language").required()
    .help("python3, c, cpp, java or rust");
  test_cmd.add_argument("--code").required().help("Source file");
  test_cmd.add_argument("--tests").help("Test corpus file");
  test_cmd.add_argument("--tests-dir").help("Directory of 0.in, 0.out, 1.in, ...");
  test_cmd.add_argument("-t", "--time-limit")
    .default_value(1000).scan<'d', int>()
    .help("Time limit per case in milliseconds");
  test_cmd.add_argument("--judger").help("Custom judger script");

  validate_cmd.add_description("Check that a custom judger script loads");
  validate_cmd.add_argument("judger");

  decode_cmd.add_description("Decode a stored verdict string");
  decode_cmd.add_argument("value");

  parser.add_subparser(versions_cmd);
  parser.add_subparser(test_cmd);
  parser.add_subparser(validate_cmd);
  parser.add_subparser(decode_cmd);
}

void Cli::Parse(const std::vector<std::string>& args) {
  parser.parse_args(args);
}

std::string Cli::Subcommand() const {
  for (const char* name : kSubcommands) {
    if (parser.is_subcommand_used(name)) return name;
  }
  return "";
}

std::string ReadInputFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) throw InputError("cannot open " + path.string());
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

std::string ReadTestsDir(const fs::path& dir) {
  if (!fs::is_directory(dir)) throw InputError(dir.string() + " is not a directory");
  std::vector<TestCase> cases;
  for (int i = 0; fs::exists(dir / (std::to_string(i) + ".in")); i++) {
    cases.emplace_back(ReadInputFile(dir / (std::to_string(i) + ".in")),
                       ReadInputFile(dir / (std::to_string(i) + ".out")));
  }
  if (cases.empty()) throw InputError("no test cases in " + dir.string());
  return FormatTestCorpus(cases);
}

uint32_t CheckTimeLimit(int ms) {
  if (ms < 1) throw InputError(fmt::format("time limit must be positive, got {}", ms));
  return ms;
}

TestCommand BuildTestCommand(const argparse::ArgumentParser& cmd) {
  std::string abr = cmd.get<std::string>("--language");
  auto lang = LanguageFromAbr(abr);
  if (!lang) throw InputError("unknown language " + abr);
  TestCommand test;
  test.language = *lang;
  test.time_limit = CheckTimeLimit(cmd.get<int>("--time-limit"));
  test.code = ReadInputFile(cmd.get<std::string>("--code"));
  if (auto dir = cmd.present("--tests-dir")) {
    test.tests = ReadTestsDir(*dir);
  } else if (auto file = cmd.present("--tests")) {
    test.tests = ReadInputFile(*file);
  } else {
    throw InputError("one of --tests and --tests-dir is required");
  }
  if (auto judger = cmd.present("--judger")) test.custom_judger = ReadInputFile(*judger);
  return test;
}
