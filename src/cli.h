#ifndef CLI_H_
#define CLI_H_

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <filesystem>

#include <argparse/argparse.hpp>
#include <gradebox/command.h>

namespace fs = std::filesystem;

// Bad command-line input; reported to the user as is, without an error ID.
class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& msg) : std::runtime_error(msg) {}
};

// Argument parsers of the gradebox executable.
// Not movable: the main parser keeps references to the subcommand parsers.
class Cli {
  int verbosity_ = 0;
 public:
  argparse::ArgumentParser parser;
  argparse::ArgumentParser versions_cmd;
  argparse::ArgumentParser test_cmd;
  argparse::ArgumentParser validate_cmd;
  argparse::ArgumentParser decode_cmd;

  explicit Cli(const std::string& program);
  Cli(const Cli&) = delete;
  Cli& operator=(const Cli&) = delete;

  // throws std::runtime_error on bad arguments
  void Parse(const std::vector<std::string>& args);
  // empty if no subcommand was given
  std::string Subcommand() const;
  int Verbosity() const { return verbosity_; }
};

// These throw InputError.
std::string ReadInputFile(const fs::path&);
// <dir>/<n>.in and <dir>/<n>.out, n = 0, 1, ...
std::string ReadTestsDir(const fs::path&);
uint32_t CheckTimeLimit(int ms);
// reads every file the `test` subcommand names
TestCommand BuildTestCommand(const argparse::ArgumentParser& test_cmd);

#endif  // CLI_H_
