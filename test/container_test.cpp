#include <fstream>
#include <algorithm>

#include <gtest/gtest.h>
#include <gradebox/config.h>
#include <gradebox/command.h>
#include <gradebox/error.h>

#include "container.h"
#include "fake_engine.h"

using ContainerRunner = FakeEngine;

namespace {

std::vector<uint8_t> Bytes(const std::string& str) {
  return std::vector<uint8_t>(str.begin(), str.end());
}

bool Contains(const std::string& str, const std::string& sub) {
  return str.find(sub) != std::string::npos;
}

} // namespace

TEST(ContainerRunArgs, Shape) {
  kMemoryLimitMiB = 256;
  auto args = ContainerRunArgs("deadbeef", "/tmp/gradebox/run-abc");
  EXPECT_EQ(args, (std::vector<std::string>{
      kContainerEngine, "run", "--rm", "--memory=256m", "--network=none", "--mount",
      "type=bind,source=/tmp/gradebox/run-abc,destination=/input,readonly", "deadbeef"}));
  kMemoryLimitMiB = 100;
}

TEST_F(ContainerRunner, ReturnsStdout) {
  AddRawResponse("token-1", Bytes("response bytes\n"));
  auto out = RunContainer("0123abcd", Bytes("command with token-1"));
  EXPECT_EQ(out, Bytes("response bytes\n"));
  auto calls = RunCalls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_TRUE(Contains(calls[0], "--rm"));
  EXPECT_TRUE(Contains(calls[0], "--memory=100m"));
  EXPECT_TRUE(Contains(calls[0], "--network=none"));
  EXPECT_TRUE(Contains(calls[0], ",destination=/input,readonly"));
  EXPECT_TRUE(Contains(calls[0], "0123abcd"));
  EXPECT_EQ(LeftoverRuns(), 0u);
}

TEST_F(ContainerRunner, NonZeroExitCarriesStderr) {
  AddFailure("token-2", "Unable to find image 'nope:latest' locally");
  try {
    RunContainer("nope", Bytes("token-2"));
    FAIL();
  } catch (const SandboxError& err) {
    std::string msg = err.what();
    EXPECT_TRUE(Contains(msg, "exit status 2")) << msg;
    EXPECT_TRUE(Contains(msg, "Unable to find image 'nope:latest' locally")) << msg;
  }
  EXPECT_EQ(LeftoverRuns(), 0u);
}

TEST_F(ContainerRunner, MissingEngine) {
  kContainerEngine = (root / "no-such-engine").string();
  EXPECT_THROW(RunContainer("0123abcd", Bytes("x")), SandboxError);
  EXPECT_EQ(LeftoverRuns(), 0u);
}

TEST_F(ContainerRunner, UnusableTempRoot) {
  // a regular file where the temp root should be
  std::ofstream(root / "file") << "x";
  kTempRoot = root / "file";
  try {
    RunContainer("0123abcd", Bytes("x"));
    FAIL();
  } catch (const SandboxError& err) {
    EXPECT_EQ(std::string(err.what()).rfind("while creating temp dir", 0), 0u);
  }
  EXPECT_TRUE(RunCalls().empty());
}

TEST_F(ContainerRunner, FreshDirectoryPerRun) {
  AddRawResponse("token-3", Bytes("ok"));
  for (int i = 0; i < 3; i++) RunContainer("0123abcd", Bytes("token-3"));
  auto calls = RunCalls();
  ASSERT_EQ(calls.size(), 3u);
  std::sort(calls.begin(), calls.end());
  EXPECT_EQ(std::unique(calls.begin(), calls.end()), calls.end());
  EXPECT_EQ(LeftoverRuns(), 0u);
}
