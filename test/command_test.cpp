#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <gradebox/command.h>
#include <gradebox/error.h>

using nlohmann::json;

namespace {

std::vector<uint8_t> Cbor(const json& j) {
  return json::to_cbor(j);
}

} // namespace

TEST(CommandCodec, EncodeTest) {
  TestCommand test{Language::CPP, 2000, "int main(){}", "1\n--\n1", std::nullopt};
  json j = json::from_cbor(EncodeCommand(test));
  EXPECT_EQ(j, (json{
      {"command", "Test"},
      {"language", 2},
      {"time_limit", 2000},
      {"code", "int main(){}"},
      {"tests", "1\n--\n1"}}));
}

TEST(CommandCodec, EncodeTestWithJudger) {
  TestCommand test{Language::PYTHON3, 1000, "print(1)", "", std::string("def judge(i, a, b, c): return True")};
  json j = json::from_cbor(EncodeCommand(test));
  EXPECT_EQ(j["command"], "Test");
  EXPECT_EQ(j["language"], 0);
  EXPECT_EQ(j["custom_judger"], "def judge(i, a, b, c): return True");
}

TEST(CommandCodec, EncodeVersions) {
  EXPECT_EQ(json::from_cbor(EncodeCommand(VersionsCommand{})), (json{{"command", "Versions"}}));
}

TEST(CommandCodec, EncodeValidateJudger) {
  EXPECT_EQ(json::from_cbor(EncodeCommand(ValidateJudgerCommand{"x = 1"})),
            (json{{"command", "ValidateJudger"}, {"judger", "x = 1"}}));
}

TEST(CommandCodec, DecodeOk) {
  json resp{{"Ok", {
      {{"kind", "Correct"}, {"memory_usage", 120}, {"time", 15}},
      {{"kind", "TimeLimitExceeded"}, {"memory_usage", 4}, {"time", 1000}}}}};
  TestResponse res = DecodeRunnerTestResponse(Cbor(resp));
  EXPECT_EQ(res, TestResponse(std::vector<CaseResult>{
      {CaseResultKind::Correct, 120, 15},
      {CaseResultKind::TimeLimitExceeded, 4, 1000}}));
}

TEST(CommandCodec, DecodeOkWithoutMemory) {
  json resp{{"Ok", {{{"kind", "Wrong"}, {"time", 7}}}}};
  EXPECT_EQ(DecodeRunnerTestResponse(Cbor(resp)),
            TestResponse(std::vector<CaseResult>{{CaseResultKind::Wrong, 0, 7}}));
}

TEST(CommandCodec, DecodeInvalidProgram) {
  json resp{{"InvalidProgram", "While running ['gcc']:\n\nerror"}};
  EXPECT_EQ(DecodeRunnerTestResponse(Cbor(resp)),
            TestResponse(InvalidProgram{"While running ['gcc']:\n\nerror"}));
}

TEST(CommandCodec, DecodeRejectsMalformed) {
  std::vector<std::vector<uint8_t>> bad = {
    {},
    {0xff, 0x00},
    Cbor(json{{"Ok", json::array()}}.dump()), // a string
    Cbor(json{{"Ok", json::array()}, {"InvalidProgram", "x"}}),
    Cbor(json{{"Unknown", 1}}),
    Cbor(json{{"Ok", 1}}),
    Cbor(json{{"Ok", {{{"kind", "Timeout"}, {"time", 1}}}}}),
    Cbor(json{{"Ok", {{{"kind", "Correct"}}}}}),
    Cbor(json{{"Ok", {{{"kind", "Correct"}, {"time", -1}}}}}),
    Cbor(json{{"Ok", {{{"kind", "Correct"}, {"time", 1.5}}}}}),
    Cbor(json{{"InvalidProgram", 3}}),
  };
  // truncated
  auto good = Cbor(json{{"Ok", {{{"kind", "Correct"}, {"time", 1}}}}});
  bad.emplace_back(good.begin(), good.end() - 1);
  // trailing garbage
  good.push_back(0x00);
  bad.push_back(good);
  for (size_t i = 0; i < bad.size(); i++) {
    EXPECT_THROW(DecodeRunnerTestResponse(bad[i]), SandboxError) << "case " << i;
  }
}

TEST(CommandCodec, DecodeRejectsInvalidUtf8) {
  const std::string bad_text = "\xff\xfe";
  std::vector<std::vector<uint8_t>> bad = {
    Cbor(json(bad_text)),
    Cbor(json{{"Ok", {{{"kind", "\xff"}, {"time", 1}}}}}),
    Cbor(json{{bad_text, 1}}),
  };
  for (size_t i = 0; i < bad.size(); i++) {
    EXPECT_THROW(DecodeRunnerTestResponse(bad[i]), SandboxError) << "case " << i;
    EXPECT_THROW(DecodeRunnerValidateJudger(bad[i]), SandboxError) << "case " << i;
  }
  // text payloads are passed through untouched
  auto res = DecodeRunnerTestResponse(Cbor(json{{"InvalidProgram", bad_text}}));
  ASSERT_TRUE(std::holds_alternative<InvalidProgram>(res));
  EXPECT_EQ(std::get<InvalidProgram>(res).reason, bad_text);
}

TEST(CommandCodec, DecodeErrorHasContext) {
  try {
    DecodeRunnerTestResponse({0xff});
    FAIL();
  } catch (const SandboxError& err) {
    EXPECT_EQ(std::string(err.what()).rfind("while deserializing response from runner: ", 0), 0u);
  }
}

TEST(CommandCodec, DecodeVersions) {
  EXPECT_EQ(DecodeRunnerVersions(Cbor(json{"Python 3.11", "gcc 13"})),
            (std::vector<std::string>{"Python 3.11", "gcc 13"}));
  EXPECT_THROW(DecodeRunnerVersions(Cbor(json{{"a", 1}})), SandboxError);
  EXPECT_THROW(DecodeRunnerVersions(Cbor(json{"a", 1})), SandboxError);
}

TEST(CommandCodec, DecodeValidateJudger) {
  EXPECT_EQ(DecodeRunnerValidateJudger(Cbor(json{{"Ok", nullptr}})), std::nullopt);
  EXPECT_EQ(DecodeRunnerValidateJudger(Cbor(json{{"Err", "name 'judge' is not defined"}})),
            std::optional<std::string>("name 'judge' is not defined"));
  EXPECT_THROW(DecodeRunnerValidateJudger(Cbor(json{{"Ok", 1}})), SandboxError);
  EXPECT_THROW(DecodeRunnerValidateJudger(Cbor(json{{"Maybe", nullptr}})), SandboxError);
}

TEST(TestCorpus, Format) {
  EXPECT_EQ(FormatTestCorpus({{"1 2", "3"}, {"4 5", "9"}}), "1 2\n--\n3\n===\n4 5\n--\n9");
  EXPECT_EQ(FormatTestCorpus({}), "");
}

TEST(TestCorpus, Parse) {
  auto cases = ParseTestCorpus("1 2\n--\n3\n\n===\n  4 5\n--\n9\n");
  ASSERT_EQ(cases.size(), 2u);
  EXPECT_EQ(cases[0], TestCase("1 2", "3"));
  EXPECT_EQ(cases[1], TestCase("4 5", "9"));
  EXPECT_TRUE(ParseTestCorpus("").empty());
  EXPECT_TRUE(ParseTestCorpus(" \n").empty());
  auto no_output = ParseTestCorpus("only input\n");
  ASSERT_EQ(no_output.size(), 1u);
  EXPECT_EQ(no_output[0], TestCase("only input", ""));
}

TEST(TestCorpus, ParseFormatted) {
  std::vector<TestCase> cases = {{"a\nb", "c\nd"}, {"e", "f"}, {"g", ""}};
  EXPECT_EQ(ParseTestCorpus(FormatTestCorpus(cases)), cases);
}
