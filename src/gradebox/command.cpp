#include <gradebox/command.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <gradebox/error.h>

namespace {

using nlohmann::json;

const char kCaseSep[] = "\n===\n";
const char kOutputSep[] = "\n--\n";
constexpr char kWhites[] = " \n\r\t";

const char kDecodeContext[] = "deserializing response from runner";

std::string Strip(const std::string& str) {
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  size_t end = str.find_last_not_of(kWhites);
  return str.substr(begin, end - begin + 1);
}

[[noreturn]] void Malformed(const std::string& what) {
  throw SandboxError(kDecodeContext, what);
}

json ParseCbor(const std::vector<uint8_t>& buf) {
  try {
    return json::from_cbor(buf);
  } catch (json::exception& err) {
    Malformed(err.what());
  }
}

// from_cbor does not validate UTF-8, so a strict dump() can throw type_error
std::string Describe(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// response variants are maps with exactly one key naming the variant
std::pair<std::string, const json*> Variant(const json& j) {
  if (!j.is_object()) Malformed(fmt::format("expected a map, got {}", j.type_name()));
  if (j.size() != 1) Malformed(fmt::format("expected a map with one entry, got {} entries", j.size()));
  auto it = j.begin();
  return {it.key(), &it.value()};
}

uint64_t GetUnsigned(const json& obj, const char* key, bool required) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    if (required) Malformed(fmt::format("missing field {}", key));
    return 0;
  }
  if (!it->is_number_unsigned()) Malformed(fmt::format("field {} is not an unsigned integer", key));
  return it->get<uint64_t>();
}

CaseResult ParseCase(const json& obj) {
  if (!obj.is_object()) Malformed("case result is not a map");
  auto kind_it = obj.find("kind");
  if (kind_it == obj.end() || !kind_it->is_string()) Malformed("case result without kind");
  auto kind = NameToCaseResultKind(kind_it->get_ref<const std::string&>());
  if (!kind) Malformed("unknown case result kind " + Describe(*kind_it));
  CaseResult ret;
  ret.kind = *kind;
  ret.time = GetUnsigned(obj, "time", true);
  // runners that cannot measure memory leave it out
  ret.memory_usage = GetUnsigned(obj, "memory_usage", false);
  return ret;
}

} // namespace

const char* CommandName(const Command& cmd) {
  switch (cmd.index()) {
    case 0: return "Test";
    case 1: return "Versions";
    case 2: return "ValidateJudger";
  }
  __builtin_unreachable();
}

std::vector<uint8_t> EncodeCommand(const Command& cmd) {
  json j{{"command", CommandName(cmd)}};
  if (auto test = std::get_if<TestCommand>(&cmd)) {
    j["language"] = (int)test->language;
    j["time_limit"] = test->time_limit;
    j["code"] = test->code;
    j["tests"] = test->tests;
    if (test->custom_judger) j["custom_judger"] = *test->custom_judger;
  } else if (auto validate = std::get_if<ValidateJudgerCommand>(&cmd)) {
    j["judger"] = validate->judger;
  }
  try {
    return json::to_cbor(j);
  } catch (json::exception& err) {
    throw SandboxError("serializing runner command", err.what());
  }
}

TestResponse DecodeRunnerTestResponse(const std::vector<uint8_t>& buf) {
  json j = ParseCbor(buf);
  auto [tag, value] = Variant(j);
  if (tag == "Ok") {
    if (!value->is_array()) Malformed("Ok payload is not a list");
    std::vector<CaseResult> cases;
    cases.reserve(value->size());
    for (auto& i : *value) cases.push_back(ParseCase(i));
    return cases;
  }
  if (tag == "InvalidProgram") {
    if (!value->is_string()) Malformed("InvalidProgram payload is not a string");
    return InvalidProgram{value->get<std::string>()};
  }
  Malformed("unknown test response variant " + tag);
}

std::vector<std::string> DecodeRunnerVersions(const std::vector<uint8_t>& buf) {
  json j = ParseCbor(buf);
  if (!j.is_array()) Malformed("versions response is not a list");
  std::vector<std::string> ret;
  for (auto& i : j) {
    if (!i.is_string()) Malformed("version is not a string");
    ret.push_back(i.get<std::string>());
  }
  if (ret.size() != (size_t)kLanguageCount) {
    spdlog::warn("Runner reported {} versions for {} languages", ret.size(), kLanguageCount);
  }
  return ret;
}

std::optional<std::string> DecodeRunnerValidateJudger(const std::vector<uint8_t>& buf) {
  json j = ParseCbor(buf);
  auto [tag, value] = Variant(j);
  if (tag == "Ok") {
    if (!value->is_null()) Malformed("Ok payload of judger validation is not null");
    return std::nullopt;
  }
  if (tag == "Err") {
    if (!value->is_string()) Malformed("Err payload is not a string");
    return value->get<std::string>();
  }
  Malformed("unknown judger validation variant " + tag);
}

std::string FormatTestCorpus(const std::vector<TestCase>& cases) {
  std::string ret;
  for (size_t i = 0; i < cases.size(); i++) {
    if (i) ret += kCaseSep;
    ret += cases[i].first;
    ret += kOutputSep;
    ret += cases[i].second;
  }
  return ret;
}

std::vector<TestCase> ParseTestCorpus(const std::string& text) {
  std::vector<TestCase> ret;
  if (text.find_first_not_of(kWhites) == std::string::npos) return ret;
  const size_t case_sep_len = sizeof(kCaseSep) - 1;
  const size_t output_sep_len = sizeof(kOutputSep) - 1;
  for (size_t pos = 0;;) {
    size_t end = text.find(kCaseSep, pos);
    std::string item = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    if (size_t sep = item.find(kOutputSep); sep != std::string::npos) {
      ret.emplace_back(Strip(item.substr(0, sep)), Strip(item.substr(sep + output_sep_len)));
    } else {
      ret.emplace_back(Strip(item), "");
    }
    if (end == std::string::npos) break;
    pos = end + case_sep_len;
  }
  return ret;
}
