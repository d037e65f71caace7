#include <gradebox/result.h>

#include <charconv>
#include <algorithm>

#include <fmt/core.h>

namespace {

constexpr char kTagInvalid = 'i';
constexpr char kTagAllCorrect = 'o';
constexpr char kTagHasError = 'e';
constexpr char kFieldSep = ',';
constexpr char kCaseEnd = ';';

bool ParseUnsigned(std::string_view str, uint64_t& out) {
  if (str.empty()) return false;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
  return ec == std::errc() && ptr == str.data() + str.size();
}

// "<kind>,<memory>,<time>"
bool ParseCase(std::string_view record, CaseResult& res) {
  size_t p1 = record.find(kFieldSep);
  if (p1 == std::string_view::npos) return false;
  size_t p2 = record.find(kFieldSep, p1 + 1);
  if (p2 == std::string_view::npos) return false;
  std::string_view kind = record.substr(0, p1);
  if (kind.size() != 1) return false;
  auto parsed_kind = CharToCaseResultKind(kind[0]);
  if (!parsed_kind) return false;
  res.kind = *parsed_kind;
  return ParseUnsigned(record.substr(p1 + 1, p2 - p1 - 1), res.memory_usage) &&
         ParseUnsigned(record.substr(p2 + 1), res.time);
}

} // namespace

InvalidResultString::InvalidResultString(std::string_view value) :
    std::runtime_error(fmt::format("invalid serialized test response \"{}\"", value)) {}

const char* CaseResultKindName(CaseResultKind kind) {
  switch (kind) {
#define X(name, chr, desc) case CaseResultKind::name: return #name;
    ENUM_CASE_RESULT_KIND_
#undef X
  }
  __builtin_unreachable();
}

const char* CaseResultKindDesc(CaseResultKind kind) {
  switch (kind) {
#define X(name, chr, desc) case CaseResultKind::name: return desc;
    ENUM_CASE_RESULT_KIND_
#undef X
  }
  __builtin_unreachable();
}

char CaseResultKindToChar(CaseResultKind kind) {
  switch (kind) {
#define X(name, chr, desc) case CaseResultKind::name: return chr;
    ENUM_CASE_RESULT_KIND_
#undef X
  }
  __builtin_unreachable();
}

std::optional<CaseResultKind> CharToCaseResultKind(char c) {
  switch (c) {
#define X(name, chr, desc) case chr: return CaseResultKind::name;
    ENUM_CASE_RESULT_KIND_
#undef X
  }
  return std::nullopt;
}

std::optional<CaseResultKind> NameToCaseResultKind(std::string_view str) {
#define X(name, chr, desc) if (str == #name) return CaseResultKind::name;
  ENUM_CASE_RESULT_KIND_
#undef X
  return std::nullopt;
}

const char* SimpleTestResponseDesc(SimpleTestResponse res) {
  switch (res) {
#define X(name, chr, desc) case SimpleTestResponse::name: return desc;
    ENUM_SIMPLE_TEST_RESPONSE_
#undef X
  }
  __builtin_unreachable();
}

SimpleTestResponse Classify(const TestResponse& res) {
  if (std::holds_alternative<InvalidProgram>(res)) return SimpleTestResponse::InvalidProgram;
  auto& cases = std::get<std::vector<CaseResult>>(res);
  bool all_correct = std::all_of(cases.begin(), cases.end(), [](const CaseResult& c) {
    return c.kind == CaseResultKind::Correct;
  });
  return all_correct ? SimpleTestResponse::Correct : SimpleTestResponse::Wrong;
}

std::string EncodeTestResponse(const TestResponse& res) {
  if (auto invalid = std::get_if<InvalidProgram>(&res)) {
    return kTagInvalid + invalid->reason;
  }
  auto& cases = std::get<std::vector<CaseResult>>(res);
  std::string ret(1, '\0'); // tag, filled in below
  bool all_correct = true;
  for (auto& c : cases) {
    if (c.kind != CaseResultKind::Correct) all_correct = false;
    ret += CaseResultKindToChar(c.kind);
    ret += kFieldSep;
    ret += std::to_string(c.memory_usage);
    ret += kFieldSep;
    ret += std::to_string(c.time);
    ret += kCaseEnd;
  }
  ret[0] = all_correct ? kTagAllCorrect : kTagHasError;
  return ret;
}

TestResponse DecodeTestResponse(std::string_view value) {
  if (value.empty()) throw InvalidResultString(value);
  std::string_view rest = value.substr(1);
  switch (value[0]) {
    case kTagInvalid: return InvalidProgram{std::string(rest)};
    case kTagAllCorrect: [[fallthrough]];
    case kTagHasError: {
      std::vector<CaseResult> cases;
      while (!rest.empty()) {
        size_t end = rest.find(kCaseEnd);
        // every record, including the last one, must be terminated
        if (end == std::string_view::npos) throw InvalidResultString(value);
        CaseResult c;
        if (!ParseCase(rest.substr(0, end), c)) throw InvalidResultString(value);
        cases.push_back(c);
        rest.remove_prefix(end + 1);
      }
      return cases;
    }
  }
  throw InvalidResultString(value);
}

SimpleTestResponse DecodeSimpleTestResponse(std::string_view value) {
  if (value.empty()) throw InvalidResultString(value);
  switch (value[0]) {
#define X(name, chr, desc) case chr: return SimpleTestResponse::name;
    ENUM_SIMPLE_TEST_RESPONSE_
#undef X
  }
  throw InvalidResultString(value);
}
