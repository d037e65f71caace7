#ifndef INCLUDE_GRADEBOX_RESULT_H_
#define INCLUDE_GRADEBOX_RESULT_H_

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

// name, storage char, description
#define ENUM_CASE_RESULT_KIND_ \
  X(Correct, 'c', "Correct") \
  X(Wrong, 'w', "Wrong") \
  X(RuntimeError, 'r', "Runtime error") \
  X(TimeLimitExceeded, 't', "Time limit exceeded") \
  X(MemoryLimitExceeded, 'm', "Memory limit exceeded")
enum class CaseResultKind {
#define X(name, chr, desc) name,
  ENUM_CASE_RESULT_KIND_
#undef X
};

struct CaseResult {
  CaseResultKind kind;
  uint64_t memory_usage;
  uint64_t time; // ms

  bool operator==(const CaseResult& x) const {
    return kind == x.kind && memory_usage == x.memory_usage && time == x.time;
  }
  bool operator!=(const CaseResult& x) const { return !(*this == x); }
};

struct InvalidProgram {
  std::string reason;

  bool operator==(const InvalidProgram& x) const { return reason == x.reason; }
  bool operator!=(const InvalidProgram& x) const { return !(*this == x); }
};

// Either the per-case results (in test order) or the reason the program could
// not be run at all (e.g. a compile error).
using TestResponse = std::variant<std::vector<CaseResult>, InvalidProgram>;

#define ENUM_SIMPLE_TEST_RESPONSE_ \
  X(Correct, 'o', "Correct") \
  X(Wrong, 'e', "Wrong") \
  X(InvalidProgram, 'i', "Invalid program")
enum class SimpleTestResponse {
#define X(name, chr, desc) name,
  ENUM_SIMPLE_TEST_RESPONSE_
#undef X
};

class InvalidResultString : public std::runtime_error {
 public:
  explicit InvalidResultString(std::string_view value);
};

const char* CaseResultKindName(CaseResultKind);
const char* CaseResultKindDesc(CaseResultKind);
char CaseResultKindToChar(CaseResultKind);
std::optional<CaseResultKind> CharToCaseResultKind(char);
std::optional<CaseResultKind> NameToCaseResultKind(std::string_view);

const char* SimpleTestResponseDesc(SimpleTestResponse);
SimpleTestResponse Classify(const TestResponse&);

// Storage format; see result.cpp. The first character is 'o' iff every case
//   is correct, so "all correct" can be filtered with a prefix match.
std::string EncodeTestResponse(const TestResponse&);
TestResponse DecodeTestResponse(std::string_view);
// Only looks at the first character
SimpleTestResponse DecodeSimpleTestResponse(std::string_view);

#endif  // INCLUDE_GRADEBOX_RESULT_H_
