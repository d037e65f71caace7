#ifndef INCLUDE_GRADEBOX_LANGUAGE_H_
#define INCLUDE_GRADEBOX_LANGUAGE_H_

#include <string>
#include <optional>

// Ordinals are stored in the database and sent to the runner; never renumber.
#define ENUM_LANGUAGE_ \
  X(PYTHON3, 0, "python3", "Python 3") \
  X(C, 1, "c", "C") \
  X(CPP, 2, "cpp", "C++") \
  X(JAVA, 3, "java", "Java") \
  X(RUST, 4, "rust", "Rust")
enum class Language {
#define X(name, ord, abr, desc) name = ord,
  ENUM_LANGUAGE_
#undef X
};

constexpr int kLanguageCount = 0
#define X(name, ord, abr, desc) + 1
  ENUM_LANGUAGE_
#undef X
  ;

const char* LanguageName(Language);
const char* LanguageAbr(Language);
std::optional<Language> LanguageFromOrdinal(long);
std::optional<Language> LanguageFromAbr(const std::string&);

#endif  // INCLUDE_GRADEBOX_LANGUAGE_H_
