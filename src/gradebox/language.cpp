#include <gradebox/language.h>

namespace {

const char* kLanguageAbrTable[] = {
#define X(name, ord, abr, desc) abr,
  ENUM_LANGUAGE_
#undef X
};

} // namespace

const char* LanguageName(Language lang) {
  switch (lang) {
#define X(name, ord, abr, desc) case Language::name: return desc;
    ENUM_LANGUAGE_
#undef X
  }
  __builtin_unreachable();
}

const char* LanguageAbr(Language lang) {
  return kLanguageAbrTable[(int)lang];
}

std::optional<Language> LanguageFromOrdinal(long ord) {
  if (ord < 0 || ord >= kLanguageCount) return std::nullopt;
  return (Language)ord;
}

std::optional<Language> LanguageFromAbr(const std::string& str) {
  for (int i = 0; i < kLanguageCount; i++) {
    if (str == kLanguageAbrTable[i]) return (Language)i;
  }
  return std::nullopt;
}
