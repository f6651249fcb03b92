#include <tabledep/inflector.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace {

const std::unordered_map<std::string, std::string> &PluralToSingular() {
  static const std::unordered_map<std::string, std::string> irregulars = {
      {"people", "person"},       {"men", "man"},
      {"women", "woman"},         {"children", "child"},
      {"teeth", "tooth"},         {"feet", "foot"},
      {"geese", "goose"},         {"mice", "mouse"},
      {"oxen", "ox"},             {"data", "datum"},
      {"criteria", "criterion"},  {"media", "medium"},
      {"alumni", "alumnus"},      {"cacti", "cactus"},
      {"fungi", "fungus"},        {"nuclei", "nucleus"},
      {"radii", "radius"},        {"stimuli", "stimulus"},
      {"syllabi", "syllabus"},    {"analyses", "analysis"},
      {"bases", "basis"},         {"crises", "crisis"},
      {"diagnoses", "diagnosis"}, {"hypotheses", "hypothesis"},
      {"parentheses", "parenthesis"},
      {"syntheses", "synthesis"}, {"theses", "thesis"}};
  return irregulars;
}

const std::unordered_map<std::string, std::string> &SingularToPlural() {
  static const std::unordered_map<std::string, std::string> irregulars = [] {
    std::unordered_map<std::string, std::string> inverted;
    for (const auto &[plural, singular] : PluralToSingular()) {
      inverted.emplace(singular, plural);
    }
    return inverted;
  }();
  return irregulars;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

bool EndsWithAny(std::string_view value,
                 std::initializer_list<std::string_view> suffixes) {
  return std::any_of(suffixes.begin(), suffixes.end(),
                     [&](std::string_view suffix) {
                       return EndsWith(value, suffix);
                     });
}

bool IsVowel(char character) {
  return character == 'a' || character == 'e' || character == 'i' ||
         character == 'o' || character == 'u';
}

template <typename Transform>
std::string TransformLastSegment(const std::string &lower,
                                 Transform transform) {
  const auto separator = lower.rfind('_');
  if (separator == std::string::npos) {
    return transform(lower);
  }
  return lower.substr(0, separator + 1) +
         transform(lower.substr(separator + 1));
}

std::string SingularizeSegment(const std::string &word) {
  const auto &irregulars = PluralToSingular();
  if (const auto found = irregulars.find(word); found != irregulars.end()) {
    return found->second;
  }
  if (SingularToPlural().count(word) > 0) {
    return word;
  }
  if (EndsWithAny(word, {"sses", "xes", "zes", "ches", "shes"})) {
    return word.substr(0, word.size() - 2);
  }
  if (EndsWith(word, "ies") && word.size() > 4) {
    return word.substr(0, word.size() - 3) + "y";
  }
  if (EndsWith(word, "ves") && word.size() > 4) {
    return word.substr(0, word.size() - 3) + "fe";
  }
  if (EndsWith(word, "ses") && word.size() > 4) {
    return word.substr(0, word.size() - 2);
  }
  if (EndsWith(word, "oes") && word.size() > 4) {
    return word.substr(0, word.size() - 2);
  }
  if (EndsWith(word, "s") && !EndsWith(word, "ss")) {
    return word.substr(0, word.size() - 1);
  }
  return word;
}

std::string PluralizeSegment(const std::string &word) {
  const auto &irregulars = SingularToPlural();
  if (const auto found = irregulars.find(word); found != irregulars.end()) {
    return found->second;
  }
  if (EndsWith(word, "ies")) {
    return word;
  }
  if (EndsWith(word, "fe")) {
    return word.substr(0, word.size() - 2) + "ves";
  }
  if (EndsWith(word, "y") && word.size() > 2 &&
      !IsVowel(word[word.size() - 2])) {
    return word.substr(0, word.size() - 1) + "ies";
  }
  if (EndsWithAny(word, {"s", "x", "z", "ch", "sh"})) {
    return word + "es";
  }
  return word + "s";
}

} // namespace

namespace tabledep {

std::string Singularize(const std::string &word) {
  if (word.empty()) {
    return word;
  }
  return TransformLastSegment(ToLower(word), SingularizeSegment);
}

std::string Pluralize(const std::string &word) {
  if (word.empty()) {
    return word;
  }
  return TransformLastSegment(ToLower(word), PluralizeSegment);
}

std::string ClassNameToTableName(const std::string &class_name) {
  std::string snake;
  snake.reserve(class_name.size() + 4);
  for (std::size_t i = 0; i < class_name.size(); ++i) {
    const auto character = static_cast<unsigned char>(class_name[i]);
    if (character == ':') {
      continue;
    }
    if (std::isupper(character) != 0 && !snake.empty()) {
      snake.push_back('_');
    }
    snake.push_back(static_cast<char>(std::tolower(character)));
  }
  return Pluralize(snake);
}

std::string TableNameToClassName(const std::string &table_name) {
  const auto singular = Singularize(table_name);
  std::string class_name;
  class_name.reserve(singular.size());
  bool capitalize_next = true;
  for (const auto character : singular) {
    if (character == '_') {
      capitalize_next = true;
      continue;
    }
    class_name.push_back(
        capitalize_next
            ? static_cast<char>(
                  std::toupper(static_cast<unsigned char>(character)))
            : character);
    capitalize_next = false;
  }
  return class_name;
}

} // namespace tabledep
