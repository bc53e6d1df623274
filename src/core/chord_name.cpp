#include "core/chord_name.h"

#include <map>
#include <sstream>

#include "core/chord.h"
#include "core/json_helpers.h"

namespace chordlab {

namespace {

// UTF-8 accidentals.
constexpr const char* kFlatSign = "\xE2\x99\xAD";   // ♭
constexpr const char* kSharpSign = "\xE2\x99\xAF";  // ♯

struct AliasGroup {
  const char* canonical;
  std::vector<const char*> aliases;
};

// Root spellings grouped by canonical pitch class name.
const std::vector<AliasGroup>& rootAliasGroups() {
  static const std::vector<AliasGroup> groups = {
      {"C", {"C", "B#", "B\xE2\x99\xAF"}},
      {"C#", {"C#", "C\xE2\x99\xAF", "Db", "D\xE2\x99\xAD"}},
      {"D", {"D"}},
      {"D#", {"D#", "D\xE2\x99\xAF", "Eb", "E\xE2\x99\xAD"}},
      {"E", {"E", "Fb", "F\xE2\x99\xAD"}},
      {"F", {"F", "E#", "E\xE2\x99\xAF"}},
      {"F#", {"F#", "F\xE2\x99\xAF", "Gb", "G\xE2\x99\xAD"}},
      {"G", {"G"}},
      {"G#", {"G#", "G\xE2\x99\xAF", "Ab", "A\xE2\x99\xAD"}},
      {"A", {"A"}},
      {"A#", {"A#", "A\xE2\x99\xAF", "Bb", "B\xE2\x99\xAD"}},
      {"B", {"B", "Cb", "C\xE2\x99\xAD"}},
  };
  return groups;
}

// Suffix spellings grouped by canonical suffix.
const std::vector<AliasGroup>& suffixAliasGroups() {
  static const std::vector<AliasGroup> groups = {
      {"", {"", "major", "maj", "M"}},
      {"m", {"m", "minor", "min", "-"}},
      {"dim", {"dim", "diminished", "dimin", "o", "\xC2\xB0"}},
      {"aug", {"aug", "augmented", "+"}},
      {"maj7", {"maj7", "major7", "major 7", "M7"}},
      {"m7", {"m7", "min7", "minor7", "minor 7", "-7"}},
      {"7", {"7", "dom7", "dominant7", "dominant 7"}},
      {"dim7", {"dim7", "diminished7", "diminished 7", "o7", "\xC2\xB0" "7"}},
      {"m7\xE2\x99\xAD" "5",
       {"m7\xE2\x99\xAD" "5", "m7b5", "halfdiminished7", "half diminished 7", "\xC3\xB8" "7",
        "\xC3\xB8"}},
      {"maj9", {"maj9", "major9", "major 9", "M9"}},
      {"m9", {"m9", "min9", "minor9", "minor 9", "-9"}},
      {"9", {"9", "dom9", "dominant9", "dominant 9"}},
      {"maj11", {"maj11", "major11", "major 11", "M11"}},
      {"m11", {"m11", "min11", "minor11", "minor 11", "-11"}},
      {"11", {"11", "dom11", "dominant11", "dominant 11"}},
      {"maj13", {"maj13", "major13", "major 13", "M13"}},
      {"m13", {"m13", "min13", "minor13", "minor 13", "-13"}},
      {"13", {"13", "dom13", "dominant13", "dominant 13"}},
      {"sus2", {"sus2", "suspended2", "suspended 2"}},
      {"sus4", {"sus4", "suspended4", "suspended 4", "sus"}},
      {"add9", {"add9", "add 9"}},
      {"add11", {"add11", "add 11"}},
      {"madd9", {"madd9", "minoradd9", "minor add9", "minor add 9"}},
  };
  return groups;
}

bool isSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

char asciiLower(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; }
char asciiUpper(char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isSpace(s[begin])) ++begin;
  while (end > begin && isSpace(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

// Trim and collapse internal whitespace runs to one space.
std::string collapseWhitespace(const std::string& s) {
  std::string result;
  bool pending_space = false;
  for (char c : trim(s)) {
    if (isSpace(c)) {
      pending_space = true;
      continue;
    }
    if (pending_space) result += ' ';
    pending_space = false;
    result += c;
  }
  return result;
}

std::string foldCase(const std::string& s) {
  std::string result = s;
  for (char& c : result) c = asciiLower(c);
  return result;
}

// Byte length of the UTF-8 sequence starting with `lead` (0 if invalid).
size_t utf8SequenceLength(char lead) {
  unsigned char c = static_cast<unsigned char>(lead);
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 0;
}

bool startsWith(const std::string& s, size_t pos, const char* prefix) {
  return s.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

// True if text at pos is an accidental that could fuse with a root letter.
bool startsWithAccidental(const std::string& s, size_t pos = 0) {
  if (pos >= s.size()) return false;
  char c = s[pos];
  if (c == '#' || c == 'b' || c == 'B') return true;
  return startsWith(s, pos, kFlatSign) || startsWith(s, pos, kSharpSign);
}

class NameTables {
 public:
  static const NameTables& instance() {
    static const NameTables tables;
    return tables;
  }

  std::optional<PitchClass> lookupRoot(const std::string& token) const {
    auto it = roots_.find(token);
    if (it == roots_.end()) return std::nullopt;
    return it->second;
  }

  std::string lookupSuffix(const std::string& suffix) const {
    auto it = exact_suffixes_.find(suffix);
    if (it != exact_suffixes_.end()) return it->second;
    it = folded_suffixes_.find(foldCase(suffix));
    if (it != folded_suffixes_.end()) return it->second;
    return suffix;
  }

 private:
  NameTables() {
    for (const auto& group : rootAliasGroups()) {
      auto pc = pitchClassFromName(group.canonical);
      if (!pc) continue;
      for (const char* alias : group.aliases) roots_[alias] = *pc;
    }
    for (const auto& group : suffixAliasGroups()) {
      for (const char* alias : group.aliases) {
        exact_suffixes_[alias] = group.canonical;
        // Upper-case M spellings mean major and must not match "m" forms.
        if (alias[0] != 'M') folded_suffixes_.emplace(foldCase(alias), group.canonical);
      }
    }
  }

  std::map<std::string, PitchClass> roots_;
  std::map<std::string, std::string> exact_suffixes_;
  std::map<std::string, std::string> folded_suffixes_;
};

// First character upper case, the rest lower case (ASCII only).
std::string normalizeRootCase(const std::string& token) {
  std::string result = token;
  for (size_t i = 0; i < result.size(); ++i) {
    result[i] = (i == 0) ? asciiUpper(result[i]) : asciiLower(result[i]);
  }
  return result;
}

std::optional<PitchClass> lookupRootToken(const std::string& token) {
  return NameTables::instance().lookupRoot(normalizeRootCase(token));
}

bool containsFlatNotation(const std::string& text) {
  for (size_t i = 0; i + 1 < text.size(); ++i) {
    if (text[i] < 'A' || text[i] > 'G') continue;
    if (text[i + 1] == 'b' || startsWith(text, i + 1, kFlatSign)) return true;
  }
  return false;
}

}  // namespace

std::optional<PitchClass> normalizeNoteName(const std::string& name) {
  std::string trimmed = trim(name);
  if (trimmed.empty()) return std::nullopt;
  return lookupRootToken(trimmed);
}

std::optional<ParsedChordName> parseChordName(const std::string& name) {
  std::string trimmed = trim(name);
  if (trimmed.empty()) return std::nullopt;

  std::optional<PitchClass> root;
  size_t root_length = 0;

  // Two code point root first ("C#", "Db", "D♭"), then a single letter.
  if (trimmed.size() >= 2) {
    size_t second = utf8SequenceLength(trimmed[1]);
    if (second > 0 && 1 + second <= trimmed.size()) {
      root = lookupRootToken(trimmed.substr(0, 1 + second));
      if (root) root_length = 1 + second;
    }
  }
  if (!root) {
    root = lookupRootToken(trimmed.substr(0, 1));
    if (root) root_length = 1;
  }
  if (!root) return std::nullopt;

  ParsedChordName parsed;
  parsed.root = *root;
  parsed.suffix = trim(trimmed.substr(root_length));
  if (startsWithAccidental(parsed.suffix)) return std::nullopt;
  return parsed;
}

std::string normalizeChordName(const std::string& name) {
  std::string trimmed = trim(name);
  if (trimmed.empty()) return "";

  size_t slash = trimmed.find('/');
  if (slash != std::string::npos) {
    std::string chord_part = normalizeChordName(trimmed.substr(0, slash));
    auto bass = normalizeNoteName(trimmed.substr(slash + 1));
    if (!chord_part.empty() && bass) {
      return chord_part + "/" + pitchClassName(*bass);
    }
    // Fall through: the whole text is parsed as root + suffix.
  }

  auto parsed = parseChordName(trimmed);
  if (!parsed) return "";

  std::string suffix = NameTables::instance().lookupSuffix(collapseWhitespace(parsed->suffix));
  return std::string(pitchClassName(parsed->root)) + suffix;
}

std::vector<std::string> enharmonicEquivalents(PitchClass pc) {
  switch (pc) {
    case PitchClass::Cs: return {"C#", "Db"};
    case PitchClass::Ds: return {"D#", "Eb"};
    case PitchClass::Fs: return {"F#", "Gb"};
    case PitchClass::Gs: return {"G#", "Ab"};
    case PitchClass::As: return {"A#", "Bb"};
    default: return {pitchClassName(pc)};
  }
}

ChordValidationResult validateChordGuess(const std::string& guess, const Chord& target) {
  ChordValidationResult result;
  result.original_guess = trim(guess);

  int inversion = target.notes.empty() ? 0 : target.inversion;
  std::string answer_name =
      chordDisplayName(target.root, target.quality, inversion, target.bass().pitch_class);

  result.normalized_guess = normalizeChordName(guess);
  result.normalized_answer = normalizeChordName(answer_name);

  if (!result.normalized_guess.empty() && result.normalized_guess == result.normalized_answer) {
    result.is_correct = true;
    result.is_enharmonic = containsFlatNotation(result.original_guess) &&
                           answer_name.find('#') != std::string::npos;
    return result;
  }

  // Enharmonic roots with identical suffixes.
  auto guess_parts = parseChordName(result.normalized_guess);
  auto answer_parts = parseChordName(result.normalized_answer);
  if (guess_parts && answer_parts && guess_parts->suffix == answer_parts->suffix) {
    std::vector<std::string> guess_spellings = enharmonicEquivalents(guess_parts->root);
    std::vector<std::string> answer_spellings = enharmonicEquivalents(answer_parts->root);
    for (const auto& spelling : guess_spellings) {
      for (const auto& other : answer_spellings) {
        if (spelling == other) {
          result.is_correct = true;
          result.is_enharmonic = true;
          return result;
        }
      }
    }
  }

  result.feedback = "Incorrect. The correct answer is " + answer_name + ".";
  return result;
}

std::string validationResultToJson(const ChordValidationResult& result) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject()
      .write("is_correct", result.is_correct)
      .write("normalized_guess", result.normalized_guess)
      .write("normalized_answer", result.normalized_answer)
      .write("is_enharmonic", result.is_enharmonic)
      .write("original_guess", result.original_guess);
  if (result.feedback) {
    w.write("feedback", *result.feedback);
  } else {
    w.writeNull("feedback");
  }
  w.endObject();
  return oss.str();
}

}  // namespace chordlab
