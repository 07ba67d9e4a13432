#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace phon {

struct WordEntry {
  std::string text;
  Tier tier = Tier::Easy;
  std::string hint;
};

/**
 * Curriculum: immutable alphabet and word lists. Every word is stored as the
 * sequence of letter ids it spells; construction fails with CurriculumCorrupt
 * if a word uses a letter the alphabet does not define.
 */
class Curriculum {
public:
  Curriculum(std::vector<Letter> letters, std::vector<WordEntry> words);

  const std::vector<Letter>& letters() const { return letters_; }
  const std::vector<Word>& words() const { return words_; }

  const Letter* find_letter(const std::string& id) const;
  const Letter& letter(const std::string& id) const;
  bool has_letter(const std::string& id) const { return find_letter(id) != nullptr; }

  std::vector<const Letter*> letters_by_difficulty(Tier tier) const;
  std::vector<const Word*> words_by_difficulty(Tier tier) const;

private:
  std::vector<Letter> letters_;
  std::vector<Word> words_;
  std::unordered_map<std::string, std::size_t> letter_lookup_;
};

// Built-in Swedish alphabet and word lists.
Curriculum load_curriculum();

Curriculum load_curriculum(std::vector<Letter> letters, std::vector<WordEntry> words);

// {"letters":[{"id","sound","name","tier"[,"glyph"]}],"words":[{"text","tier"[,"hint"]}]}
Curriculum curriculum_from_json(const nlohmann::json& document);

// Splits UTF-8 text into one string per code point.
std::vector<std::string> split_graphemes(const std::string& text);

} // namespace phon
