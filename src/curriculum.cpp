#include "phon/curriculum.hpp"

#include "phon/errors.hpp"
#include "resources/builtin_curriculum.hpp"

#include <string_view>
#include <utility>

namespace phon {
namespace {

std::size_t utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 0;
}

std::string json_string(const nlohmann::json& obj, const char* key, std::string_view where) {
  if (!obj.contains(key) || !obj[key].is_string()) {
    throw CurriculumCorrupt(std::string(where) + " is missing string field '" + key + "'");
  }
  return obj[key].get<std::string>();
}

Tier json_tier(const nlohmann::json& obj, std::string_view where) {
  const std::string value = json_string(obj, "tier", where);
  try {
    return tier_from_string(value);
  } catch (const std::invalid_argument&) {
    throw CurriculumCorrupt(std::string(where) + " has unknown tier '" + value + "'");
  }
}

} // namespace

std::vector<std::string> split_graphemes(const std::string& text) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < text.size()) {
    const std::size_t len = utf8_sequence_length(static_cast<unsigned char>(text[i]));
    if (len == 0 || i + len > text.size()) {
      throw std::invalid_argument("Invalid UTF-8 in '" + text + "'");
    }
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        throw std::invalid_argument("Invalid UTF-8 in '" + text + "'");
      }
    }
    out.push_back(text.substr(i, len));
    i += len;
  }
  return out;
}

Curriculum::Curriculum(std::vector<Letter> letters, std::vector<WordEntry> words)
    : letters_(std::move(letters)) {
  if (letters_.empty()) {
    throw CurriculumCorrupt("alphabet is empty");
  }
  letter_lookup_.reserve(letters_.size());
  for (std::size_t i = 0; i < letters_.size(); ++i) {
    auto& letter = letters_[i];
    if (letter.id.empty()) {
      throw CurriculumCorrupt("letter at index " + std::to_string(i) + " has an empty id");
    }
    if (letter.sound_id.empty()) {
      throw CurriculumCorrupt("letter '" + letter.id + "' has no sound id");
    }
    if (letter.glyph.empty()) {
      letter.glyph = letter.id;
    }
    if (!letter_lookup_.emplace(letter.id, i).second) {
      throw CurriculumCorrupt("duplicate letter id '" + letter.id + "'");
    }
  }

  words_.reserve(words.size());
  for (auto& entry : words) {
    if (entry.text.empty()) {
      throw CurriculumCorrupt("word list contains an empty word");
    }
    Word word;
    try {
      word.letters = split_graphemes(entry.text);
    } catch (const std::invalid_argument& ex) {
      throw CurriculumCorrupt(ex.what());
    }
    for (const auto& id : word.letters) {
      if (letter_lookup_.find(id) == letter_lookup_.end()) {
        throw CurriculumCorrupt("word '" + entry.text + "' uses unknown letter '" + id + "'");
      }
    }
    word.text = std::move(entry.text);
    word.tier = entry.tier;
    word.hint = std::move(entry.hint);
    words_.push_back(std::move(word));
  }

  for (Tier tier : {Tier::Easy, Tier::Medium, Tier::Hard}) {
    if (letters_by_difficulty(tier).empty()) {
      throw CurriculumCorrupt("no letters at tier " + to_string(tier));
    }
    if (words_by_difficulty(tier).empty()) {
      throw CurriculumCorrupt("no words at tier " + to_string(tier));
    }
  }
}

const Letter* Curriculum::find_letter(const std::string& id) const {
  auto it = letter_lookup_.find(id);
  if (it == letter_lookup_.end()) {
    return nullptr;
  }
  return &letters_[it->second];
}

const Letter& Curriculum::letter(const std::string& id) const {
  const auto* found = find_letter(id);
  if (!found) {
    throw std::invalid_argument("Unknown letter id: " + id);
  }
  return *found;
}

std::vector<const Letter*> Curriculum::letters_by_difficulty(Tier tier) const {
  std::vector<const Letter*> out;
  for (const auto& letter : letters_) {
    if (letter.tier == tier) {
      out.push_back(&letter);
    }
  }
  return out;
}

std::vector<const Word*> Curriculum::words_by_difficulty(Tier tier) const {
  std::vector<const Word*> out;
  for (const auto& word : words_) {
    if (word.tier == tier) {
      out.push_back(&word);
    }
  }
  return out;
}

Curriculum load_curriculum() {
  return Curriculum(builtin::swedish_letters(), builtin::swedish_words());
}

Curriculum load_curriculum(std::vector<Letter> letters, std::vector<WordEntry> words) {
  return Curriculum(std::move(letters), std::move(words));
}

Curriculum curriculum_from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw CurriculumCorrupt("document must be an object");
  }
  if (!document.contains("letters") || !document["letters"].is_array()) {
    throw CurriculumCorrupt("document has no 'letters' array");
  }
  if (!document.contains("words") || !document["words"].is_array()) {
    throw CurriculumCorrupt("document has no 'words' array");
  }

  std::vector<Letter> letters;
  for (const auto& item : document["letters"]) {
    if (!item.is_object()) {
      throw CurriculumCorrupt("letter entry must be an object");
    }
    Letter letter;
    letter.id = json_string(item, "id", "letter");
    letter.sound_id = json_string(item, "sound", "letter '" + letter.id + "'");
    letter.name = json_string(item, "name", "letter '" + letter.id + "'");
    letter.tier = json_tier(item, "letter '" + letter.id + "'");
    if (item.contains("glyph") && item["glyph"].is_string()) {
      letter.glyph = item["glyph"].get<std::string>();
    }
    letters.push_back(std::move(letter));
  }

  std::vector<WordEntry> words;
  for (const auto& item : document["words"]) {
    if (!item.is_object()) {
      throw CurriculumCorrupt("word entry must be an object");
    }
    WordEntry entry;
    entry.text = json_string(item, "text", "word");
    entry.tier = json_tier(item, "word '" + entry.text + "'");
    if (item.contains("hint") && item["hint"].is_string()) {
      entry.hint = item["hint"].get<std::string>();
    }
    words.push_back(std::move(entry));
  }
  return Curriculum(std::move(letters), std::move(words));
}

} // namespace phon
