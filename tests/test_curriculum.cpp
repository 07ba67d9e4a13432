#include "phon/curriculum.hpp"
#include "phon/errors.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using phon::testing::TestSuite;

namespace {

template <typename Fn>
bool throws_corrupt(Fn&& fn) {
  try {
    fn();
  } catch (const phon::CurriculumCorrupt&) {
    return true;
  }
  return false;
}

void test_builtin_alphabet(TestSuite& suite) {
  const auto curriculum = phon::load_curriculum();
  suite.require(curriculum.letters().size() == 29, "Swedish alphabet should have 29 letters");
  suite.require(curriculum.has_letter("Å") && curriculum.has_letter("Ä") &&
                    curriculum.has_letter("Ö"),
                "alphabet should include Å, Ä and Ö");

  std::size_t total = 0;
  for (auto tier : {phon::Tier::Easy, phon::Tier::Medium, phon::Tier::Hard}) {
    const auto letters = curriculum.letters_by_difficulty(tier);
    suite.require(!letters.empty(), "every tier should have letters");
    for (const auto* letter : letters) {
      suite.require(letter->tier == tier, "letters_by_difficulty returned a letter of another tier");
    }
    total += letters.size();
  }
  suite.require(total == curriculum.letters().size(), "tiers should partition the alphabet");

  const auto easy = curriculum.letters_by_difficulty(phon::Tier::Easy);
  suite.require(easy.front()->id == "A", "easy letters should keep alphabet order");

  const auto& a = curriculum.letter("A");
  suite.require(a.sound_id == "aaa", "A should carry its elongated sound");
  suite.require(a.glyph == "A", "glyph should default to the id");
}

void test_builtin_words(TestSuite& suite) {
  const auto curriculum = phon::load_curriculum();
  for (auto tier : {phon::Tier::Easy, phon::Tier::Medium, phon::Tier::Hard}) {
    suite.require(!curriculum.words_by_difficulty(tier).empty(), "every tier should have words");
  }
  for (const auto& word : curriculum.words()) {
    suite.require(!word.letters.empty(), "word should spell at least one letter");
    for (const auto& id : word.letters) {
      suite.require(curriculum.has_letter(id), "word " + word.text + " uses unknown letter " + id);
    }
  }
  const auto& words = curriculum.words();
  auto it = std::find_if(words.begin(), words.end(),
                         [](const phon::Word& w) { return w.text == "ÄPPLE"; });
  suite.require(it != words.end(), "ÄPPLE should be in the word list");
  if (it != words.end()) {
    suite.require(it->letters.size() == 5, "ÄPPLE should split into five letters");
    suite.require(it->letters.front() == "Ä", "first letter of ÄPPLE should be Ä");
  }
}

void test_split_graphemes(TestSuite& suite) {
  const auto letters = phon::split_graphemes("NÄS");
  suite.require(letters.size() == 3, "NÄS should split into three letters");
  suite.require(letters.size() == 3 && letters[1] == "Ä", "middle letter of NÄS should be Ä");

  bool threw = false;
  try {
    phon::split_graphemes(std::string("A\xC3"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "truncated UTF-8 should be rejected");
}

void test_validation(TestSuite& suite) {
  using phon::testing::test_letter;
  using phon::Tier;

  suite.require(throws_corrupt([] { phon::load_curriculum({}, {}); }),
                "empty alphabet should be corrupt");

  suite.require(throws_corrupt([] {
                  phon::load_curriculum({test_letter("A", Tier::Easy), test_letter("B", Tier::Medium),
                                         test_letter("C", Tier::Hard)},
                                        {{"AX", Tier::Easy, ""}, {"B", Tier::Medium, ""},
                                         {"C", Tier::Hard, ""}});
                }),
                "word with an unknown letter should be corrupt");

  suite.require(throws_corrupt([] {
                  phon::load_curriculum({test_letter("A", Tier::Easy), test_letter("A", Tier::Medium),
                                         test_letter("C", Tier::Hard)},
                                        {{"A", Tier::Easy, ""}, {"A", Tier::Medium, ""},
                                         {"C", Tier::Hard, ""}});
                }),
                "duplicate letter ids should be corrupt");

  suite.require(throws_corrupt([] {
                  phon::load_curriculum({test_letter("A", Tier::Easy), test_letter("B", Tier::Medium)},
                                        {{"A", Tier::Easy, ""}, {"B", Tier::Medium, ""}});
                }),
                "a tier without letters should be corrupt");

  suite.require(throws_corrupt([] {
                  auto letter = test_letter("A", Tier::Easy);
                  letter.sound_id.clear();
                  phon::load_curriculum({letter, test_letter("B", Tier::Medium),
                                         test_letter("C", Tier::Hard)},
                                        {{"A", Tier::Easy, ""}, {"B", Tier::Medium, ""},
                                         {"C", Tier::Hard, ""}});
                }),
                "letter without a sound should be corrupt");

  const auto curriculum = phon::testing::cat_curriculum();
  bool threw = false;
  try {
    curriculum.letter("Z");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "looking up an unknown letter should throw invalid_argument");
  suite.require(curriculum.find_letter("Z") == nullptr, "find_letter should return null for Z");
}

void test_from_json(TestSuite& suite) {
  const auto document = nlohmann::json::parse(R"({
    "letters": [
      {"id": "A", "sound": "aaa", "name": "ah", "tier": "easy"},
      {"id": "M", "sound": "mmm", "name": "emm", "tier": "medium", "glyph": "m"},
      {"id": "S", "sound": "sss", "name": "ess", "tier": "hard"}
    ],
    "words": [
      {"text": "MAMMA", "tier": "medium", "hint": "mum"},
      {"text": "AS", "tier": "easy"},
      {"text": "SMA", "tier": "hard"}
    ]
  })");
  const auto curriculum = phon::curriculum_from_json(document);
  suite.require(curriculum.letters().size() == 3, "JSON curriculum should have three letters");
  suite.require(curriculum.letter("M").glyph == "m", "explicit glyph should be kept");
  const auto medium = curriculum.words_by_difficulty(phon::Tier::Medium);
  suite.require(medium.size() == 1 && medium.front()->hint == "mum", "hint should be loaded");

  suite.require(throws_corrupt([] {
                  phon::curriculum_from_json(nlohmann::json::parse(
                      R"({"letters": [{"id": "A", "name": "ah", "tier": "easy"}], "words": []})"));
                }),
                "letter without sound should be corrupt");
  suite.require(throws_corrupt([] {
                  phon::curriculum_from_json(nlohmann::json::parse(
                      R"({"letters": [{"id": "A", "sound": "a", "name": "ah", "tier": "expert"}],
                          "words": []})"));
                }),
                "unknown tier should be corrupt");
  suite.require(throws_corrupt([] { phon::curriculum_from_json(nlohmann::json::array()); }),
                "non-object document should be corrupt");
}

} // namespace

int main() {
  TestSuite suite;
  test_builtin_alphabet(suite);
  test_builtin_words(suite);
  test_split_graphemes(suite);
  test_validation(suite);
  test_from_json(suite);

  if (!suite.ok) {
    std::cerr << "Curriculum tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Curriculum tests passed" << std::endl;
  return 0;
}
