#include "resources/builtin_curriculum.hpp"

namespace phon::builtin {
namespace {

Letter make_letter(const char* id, const char* name, const char* sound, Tier tier) {
  Letter letter;
  letter.id = id;
  letter.glyph = id;
  letter.name = name;
  letter.sound_id = sound;
  letter.tier = tier;
  return letter;
}

} // namespace

const std::vector<Letter>& swedish_letters() {
  static const std::vector<Letter> letters = {
      make_letter("A", "ah", "aaa", Tier::Easy),
      make_letter("B", "beh", "bbb", Tier::Medium),
      make_letter("C", "seh", "sss", Tier::Hard),
      make_letter("D", "deh", "ddd", Tier::Medium),
      make_letter("E", "eh", "eee", Tier::Easy),
      make_letter("F", "eff", "fff", Tier::Medium),
      make_letter("G", "geh", "ggg", Tier::Medium),
      make_letter("H", "hå", "hhh", Tier::Medium),
      make_letter("I", "ih", "iii", Tier::Easy),
      make_letter("J", "jih", "jjj", Tier::Hard),
      make_letter("K", "kå", "kkk", Tier::Medium),
      make_letter("L", "ell", "lll", Tier::Easy),
      make_letter("M", "emm", "mmm", Tier::Easy),
      make_letter("N", "enn", "nnn", Tier::Easy),
      make_letter("O", "oh", "ooo", Tier::Easy),
      make_letter("P", "peh", "ppp", Tier::Medium),
      make_letter("Q", "kuh", "kkk", Tier::Hard),
      make_letter("R", "err", "rrr", Tier::Easy),
      make_letter("S", "ess", "sss", Tier::Easy),
      make_letter("T", "teh", "ttt", Tier::Medium),
      make_letter("U", "uh", "uuu", Tier::Easy),
      make_letter("V", "veh", "vvv", Tier::Medium),
      make_letter("W", "dubbelveh", "vvv", Tier::Hard),
      make_letter("X", "eks", "ks", Tier::Hard),
      make_letter("Y", "yh", "yyy", Tier::Hard),
      make_letter("Z", "seta", "sss", Tier::Hard),
      make_letter("Å", "å", "ååå", Tier::Medium),
      make_letter("Ä", "äh", "äää", Tier::Hard),
      make_letter("Ö", "öh", "ööö", Tier::Hard),
  };
  return letters;
}

const std::vector<WordEntry>& swedish_words() {
  static const std::vector<WordEntry> words = {
      // EASY
      {"SOL", Tier::Easy, "sun"},
      {"KAT", Tier::Easy, "cat"},
      {"HUS", Tier::Easy, "house"},
      {"BIL", Tier::Easy, "car"},
      {"MUS", Tier::Easy, "mouse"},
      {"HÅR", Tier::Easy, "hair"},
      {"BÅT", Tier::Easy, "boat"},
      {"ÖGA", Tier::Easy, "eye"},
      {"ARM", Tier::Easy, "arm"},
      {"BEN", Tier::Easy, "leg"},
      {"LÅS", Tier::Easy, "lock"},
      {"NÄS", Tier::Easy, "nose"},
      // MEDIUM
      {"BOLL", Tier::Medium, "ball"},
      {"LAMM", Tier::Medium, "lamb"},
      {"FISK", Tier::Medium, "fish"},
      {"GRIS", Tier::Medium, "pig"},
      {"HUND", Tier::Medium, "dog"},
      {"KATT", Tier::Medium, "cat"},
      {"STOL", Tier::Medium, "chair"},
      {"DÖRR", Tier::Medium, "door"},
      {"BLAD", Tier::Medium, "leaf"},
      {"SNÄL", Tier::Medium, "kind"},
      {"GLAD", Tier::Medium, "happy"},
      {"STOR", Tier::Medium, "big"},
      // HARD
      {"ÄPPLE", Tier::Hard, "apple"},
      {"SKOLA", Tier::Hard, "school"},
      {"BJÖRN", Tier::Hard, "bear"},
      {"BLOMMA", Tier::Hard, "flower"},
      {"STJÄRNA", Tier::Hard, "star"},
      {"TRÄD", Tier::Hard, "tree"},
      {"SJUNGA", Tier::Hard, "sing"},
      {"HIMMEL", Tier::Hard, "sky"},
      {"VATTEN", Tier::Hard, "water"},
  };
  return words;
}

} // namespace phon::builtin
