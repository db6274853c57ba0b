/**
 * Generation 6+ type chart.
 *
 * Row = attacking type, column = defending type, both in TYPE_NAMES order.
 *   '.' neutral   's' super effective   'h' resisted   '0' immune
 */

#include "data/type_chart.hpp"

namespace evsim::data {

namespace {

constexpr int NUM_TYPES = 18;

constexpr const char* TYPE_NAMES[NUM_TYPES] = {
    "Normal", "Fire", "Water", "Electric", "Grass", "Ice",
    "Fighting", "Poison", "Ground", "Flying", "Psychic", "Bug",
    "Rock", "Ghost", "Dragon", "Dark", "Steel", "Fairy"
};

constexpr const char* CHART[NUM_TYPES] = {
    "............h0..h.",   // Normal
    ".hh.ss.....sh.h.s.",   // Fire
    ".sh.h...s...s.h...",   // Water
    "..shh...0s....h...",   // Electric
    ".hs.h..hsh.hs.h.h.",   // Grass
    ".hh.sh..ss....s.h.",   // Ice
    "s....s.h.hhhs0.ssh",   // Fighting
    "....s..hh...hh..0s",   // Poison
    ".s.sh..s.0.hs...s.",   // Ground
    "...hs.s....sh...h.",   // Flying
    "......ss..h....0h.",   // Psychic
    ".h..s.hh.hs..h.shh",   // Bug
    ".s...sh.hs.s....h.",   // Rock
    "0.........s..s.h..",   // Ghost
    "..............s.h0",   // Dragon
    "......h...s..s.h.h",   // Dark
    ".hhh.s......s...hs",   // Steel
    ".h....sh......ssh.",   // Fairy
};

int type_index(const std::string& type) {
    for (int i = 0; i < NUM_TYPES; i++) {
        if (type == TYPE_NAMES[i]) return i;
    }
    return -1;
}

} // anonymous namespace

double type_effectiveness(const std::string& attacking, const std::string& defending) {
    int row = type_index(attacking);
    int col = type_index(defending);
    if (row < 0 || col < 0) return 1.0;

    switch (CHART[row][col]) {
        case 's': return 2.0;
        case 'h': return 0.5;
        case '0': return 0.0;
        default:  return 1.0;
    }
}

double type_effectiveness(const std::string& attacking,
                          const std::vector<std::string>& defending) {
    double total = 1.0;
    for (const auto& type : defending) {
        total *= type_effectiveness(attacking, type);
    }
    return total;
}

bool is_known_type(const std::string& type) {
    return type_index(type) >= 0;
}

} // namespace evsim::data
