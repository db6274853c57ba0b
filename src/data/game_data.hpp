/**
 * Game-data catalog — species and move lookup by name.
 *
 * GameData is the seam the engine consumes; JsonGameData is the
 * file-backed implementation used by the command-line tool.
 *
 * Catalog file format:
 *   {
 *     "species": [ { "name": "Garchomp", "types": ["Dragon", "Ground"],
 *                    "baseStats": { "hp": 108, "atk": 130, ... } } ],
 *     "moves":   [ { "name": "Earthquake", "type": "Ground",
 *                    "category": "physical", "basePower": 100,
 *                    "spread": true } ]
 *   }
 */

#ifndef EVSIM_DATA_GAME_DATA_HPP
#define EVSIM_DATA_GAME_DATA_HPP

#include "core/battle_types.hpp"
#include "io/json_reader.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace evsim::data {

struct SpeciesData {
    std::string name;
    StatsTable base_stats;
    std::vector<std::string> types;
};

struct MoveData {
    std::string name;
    std::string type = "Normal";
    MoveCategory category = MoveCategory::PHYSICAL;
    int base_power = 0;
    int priority = 0;
    double drain = 0.0;         // fraction of damage dealt restored to the user
    double recoil = 0.0;        // fraction of damage dealt taken by the user
    int min_hits = 1;
    int max_hits = 1;
    bool spread = false;        // hits all foes in doubles
};

class GameData {
public:
    virtual ~GameData() = default;

    /// nullptr when the species is not in the catalog.
    virtual const SpeciesData* find_species(const std::string& name) const = 0;

    /// nullptr when the move is not in the catalog.
    virtual const MoveData* find_move(const std::string& name) const = 0;
};

class JsonGameData : public GameData {
public:
    JsonGameData() = default;

    /**
     * Load a catalog file.
     * @throws ConfigurationError on unreadable or malformed catalogs
     */
    static JsonGameData load_file(const std::string& path);

    /// Build from an already-parsed catalog document.
    static JsonGameData from_json(const JsonValue& root);

    void add_species(SpeciesData species);
    void add_move(MoveData move);

    const SpeciesData* find_species(const std::string& name) const override;
    const MoveData* find_move(const std::string& name) const override;

    size_t species_count() const { return species_.size(); }
    size_t move_count() const { return moves_.size(); }

private:
    std::unordered_map<std::string, SpeciesData> species_;
    std::unordered_map<std::string, MoveData> moves_;
};

/**
 * Type a move is used as: explicit override first, then Tera Blast's tera
 * type, then the catalog type. Unknown moves (or no catalog) are Normal.
 */
std::string resolve_move_type(const GameData* data, const MoveConfig& move,
                              const Combatant& attacker);

} // namespace evsim::data

#endif // EVSIM_DATA_GAME_DATA_HPP
