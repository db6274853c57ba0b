#include "data/game_data.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace evsim::data {

namespace {

// "Iron Hands", "iron-hands" and "ironhands" all resolve to the same entry.
std::string to_id(const std::string& name) {
    std::string id;
    id.reserve(name.size());
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) id += static_cast<char>(std::tolower(u));
    }
    return id;
}

SpeciesData parse_species(const JsonValue& def) {
    SpeciesData species;
    species.name = def["name"].get_string();
    if (species.name.empty()) {
        throw ConfigurationError("Catalog species entry without a name");
    }

    const JsonValue& stats = def["baseStats"];
    if (!stats.is_object()) {
        throw ConfigurationError("Catalog species '" + species.name + "' has no baseStats");
    }
    for (StatId stat : ALL_STATS) {
        const JsonValue& v = stats[stat_to_string(stat)];
        if (!v.is_number()) {
            throw ConfigurationError("Catalog species '" + species.name +
                                     "' is missing base " + stat_to_string(stat));
        }
        species.base_stats[stat] = v.as_int();
    }

    for (const auto& t : def["types"].as_array()) {
        if (t.is_string()) species.types.push_back(t.as_string());
    }
    return species;
}

MoveData parse_move(const JsonValue& def) {
    MoveData move;
    move.name = def["name"].get_string();
    if (move.name.empty()) {
        throw ConfigurationError("Catalog move entry without a name");
    }
    move.type = def["type"].get_string("Normal");
    move.category = category_from_string(def["category"].get_string("physical"),
                                          MoveCategory::PHYSICAL);
    move.base_power = def["basePower"].get_int(0);
    move.priority = def["priority"].get_int(0);
    move.drain = def["drain"].get_number(0.0);
    move.recoil = def["recoil"].get_number(0.0);
    move.spread = def["spread"].get_bool(false);

    const JsonValue& hits = def["multihit"];
    double lo = 1.0;
    double hi = 1.0;
    if (hits.is_number()) {
        lo = hi = hits.as_number();
    } else {
        hits.get_number_pair(lo, hi);
    }
    move.min_hits = std::max(1, static_cast<int>(lo));
    move.max_hits = std::max(move.min_hits, static_cast<int>(hi));
    return move;
}

} // anonymous namespace

JsonGameData JsonGameData::load_file(const std::string& path) {
    JsonValue root;
    try {
        root = JsonReader::parse_file(path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError("Cannot load game data: " + std::string(e.what()));
    }
    return from_json(root);
}

JsonGameData JsonGameData::from_json(const JsonValue& root) {
    if (!root.is_object()) {
        throw ConfigurationError("Game data root must be an object");
    }

    JsonGameData catalog;
    for (const auto& def : root["species"].as_array()) {
        catalog.add_species(parse_species(def));
    }
    for (const auto& def : root["moves"].as_array()) {
        catalog.add_move(parse_move(def));
    }
    return catalog;
}

void JsonGameData::add_species(SpeciesData species) {
    std::string id = to_id(species.name);
    species_[id] = std::move(species);
}

void JsonGameData::add_move(MoveData move) {
    std::string id = to_id(move.name);
    moves_[id] = std::move(move);
}

const SpeciesData* JsonGameData::find_species(const std::string& name) const {
    auto it = species_.find(to_id(name));
    return it != species_.end() ? &it->second : nullptr;
}

const MoveData* JsonGameData::find_move(const std::string& name) const {
    auto it = moves_.find(to_id(name));
    return it != moves_.end() ? &it->second : nullptr;
}

std::string resolve_move_type(const GameData* data, const MoveConfig& move,
                              const Combatant& attacker) {
    if (!move.type_override.empty()) return move.type_override;
    if (move.name == "Tera Blast") {
        const std::string& tera = move.tera_type.empty() ? attacker.tera_type : move.tera_type;
        if (!tera.empty()) return tera;
    }
    const MoveData* found = data ? data->find_move(move.name) : nullptr;
    return found ? found->type : "Normal";
}

} // namespace evsim::data
