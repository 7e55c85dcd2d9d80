/**
 * dexref - Python Bindings
 *
 * pybind11 wrapper for the resolution and type-effectiveness engine.
 * Failed resolutions raise ValueError carrying the resolution message.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "dexref/dexref.hpp"
#include "dexref/custom.hpp"
#include "dexref/name_validator.hpp"

namespace py = pybind11;

namespace {

template <typename T>
T unwrap(dexref::Resolution<T> result) {
    if (!result.ok()) {
        throw py::value_error(result.error.message);
    }
    return std::move(result.get());
}

template <typename T>
void bind_weakness_groups(py::module_& m, const char* name) {
    py::class_<dexref::WeaknessGroups<T>>(m, name)
        .def("at", py::overload_cast<dexref::WeaknessTier>(&dexref::WeaknessGroups<T>::at, py::const_))
        .def("empty", &dexref::WeaknessGroups<T>::empty)
        .def("total", &dexref::WeaknessGroups<T>::total);
}

} // namespace

PYBIND11_MODULE(dexref_cpp, m) {
    m.doc() = "Generation-aware Pokémon ruleset resolution and type-effectiveness engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<dexref::ResourceKind>(m, "ResourceKind")
        .value("POKEMON", dexref::ResourceKind::POKEMON)
        .value("MOVES", dexref::ResourceKind::MOVES)
        .value("ABILITIES", dexref::ResourceKind::ABILITIES)
        .value("TYPES", dexref::ResourceKind::TYPES)
        .value("GAMES", dexref::ResourceKind::GAMES)
        .value("SPECIES", dexref::ResourceKind::SPECIES)
        .export_values();

    py::enum_<dexref::ChartKind>(m, "ChartKind")
        .value("OFFENSE", dexref::ChartKind::OFFENSE)
        .value("DEFENSE", dexref::ChartKind::DEFENSE)
        .export_values();

    py::enum_<dexref::WeaknessTier>(m, "WeaknessTier")
        .value("QUAD", dexref::WeaknessTier::QUAD)
        .value("DOUBLE", dexref::WeaknessTier::DOUBLE)
        .value("NEUTRAL", dexref::WeaknessTier::NEUTRAL)
        .value("HALF", dexref::WeaknessTier::HALF)
        .value("QUARTER", dexref::WeaknessTier::QUARTER)
        .value("ZERO", dexref::WeaknessTier::ZERO)
        .value("OTHER", dexref::WeaknessTier::OTHER)
        .export_values();

    py::enum_<dexref::PokemonGroup>(m, "PokemonGroup")
        .value("REGULAR", dexref::PokemonGroup::REGULAR)
        .value("LEGENDARY", dexref::PokemonGroup::LEGENDARY)
        .value("MYTHICAL", dexref::PokemonGroup::MYTHICAL)
        .value("BABY", dexref::PokemonGroup::BABY)
        .export_values();

    // ========================================================================
    // TYPE CHARTS
    // ========================================================================

    py::class_<dexref::DamageRelations>(m, "DamageRelations")
        .def(py::init<>())
        .def_readwrite("no_damage_to", &dexref::DamageRelations::no_damage_to)
        .def_readwrite("half_damage_to", &dexref::DamageRelations::half_damage_to)
        .def_readwrite("double_damage_to", &dexref::DamageRelations::double_damage_to)
        .def_readwrite("no_damage_from", &dexref::DamageRelations::no_damage_from)
        .def_readwrite("half_damage_from", &dexref::DamageRelations::half_damage_from)
        .def_readwrite("double_damage_from", &dexref::DamageRelations::double_damage_from);

    py::class_<dexref::TypeChart>(m, "TypeChart")
        .def_static("neutral", &dexref::TypeChart::neutral)
        .def_property_readonly("kind", &dexref::TypeChart::kind)
        .def_property_readonly("label", &dexref::TypeChart::label)
        .def_property_readonly("values", &dexref::TypeChart::values)
        .def("multiplier_of", &dexref::TypeChart::multiplier_of)
        .def("combine", &dexref::TypeChart::combine)
        .def(py::self == py::self);

    py::class_<dexref::TypeCharts>(m, "TypeCharts")
        .def_readonly("offense", &dexref::TypeCharts::offense)
        .def_readonly("defense", &dexref::TypeCharts::defense);

    m.def("build_charts", &dexref::build_charts);
    m.def("classify", &dexref::classify);
    m.def("group_chart", &dexref::group_chart);
    m.def("all_type_names", []() {
        const auto& names = dexref::all_type_names();
        return std::vector<std::string>(names.begin(), names.end());
    });

    bind_weakness_groups<std::string>(m, "TypeGroups");

    // ========================================================================
    // SNAPSHOTS
    // ========================================================================

    py::class_<dexref::MoveSnapshot>(m, "Move")
        .def_readonly("name", &dexref::MoveSnapshot::name)
        .def_readonly("power", &dexref::MoveSnapshot::power)
        .def_readonly("accuracy", &dexref::MoveSnapshot::accuracy)
        .def_readonly("pp", &dexref::MoveSnapshot::pp)
        .def_readonly("effect_chance", &dexref::MoveSnapshot::effect_chance)
        .def_readonly("type", &dexref::MoveSnapshot::type)
        .def_readonly("damage_class", &dexref::MoveSnapshot::damage_class)
        .def_readonly("generation", &dexref::MoveSnapshot::generation)
        .def("effect_text", &dexref::MoveSnapshot::effect_text)
        .def("is_damaging", &dexref::MoveSnapshot::is_damaging);

    py::class_<dexref::TypeSnapshot>(m, "Type")
        .def_readonly("name", &dexref::TypeSnapshot::name)
        .def_readonly("relations", &dexref::TypeSnapshot::relations)
        .def_readonly("generation", &dexref::TypeSnapshot::generation)
        .def("charts", &dexref::TypeSnapshot::charts);

    py::class_<dexref::AbilitySnapshot>(m, "Ability")
        .def_readonly("name", &dexref::AbilitySnapshot::name)
        .def_readonly("effect", &dexref::AbilitySnapshot::effect)
        .def_readonly("generation", &dexref::AbilitySnapshot::generation);

    py::class_<dexref::Stats>(m, "Stats")
        .def_readonly("hp", &dexref::Stats::hp)
        .def_readonly("attack", &dexref::Stats::attack)
        .def_readonly("defense", &dexref::Stats::defense)
        .def_readonly("special_attack", &dexref::Stats::special_attack)
        .def_readonly("special_defense", &dexref::Stats::special_defense)
        .def_readonly("speed", &dexref::Stats::speed)
        .def("total", &dexref::Stats::total);

    py::class_<dexref::LearnMove>(m, "LearnMove")
        .def_readonly("name", &dexref::LearnMove::name)
        .def_readonly("learn_method", &dexref::LearnMove::learn_method)
        .def_readonly("learn_level", &dexref::LearnMove::learn_level);

    py::class_<dexref::PokemonAbility>(m, "PokemonAbility")
        .def_readonly("name", &dexref::PokemonAbility::name)
        .def_readonly("is_hidden", &dexref::PokemonAbility::is_hidden);

    py::class_<dexref::PokemonSnapshot>(m, "PokemonSnapshot")
        .def_readonly("name", &dexref::PokemonSnapshot::name)
        .def_readonly("nickname", &dexref::PokemonSnapshot::nickname)
        .def_readonly("species", &dexref::PokemonSnapshot::species)
        .def_readonly("primary_type", &dexref::PokemonSnapshot::primary_type)
        .def_readonly("secondary_type", &dexref::PokemonSnapshot::secondary_type)
        .def_readonly("stats", &dexref::PokemonSnapshot::stats)
        .def_readonly("group", &dexref::PokemonSnapshot::group)
        .def_readonly("learn_moves", &dexref::PokemonSnapshot::learn_moves)
        .def_readonly("abilities", &dexref::PokemonSnapshot::abilities)
        .def_readonly("generation", &dexref::PokemonSnapshot::generation)
        .def("types", &dexref::PokemonSnapshot::types);

    py::class_<dexref::Pokemon>(m, "Pokemon")
        .def_readonly("snapshot", &dexref::Pokemon::snapshot)
        .def_readonly("defense_chart", &dexref::Pokemon::defense_chart)
        .def_readonly("moves", &dexref::Pokemon::moves)
        .def_property_readonly("name", &dexref::Pokemon::name);

    py::class_<dexref::TypePairCharts>(m, "TypePairCharts")
        .def_readonly("primary", &dexref::TypePairCharts::primary)
        .def_readonly("secondary", &dexref::TypePairCharts::secondary)
        .def_readonly("primary_offense", &dexref::TypePairCharts::primary_offense)
        .def_readonly("secondary_offense", &dexref::TypePairCharts::secondary_offense)
        .def_readonly("defense", &dexref::TypePairCharts::defense);

    // ========================================================================
    // EVOLUTION
    // ========================================================================

    py::class_<dexref::EvolutionMethod>(m, "EvolutionMethod")
        .def_readonly("trigger", &dexref::EvolutionMethod::trigger)
        .def_readonly("item", &dexref::EvolutionMethod::item)
        .def_readonly("min_level", &dexref::EvolutionMethod::min_level)
        .def_readonly("time_of_day", &dexref::EvolutionMethod::time_of_day)
        .def("describe", &dexref::EvolutionMethod::describe);

    py::class_<dexref::EvolutionStep>(m, "EvolutionStep")
        .def_readonly("name", &dexref::EvolutionStep::name)
        .def_readonly("methods", &dexref::EvolutionStep::methods)
        .def_readonly("evolves_to", &dexref::EvolutionStep::evolves_to)
        .def("size", &dexref::EvolutionStep::size);

    // ========================================================================
    // ANALYSIS
    // ========================================================================

    py::class_<dexref::CoverageEntry>(m, "CoverageEntry")
        .def_readonly("pokemon", &dexref::CoverageEntry::pokemon)
        .def_readonly("via_types", &dexref::CoverageEntry::via_types)
        .def_readonly("multiplier", &dexref::CoverageEntry::multiplier);

    py::class_<dexref::CoverageReport>(m, "CoverageReport")
        .def_readonly("offense", &dexref::CoverageReport::offense)
        .def_readonly("defense", &dexref::CoverageReport::defense);

    py::class_<dexref::MoveMatchup>(m, "MoveMatchup")
        .def_readonly("move", &dexref::MoveMatchup::move)
        .def_readonly("multiplier", &dexref::MoveMatchup::multiplier)
        .def_readonly("stab", &dexref::MoveMatchup::stab);

    bind_weakness_groups<dexref::MoveMatchup>(m, "MoveGroups");

    py::class_<dexref::MatchupOptions>(m, "MatchupOptions")
        .def(py::init<>())
        .def_readwrite("verbose", &dexref::MatchupOptions::verbose)
        .def_readwrite("stab_only", &dexref::MatchupOptions::stab_only);

    py::class_<dexref::MatchupReport>(m, "MatchupReport")
        .def_readonly("attacker_vs_defender", &dexref::MatchupReport::attacker_vs_defender)
        .def_readonly("defender_vs_attacker", &dexref::MatchupReport::defender_vs_attacker);

    // ========================================================================
    // STORAGE
    // ========================================================================

    py::class_<dexref::ResourceStore>(m, "ResourceStore")
        .def("select_all_names", &dexref::ResourceStore::select_all_names);

    py::class_<dexref::JsonResourceStore, dexref::ResourceStore>(m, "JsonResourceStore")
        .def(py::init<>())
        .def("load_from_json", &dexref::JsonResourceStore::load_from_json)
        .def("load_from_string", &dexref::JsonResourceStore::load_from_string)
        .def("dataset_version", &dexref::JsonResourceStore::dataset_version)
        .def("last_error", &dexref::JsonResourceStore::last_error)
        .def("pokemon_count", &dexref::JsonResourceStore::pokemon_count)
        .def("move_count", &dexref::JsonResourceStore::move_count);

    py::class_<dexref::CustomPokemon>(m, "CustomPokemon")
        .def(py::init<>())
        .def_readwrite("nickname", &dexref::CustomPokemon::nickname)
        .def_readwrite("base", &dexref::CustomPokemon::base)
        .def_readwrite("generation", &dexref::CustomPokemon::generation)
        .def_readwrite("moves", &dexref::CustomPokemon::moves)
        .def_readwrite("types", &dexref::CustomPokemon::types);

    py::class_<dexref::CustomCollection>(m, "CustomCollection")
        .def(py::init<>())
        .def("load_from_json", &dexref::CustomCollection::load_from_json)
        .def("save_to_json", &dexref::CustomCollection::save_to_json)
        .def("find_pokemon", &dexref::CustomCollection::find_pokemon, py::return_value_policy::reference)
        .def("add", &dexref::CustomCollection::add)
        .def("size", &dexref::CustomCollection::size);

    // ========================================================================
    // RESOLUTION
    // ========================================================================

    m.def("generation_of_game", [](const dexref::ResourceStore& store, const std::string& game) {
        return unwrap(dexref::GenerationResolver::from_store(store).generation_of_game(game));
    });
    m.def("generation_of_reference", [](const std::string& ref) {
        return unwrap(dexref::GenerationResolver().generation_of_reference(ref));
    });

    m.def("resolve_move", [](const std::string& name, dexref::Generation generation,
                             const dexref::ResourceStore& store) {
        return unwrap(dexref::resolve_move(name, generation, store));
    });
    m.def("resolve_type", [](const std::string& name, dexref::Generation generation,
                             const dexref::ResourceStore& store) {
        return unwrap(dexref::resolve_type(name, generation, store));
    });
    m.def("resolve_ability", [](const std::string& name, dexref::Generation generation,
                                const dexref::ResourceStore& store) {
        return unwrap(dexref::resolve_ability(name, generation, store));
    });
    m.def("resolve_pokemon", [](const std::string& name, dexref::Generation generation,
                                const dexref::ResourceStore& store) {
        return unwrap(dexref::resolve_pokemon(name, generation, store));
    });
    m.def("resolve_type_pair", [](const std::string& primary, std::optional<std::string> secondary,
                                  dexref::Generation generation, const dexref::ResourceStore& store) {
        return unwrap(dexref::resolve_type_pair(primary, secondary, generation, store));
    });
    m.def("defense_chart_of", [](const dexref::PokemonSnapshot& snapshot, const dexref::ResourceStore& store) {
        return unwrap(dexref::defense_chart_of(snapshot, store));
    });
    m.def("load_pokemon", [](const std::string& name, dexref::Generation generation,
                             const dexref::ResourceStore& store, const dexref::CustomCollection* custom) {
        return unwrap(dexref::load_pokemon(name, generation, store, custom));
    }, py::arg("name"), py::arg("generation"), py::arg("store"), py::arg("custom") = nullptr);
    m.def("evolution_tree_of", [](const std::string& species, const dexref::ResourceStore& store) {
        return unwrap(dexref::evolution_tree_of(species, store));
    });
    m.def("validate_name", [](const dexref::ResourceStore& store, dexref::ResourceKind kind,
                              const std::string& value) {
        return unwrap(dexref::NameValidator(store).validate(kind, value));
    });

    m.def("coverage_report", [](const std::vector<dexref::Pokemon>& roster, const dexref::ResourceStore& store) {
        return unwrap(dexref::coverage_report(roster, store));
    });
    m.def("matchup_report", &dexref::matchup_report);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = dexref::get_version();
    m.attr("__version__") = dexref::get_version();
}
