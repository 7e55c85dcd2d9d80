/**
 * dexref - Core Type Definitions
 *
 * Enums, aliases and the fixed type roster shared by every component.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace dexref {

// ============================================================================
// TYPE ALIASES
// ============================================================================

using Generation = int;               // 1..=current ruleset epoch
using RowID = int64_t;                // Primary key of a stored record

// ============================================================================
// ENUMS
// ============================================================================

enum class ResourceKind : uint8_t {
    POKEMON,
    MOVES,
    ABILITIES,
    TYPES,
    GAMES,
    SPECIES
};

enum class ChartKind : uint8_t {
    OFFENSE,
    DEFENSE
};

// Ordered strongest to weakest, matching display order.
enum class WeaknessTier : uint8_t {
    QUAD,
    DOUBLE,
    NEUTRAL,
    HALF,
    QUARTER,
    ZERO,
    OTHER
};

constexpr size_t WEAKNESS_TIER_COUNT = 7;

enum class PokemonGroup : uint8_t {
    REGULAR,
    LEGENDARY,
    MYTHICAL,
    BABY
};

enum class ResolutionErrorKind : uint8_t {
    NOT_FOUND,
    NOT_PRESENT_IN_GENERATION,
    MALFORMED_OVERRIDE
};

// ============================================================================
// TYPE ROSTER
// ============================================================================

constexpr size_t TYPE_COUNT = 18;

/**
 * Every type a chart is populated with. Charts are dense over this roster.
 */
inline const std::array<std::string, TYPE_COUNT>& all_type_names() {
    static const std::array<std::string, TYPE_COUNT> names = {
        "normal", "fighting", "flying", "poison", "ground", "rock",
        "bug", "ghost", "steel", "fire", "water", "grass",
        "electric", "psychic", "ice", "dragon", "dark", "fairy"
    };
    return names;
}

inline bool is_known_type(const std::string& name) {
    for (const auto& type_name : all_type_names()) {
        if (type_name == name) return true;
    }
    return false;
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(WeaknessTier tier) {
    switch (tier) {
        case WeaknessTier::QUAD: return "quad";
        case WeaknessTier::DOUBLE: return "double";
        case WeaknessTier::NEUTRAL: return "neutral";
        case WeaknessTier::HALF: return "half";
        case WeaknessTier::QUARTER: return "quarter";
        case WeaknessTier::ZERO: return "zero";
        case WeaknessTier::OTHER: return "other";
        default: return "unknown";
    }
}

inline const char* to_string(PokemonGroup group) {
    switch (group) {
        case PokemonGroup::REGULAR: return "regular";
        case PokemonGroup::LEGENDARY: return "legendary";
        case PokemonGroup::MYTHICAL: return "mythical";
        case PokemonGroup::BABY: return "baby";
        default: return "unknown";
    }
}

inline const char* to_string(ChartKind kind) {
    switch (kind) {
        case ChartKind::OFFENSE: return "offense";
        case ChartKind::DEFENSE: return "defense";
        default: return "unknown";
    }
}

inline const char* to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::POKEMON: return "Pokémon";
        case ResourceKind::MOVES: return "Move";
        case ResourceKind::ABILITIES: return "Ability";
        case ResourceKind::TYPES: return "Type";
        case ResourceKind::GAMES: return "Game";
        case ResourceKind::SPECIES: return "Species";
        default: return "Resource";
    }
}

inline const char* to_string(ResolutionErrorKind kind) {
    switch (kind) {
        case ResolutionErrorKind::NOT_FOUND: return "not_found";
        case ResolutionErrorKind::NOT_PRESENT_IN_GENERATION: return "not_present_in_generation";
        case ResolutionErrorKind::MALFORMED_OVERRIDE: return "malformed_override";
        default: return "unknown";
    }
}

} // namespace dexref
