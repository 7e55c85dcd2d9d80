/**
 * dexref - Historical Override Matcher
 *
 * A change record tagged with generation G applies to queries at
 * generations <= G. For a target generation the applicable record is the
 * one with the smallest tag still >= target; with none, the base value
 * applies.
 *
 * The matcher is generic over a Past adapter exposing generation() and
 * value(). One adapter exists per change-record kind.
 */

#pragma once

#include "records.hpp"
#include <type_traits>
#include <utility>

namespace dexref {

/**
 * Resolve which historical record applies at target.
 *
 * Scans the whole collection; input order is irrelevant.
 */
template <typename Past>
auto match_override(Generation target, const std::vector<Past>& pasts)
    -> std::optional<std::decay_t<decltype(std::declval<const Past&>().value())>> {
    using Value = std::decay_t<decltype(std::declval<const Past&>().value())>;

    const Past* oldest = nullptr;
    Generation oldest_generation = 0;

    for (const auto& past : pasts) {
        Generation generation = past.generation();
        if (generation < target) continue;
        if (oldest == nullptr || generation < oldest_generation) {
            oldest = &past;
            oldest_generation = generation;
        }
    }

    if (oldest == nullptr) return std::nullopt;
    return std::optional<Value>(oldest->value());
}

/**
 * Wrap a vector of change rows in their adapter type.
 */
template <typename Past, typename Row>
std::vector<Past> as_pasts(const std::vector<Row>& rows) {
    std::vector<Past> pasts;
    pasts.reserve(rows.size());
    for (const auto& row : rows) {
        pasts.emplace_back(row);
    }
    return pasts;
}

// ============================================================================
// ADAPTERS
// ============================================================================

/**
 * Past move values.
 *
 * Upstream tags move history with the generation it stopped applying in,
 * so the effective tag is one lower.
 */
class MovePast {
public:
    explicit MovePast(const MoveChangeRow& row) : row_(&row) {}

    Generation generation() const { return row_->generation - 1; }
    const MoveChangeRow& value() const { return *row_; }

private:
    const MoveChangeRow* row_;
};

/**
 * Past ability effect text. Same tagging as MovePast.
 */
class AbilityPast {
public:
    explicit AbilityPast(const AbilityChangeRow& row) : row_(&row) {}

    Generation generation() const { return row_->generation - 1; }
    const std::string& value() const { return row_->effect; }

private:
    const AbilityChangeRow* row_;
};

/**
 * Past damage relations, replaced as a whole.
 */
class TypePast {
public:
    explicit TypePast(const TypeChangeRow& row) : row_(&row) {}

    Generation generation() const { return row_->generation; }
    const DamageRelations& value() const { return row_->relations; }

private:
    const TypeChangeRow* row_;
};

/**
 * Past primary/secondary type pair of a Pokémon.
 */
class PokemonTypePast {
public:
    using TypePair = std::pair<std::string, std::optional<std::string>>;

    explicit PokemonTypePast(const PokemonTypeChangeRow& row) : row_(&row) {}

    Generation generation() const { return row_->generation; }
    TypePair value() const { return {row_->primary_type, row_->secondary_type}; }

private:
    const PokemonTypeChangeRow* row_;
};

} // namespace dexref
