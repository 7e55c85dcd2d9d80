/**
 * dexref - Type Chart Engine
 *
 * Dense multiplier tables over the full type roster, dual-type composition,
 * and classification of multipliers into weakness tiers.
 */

#pragma once

#include "records.hpp"
#include <functional>
#include <map>
#include <utility>

namespace dexref {

// ============================================================================
// TYPE CHART
// ============================================================================

/**
 * TypeChart - Multiplier per type name.
 *
 * An offense chart holds the damage this type deals to each type; a
 * defense chart holds the damage it takes from each type. Built charts are
 * always dense over all_type_names(). Iteration is alphabetical.
 */
class TypeChart {
public:
    TypeChart() = default;
    TypeChart(ChartKind kind, std::string label);

    /**
     * A chart with every roster type at 1.0.
     */
    static TypeChart neutral(ChartKind kind, const std::string& label);

    ChartKind kind() const { return kind_; }
    const std::string& label() const { return label_; }
    const std::map<std::string, float>& values() const { return values_; }

    void set(const std::string& type_name, float multiplier);

    /**
     * Multiplier for type_name, or nullopt if the name is not in the table.
     */
    std::optional<float> multiplier_of(const std::string& type_name) const;

    /**
     * Type-by-type product of two charts. Keys present in only one chart
     * keep that chart's value. Labels are joined with a space.
     */
    TypeChart combine(const TypeChart& other) const;

    bool operator==(const TypeChart& other) const {
        return kind_ == other.kind_ && values_ == other.values_;
    }

private:
    ChartKind kind_ = ChartKind::DEFENSE;
    std::string label_;
    std::map<std::string, float> values_;
};

struct TypeCharts {
    TypeChart offense;
    TypeChart defense;
};

/**
 * Build both charts of a single type from its damage relations.
 */
TypeCharts build_charts(const std::string& type_name, const DamageRelations& relations);

// ============================================================================
// WEAKNESS TIERS
// ============================================================================

/**
 * Classify by exact comparison against {4, 2, 1, 0.5, 0.25, 0}.
 */
WeaknessTier classify(float multiplier);

/**
 * Items partitioned into the seven tiers, preserving input order per tier.
 */
template <typename T>
struct WeaknessGroups {
    std::array<std::vector<T>, WEAKNESS_TIER_COUNT> tiers;

    std::vector<T>& at(WeaknessTier tier) { return tiers[static_cast<size_t>(tier)]; }
    const std::vector<T>& at(WeaknessTier tier) const { return tiers[static_cast<size_t>(tier)]; }

    bool empty() const {
        for (const auto& tier : tiers) {
            if (!tier.empty()) return false;
        }
        return true;
    }

    size_t total() const {
        size_t count = 0;
        for (const auto& tier : tiers) count += tier.size();
        return count;
    }
};

/**
 * Group items by the tier of their multiplier.
 *
 * extractor returns the (value, multiplier) pair to file, or nullopt to
 * drop the item.
 */
template <typename T, typename Item>
WeaknessGroups<T> group_by_tier(
    const std::vector<Item>& items,
    const std::function<std::optional<std::pair<T, float>>(const Item&)>& extractor) {
    WeaknessGroups<T> groups;
    for (const auto& item : items) {
        auto entry = extractor(item);
        if (!entry) continue;
        groups.at(classify(entry->second)).push_back(std::move(entry->first));
    }
    return groups;
}

/**
 * Group the type names of a chart by tier.
 */
WeaknessGroups<std::string> group_chart(const TypeChart& chart);

} // namespace dexref
