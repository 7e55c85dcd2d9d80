/**
 * dexref - Type Chart Engine Implementation
 */

#include "dexref/type_chart.hpp"

namespace dexref {

TypeChart::TypeChart(ChartKind kind, std::string label)
    : kind_(kind), label_(std::move(label)) {}

TypeChart TypeChart::neutral(ChartKind kind, const std::string& label) {
    TypeChart chart(kind, label);
    for (const auto& type_name : all_type_names()) {
        chart.values_[type_name] = 1.0f;
    }
    return chart;
}

void TypeChart::set(const std::string& type_name, float multiplier) {
    values_[type_name] = multiplier;
}

std::optional<float> TypeChart::multiplier_of(const std::string& type_name) const {
    auto it = values_.find(type_name);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

TypeChart TypeChart::combine(const TypeChart& other) const {
    std::string label = label_;
    if (!other.label_.empty()) {
        label = label.empty() ? other.label_ : label + " " + other.label_;
    }

    TypeChart result(kind_, label);
    result.values_ = values_;
    for (const auto& entry : other.values_) {
        auto it = result.values_.find(entry.first);
        if (it != result.values_.end()) {
            it->second *= entry.second;
        } else {
            result.values_.insert(entry);
        }
    }
    return result;
}

TypeCharts build_charts(const std::string& type_name, const DamageRelations& relations) {
    TypeCharts charts{TypeChart::neutral(ChartKind::OFFENSE, type_name),
                      TypeChart::neutral(ChartKind::DEFENSE, type_name)};

    // Relations naming types outside the fixed roster are ignored
    auto apply = [](TypeChart& chart, const std::vector<std::string>& names, float multiplier) {
        for (const auto& t : names) {
            if (is_known_type(t)) chart.set(t, multiplier);
        }
    };

    apply(charts.offense, relations.no_damage_to, 0.0f);
    apply(charts.offense, relations.half_damage_to, 0.5f);
    apply(charts.offense, relations.double_damage_to, 2.0f);

    apply(charts.defense, relations.no_damage_from, 0.0f);
    apply(charts.defense, relations.half_damage_from, 0.5f);
    apply(charts.defense, relations.double_damage_from, 2.0f);

    return charts;
}

WeaknessTier classify(float multiplier) {
    if (multiplier == 4.0f) return WeaknessTier::QUAD;
    if (multiplier == 2.0f) return WeaknessTier::DOUBLE;
    if (multiplier == 1.0f) return WeaknessTier::NEUTRAL;
    if (multiplier == 0.5f) return WeaknessTier::HALF;
    if (multiplier == 0.25f) return WeaknessTier::QUARTER;
    if (multiplier == 0.0f) return WeaknessTier::ZERO;
    return WeaknessTier::OTHER;
}

WeaknessGroups<std::string> group_chart(const TypeChart& chart) {
    using Entry = std::pair<std::string, float>;
    std::vector<Entry> entries(chart.values().begin(), chart.values().end());

    return group_by_tier<std::string, Entry>(
        entries,
        [](const Entry& entry) -> std::optional<std::pair<std::string, float>> {
            return entry;
        });
}

} // namespace dexref
