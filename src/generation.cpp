/**
 * dexref - Generation Resolver Implementation
 */

#include "dexref/generation.hpp"
#include "dexref/resource_store.hpp"
#include <algorithm>
#include <regex>

namespace dexref {

GenerationResolver::GenerationResolver(const std::vector<GameRow>& games)
    : games_(games) {
    std::stable_sort(games_.begin(), games_.end(),
                     [](const GameRow& a, const GameRow& b) { return a.order < b.order; });
    for (const auto& game : games_) {
        by_name_[game.name] = game.generation;
    }
}

GenerationResolver GenerationResolver::from_store(const ResourceStore& store) {
    return GenerationResolver(store.select_games());
}

Resolution<Generation> GenerationResolver::generation_of_game(const std::string& game_name) const {
    auto it = by_name_.find(game_name);
    if (it == by_name_.end()) {
        return Resolution<Generation>::failure(not_found("Game", game_name));
    }
    return Resolution<Generation>::success(it->second);
}

Resolution<Generation> GenerationResolver::generation_of_reference(const std::string& ref) const {
    static const std::regex url_pattern(R"(generation/(\d+)/?$)");
    static const std::regex name_pattern(R"(^generation-([ivx]+)$)");
    static const std::regex digits_pattern(R"(^(\d+)$)");

    std::smatch match;
    if ((std::regex_search(ref, match, url_pattern) ||
         std::regex_match(ref, match, digits_pattern)) && match[1].length() <= 3) {
        int generation = std::stoi(match[1].str());
        if (generation > 0) {
            return Resolution<Generation>::success(generation);
        }
    } else if (std::regex_match(ref, match, name_pattern)) {
        auto generation = parse_roman_numeral(match[1].str());
        if (generation) {
            return Resolution<Generation>::success(*generation);
        }
    }

    return Resolution<Generation>::failure(
        ResolutionErrorKind::MALFORMED_OVERRIDE,
        "Reference '" + ref + "' does not name a generation.");
}

std::optional<GameRow> GenerationResolver::latest_game() const {
    if (games_.empty()) return std::nullopt;
    return games_.back();
}

Generation GenerationResolver::latest_generation() const {
    Generation latest = 0;
    for (const auto& game : games_) {
        latest = std::max(latest, game.generation);
    }
    return latest;
}

std::optional<int> parse_roman_numeral(const std::string& numeral) {
    if (numeral.empty()) return std::nullopt;

    auto value_of = [](char c) -> int {
        switch (c) {
            case 'i': return 1;
            case 'v': return 5;
            case 'x': return 10;
            case 'l': return 50;
            case 'c': return 100;
            default: return 0;
        }
    };

    int total = 0;
    for (size_t i = 0; i < numeral.size(); i++) {
        int current = value_of(numeral[i]);
        if (current == 0) return std::nullopt;
        int next = (i + 1 < numeral.size()) ? value_of(numeral[i + 1]) : 0;
        total += (current < next) ? -current : current;
    }

    if (total <= 0 || total >= 400) return std::nullopt;

    // Only the canonical spelling is accepted
    static const char* const HUNDREDS[] = {"", "c", "cc", "ccc"};
    static const char* const TENS[] = {"", "x", "xx", "xxx", "xl", "l", "lx", "lxx", "lxxx", "xc"};
    static const char* const ONES[] = {"", "i", "ii", "iii", "iv", "v", "vi", "vii", "viii", "ix"};
    std::string canonical = std::string(HUNDREDS[total / 100]) + TENS[(total / 10) % 10] + ONES[total % 10];
    if (canonical != numeral) return std::nullopt;

    return total;
}

} // namespace dexref
