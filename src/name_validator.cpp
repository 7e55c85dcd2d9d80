/**
 * dexref - Name Validator Implementation
 */

#include "dexref/name_validator.hpp"
#include "dexref/resource_store.hpp"
#include <algorithm>
#include <cctype>

namespace dexref {

std::string to_lower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);

    for (size_t j = 0; j <= b.size(); j++) previous[j] = j;

    for (size_t i = 1; i <= a.size(); i++) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); j++) {
            size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }

    return previous[b.size()];
}

std::string first_character(const std::string& value) {
    if (value.empty()) return "";

    // Length of the UTF-8 sequence from its lead byte
    unsigned char lead = static_cast<unsigned char>(value[0]);
    size_t length = 1;
    if ((lead & 0xE0) == 0xC0) length = 2;
    else if ((lead & 0xF0) == 0xE0) length = 3;
    else if ((lead & 0xF8) == 0xF0) length = 4;

    return value.substr(0, std::min(length, value.size()));
}

std::vector<std::string> potential_matches(const std::vector<std::string>& candidates,
                                           const std::string& value) {
    std::vector<std::string> matches;

    const std::string leading = first_character(value);

    for (const auto& candidate : candidates) {
        // Spellcheck only on a first-character match
        bool close_enough = !leading.empty() &&
                            first_character(candidate) == leading &&
                            levenshtein(candidate, value) < MAX_EDIT_DISTANCE;

        if (candidate.find(value) != std::string::npos || close_enough) {
            matches.push_back(candidate);
        }
    }

    return matches;
}

std::string invalid_message(const std::string& label, const std::string& value,
                            const std::vector<std::string>& matches) {
    std::string message = label + " '" + value + "' not found.";

    if (matches.size() > MAX_DISPLAYED_MATCHES) {
        message += " Potential matches found; too many to display.";
    } else if (!matches.empty()) {
        message += " Potential matches:";
        for (const auto& m : matches) message += " " + m;
        message += ".";
    }

    return message;
}

Resolution<std::string> validate_name(const std::string& label,
                                      const std::vector<std::string>& candidates,
                                      const std::string& value) {
    std::string lowered = to_lower(value);
    auto matches = potential_matches(candidates, lowered);

    if (std::find(matches.begin(), matches.end(), lowered) != matches.end()) {
        return Resolution<std::string>::success(lowered);
    }

    return Resolution<std::string>::failure(ResolutionErrorKind::NOT_FOUND,
                                            invalid_message(label, lowered, matches));
}

NameValidator::NameValidator(const ResourceStore& store) : store_(store) {}

Resolution<std::string> NameValidator::validate(ResourceKind kind, const std::string& value) const {
    return validate_name(to_string(kind), store_.select_all_names(kind), value);
}

} // namespace dexref
