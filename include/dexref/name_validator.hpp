/**
 * dexref - Name Validator
 *
 * Case-folds user-supplied names and, when a name is unknown, suggests
 * stored names that contain it or are a short edit away.
 */

#pragma once

#include "resolution.hpp"

namespace dexref {

class ResourceStore;

constexpr size_t MAX_DISPLAYED_MATCHES = 20;
constexpr size_t MAX_EDIT_DISTANCE = 4;     // exclusive

std::string to_lower(const std::string& value);

size_t levenshtein(const std::string& a, const std::string& b);

/**
 * The first UTF-8 encoded character of value, or "" when value is empty.
 */
std::string first_character(const std::string& value);

/**
 * Stored names that contain value, or share its first character and are
 * within MAX_EDIT_DISTANCE edits of it. Order follows candidates.
 */
std::vector<std::string> potential_matches(const std::vector<std::string>& candidates,
                                           const std::string& value);

/**
 * "<Label> '<value>' not found." with the potential matches appended.
 */
std::string invalid_message(const std::string& label, const std::string& value,
                            const std::vector<std::string>& matches);

/**
 * Validate value against a list of names. Success carries the
 * lower-cased name.
 */
Resolution<std::string> validate_name(const std::string& label,
                                      const std::vector<std::string>& candidates,
                                      const std::string& value);

class NameValidator {
public:
    explicit NameValidator(const ResourceStore& store);

    Resolution<std::string> validate(ResourceKind kind, const std::string& value) const;

private:
    const ResourceStore& store_;
};

} // namespace dexref
