/**
 * dexref - Resolution Results
 *
 * Every lookup in the core reports failure through a typed result rather
 * than throwing. A result either holds a value or a ResolutionError.
 */

#pragma once

#include "types.hpp"
#include <utility>

namespace dexref {

struct ResolutionError {
    ResolutionErrorKind kind = ResolutionErrorKind::NOT_FOUND;
    std::string message;
};

template <typename T>
struct Resolution {
    std::optional<T> value;
    ResolutionError error;

    bool ok() const { return value.has_value(); }

    const T& get() const { return *value; }
    T& get() { return *value; }

    static Resolution success(T v) {
        Resolution result;
        result.value = std::move(v);
        return result;
    }

    static Resolution failure(ResolutionErrorKind kind, std::string message) {
        Resolution result;
        result.error.kind = kind;
        result.error.message = std::move(message);
        return result;
    }

    static Resolution failure(const ResolutionError& error) {
        Resolution result;
        result.error = error;
        return result;
    }
};

inline ResolutionError not_found(const std::string& label, const std::string& name) {
    return {ResolutionErrorKind::NOT_FOUND, label + " '" + name + "' not found."};
}

inline ResolutionError not_present(const std::string& name, Generation generation) {
    return {ResolutionErrorKind::NOT_PRESENT_IN_GENERATION,
            "'" + name + "' is not present in generation " + std::to_string(generation) + "."};
}

} // namespace dexref
