#pragma once

#include "core/DependencyKey.hpp"
#include "core/Environment.hpp"

namespace tinydep::core {

template <typename K>
struct DefaultPolicy {
    using Value = typename KeyTraits<K>::Value;

    static Value valueFor(Classification classification) {
        switch (classification) {
        case Classification::Preview:
            return KeyTraits<K>::previewDefault();
        case Classification::Test:
            return KeyTraits<K>::testDefault();
        case Classification::Production:
            break;
        }
        return KeyTraits<K>::productionDefault();
    }

    // Probes the environment once per call.
    static Value resolve() { return valueFor(environment::current()); }
};

}  // namespace tinydep::core
