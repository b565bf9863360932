#pragma once

#include "AG/Runtime/Activation.hpp"

#include <vector>

namespace ag {

/**
 * @brief Chooses the single activation to fire next
 *
 * Total order, first difference wins:
 * 1. higher rule priority
 * 2. smaller most-recent matched fact-id (earliest observations first)
 * 3. rule name, ascending
 * 4. matched fact-id sequence, lexicographically ascending
 */
class ConflictResolver {
public:
    /**
     * @brief true if `a` must fire before `b`
     */
    static bool precedes(const Activation& a, const Activation& b);

    /**
     * @brief The activation to fire next
     * @throws std::invalid_argument if `candidates` is empty
     */
    const Activation& select(const std::vector<Activation>& candidates) const;

    /**
     * @brief Candidates sorted into firing order (agenda view for diagnostics)
     */
    std::vector<Activation> order(std::vector<Activation> candidates) const;
};

} // namespace ag
