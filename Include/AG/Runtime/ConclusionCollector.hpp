#pragma once

#include "AG/Runtime/FactStore.hpp"
#include "AG/Runtime/RuleLibrary.hpp"

#include <string>
#include <vector>

namespace ag {

// Snapshot of an output-kind fact handed to the caller
using Conclusion = Fact;

/**
 * @brief Extracts output-kind facts from a quiescent store
 *
 * Conclusions come back in assertion order. The store never holds two
 * identical facts, so the result is already deduplicated. The store is not
 * modified.
 */
class ConclusionCollector {
public:
    explicit ConclusionCollector(const RuleLibrary& library) : library_(library) {}

    std::vector<Conclusion> collect(const FactStore& store) const;

    // Conclusions of one kind, in assertion order
    static std::vector<Conclusion> ofKind(const std::vector<Conclusion>& conclusions,
                                          const std::string& kind);

private:
    const RuleLibrary& library_;
};

} // namespace ag
