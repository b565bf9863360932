#pragma once

#include "AG/core.hpp"

#include <functional>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ag {

/**
 * @brief Working memory for one advisory session
 *
 * Handles:
 * - Fact assertion with monotonically increasing fact-ids
 * - Rejection of duplicate (kind, attributes) pairs
 * - Retraction by id
 * - Lazy, per-kind queries in assertion order
 *
 * A FactStore is owned by exactly one session and is not thread-safe.
 */
class FactStore {
public:
    using Predicate = std::function<bool(const Fact&)>;

    /**
     * @brief Lazy sequence of live facts of one kind satisfying a predicate
     *
     * Iteration walks the store as it is at the time of iteration; any
     * mutation of the store invalidates live iterators. A Query can be
     * iterated any number of times.
     */
    class Query {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = Fact;
            using difference_type = std::ptrdiff_t;
            using pointer = const Fact*;
            using reference = const Fact&;

            iterator() = default;

            reference operator*() const { return *current_; }
            pointer operator->() const { return current_; }
            iterator& operator++() { ++it_; settle(); return *this; }
            iterator operator++(int) { iterator tmp = *this; ++(*this); return tmp; }

            friend bool operator==(const iterator& a, const iterator& b) { return a.it_ == b.it_; }
            friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

        private:
            friend class Query;
            iterator(const Query* q, std::set<FactId>::const_iterator it) : query_(q), it_(it) { settle(); }

            // Advance to the next fact accepted by the predicate
            void settle();

            const Query* query_{nullptr};
            std::set<FactId>::const_iterator it_{};
            const Fact* current_{nullptr};
        };

        iterator begin() const { return iterator(this, ids_->begin()); }
        iterator end() const { return iterator(this, ids_->end()); }

        bool empty() const { return begin() == end(); }

    private:
        friend class FactStore;
        Query(const FactStore& store, const std::set<FactId>& ids, Predicate pred)
            : store_(&store), ids_(&ids), pred_(std::move(pred)) {}

        const FactStore* store_;
        const std::set<FactId>* ids_;
        Predicate pred_;
    };

    /**
     * @brief Add a fact to working memory
     * @return The new fact-id
     * @throws DuplicateFactError if an identical fact is already live
     */
    FactId assertFact(const std::string& kind, Attributes attributes);

    /**
     * @brief Remove a live fact
     * @throws UnknownFactError if the id is not live
     */
    void retract(FactId id);

    /**
     * @brief Live facts of `kind` accepted by `pred` (all of them when pred is empty)
     */
    Query query(const std::string& kind, Predicate pred = {}) const;

    // nullptr when the id is not live
    const Fact* get(FactId id) const;
    bool contains(FactId id) const { return facts_.count(id) != 0; }

    // Id of the live fact identical to (kind, attributes), or 0
    FactId find(const std::string& kind, const Attributes& attributes) const;

    size_t size() const { return facts_.size(); }
    bool empty() const { return facts_.empty(); }

    // All live facts in assertion order
    std::vector<Fact> facts() const;

    // Id the next assertion will receive
    FactId nextId() const { return nextId_; }

private:
    FactId nextId_{1};
    // Ordered by id, which is assertion order
    std::map<FactId, Fact> facts_;
    std::unordered_map<std::string, std::set<FactId>> byKind_;
    // For fast deduplication: factKey(kind, attributes) -> id
    std::unordered_map<std::string, FactId> index_;
};

} // namespace ag
