#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace navpick::search {

/**
 * @brief A ranked candidate. Higher scores rank earlier; sourceIndex is the
 * position of the item in the input sequence and breaks ties.
 */
template <typename T> struct FuzzyMatchResult {
    T item;
    int score = 0;
    std::size_t sourceIndex = 0;
};

template <typename T> using KeyExtractor = std::function<std::vector<std::string>(const T&)>;

/**
 * @brief Case-insensitive substring/subsequence scorer
 *
 * Scoring per key (query and key are lowercased):
 *  - substring at startIndex:  1000 + 100 - startIndex - min(len(key), 50)
 *  - subsequence:              +2 per matched char, +1 when the match extends a run
 *  - neither:                  no score
 * An item scores the best of its keys and is dropped when no key scores.
 * An empty (or all-whitespace) query passes every item through with score 0.
 */
class FuzzyMatcher {
public:
    static constexpr int kSubstringBase = 1000 + 100;
    static constexpr std::size_t kLengthPenaltyCap = 50;

    /// Trim surrounding whitespace and lowercase.
    static std::string normalizeQuery(std::string_view query);

    /// Score a single key against an already normalized query.
    static std::optional<int> scoreKey(std::string_view key, std::string_view normalizedQuery);

    template <typename T>
    static std::optional<int> scoreItem(const T& item,
                                        const std::type_identity_t<KeyExtractor<T>>& keys,
                                        std::string_view normalizedQuery) {
        if (normalizedQuery.empty()) {
            return 0;
        }
        std::optional<int> best;
        for (const auto& key : keys(item)) {
            if (auto s = scoreKey(key, normalizedQuery); s && (!best || *s > *best)) {
                best = s;
            }
        }
        return best;
    }

    /**
     * @brief Lazily scored view over a vector of items
     *
     * Each item is scored once, when the iterator reaches it; items that do not
     * match are skipped. Results come out in input order (not sorted).
     * The view refers to the item vector, which must outlive it.
     */
    template <typename T> class RankedSequence {
    public:
        class iterator {
        public:
            using value_type = FuzzyMatchResult<T>;
            using difference_type = std::ptrdiff_t;
            using iterator_concept = std::input_iterator_tag;

            iterator() = default;

            const value_type& operator*() const { return *current_; }
            const value_type* operator->() const { return &*current_; }

            iterator& operator++() {
                ++pos_;
                advance();
                return *this;
            }
            void operator++(int) { ++*this; }

            friend bool operator==(const iterator& it, std::default_sentinel_t) {
                return !it.current_.has_value();
            }

        private:
            friend class RankedSequence;

            iterator(const RankedSequence* seq, std::size_t pos) : seq_(seq), pos_(pos) {
                advance();
            }

            void advance() {
                current_.reset();
                const auto& items = *seq_->items_;
                for (; pos_ < items.size(); ++pos_) {
                    if (auto score = scoreItem(items[pos_], seq_->keys_, seq_->query_)) {
                        current_.emplace(value_type{items[pos_], *score, pos_});
                        return;
                    }
                }
            }

            const RankedSequence* seq_ = nullptr;
            std::size_t pos_ = 0;
            std::optional<value_type> current_;
        };

        RankedSequence(const std::vector<T>& items, KeyExtractor<T> keys, std::string query,
                       std::size_t from)
            : items_(&items), keys_(std::move(keys)), query_(std::move(query)), from_(from) {}

        iterator begin() const { return iterator(this, from_); }
        std::default_sentinel_t end() const { return {}; }

    private:
        const std::vector<T>* items_;
        KeyExtractor<T> keys_;
        std::string query_;
        std::size_t from_;
    };

    /**
     * @brief Score items[from..] against query, lazily
     */
    template <typename T>
    RankedSequence<T> rank(const std::vector<T>& items, std::type_identity_t<KeyExtractor<T>> keys,
                           std::string_view query, std::size_t from = 0) const {
        return RankedSequence<T>(items, std::move(keys), normalizeQuery(query), from);
    }

    template <typename T>
    RankedSequence<T> rank(const std::vector<T>&& items, std::type_identity_t<KeyExtractor<T>> keys,
                           std::string_view query, std::size_t from = 0) const = delete;

    /**
     * @brief Score and order items[from..]: descending score, ties in input order
     */
    template <typename T>
    std::vector<FuzzyMatchResult<T>> rankAll(const std::vector<T>& items,
                                             std::type_identity_t<KeyExtractor<T>> keys,
                                             std::string_view query, std::size_t from = 0) const {
        std::vector<FuzzyMatchResult<T>> out;
        for (const auto& r : rank(items, std::move(keys), query, from)) {
            out.push_back(r);
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.score > b.score; });
        return out;
    }
};

} // namespace navpick::search
