#ifndef WARMCACHE_SRC_CANDIDATES_CANDIDATE_SET_HPP_
#define WARMCACHE_SRC_CANDIDATES_CANDIDATE_SET_HPP_

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/identity.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstddef>
#include <string>

namespace WarmCache::Candidates
{

namespace bmi = boost::multi_index;

/**
 * @brief Ordered, de-duplicated candidate paths.
 *
 * Insertion order is priority order. A repeated path keeps its first position.
 * Once the cap is reached further paths are refused; a cap of 0 means unlimited.
 */
class CandidateSet
{
    private:
    struct by_order {
    };
    struct by_path {
    };

    using Container = bmi::multi_index_container<
        std::string, bmi::indexed_by<
                         bmi::sequenced<bmi::tag<by_order>>,
                         bmi::hashed_unique<bmi::tag<by_path>, bmi::identity<std::string>>>>;

    public:
    explicit CandidateSet(std::size_t max_items = 0) : max_items_(max_items) {}

    /// Returns true if the path was added.
    bool Add(const std::string& path)
    {
        if (IsFull()) {
            return false;
        }
        auto [it, inserted] = items_.get<by_order>().push_back(path);
        if (!inserted) {
            ++duplicates_;
        }
        return inserted;
    }

    bool IsFull() const { return max_items_ != 0 && items_.size() >= max_items_; }
    std::size_t Size() const { return items_.size(); }
    std::size_t GetDuplicateCount() const { return duplicates_; }

    private:
    Container items_;
    std::size_t max_items_;
    std::size_t duplicates_ = 0;
};

}  // namespace WarmCache::Candidates

#endif  // WARMCACHE_SRC_CANDIDATES_CANDIDATE_SET_HPP_
