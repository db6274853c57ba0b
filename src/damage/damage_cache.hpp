/**
 * DamageCache — LRU memoization of damage calculator calls.
 *
 * Keys serialize only the state the calculator reads: both combatants'
 * build and HP, the move configuration, the field, the acting side and
 * the battle style. One cache per job; never share across jobs.
 */

#ifndef EVSIM_DAMAGE_DAMAGE_CACHE_HPP
#define EVSIM_DAMAGE_DAMAGE_CACHE_HPP

#include "damage/damage_calculator.hpp"
#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>

namespace evsim::damage {

constexpr size_t DEFAULT_CACHE_CAPACITY = 512;

class DamageCache {
public:
    explicit DamageCache(size_t capacity = DEFAULT_CACHE_CAPACITY);

    /**
     * Look up a computation and mark it most recently used.
     * The pointer stays valid until the entry is evicted or the cache cleared.
     */
    const DamageComputation* get(const std::string& key);

    /// Insert or replace; evicts the least recently used entry on overflow.
    void put(const std::string& key, DamageComputation result);

    /// get(), and on a miss compute through the calculator and put().
    const DamageComputation& get_or_compute(const AttackContext& ctx,
                                            DamageCalculator& calculator);

    void clear();

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    size_t hits() const { return hits_; }
    size_t misses() const { return misses_; }

    static std::string make_key(const AttackContext& ctx);

private:
    using Entry = std::pair<std::string, DamageComputation>;

    size_t capacity_;
    std::list<Entry> entries_;      // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace evsim::damage

#endif // EVSIM_DAMAGE_DAMAGE_CACHE_HPP
