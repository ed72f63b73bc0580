/* ===================================================================== *
 *  include/ramancal/CalibrationCache.hpp : bounded L-R-U cache (thread safe)
 * ===================================================================== */
#pragma once
#include "Types.hpp"

#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace ramancal {

struct CalibrationConfig;

using AxisPtr = std::shared_ptr<const Vector>;

/*
 * Key over both raw calibration traces and every config field that
 * changes the resulting axis.  `hash` buckets the entry; `check` is the
 * same data hashed from another seed and, with the trace sizes, must also
 * match before a cached axis is handed out.
 */
struct CalibrationKey {
    std::size_t  hash            = 0;
    std::size_t  check           = 0;
    Eigen::Index excitation_size = 0;
    Eigen::Index emission_size   = 0;

    bool operator==(const CalibrationKey&) const = default;
};

struct CalibrationKeyHash {
    std::size_t operator()(const CalibrationKey& k) const noexcept { return k.hash; }
};

CalibrationKey calibration_key(const Vector&            excitation_trace,
                            const Vector&            emission_trace,
                            const CalibrationConfig& config);

/*
 * Thread–safe bounded cache of calibrated wavenumber axes with
 * L-R-U eviction and shared ownership.
 *
 *     const auto axis = cache.insert_if_absent(key, [&]{ return calibrate(); });
 *     use(*axis);                  // operator*  gives a  const&.
 *
 * A producer that throws leaves the cache untouched.
 */
class CalibrationCache
{
public:
    explicit CalibrationCache(std::size_t capacity = 64);

    static CalibrationCache& instance();

    /* ------------ zero-copy read (shared ownership) ---------------- */
    AxisPtr try_get(const CalibrationKey& key) const;

    /* ------------ insert-or-get ------------------------------------ */
    template<typename Producer>
    AxisPtr insert_if_absent(const CalibrationKey& key, Producer&& make);

    /* ------------ house-keeping ------------------------------------ */
    void        set_capacity(std::size_t n);
    void        clear();
    std::size_t size() const;

private:
    /* ---------- internal L-R-U bookkeeping ------------------------- */
    using LruList = std::list<CalibrationKey>;
    struct Node {
        AxisPtr           axis;     // shared ownership
        LruList::iterator lru_pos;  // position in the list
    };
    using Map = ankerl::unordered_dense::map<CalibrationKey, Node, CalibrationKeyHash>;

    void touch_(typename Map::iterator it) const;
    void evict_if_needed_();

    /* ---------- data members --------------------------------------- */
    mutable std::shared_mutex mtx_;
    mutable Map     cache_;
    mutable LruList lru_;
    std::size_t     max_entries_;
};

/* ===================================================================== *
 *  template implementation
 * ===================================================================== */
template<typename Producer>
AxisPtr CalibrationCache::insert_if_absent(const CalibrationKey& key, Producer&& make)
{
    {
        std::unique_lock lk(mtx_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            touch_(it);
            return it->second.axis;        //  fast-path hit
        }
    }

    /* ---------- calibrate outside any lock ------------------------- */
    AxisPtr new_axis = std::make_shared<const Vector>(std::forward<Producer>(make)());

    /* ---------- second attempt / insertion ------------------------- */
    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {              // someone else inserted
        touch_(it);
        return it->second.axis;
    }

    auto lru_it = lru_.insert(lru_.begin(), key);           // MRU front
    cache_.try_emplace(key, Node{new_axis, lru_it});
    evict_if_needed_();
    return new_axis;
}

} // namespace ramancal
