/* ===================================================================== *
 *  src/CalibrationCache.cpp
 * ===================================================================== */
#include "ramancal/CalibrationCache.hpp"
#include "ramancal/Calibrator.hpp"
#include <cstdint>
#include <cstring>
#include <functional>

namespace ramancal {

/* ---------- hashing helpers for (traces, config) ---------------------- */
static std::size_t hash_combine(std::size_t seed, std::size_t v) noexcept
{
    seed ^= v + 0x9E3779B97F4A7C15ULL + (seed << 6) + (seed >> 2);
    return seed;
}
static std::size_t hash_double(double x) noexcept
{
    std::uint64_t bits; std::memcpy(&bits, &x, sizeof bits);
    return std::hash<std::uint64_t>{}(bits);
}
static std::size_t hash_vector(std::size_t seed, const Vector& v) noexcept
{
    seed = hash_combine(seed, static_cast<std::size_t>(v.size()));
    for (Eigen::Index i = 0; i < v.size(); ++i)
        seed = hash_combine(seed, hash_double(v[i]));
    return seed;
}

static std::size_t hash_inputs(std::size_t              seed,
                               const Vector&            excitation,
                               const Vector&            emission,
                               const CalibrationConfig& c)
{
    std::size_t k = hash_vector(seed, excitation);
    k = hash_vector(k, emission);
    k = hash_combine(k, hash_double(c.excitation_wavelength_nm));
    k = hash_combine(k, static_cast<std::size_t>(c.kernel_size));
    k = hash_combine(k, hash_double(c.rough_residuals_threshold));
    k = hash_combine(k, hash_double(c.fine_residuals_threshold));
    k = hash_combine(k, hash_double(c.prominence_increment));
    k = hash_combine(k, static_cast<std::size_t>(c.max_iterations));
    k = hash_combine(k, static_cast<std::size_t>(c.rough_degree));
    k = hash_combine(k, static_cast<std::size_t>(c.fine_degree));
    k = hash_combine(k, static_cast<std::size_t>(c.refinement_method));
    k = hash_combine(k, static_cast<std::size_t>(c.refinement_window));
    k = hash_vector(k, c.rough_reference);
    k = hash_vector(k, c.fine_reference);
    return k;
}

CalibrationKey calibration_key(const Vector&            excitation,
                               const Vector&            emission,
                               const CalibrationConfig& c)
{
    CalibrationKey key;
    key.hash            = hash_inputs(0, excitation, emission, c);
    key.check           = hash_inputs(0x243F6A8885A308D3ULL, excitation, emission, c);
    key.excitation_size = excitation.size();
    key.emission_size   = emission.size();
    return key;
}

/* -------- construction / singleton ----------------------------------- */
CalibrationCache::CalibrationCache(std::size_t capacity)
    : max_entries_(capacity == 0 ? 1 : capacity)
{}

CalibrationCache& CalibrationCache::instance()
{
    static CalibrationCache inst;
    return inst;
}

/* -------- simple helpers -------------------------------------------- */
void CalibrationCache::set_capacity(std::size_t n)
{
    std::unique_lock lk(mtx_);
    max_entries_ = (n == 0) ? 1 : n;
    evict_if_needed_();
}
void CalibrationCache::clear()
{
    std::unique_lock lk(mtx_);
    cache_.clear();
    lru_.clear();
}
std::size_t CalibrationCache::size() const
{
    std::shared_lock lk(mtx_);
    return cache_.size();
}

/* -------- try_get ---------------------------------------------------- */
AxisPtr CalibrationCache::try_get(const CalibrationKey& key) const
{
    std::unique_lock lk(mtx_);
    auto it = cache_.find(key);
    if (it == cache_.end()) return nullptr;
    touch_(it);                      // update LRU even on read
    return it->second.axis;
}

/* ===================================================================== *
 *            internal L-R-U helpers (private)
 * ===================================================================== */
void CalibrationCache::touch_(typename Map::iterator it) const
{
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
}
void CalibrationCache::evict_if_needed_()
{
    while (cache_.size() > max_entries_) {
        const CalibrationKey victim = lru_.back();
        lru_.pop_back();
        cache_.erase(victim);        // shared_ptr keeps data alive
    }
}

} // namespace ramancal
