#pragma once
#include "Types.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ramancal {

struct CalibrationConfig;
class  CalibrationCache;

// Container for a calibrated Raman spectrum.  Never modified in place:
// every transform returns a new spectrum.
class RamanSpectrum {
public:
    RamanSpectrum() = default;
    RamanSpectrum(Vector wavenumbers_cm1, Vector intensities);   // equal sizes

    const Vector& wavenumbers_cm1() const { return wavenumbers_cm1_; }
    const Vector& intensities()     const { return intensities_; }
    Eigen::Index  size()            const { return intensities_.size(); }

    /* samples with  min < wavenumber < max  (open interval) */
    RamanSpectrum between(Real min_wavenumber_cm1, Real max_wavenumber_cm1) const;

    /* (I − min) / (max − min) */
    RamanSpectrum normalize() const;

    /* (I − mean) / std, population standard deviation */
    RamanSpectrum standardize() const;

    /* median filter on the intensities, zero-padded edges */
    RamanSpectrum smooth(int kernel_size = 5) const;

    /* linear interpolation onto `wavenumbers_cm1`, clamped at the ends */
    RamanSpectrum resample(const Vector& wavenumbers_cm1) const;

    Vector find_n_most_prominent_wavenumbers(int  num_peaks,
                                             Real prominence_increment = 0.005,
                                             int  max_iterations       = 500) const;

    Vector find_prominent_wavenumbers(Real prominence = 0.01) const;

    /* calibrate the OpenRAMAN pixel axis from the neon / acetonitrile
     * traces and pair it with the (unfiltered) sample intensities        */
    static RamanSpectrum from_openraman_csvfiles(const std::string&       sample_csv,
                                                 const std::string&       excitation_csv,
                                                 const std::string&       emission_csv,
                                                 const CalibrationConfig& config);

    static RamanSpectrum from_horiba_txtfile(const std::string& path);

private:
    Vector wavenumbers_cm1_;
    Vector intensities_;
};

/* "s2" < "s10" */
bool natural_less(const std::string& a, const std::string& b);

struct NaturalLess {
    bool operator()(const std::string& a, const std::string& b) const
    { return natural_less(a, b); }
};

/* one row of a batch manifest: a sample and its calibration pair */
struct ManifestEntry {
    std::string name;          // empty: file stem of `sample`
    std::string sample;
    std::string excitation;
    std::string emission;
};

// Collection of spectra keyed by sample name (natural order).
class RamanSpectra {
public:
    using Map = std::map<std::string, RamanSpectrum, NaturalLess>;

    RamanSpectra() = default;
    explicit RamanSpectra(Map spectra) : spectra_(std::move(spectra)) {}

    /**
     * All OpenRAMAN samples in `directory` matching `sample_glob`, sharing
     * one calibration from the first (natural order) matches of the two
     * calibration globs.  The calibration files themselves are not samples.
     * Sample files are read in parallel.
     */
    static RamanSpectra from_openraman_directory(const std::string&       directory,
                                                 const CalibrationConfig& config,
                                                 const std::string& sample_glob     = "*.csv",
                                                 const std::string& excitation_glob = "*neon*.csv",
                                                 const std::string& emission_glob   = "*aceto*.csv");

    /**
     * Samples with individual calibration pairs.  Entries are processed on
     * `nthreads` workers (0 == hardware concurrency); each distinct
     * calibration pair is calibrated once through `cache`.
     */
    static RamanSpectra from_manifest(const std::vector<ManifestEntry>& entries,
                                      const CalibrationConfig&          config,
                                      CalibrationCache&                 cache,
                                      unsigned                          nthreads = 0);

    const Map&           spectra()  const { return spectra_; }
    std::size_t          size()     const { return spectra_.size(); }
    bool                 contains(const std::string& name) const { return spectra_.count(name) != 0; }
    const RamanSpectrum& at(const std::string& name) const;

    void insert(std::string name, RamanSpectrum spectrum);

    Map::const_iterator begin() const { return spectra_.begin(); }
    Map::const_iterator end()   const { return spectra_.end(); }

private:
    Map spectra_;
};

} // namespace ramancal
