#include "ramancal/Spectrum.hpp"
#include "ramancal/SpectrumLoaders.hpp"
#include "ramancal/NumericUtils.hpp"
#include "ramancal/PeakFinder.hpp"
#include "ramancal/Calibrator.hpp"
#include "ramancal/CalibrationCache.hpp"
#include "ramancal/ThreadPool.hpp"

#include <boost/math/statistics/univariate_statistics.hpp>
#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <filesystem>
#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace ramancal {

namespace {

Vector gather(const Vector& v, const IndexVector& idx)
{
    Vector out(static_cast<Eigen::Index>(idx.size()));
    for (std::size_t k = 0; k < idx.size(); ++k)
        out[static_cast<Eigen::Index>(k)] = v[idx[k]];
    return out;
}

/* regular files in `dir` whose name matches `glob`, natural order */
std::vector<fs::path> glob_files(const fs::path& dir, const std::string& glob)
{
    std::vector<fs::path> hits;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (::fnmatch(glob.c_str(), name.c_str(), 0) == 0)
            hits.push_back(entry.path());
    }
    std::sort(hits.begin(), hits.end(), [](const fs::path& a, const fs::path& b) {
        return natural_less(a.filename().string(), b.filename().string());
    });
    return hits;
}

fs::path first_match(const fs::path& dir, const std::string& glob, const char* what)
{
    auto hits = glob_files(dir, glob);
    if (hits.empty())
        throw std::runtime_error("No " + std::string(what) + " calibration file matching '" +
                                 glob + "' in '" + dir.string() + "'");
    return hits.front();
}

/* read OpenRAMAN intensities for every path, in parallel; the first
 * failure (in input order) is rethrown after the loop                  */
std::vector<Vector> read_openraman_parallel(const std::vector<std::string>& paths)
{
    const auto n = static_cast<long>(paths.size());
    std::vector<Vector>             traces(paths.size());
    std::vector<std::exception_ptr> errors(paths.size());

#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for (long i = 0; i < n; ++i) {
        const auto k = static_cast<std::size_t>(i);
        try {
            traces[k] = read_openraman_csv(paths[k]);
        } catch (const std::exception&) {
            errors[k] = std::current_exception();
        }
    }

    for (const auto& e : errors)
        if (e) std::rethrow_exception(e);
    return traces;
}

} // unnamed namespace

/* ====================================================================== */
/*  RamanSpectrum                                                          */
/* ====================================================================== */
RamanSpectrum::RamanSpectrum(Vector wavenumbers_cm1, Vector intensities)
    : wavenumbers_cm1_(std::move(wavenumbers_cm1)),
      intensities_(std::move(intensities))
{
    if (wavenumbers_cm1_.size() != intensities_.size())
        throw std::invalid_argument("RamanSpectrum: " +
                                    std::to_string(wavenumbers_cm1_.size()) +
                                    " wavenumbers but " +
                                    std::to_string(intensities_.size()) + " intensities");
}

RamanSpectrum RamanSpectrum::between(Real lo, Real hi) const
{
    std::vector<Eigen::Index> keep;
    for (Eigen::Index i = 0; i < size(); ++i)
        if (wavenumbers_cm1_[i] > lo && wavenumbers_cm1_[i] < hi)
            keep.push_back(i);
    return RamanSpectrum(gather(wavenumbers_cm1_, keep), gather(intensities_, keep));
}

RamanSpectrum RamanSpectrum::normalize() const
{
    return RamanSpectrum(wavenumbers_cm1_, min_max_normalize(intensities_));
}

RamanSpectrum RamanSpectrum::standardize() const
{
    if (size() == 0)
        throw std::invalid_argument("RamanSpectrum::standardize(): empty spectrum");

    const Real* first = intensities_.data();
    const Real* last  = first + intensities_.size();
    const Real mean   = boost::math::statistics::mean(first, last);
    const Real sigma  = std::sqrt(boost::math::statistics::variance(first, last));
    if (!(sigma > 0.0))
        throw std::invalid_argument("RamanSpectrum::standardize(): constant intensities");

    Vector scaled = ((intensities_.array() - mean) / sigma).matrix();
    return RamanSpectrum(wavenumbers_cm1_, std::move(scaled));
}

RamanSpectrum RamanSpectrum::smooth(int kernel_size) const
{
    return RamanSpectrum(wavenumbers_cm1_, median_filter(intensities_, kernel_size));
}

RamanSpectrum RamanSpectrum::resample(const Vector& new_axis) const
{
    if (size() < 2)
        throw std::invalid_argument("RamanSpectrum::resample(): need at least two samples");
    return RamanSpectrum(new_axis, interp_linear(wavenumbers_cm1_, intensities_, new_axis));
}

Vector RamanSpectrum::find_n_most_prominent_wavenumbers(int  num_peaks,
                                                        Real prominence_increment,
                                                        int  max_iterations) const
{
    const PeakSearchResult res = find_n_most_prominent_peaks(intensities_, num_peaks,
                                                             prominence_increment,
                                                             max_iterations);
    return gather(wavenumbers_cm1_, res.peaks);
}

Vector RamanSpectrum::find_prominent_wavenumbers(Real prominence) const
{
    return gather(wavenumbers_cm1_, find_peaks(intensities_, prominence));
}

RamanSpectrum RamanSpectrum::from_openraman_csvfiles(const std::string&       sample_csv,
                                                     const std::string&       excitation_csv,
                                                     const std::string&       emission_csv,
                                                     const CalibrationConfig& config)
{
    Vector intensities = read_openraman_csv(sample_csv);
    Vector axis = Calibrator(config).calibrate(read_openraman_csv(excitation_csv),
                                               read_openraman_csv(emission_csv));
    return RamanSpectrum(std::move(axis), std::move(intensities));
}

RamanSpectrum RamanSpectrum::from_horiba_txtfile(const std::string& path)
{
    return read_horiba_txt(path);
}

/* ====================================================================== */
/*  natural ordering                                                       */
/* ====================================================================== */
bool natural_less(const std::string& a, const std::string& b)
{
    std::size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[j]);

        if (std::isdigit(ca) && std::isdigit(cb)) {
            std::size_t ie = i, je = j;
            while (ie < a.size() && std::isdigit(static_cast<unsigned char>(a[ie]))) ++ie;
            while (je < b.size() && std::isdigit(static_cast<unsigned char>(b[je]))) ++je;

            /* compare digit runs by value: strip zeros, then length, then text */
            std::size_t ia = i, jb = j;
            while (ia + 1 < ie && a[ia] == '0') ++ia;
            while (jb + 1 < je && b[jb] == '0') ++jb;
            const std::size_t la = ie - ia, lb = je - jb;
            if (la != lb) return la < lb;
            const int c = a.compare(ia, la, b, jb, lb);
            if (c != 0) return c < 0;
            if (ie - i != je - j) return (ie - i) < (je - j);
            i = ie; j = je;
            continue;
        }
        if (ca != cb) return ca < cb;
        ++i; ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

/* ====================================================================== */
/*  RamanSpectra                                                           */
/* ====================================================================== */
const RamanSpectrum& RamanSpectra::at(const std::string& name) const
{
    auto it = spectra_.find(name);
    if (it == spectra_.end())
        throw std::out_of_range("RamanSpectra::at(): no sample named '" + name + "'");
    return it->second;
}

void RamanSpectra::insert(std::string name, RamanSpectrum spectrum)
{
    spectra_.insert_or_assign(std::move(name), std::move(spectrum));
}

RamanSpectra RamanSpectra::from_openraman_directory(const std::string&       directory,
                                                    const CalibrationConfig& config,
                                                    const std::string&       sample_glob,
                                                    const std::string&       excitation_glob,
                                                    const std::string&       emission_glob)
{
    const fs::path dir(directory);
    if (!fs::is_directory(dir))
        throw std::runtime_error("'" + directory + "' is not a directory");

    const fs::path exc = first_match(dir, excitation_glob, "excitation");
    const fs::path emi = first_match(dir, emission_glob,   "emission");

    std::vector<std::string> sample_paths;
    std::vector<std::string> names;
    for (const auto& p : glob_files(dir, sample_glob)) {
        if (p == exc || p == emi) continue;
        sample_paths.push_back(p.string());
        names.push_back(p.stem().string());
    }

    if (config.verbose)
        std::cout << "[Spectra] " << sample_paths.size() << " samples, calibration from "
                  << exc.filename().string() << " / " << emi.filename().string() << '\n';

    const Vector axis = Calibrator(config).calibrate(read_openraman_csv(exc.string()),
                                                     read_openraman_csv(emi.string()));

    std::vector<Vector> traces = read_openraman_parallel(sample_paths);

    RamanSpectra out;
    for (std::size_t k = 0; k < traces.size(); ++k) {
        if (traces[k].size() != axis.size())
            throw std::runtime_error("'" + sample_paths[k] + "' has " +
                                     std::to_string(traces[k].size()) +
                                     " samples, calibration axis " +
                                     std::to_string(axis.size()));
        out.insert(names[k], RamanSpectrum(axis, std::move(traces[k])));
    }
    return out;
}

RamanSpectra RamanSpectra::from_manifest(const std::vector<ManifestEntry>& entries,
                                         const CalibrationConfig&          config,
                                         CalibrationCache&                 cache,
                                         unsigned                          nthreads)
{
    const Calibrator calibrator(config);

    /* distinct calibration pairs, in first-seen order */
    std::vector<std::pair<std::string, std::string>> pairs;
    std::vector<std::size_t> pair_of(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto key = std::make_pair(entries[i].excitation, entries[i].emission);
        auto it = std::find(pairs.begin(), pairs.end(), key);
        pair_of[i] = static_cast<std::size_t>(it - pairs.begin());
        if (it == pairs.end()) pairs.push_back(key);
    }

    ThreadPool pool(std::min<unsigned>(resolve_thread_count(nthreads),
                                       static_cast<unsigned>(std::max<std::size_t>(1, pairs.size()))));

    /* 1. one calibration per distinct pair -------------------------- */
    std::vector<std::future<AxisPtr>> axis_futs;
    axis_futs.reserve(pairs.size());
    for (const auto& pr : pairs)
        axis_futs.emplace_back(pool.enqueue([&calibrator, &cache, &config, &pr] {
            const Vector exc = read_openraman_csv(pr.first);
            const Vector emi = read_openraman_csv(pr.second);
            return cache.insert_if_absent(calibration_key(exc, emi, config), [&] {
                if (config.verbose)
                    std::cout << "[Spectra] calibrating " << pr.first << " / "
                              << pr.second << '\n';
                return calibrator.calibrate(exc, emi);
            });
        }));

    std::vector<AxisPtr> axes;
    axes.reserve(pairs.size());
    for (auto& f : axis_futs) axes.push_back(f.get());

    /* 2. samples ---------------------------------------------------- */
    std::vector<std::string> sample_paths;
    sample_paths.reserve(entries.size());
    for (const auto& e : entries) sample_paths.push_back(e.sample);
    std::vector<Vector> traces = read_openraman_parallel(sample_paths);

    RamanSpectra out;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Vector& axis = *axes[pair_of[i]];
        if (traces[i].size() != axis.size())
            throw std::runtime_error("'" + entries[i].sample + "' has " +
                                     std::to_string(traces[i].size()) +
                                     " samples, calibration axis " +
                                     std::to_string(axis.size()));
        std::string name = entries[i].name.empty()
                               ? fs::path(entries[i].sample).stem().string()
                               : entries[i].name;
        out.insert(std::move(name), RamanSpectrum(axis, std::move(traces[i])));
    }
    return out;
}

} // namespace ramancal
