#pragma once
#include "ramancal/Types.hpp"
#include "ramancal/SyntheticTraces.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace ramancal_test {

using ramancal::Real;
using ramancal::Vector;

/* Gaussian lines (center, amplitude) on a constant baseline, no noise */
inline Vector gaussian_peaks(Eigen::Index                                 n,
                             const std::vector<std::pair<double, double>>& lines,
                             double                                       sigma    = 2.0,
                             double                                       baseline = 0.0)
{
    std::vector<ramancal::SyntheticLine> sl;
    for (const auto& [c, a] : lines) sl.push_back({c, a});
    ramancal::SyntheticTraceOptions opt;
    opt.n_pixels      = n;
    opt.line_sigma_px = sigma;
    opt.baseline      = baseline;
    opt.noise_sigma   = 0.0;
    return ramancal::render_lines(sl, opt);
}

inline Vector make_vector(std::initializer_list<double> v)
{
    Vector out(static_cast<Eigen::Index>(v.size()));
    Eigen::Index i = 0;
    for (double x : v) out[i++] = x;
    return out;
}

/* scratch directory removed again at scope exit */
class TempDir {
public:
    TempDir()
    {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("ramancal_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                 "_" + std::to_string(counter++) + "_" +
                 std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        std::filesystem::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void write_text(const std::string& path, const std::string& content)
{
    std::ofstream f(path);
    ASSERT_TRUE(f.good()) << "cannot write " << path;
    f << content;
}

/* OpenRAMAN-style CSV: "Pixel,Intensity (a.u.)" */
inline void write_openraman(const std::string& path, const Vector& intensities)
{
    std::ofstream f(path);
    ASSERT_TRUE(f.good()) << "cannot write " << path;
    f << "Pixel,Intensity (a.u.)\n";
    f.precision(17);
    for (Eigen::Index i = 0; i < intensities.size(); ++i)
        f << i << ',' << intensities[i] << '\n';
}

} // namespace ramancal_test
