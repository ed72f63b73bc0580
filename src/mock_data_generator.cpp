// src/mock_data_generator.cpp

#include "ramancal/SyntheticTraces.hpp"
#include "ramancal/NumericUtils.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <random>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ramancal;

// Main configuration structure
struct MockDataConfig {
    LinearDispersion      dispersion;
    SyntheticTraceOptions trace;

    double excitation_nm   = 532.0;
    int    num_samples     = 3;
    int    lines_min       = 4;       // Raman lines per sample
    int    lines_max       = 10;
    double shift_min       = 300.0;   // cm^-1
    double shift_max       = 3000.0;

    std::string output_dir = "./mock_data/";
    bool verbose = false;
};

// OpenRAMAN-style export: pixel index plus the raw intensity column
static void write_openraman_csv(const fs::path& path, const Vector& intensities)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path.string() + "'");
    f << "Pixel,Intensity (a.u.)\n";
    for (Eigen::Index i = 0; i < intensities.size(); ++i)
        f << i << ',' << std::setprecision(10) << intensities[i] << '\n';
}

// Random Raman lines for one sample
static std::vector<SyntheticLine> random_sample_lines(const MockDataConfig& cfg,
                                                      std::mt19937&         rng,
                                                      nlohmann::json&       truth)
{
    std::uniform_int_distribution<int>     count(cfg.lines_min, cfg.lines_max);
    std::uniform_real_distribution<double> shift(cfg.shift_min, cfg.shift_max);
    std::uniform_real_distribution<double> amp(0.1, 1.0);

    std::vector<SyntheticLine> lines;
    const int n = count(rng);
    for (int k = 0; k < n; ++k) {
        const double s = shift(rng);
        const double px = cfg.dispersion.pixel_of_shift(s, cfg.excitation_nm);
        if (px < 0.0 || px > static_cast<double>(cfg.trace.n_pixels - 1)) continue;
        lines.push_back({px, amp(rng)});
        truth.push_back({{"shiftCm1", s}, {"pixel", px}, {"amplitude", lines.back().amplitude}});
    }
    return lines;
}

int main(int argc, char** argv) {
    cxxopts::Options options("ramancal_mock",
                             "Generate synthetic OpenRAMAN calibration and sample traces");

    options.add_options()
        ("n,num-samples", "Number of sample spectra", cxxopts::value<int>()->default_value("3"))
        ("pixels", "Detector pixels", cxxopts::value<int>()->default_value("2048"))
        ("wavelength-start", "Wavelength at pixel 0 (nm)", cxxopts::value<double>()->default_value("555"))
        ("dispersion", "Dispersion (nm / pixel)", cxxopts::value<double>()->default_value("0.05"))
        ("laser", "Excitation wavelength (nm)", cxxopts::value<double>()->default_value("532"))
        ("line-width", "Line sigma (pixels)", cxxopts::value<double>()->default_value("2"))
        ("baseline", "Constant background", cxxopts::value<double>()->default_value("0.05"))
        ("noise", "Gaussian noise sigma", cxxopts::value<double>()->default_value("0.005"))
        ("seed", "Random seed", cxxopts::value<unsigned>()->default_value("42"))
        ("o,output", "Output directory", cxxopts::value<std::string>()->default_value("./mock_data/"))
        ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        MockDataConfig config;
        config.num_samples                   = result["num-samples"].as<int>();
        config.trace.n_pixels                = result["pixels"].as<int>();
        config.dispersion.wavelength_start_nm = result["wavelength-start"].as<double>();
        config.dispersion.nm_per_pixel       = result["dispersion"].as<double>();
        config.excitation_nm                 = result["laser"].as<double>();
        config.trace.line_sigma_px           = result["line-width"].as<double>();
        config.trace.baseline                = result["baseline"].as<double>();
        config.trace.noise_sigma             = result["noise"].as<double>();
        config.trace.seed                    = result["seed"].as<unsigned>();
        config.output_dir                    = result["output"].as<std::string>();
        config.verbose                       = result["verbose"].as<bool>();

        if (config.num_samples < 0)
            throw std::invalid_argument("--num-samples must be non-negative");

        const fs::path out(config.output_dir);
        fs::create_directories(out);

        /* calibration traces --------------------------------------- */
        SyntheticTraceOptions opt = config.trace;
        write_openraman_csv(out / "neon.csv", synthetic_neon_trace(config.dispersion, opt));
        opt.seed += 1;
        write_openraman_csv(out / "acetonitrile.csv",
                            synthetic_acetonitrile_trace(config.dispersion, config.excitation_nm, opt));

        /* samples --------------------------------------------------- */
        std::mt19937 rng(config.trace.seed);
        nlohmann::json manifest = nlohmann::json::array();
        nlohmann::json truth;
        truth["wavelengthStartNm"]  = config.dispersion.wavelength_start_nm;
        truth["nmPerPixel"]         = config.dispersion.nm_per_pixel;
        truth["excitationNm"]       = config.excitation_nm;

        for (int s = 0; s < config.num_samples; ++s) {
            const std::string name = "sample_" + std::to_string(s + 1);
            nlohmann::json lines_truth = nlohmann::json::array();
            opt.seed = config.trace.seed + 100u + static_cast<unsigned>(s);
            const Vector trace = render_lines(random_sample_lines(config, rng, lines_truth), opt);

            write_openraman_csv(out / (name + ".csv"), trace);
            manifest.push_back({{"name", name},
                                {"sample", name + ".csv"},
                                {"excitation", "neon.csv"},
                                {"emission", "acetonitrile.csv"}});
            truth["samples"][name] = lines_truth;

            if (config.verbose)
                std::cout << "[Mock] " << name << ": " << lines_truth.size() << " lines\n";
        }

        /* calibrated pixel → cm^-1 axis the pipeline should reproduce */
        Vector true_axis(config.trace.n_pixels);
        for (Eigen::Index p = 0; p < true_axis.size(); ++p)
            true_axis[p] = config.dispersion.wavelength_nm(static_cast<double>(p));
        true_axis = calculate_raman_shift(true_axis, config.excitation_nm);
        truth["wavenumbersCm1"] = std::vector<double>(true_axis.data(),
                                                      true_axis.data() + true_axis.size());

        std::ofstream mf(out / "manifest.json");
        mf << std::setw(2) << manifest << '\n';
        std::ofstream tf(out / "truth.json");
        tf << std::setw(2) << truth << '\n';

        std::cout << "Wrote neon.csv, acetonitrile.csv and " << config.num_samples
                  << " samples to " << out.string() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
