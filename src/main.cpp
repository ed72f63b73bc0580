#include "ramancal/JsonUtils.hpp"
#include "ramancal/Calibrator.hpp"
#include "ramancal/CalibrationCache.hpp"
#include "ramancal/ReportUtils.hpp"
#include "ramancal/Spectrum.hpp"
#include "ramancal/SpectrumLoaders.hpp"
#include "ramancal/ThreadPool.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <iostream>
#ifdef _OPENMP
#include <omp.h>
#endif
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace ramancal;

/* --config first, then command-line overrides */
static CalibrationConfig build_config(const cxxopts::ParseResult& cli)
{
    nlohmann::json j = nlohmann::json::object();
    if (cli.count("config")) {
        j = load_json(cli["config"].as<std::string>());
        expand_env(j);
    }
    if (cli.count("rough-threshold"))
        j["roughResidualsThreshold"] = cli["rough-threshold"].as<double>();
    if (cli.count("fine-threshold"))
        j["fineResidualsThreshold"] = cli["fine-threshold"].as<double>();
    if (cli.count("laser"))
        j["excitationWavelengthNm"] = cli["laser"].as<double>();
    if (cli.count("kernel-size"))
        j["kernelSize"] = cli["kernel-size"].as<int>();
    if (cli.count("refinement"))
        j["refinementMethod"] = cli["refinement"].as<std::string>();
    if (cli.count("verbose"))
        j["verbose"] = true;

    return calibration_config_from_json(j);
}

static int run_single(const cxxopts::ParseResult& cli, const CalibrationConfig& cfg)
{
    const std::string sample = cli["sample"].as<std::string>();
    const std::string exc    = cli["excitation"].as<std::string>();
    const std::string emi    = cli["emission"].as<std::string>();

    Vector intensities = read_openraman_csv(sample);
    const CalibrationRun run = Calibrator(cfg).run(read_openraman_csv(exc),
                                                   read_openraman_csv(emi));

    if (cli.count("report")) {
        write_report(cli["report"].as<std::string>(), calibration_report(run));
        std::cout << "[ramancal] report written to " << cli["report"].as<std::string>() << '\n';
    }

    RamanSpectrum spectrum(run.wavenumbers(), std::move(intensities));   // rethrows on failure

    const std::string out = cli.count("output")
                                ? cli["output"].as<std::string>()
                                : fs::path(sample).stem().string() + "_calibrated.csv";
    write_spectrum_csv(out, spectrum);
    std::cout << "[ramancal] " << spectrum.size() << " samples written to " << out
              << " (rough fitness " << run.rough()->fitness
              << ", fine fitness " << run.fine()->fitness << ")\n";
    return 0;
}

static int run_batch(const RamanSpectra& spectra, const cxxopts::ParseResult& cli)
{
    const std::string out_dir = cli.count("output") ? cli["output"].as<std::string>()
                                                    : std::string("calibrated");
    write_spectra_csv(out_dir, spectra);
    std::cout << "[ramancal] " << spectra.size() << " spectra written to " << out_dir << '\n';
    return 0;
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    int rc = 0;
    try {
        cxxopts::Options opts("ramancal", "Two-stage wavenumber calibration of OpenRAMAN spectra");
        opts.add_options()
            ("sample",          "Sample CSV (single mode)", cxxopts::value<std::string>())
            ("excitation",      "Neon calibration CSV (single mode)", cxxopts::value<std::string>())
            ("emission",        "Acetonitrile calibration CSV (single mode)", cxxopts::value<std::string>())
            ("directory",       "Directory of OpenRAMAN CSV files", cxxopts::value<std::string>())
            ("sample-glob",     "Sample file pattern", cxxopts::value<std::string>()->default_value("*.csv"))
            ("excitation-glob", "Neon file pattern", cxxopts::value<std::string>()->default_value("*neon*.csv"))
            ("emission-glob",   "Acetonitrile file pattern", cxxopts::value<std::string>()->default_value("*aceto*.csv"))
            ("manifest",        "JSON manifest of samples and calibration pairs", cxxopts::value<std::string>())
            ("config",          "Calibration configuration JSON", cxxopts::value<std::string>())
            ("rough-threshold", "Rough residual threshold (nm^2)", cxxopts::value<double>())
            ("fine-threshold",  "Fine residual threshold (cm^-2)", cxxopts::value<double>())
            ("laser",           "Excitation wavelength (nm)", cxxopts::value<double>())
            ("kernel-size",     "Median filter kernel size", cxxopts::value<int>())
            ("refinement",      "none | parabolic | gaussian", cxxopts::value<std::string>())
            ("o,output",        "Output CSV (single) or directory (batch)", cxxopts::value<std::string>())
            ("report",          "JSON calibration report (single mode)", cxxopts::value<std::string>())
            ("threads",         "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("cache-size",      "Maximum number of cached calibrations", cxxopts::value<int>()->default_value("64"))
            ("v,verbose",       "Progress output")
            ("h,help",          "Show help");

        auto cli = opts.parse(argc, argv);
        const bool single = cli.count("sample") && cli.count("excitation") && cli.count("emission");
        if (cli.count("help") || (!single && !cli.count("directory") && !cli.count("manifest"))) {
            std::cout << opts.help() << '\n';
            return cli.count("help") ? 0 : 1;
        }

        const CalibrationConfig cfg = build_config(cli);

        int nthreads = cli["threads"].as<int>();
        const unsigned workers = resolve_thread_count(nthreads > 0 ? static_cast<unsigned>(nthreads) : 0u);
#ifdef _OPENMP
        omp_set_num_threads(static_cast<int>(workers));
#endif
        Eigen::setNbThreads(1);

        if (single) {
            rc = run_single(cli, cfg);
        } else if (cli.count("directory")) {
            rc = run_batch(RamanSpectra::from_openraman_directory(
                               cli["directory"].as<std::string>(), cfg,
                               cli["sample-glob"].as<std::string>(),
                               cli["excitation-glob"].as<std::string>(),
                               cli["emission-glob"].as<std::string>()),
                           cli);
        } else {
            CalibrationCache::instance().set_capacity(
                static_cast<std::size_t>(std::max(1, cli["cache-size"].as<int>())));
            const auto entries = load_manifest(cli["manifest"].as<std::string>());
            rc = run_batch(RamanSpectra::from_manifest(entries, cfg,
                                                       CalibrationCache::instance(), workers),
                           cli);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << ms << " ms\n";
    return rc;
}
