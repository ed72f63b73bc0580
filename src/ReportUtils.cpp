#include "ramancal/ReportUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace ramancal {

namespace {

std::vector<double> to_std(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

std::ofstream open_out(const std::string& path)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    return f;
}

nlohmann::json diagnostics_json(const Diagnostics& diags)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : diags)
        arr.push_back({{"code", to_string(d.code)}, {"message", d.message}});
    return arr;
}

} // unnamed namespace

/* ------------------------------------------------------------------ */
void write_spectrum_csv(const std::string& path, const RamanSpectrum& s)
{
    std::ofstream f = open_out(path);
    f << "wavenumber_cm1,intensity\n";
    for (Eigen::Index i = 0; i < s.size(); ++i)
        f << std::setprecision(10)
          << s.wavenumbers_cm1()[i] << ','
          << s.intensities()[i]     << '\n';
    if (!f)
        throw std::runtime_error("Error while writing '" + path + "'");
}

void write_spectra_csv(const std::string& out_dir, const RamanSpectra& spectra)
{
    namespace fs = std::filesystem;
    fs::create_directories(out_dir);
    for (const auto& [name, spectrum] : spectra) {
        const fs::path p = fs::path(out_dir) / (name + ".csv");
        write_spectrum_csv(p.string(), spectrum);
        std::cout << "[Report] wrote " << p.string() << '\n';
    }
}

/* ------------------------------------------------------------------ */
nlohmann::json calibration_report(const CalibrationRun& run)
{
    nlohmann::json j;
    j["state"] = to_string(run.state());

    if (const auto& r = run.rough()) {
        j["rough"] = {
            {"fitness",      r->fitness},
            {"coefficients", to_std(r->polynomial.power_basis_coefficients())},
            {"peakIndices",  r->peak_indices},
            {"diagnostics",  diagnostics_json(r->diagnostics)}
        };
    }
    if (const auto& f = run.fine()) {
        j["fine"] = {
            {"fitness",       f->fitness},
            {"coefficients",  to_std(f->polynomial.power_basis_coefficients())},
            {"peakIndices",   f->peak_indices},
            {"peakPositions", to_std(f->peak_positions)},
            {"observedCm1",   to_std(f->observed_cm1)},
            {"diagnostics",   diagnostics_json(f->diagnostics)}
        };
    }
    if (run.state() == CalibrationState::Failed) {
        j["error"] = {
            {"stage",   run.failed_stage() ? to_string(*run.failed_stage()) : "unknown"},
            {"message", run.error_message()}
        };
    }
    return j;
}

void write_report(const std::string& path, const nlohmann::json& report)
{
    std::ofstream f = open_out(path);
    f << std::setw(2) << report << '\n';
    if (!f)
        throw std::runtime_error("Error while writing '" + path + "'");
}

} // namespace ramancal
