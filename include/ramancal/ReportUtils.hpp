#pragma once
#include "Calibrator.hpp"
#include "Spectrum.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ramancal {

/* "wavenumber_cm1,intensity" CSV, one row per sample */
void write_spectrum_csv(const std::string& path, const RamanSpectrum& spectrum);

/* one <name>.csv per spectrum inside `out_dir` (created if missing) */
void write_spectra_csv(const std::string& out_dir, const RamanSpectra& spectra);

/*  state, per-stage fitness, power-basis coefficients, detected peaks,
 *  diagnostics and, for a Failed run, the failing stage and message   */
nlohmann::json calibration_report(const CalibrationRun& run);

void write_report(const std::string& path, const nlohmann::json& report);

} // namespace ramancal
