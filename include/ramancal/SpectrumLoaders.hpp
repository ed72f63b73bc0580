// SpectrumLoaders.hpp
#pragma once
#include "ramancal/Spectrum.hpp"          //  cm⁻¹, intensity container
#include <functional>
#include <string>
#include <vector>

namespace ramancal {

using SpectrumLoader = std::function<RamanSpectrum(const std::string&)>;

/* OpenRAMAN export: CSV with a header row, the "Intensity (a.u.)" column is
 * returned.  The instrument does not calibrate its axis.                   */
Vector read_openraman_csv(const std::string& path);

/* Horiba MacroRAM export: 32 metadata lines, then tab separated
 * wavenumber / intensity rows in descending order, returned ascending.    */
RamanSpectrum read_horiba_txt(const std::string& path);

/* whitespace separated wavenumber / intensity, '#' comments, sorted */
RamanSpectrum read_ascii_2col(const std::string& path);

/* "OpenRAMAN" (pixel-index axis), "Horiba", "ASCII" or "auto" */
RamanSpectrum load_spectrum(const std::string& path,
                            const std::string& format = "auto");

std::vector<std::string> spectrum_formats();

} // namespace ramancal
