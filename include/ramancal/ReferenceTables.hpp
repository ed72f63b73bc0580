#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace ramancal {

/* 15 neon emission lines (nm) in the OpenRAMAN excitation range */
const Vector& neon_peaks_nm();

/* 5 characteristic acetonitrile Raman lines (cm⁻¹) */
const Vector& acetonitrile_peaks_cm1();

/* lookup by name ("neon", "acetonitrile"; case-insensitive); throws
 * std::invalid_argument for an unknown table                           */
const Vector& reference_table(const std::string& name);

std::vector<std::string> reference_table_names();

} // namespace ramancal
