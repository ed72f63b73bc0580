#include "ramancal/SpectrumLoaders.hpp"
#include "ramancal/NumericUtils.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ramancal {
namespace {

constexpr const char* kOpenRamanIntensityColumn = "Intensity (a.u.)";
constexpr int         kHoribaHeaderLines        = 32;

std::ifstream open_or_throw(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");
    return in;
}

/* drop a trailing '\r' from files written on Windows */
void chomp(std::string& line)
{
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

std::string trim(const std::string& s)
{
    auto first = std::find_if_not(s.begin(), s.end(), ::isspace);
    auto last  = std::find_if_not(s.rbegin(), s.rend(), ::isspace).base();
    if (first >= last) return {};
    std::string out(first, last);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"')
        out = out.substr(1, out.size() - 2);
    return out;
}

std::vector<std::string> split(const std::string& line, char sep)
{
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream ss(line);
    while (std::getline(ss, cell, sep)) cells.push_back(trim(cell));
    if (!line.empty() && line.back() == sep) cells.emplace_back();
    return cells;
}

/* whole-cell conversion: "12abc" is an error, not 12 */
double parse_number(const std::string& cell,
                    const std::string& path,
                    std::size_t        line_no)
{
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(cell, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != cell.size())
        throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                 ": non-numeric value '" + cell + "'");
    return v;
}

// ----------------------------------------------------------------------------
//  Read an ASCII table with two columns of doubles, skip comment lines
// ----------------------------------------------------------------------------
std::vector<std::array<double, 2>>
read_ascii_table(const std::string& path, char comment_char = '#')
{
    std::ifstream in = open_or_throw(path);

    std::vector<std::array<double, 2>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        chomp(line);
        auto it = std::find_if_not(line.begin(), line.end(), ::isspace);
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::istringstream ss(line);
        std::array<double, 2> row{0.0, 0.0};
        if (!(ss >> row[0] >> row[1])) continue;
        rows.push_back(row);
    }
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    return rows;
}

// ----------------------------------------------------------------------------
//  Sort <x, y> rows by x ascending and move into Eigen vectors
// ----------------------------------------------------------------------------
RamanSpectrum to_sorted_spectrum(const std::vector<std::array<double, 2>>& rows)
{
    const std::size_t n = rows.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t i, std::size_t j)
                     { return rows[i][0] < rows[j][0]; });

    Vector x(static_cast<Eigen::Index>(n));
    Vector y(static_cast<Eigen::Index>(n));
    for (std::size_t k = 0; k < n; ++k) {
        x[static_cast<Eigen::Index>(k)] = rows[idx[k]][0];
        y[static_cast<Eigen::Index>(k)] = rows[idx[k]][1];
    }
    return RamanSpectrum(std::move(x), std::move(y));
}

RamanSpectrum load_openraman(const std::string& path)
{
    Vector intensities = read_openraman_csv(path);
    Vector pixels      = index_axis(intensities.size());
    return RamanSpectrum(std::move(pixels), std::move(intensities));
}

struct NamedLoader {
    const char*    name;
    SpectrumLoader load;
};

const std::vector<NamedLoader>& loaders()
{
    static const std::vector<NamedLoader> table = {
        {"OpenRAMAN", load_openraman},
        {"Horiba",    read_horiba_txt},
        {"ASCII",     read_ascii_2col}
    };
    return table;
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // unnamed namespace

// ============================================================================
//  Public loader implementations
// ============================================================================

Vector read_openraman_csv(const std::string& path)
{
    std::ifstream in = open_or_throw(path);

    std::string line;
    std::size_t line_no = 0;
    if (!std::getline(in, line))
        throw std::runtime_error("read_openraman_csv: '" + path + "' is empty");
    ++line_no;
    chomp(line);

    const auto header = split(line, ',');
    auto col_it = std::find(header.begin(), header.end(), kOpenRamanIntensityColumn);
    if (col_it == header.end())
        throw std::runtime_error("read_openraman_csv: '" + path + "' has no column '" +
                                 kOpenRamanIntensityColumn + "'");
    const auto col = static_cast<std::size_t>(col_it - header.begin());

    std::vector<double> values;
    while (std::getline(in, line)) {
        ++line_no;
        chomp(line);
        if (trim(line).empty()) continue;

        const auto cells = split(line, ',');
        if (col >= cells.size())
            throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                     ": row has " + std::to_string(cells.size()) +
                                     " columns, expected at least " + std::to_string(col + 1));
        values.push_back(parse_number(cells[col], path, line_no));
    }
    if (values.empty())
        throw std::runtime_error("read_openraman_csv: '" + path + "' contains no data rows");

    return Eigen::Map<const Vector>(values.data(), static_cast<Eigen::Index>(values.size()));
}

// ----------------------------------------------------------------------------
RamanSpectrum read_horiba_txt(const std::string& path)
{
    std::ifstream in = open_or_throw(path);

    std::string line;
    std::size_t line_no = 0;
    for (; line_no < static_cast<std::size_t>(kHoribaHeaderLines); ++line_no)
        if (!std::getline(in, line))
            throw std::runtime_error("read_horiba_txt: '" + path +
                                     "' ends inside the metadata header");

    std::vector<double> wn, inten;
    while (std::getline(in, line)) {
        ++line_no;
        chomp(line);
        if (trim(line).empty()) continue;

        const auto cells = split(line, '\t');
        if (cells.size() < 2)
            throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                     ": expected two tab separated columns");
        wn   .push_back(parse_number(cells[0], path, line_no));
        inten.push_back(parse_number(cells[1], path, line_no));
    }
    if (wn.empty())
        throw std::runtime_error("read_horiba_txt: '" + path + "' contains no data rows");

    /* the instrument writes high → low wavenumber */
    const auto n = static_cast<Eigen::Index>(wn.size());
    Vector x = Eigen::Map<const Vector>(wn.data(),    n).reverse();
    Vector y = Eigen::Map<const Vector>(inten.data(), n).reverse();
    return RamanSpectrum(std::move(x), std::move(y));
}

// ----------------------------------------------------------------------------
RamanSpectrum read_ascii_2col(const std::string& path)
{
    return to_sorted_spectrum(read_ascii_table(path));
}

// ----------------------------------------------------------------------------
// Dispatcher / auto-detection -------------------------------------------------
// ----------------------------------------------------------------------------
std::vector<std::string> spectrum_formats()
{
    std::vector<std::string> names;
    for (const auto& l : loaders()) names.emplace_back(l.name);
    return names;
}

RamanSpectrum load_spectrum(const std::string& path, const std::string& format)
{
    if (lower(format) == "auto") {
        /* try the reader matching the extension first, then the rest */
        const std::string ext = lower(std::filesystem::path(path).extension().string());
        const char* preferred = ext == ".csv" ? "OpenRAMAN"
                              : ext == ".txt" ? "Horiba"
                                              : "ASCII";

        std::vector<const NamedLoader*> order;
        for (const auto& l : loaders())
            if (std::string(l.name) == preferred) order.insert(order.begin(), &l);
            else                                  order.push_back(&l);

        std::string errors;
        for (const NamedLoader* l : order) {
            try { return l->load(path); }
            catch (const std::runtime_error& e) {       // try next
                errors += std::string("\n  ") + l->name + ": " + e.what();
            }
        }
        throw std::runtime_error("load_spectrum(auto): none of the registered "
                                 "readers could load '" + path + "'" + errors);
    }

    for (const auto& l : loaders())
        if (lower(l.name) == lower(format))
            return l.load(path);

    throw std::runtime_error("Unsupported spectrum format: " + format);
}

} // namespace ramancal
