#include "ramancal/ReferenceTables.hpp"
#include <ankerl/unordered_dense.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ramancal {

namespace {

Vector make_table(std::initializer_list<Real> values)
{
    Vector v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (Real x : values) v[i++] = x;
    return v;
}

using TableMap = ankerl::unordered_dense::map<std::string, Vector>;

const TableMap& registry()
{
    static const TableMap tables = {
        {"neon", make_table({585.249, 588.189, 594.483, 607.434, 609.616,
                             614.306, 616.359, 621.728, 626.649, 630.479,
                             633.443, 638.299, 640.225, 650.653, 653.288})},
        {"acetonitrile", make_table({918, 1376, 2249, 2942, 2999})}
    };
    return tables;
}

} // unnamed namespace

const Vector& neon_peaks_nm()          { return registry().at("neon"); }
const Vector& acetonitrile_peaks_cm1() { return registry().at("acetonitrile"); }

const Vector& reference_table(const std::string& name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& tables = registry();
    auto it = tables.find(key);
    if (it == tables.end())
        throw std::invalid_argument("Unknown reference table '" + name + "'");
    return it->second;
}

std::vector<std::string> reference_table_names()
{
    std::vector<std::string> names;
    for (const auto& kv : registry()) names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace ramancal
