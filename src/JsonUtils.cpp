#include "ramancal/JsonUtils.hpp"
#include "ramancal/ReferenceTables.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace ramancal {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "'");
    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("'" + path + "': " + e.what());
    }
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* ------------------------------------------------------------------ */
static Vector reference_from_json(const nlohmann::json& j, const char* key)
{
    if (j.is_string())
        return reference_table(j.get<std::string>());
    if (j.is_array()) {
        const auto values = j.get<std::vector<double>>();
        Vector v(static_cast<Eigen::Index>(values.size()));
        for (std::size_t i = 0; i < values.size(); ++i)
            v[static_cast<Eigen::Index>(i)] = values[i];
        return v;
    }
    throw std::invalid_argument(std::string("config: '") + key +
                                "' must be a table name or an array of numbers");
}

template<typename T>
static void read_opt(const nlohmann::json& j, const char* key, T& out)
{
    if (j.contains(key)) out = j.at(key).get<T>();
}

CalibrationConfig calibration_config_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::invalid_argument("config: expected a JSON object");

    for (const char* key : {"roughResidualsThreshold", "fineResidualsThreshold"})
        if (!j.contains(key))
            throw std::invalid_argument(std::string("config: missing required key '") + key + "'");

    try {
        CalibrationConfig cfg(j.at("roughResidualsThreshold").get<double>(),
                              j.at("fineResidualsThreshold").get<double>());

        read_opt(j, "excitationWavelengthNm", cfg.excitation_wavelength_nm);
        read_opt(j, "kernelSize",             cfg.kernel_size);
        read_opt(j, "prominenceIncrement",    cfg.prominence_increment);
        read_opt(j, "maxIterations",          cfg.max_iterations);
        read_opt(j, "roughDegree",            cfg.rough_degree);
        read_opt(j, "fineDegree",             cfg.fine_degree);
        read_opt(j, "refinementWindow",       cfg.refinement_window);
        read_opt(j, "verbose",                cfg.verbose);

        if (j.contains("refinementMethod"))
            cfg.refinement_method =
                parse_refinement_method(j.at("refinementMethod").get<std::string>());
        if (j.contains("roughReferenceTable"))
            cfg.rough_reference = reference_from_json(j.at("roughReferenceTable"),
                                                      "roughReferenceTable");
        if (j.contains("fineReferenceTable"))
            cfg.fine_reference = reference_from_json(j.at("fineReferenceTable"),
                                                     "fineReferenceTable");

        cfg.validate();
        return cfg;
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("config: ") + e.what());
    }
}

nlohmann::json to_json(const CalibrationConfig& c)
{
    return {
        {"excitationWavelengthNm",  c.excitation_wavelength_nm},
        {"kernelSize",              c.kernel_size},
        {"roughResidualsThreshold", c.rough_residuals_threshold},
        {"fineResidualsThreshold",  c.fine_residuals_threshold},
        {"prominenceIncrement",     c.prominence_increment},
        {"maxIterations",           c.max_iterations},
        {"roughDegree",             c.rough_degree},
        {"fineDegree",              c.fine_degree},
        {"refinementMethod",        to_string(c.refinement_method)},
        {"refinementWindow",        c.refinement_window},
        {"roughReferenceTable",     std::vector<double>(c.rough_reference.data(),
                                        c.rough_reference.data() + c.rough_reference.size())},
        {"fineReferenceTable",      std::vector<double>(c.fine_reference.data(),
                                        c.fine_reference.data() + c.fine_reference.size())}
    };
}

/* ------------------------------------------------------------------ */
std::vector<ManifestEntry> manifest_from_json(const nlohmann::json& j,
                                              const std::string&    base_dir)
{
    namespace fs = std::filesystem;

    const nlohmann::json& rows = j.is_object() && j.contains("samples") ? j.at("samples") : j;
    if (!rows.is_array())
        throw std::invalid_argument("manifest: expected an array of samples");

    auto resolve = [&](const std::string& p) {
        if (base_dir.empty() || fs::path(p).is_absolute()) return p;
        return (fs::path(base_dir) / p).string();
    };

    std::vector<ManifestEntry> entries;
    for (const auto& row : rows) {
        for (const char* key : {"sample", "excitation", "emission"})
            if (!row.contains(key))
                throw std::invalid_argument(std::string("manifest: entry without '") + key + "'");

        ManifestEntry e;
        e.name       = row.value("name", std::string{});
        e.sample     = resolve(row.at("sample").get<std::string>());
        e.excitation = resolve(row.at("excitation").get<std::string>());
        e.emission   = resolve(row.at("emission").get<std::string>());
        entries.push_back(std::move(e));
    }
    return entries;
}

std::vector<ManifestEntry> load_manifest(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);
    return manifest_from_json(j, std::filesystem::path(path).parent_path().string());
}

} // namespace ramancal
