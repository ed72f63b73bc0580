#include <gtest/gtest.h>
#include "ramancal/JsonUtils.hpp"
#include "ramancal/ReferenceTables.hpp"
#include "TestHelpers.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace ramancal_test {

using namespace ramancal;
using nlohmann::json;

// ============================================================================
// Calibration config
// ============================================================================

TEST(CalibrationConfigJson, ThresholdsAloneGiveDefaults)
{
    const CalibrationConfig c = calibration_config_from_json(
        json{{"roughResidualsThreshold", 0.2}, {"fineResidualsThreshold", 30.0}});

    EXPECT_DOUBLE_EQ(c.rough_residuals_threshold, 0.2);
    EXPECT_DOUBLE_EQ(c.fine_residuals_threshold, 30.0);
    EXPECT_DOUBLE_EQ(c.excitation_wavelength_nm, 532.0);
    EXPECT_EQ(c.kernel_size, 5);
    EXPECT_EQ(c.refinement_method, RefinementMethod::None);
    EXPECT_FALSE(c.verbose);
    EXPECT_TRUE(c.rough_reference.isApprox(neon_peaks_nm()));
}

TEST(CalibrationConfigJson, MissingThresholdThrows)
{
    EXPECT_THROW(calibration_config_from_json(json{{"roughResidualsThreshold", 0.2}}),
                 std::invalid_argument);
    EXPECT_THROW(calibration_config_from_json(json{{"fineResidualsThreshold", 0.2}}),
                 std::invalid_argument);
    EXPECT_THROW(calibration_config_from_json(json::array()), std::invalid_argument);
}

TEST(CalibrationConfigJson, ReadsOptionalFields)
{
    const json j = {
        {"roughResidualsThreshold", 1.0},
        {"fineResidualsThreshold",  2.0},
        {"excitationWavelengthNm",  785.0},
        {"kernelSize",              7},
        {"refinementMethod",        "Gaussian"},
        {"refinementWindow",        11},
        {"roughDegree",             2},
        {"roughReferenceTable",     "neon"},
        {"fineReferenceTable",      {801.3, 1028.0, 1600.0}},
        {"verbose",                 true}
    };
    const CalibrationConfig c = calibration_config_from_json(j);

    EXPECT_DOUBLE_EQ(c.excitation_wavelength_nm, 785.0);
    EXPECT_EQ(c.kernel_size, 7);
    EXPECT_EQ(c.refinement_method, RefinementMethod::Gaussian);
    EXPECT_EQ(c.refinement_window, 11);
    EXPECT_EQ(c.rough_degree, 2);
    ASSERT_EQ(c.fine_reference.size(), 3);
    EXPECT_DOUBLE_EQ(c.fine_reference[1], 1028.0);
    EXPECT_TRUE(c.verbose);
}

TEST(CalibrationConfigJson, InvalidValuesThrow)
{
    json base = {{"roughResidualsThreshold", 1.0}, {"fineResidualsThreshold", 1.0}};

    json even = base;       even["kernelSize"] = 4;
    json method = base;     method["refinementMethod"] = "cubic";
    json table = base;      table["roughReferenceTable"] = "argon";
    json wrong_type = base; wrong_type["kernelSize"] = "five";
    json obj_table = base;  obj_table["fineReferenceTable"] = json::object();

    for (const json& j : {even, method, table, wrong_type, obj_table})
        EXPECT_THROW(calibration_config_from_json(j), std::invalid_argument) << j.dump();
}

TEST(CalibrationConfigJson, RoundTripsThroughToJson)
{
    CalibrationConfig c(0.3, 40.0);
    c.kernel_size       = 3;
    c.refinement_method = RefinementMethod::Parabolic;

    const CalibrationConfig back = calibration_config_from_json(to_json(c));
    EXPECT_EQ(back.kernel_size, 3);
    EXPECT_EQ(back.refinement_method, RefinementMethod::Parabolic);
    EXPECT_DOUBLE_EQ(back.fine_residuals_threshold, 40.0);
    EXPECT_TRUE(back.fine_reference.isApprox(c.fine_reference));
}

// ============================================================================
// Files / environment
// ============================================================================

TEST(JsonFiles, LoadJsonReportsParseErrors)
{
    TempDir dir;
    write_text(dir.file("bad.json"), "{ not json");
    EXPECT_THROW(load_json(dir.file("bad.json")), std::runtime_error);
    EXPECT_THROW(load_json(dir.file("missing.json")), std::runtime_error);
}

TEST(JsonFiles, ExpandEnvReplacesVariables)
{
    ::setenv("RAMANCAL_TEST_DATA", "/data/raman", 1);
    json j = {{"sample", "${RAMANCAL_TEST_DATA}/s1.csv"}, {"list", {"${RAMANCAL_TEST_DATA}"}},
              {"n", 3}};
    expand_env(j);
    EXPECT_EQ(j["sample"].get<std::string>(), "/data/raman/s1.csv");
    EXPECT_EQ(j["list"][0].get<std::string>(), "/data/raman");
    EXPECT_EQ(j["n"].get<int>(), 3);
}

// ============================================================================
// Manifest
// ============================================================================

TEST(Manifest, ArrayAndObjectFormsAgree)
{
    const json rows = json::array({
        {{"name", "a"}, {"sample", "a.csv"}, {"excitation", "ne.csv"}, {"emission", "ac.csv"}},
        {{"sample", "/abs/b.csv"}, {"excitation", "ne.csv"}, {"emission", "ac.csv"}}
    });

    const auto from_array  = manifest_from_json(rows, "/base");
    const auto from_object = manifest_from_json(json{{"samples", rows}}, "/base");

    ASSERT_EQ(from_array.size(), 2u);
    ASSERT_EQ(from_object.size(), 2u);
    EXPECT_EQ(from_array[0].name, "a");
    EXPECT_EQ(from_array[0].sample, (std::filesystem::path("/base") / "a.csv").string());
    EXPECT_EQ(from_array[1].name, "");
    EXPECT_EQ(from_array[1].sample, "/abs/b.csv");
    EXPECT_EQ(from_object[1].excitation, from_array[1].excitation);
}

TEST(Manifest, MissingKeysThrow)
{
    EXPECT_THROW(manifest_from_json(json::array({{{"sample", "a.csv"}}})), std::invalid_argument);
    EXPECT_THROW(manifest_from_json(json{{"name", "x"}}), std::invalid_argument);
}

TEST(Manifest, LoadResolvesAgainstManifestDirectory)
{
    TempDir dir;
    write_text(dir.file("manifest.json"),
               R"([{"sample": "s.csv", "excitation": "n.csv", "emission": "a.csv"}])");

    const auto entries = load_manifest(dir.file("manifest.json"));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].sample, dir.file("s.csv"));
    EXPECT_EQ(entries[0].emission, dir.file("a.csv"));
}

} // namespace ramancal_test
