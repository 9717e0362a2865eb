#include "test_support.hpp"
#include <zscan/zscan.h>
#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

using namespace zscan;
using zscan_test::dataPath;

namespace {

FitResult phaseOnlyResult(double delta_phi0, double delta_phi0_error, double q0 = 0.0, double q0_error = 0.0) {
    FitResult result;
    result.delta_phi0 = {delta_phi0, delta_phi0_error, false};
    result.q0 = {q0, q0_error, false};
    return result;
}

} // namespace

TEST(DerivationTest, EffectiveLength) {
    EXPECT_DOUBLE_EQ(analysis::effectiveLength(1e-3, 1.0), 1e-3);

    const double alpha = -std::log(0.5) / 2e-3;
    EXPECT_NEAR(analysis::effectiveLength(2e-3, 0.5), (1.0 - std::exp(-alpha * 2e-3)) / alpha, 1e-15);
    EXPECT_LT(analysis::effectiveLength(2e-3, 0.5), 2e-3);
}

TEST(DerivationTest, NonlinearCoefficients) {
    PhysicalConstants constants;
    constants.sample_length_m = 1e-3;
    constants.linear_transmittance = 1.0;
    constants.peak_irradiance = 1e13;
    constants.wavelength_m = 532e-9;

    const auto derived = analysis::deriveNonlinearCoefficients(phaseOnlyResult(0.5, 0.01, 0.2, 0.02), constants);

    const double pi = std::acos(-1.0);
    const double n2 = 0.5 * 532e-9 / (2.0 * pi * 1e-3 * 1e13);
    const double beta = 2.0 * std::sqrt(2.0) * 0.2 / (1e-3 * 1e13);
    EXPECT_NEAR(derived.n2, n2, 1e-12 * std::abs(n2));
    EXPECT_NEAR(derived.n2_error, n2 * 0.02, 1e-12 * std::abs(n2));
    EXPECT_NEAR(derived.beta, beta, 1e-12 * beta);
    EXPECT_NEAR(derived.beta_error, beta * 0.1, 1e-12 * beta);
    EXPECT_DOUBLE_EQ(derived.effective_length, 1e-3);
}

TEST(DerivationTest, SignFollowsPhaseShift) {
    PhysicalConstants constants = zscan_test::testConstants();
    constants.wavelength_m = 800e-9;
    EXPECT_LT(analysis::deriveNonlinearCoefficients(phaseOnlyResult(-0.3, 0.0), constants).n2, 0.0);
    EXPECT_GT(analysis::deriveNonlinearCoefficients(phaseOnlyResult(0.3, 0.0), constants).n2, 0.0);
}

TEST(DerivationTest, InvalidConstants) {
    PhysicalConstants constants = zscan_test::testConstants();
    constants.wavelength_m = 532e-9;
    const auto result = phaseOnlyResult(0.5, 0.01);

    PhysicalConstants bad = constants;
    bad.sample_length_m = 0.0;
    EXPECT_THROW(analysis::deriveNonlinearCoefficients(result, bad), InvalidConstantsError);

    bad = constants;
    bad.peak_irradiance = -1.0;
    EXPECT_THROW(analysis::deriveNonlinearCoefficients(result, bad), InvalidConstantsError);

    bad = constants;
    bad.linear_transmittance = 0.0;
    EXPECT_THROW(analysis::deriveNonlinearCoefficients(result, bad), InvalidConstantsError);
    bad.linear_transmittance = 1.2;
    EXPECT_THROW(analysis::deriveNonlinearCoefficients(result, bad), InvalidConstantsError);

    bad = constants;
    bad.wavelength_m = 0.0;
    EXPECT_THROW(analysis::deriveNonlinearCoefficients(result, bad), InvalidConstantsError);
    EXPECT_NO_THROW(analysis::validateConstants(bad, false));
    EXPECT_THROW(analysis::validateConstants(bad, true), InvalidConstantsError);

    bad.sample_length_m = std::nan("");
    EXPECT_THROW(analysis::validateConstants(bad, false), InvalidConstantsError);
}

TEST(DerivationTest, FusedSilicaDispersion) {
    const double n2_800 = analysis::fusedSilicaN2(800e-9);
    EXPECT_NEAR(n2_800, 2.8203e-20 - 3e-27 / 800e-9 + 2e-33 / (800e-9 * 800e-9), 1e-30);
    EXPECT_GT(n2_800, 2e-20);
    EXPECT_LT(n2_800, 3e-20);
    EXPECT_THROW(analysis::fusedSilicaN2(0.0), InvalidConstantsError);
}

TEST(DerivationTest, CalibrationInvertsDerivation) {
    const double wavelength = 475e-9;
    const double length = 1e-3;
    const double n2_reference = analysis::fusedSilicaN2(wavelength);
    const auto reference = phaseOnlyResult(0.35, 0.01);

    const double irradiance = analysis::calibratePeakIrradiance(reference, wavelength, length, n2_reference);
    EXPECT_GT(irradiance, 0.0);

    PhysicalConstants constants;
    constants.sample_length_m = length;
    constants.linear_transmittance = 1.0;
    constants.peak_irradiance = irradiance;
    constants.wavelength_m = wavelength;
    const auto derived = analysis::deriveNonlinearCoefficients(reference, constants);
    EXPECT_NEAR(derived.n2, n2_reference, 1e-12 * n2_reference);

    EXPECT_THROW(analysis::calibratePeakIrradiance(phaseOnlyResult(-0.35, 0.01), wavelength, length, n2_reference),
                 InvalidConstantsError);
    EXPECT_THROW(analysis::calibratePeakIrradiance(reference, wavelength, 0.0, n2_reference), InvalidConstantsError);
}

class CApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = zscan_create_config(1e-3, 0.8, 1e13);
        ASSERT_NE(config_, nullptr);
        text_ = analysis::loadFileText(dataPath("RIO3BiFF-P_0.00.txt"));
    }

    void TearDown() override {
        zscan_destroy_config(config_);
    }

    ZscanConfig* config_ = nullptr;
    std::string text_;
};

TEST_F(CApiTest, FitsInstrumentText) {
    ZscanFitResult result{};
    ASSERT_EQ(zscan_fit_text(text_.c_str(), config_, &result), ZSCAN_OK);

    EXPECT_EQ(result.converged, 1);
    EXPECT_EQ(result.q0_out_of_range, 0);
    EXPECT_LT(result.delta_phi0, 0.0);
    EXPECT_LT(result.n2, 0.0);
    EXPECT_GT(result.beta, 0.0);
    EXPECT_NEAR(result.z0, 49.0, 0.25);
    EXPECT_NEAR(result.effective_length, zscan_effective_length(1e-3, 0.8), 1e-18);
}

TEST_F(CApiTest, StatusCodes) {
    ZscanFitResult result{};
    EXPECT_EQ(zscan_fit_text(nullptr, config_, &result), ZSCAN_INVALID_ARGUMENT);
    EXPECT_EQ(zscan_fit_text(text_.c_str(), nullptr, &result), ZSCAN_INVALID_ARGUMENT);
    EXPECT_EQ(zscan_fit_text("Code: nothing else\n", config_, &result), ZSCAN_PARSE_ERROR);

    config_->peak_irradiance = 0.0;
    EXPECT_EQ(zscan_fit_text(text_.c_str(), config_, &result), ZSCAN_INVALID_CONSTANTS);
    config_->peak_irradiance = 1e13;

    config_->max_iterations = 1;
    EXPECT_EQ(zscan_fit_text(text_.c_str(), config_, &result), ZSCAN_FIT_DIVERGED);
    EXPECT_EQ(result.converged, 0);

    std::string live_empty = text_;
    const std::string row = "0      ";
    const auto pos = live_empty.find("\n" + row);
    ASSERT_NE(pos, std::string::npos);
    const auto end = live_empty.find('\n', pos + 1);
    live_empty.replace(end - 3, 3, "0.5");
    config_->max_iterations = 200;
    EXPECT_EQ(zscan_fit_text(live_empty.c_str(), config_, &result), ZSCAN_NORMALIZATION_ERROR);
}

TEST_F(CApiTest, DivergedFitCarriesDerivedCoefficients) {
    config_->max_iterations = 1;
    ZscanFitResult result{};
    ASSERT_EQ(zscan_fit_text(text_.c_str(), config_, &result), ZSCAN_FIT_DIVERGED);

    // Same partial estimate and derivation as a batch entry
    AnalysisConfig config;
    config.fit.max_iterations = 1;
    config.batch.threads = 1;
    std::vector<MeasurementRecord> records;
    records.push_back(analysis::parseRecord(text_));
    const auto batch = analysis::runBatch(records, zscan_test::testConstants(), config);
    ASSERT_EQ(batch.results.size(), 1u);
    const FitResult& partial = batch.results.begin()->second.result;
    ASSERT_TRUE(partial.derived.has_value());

    EXPECT_NE(result.n2, 0.0);
    EXPECT_NE(result.beta, 0.0);
    EXPECT_DOUBLE_EQ(result.q0, partial.q0.value);
    EXPECT_DOUBLE_EQ(result.n2, partial.derived->n2);
    EXPECT_DOUBLE_EQ(result.beta, partial.derived->beta);
    EXPECT_DOUBLE_EQ(result.effective_length, partial.derived->effective_length);
}

TEST_F(CApiTest, StatusStrings) {
    EXPECT_STREQ(zscan_status_string(ZSCAN_OK), "ok");
    EXPECT_STREQ(zscan_status_string(ZSCAN_FIT_DIVERGED), "fit diverged");
    EXPECT_STREQ(zscan_status_string(ZSCAN_INVALID_CONSTANTS), "invalid constants");
}

TEST(CApiHelpersTest, RejectInvalidInput) {
    EXPECT_EQ(zscan_fused_silica_n2(-1.0), -1.0);
    EXPECT_EQ(zscan_effective_length(1e-3, 0.0), -1.0);
    EXPECT_DOUBLE_EQ(zscan_fused_silica_n2(800e-9), analysis::fusedSilicaN2(800e-9));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
