#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace zscan;
using zscan_test::dataPath;
using zscan_test::modelCurves;

TEST(ModelTest, ClosedApertureReducesToRefractiveCurve) {
    const ZscanParameters params{0.7, 0.0, 2.0, 3.0};
    for (double z = -20.0; z <= 20.0; z += 0.5) {
        const double x = (z - params.z0) / params.rayleigh_range;
        const double refractive = 1.0 + 4.0 * x * params.delta_phi0 / ((x * x + 1.0) * (x * x + 9.0));
        EXPECT_NEAR(analysis::closedApertureTransmittance(z, params), refractive, 1e-15) << "z=" << z;
    }
}

TEST(ModelTest, StableAtFocus) {
    const ZscanParameters params{0.7, 0.3, 2.0, 3.0};
    EXPECT_DOUBLE_EQ(analysis::closedApertureTransmittance(2.0, params), 1.0 - 3.0 * 0.3 / 9.0);
    EXPECT_TRUE(std::isfinite(analysis::closedApertureTransmittance(2.0 + 1e-12, params)));

    const auto gradient = analysis::closedApertureGradient(2.0, params);
    EXPECT_TRUE(std::isfinite(gradient.d_z0));
    EXPECT_TRUE(std::isfinite(gradient.d_rayleigh_range));
}

TEST(ModelTest, OpenApertureSeries) {
    EXPECT_DOUBLE_EQ(analysis::openApertureTransmittance(0.0, {0.0, 0.0, 0.0, 1.0}), 1.0);

    // Leading terms 1 - q0 + 8 q0^2 / 3^(3/2) at focus
    const double q0 = 0.001;
    const double expected = 1.0 - q0 + 8.0 * q0 * q0 / std::pow(3.0, 1.5);
    EXPECT_NEAR(analysis::openApertureTransmittance(0.0, {0.0, q0, 0.0, 1.0}), expected, 1e-8);

    // Half the on-axis absorption one Rayleigh range away
    const double q_focus = kAbsorptionScale * 0.1;
    const double at_rayleigh = 1.0 - 0.5 * q_focus / std::pow(2.0, 1.5) + 0.25 * q_focus * q_focus / std::pow(3.0, 1.5);
    EXPECT_NEAR(analysis::openApertureTransmittance(1.0, {0.0, 0.1, 0.0, 1.0}), at_rayleigh, 1e-3);

    // Far field is transparent
    EXPECT_NEAR(analysis::openApertureTransmittance(1e4, {0.0, 0.3, 0.0, 1.0}), 1.0, 1e-8);
    // Saturable absorption raises the transmittance
    EXPECT_GT(analysis::openApertureTransmittance(0.0, {0.0, -0.3, 0.0, 1.0}), 1.0);
}

TEST(ModelTest, OpenApertureUndefinedOutsideDomain) {
    EXPECT_TRUE(std::isnan(analysis::openApertureTransmittance(0.0, {0.0, 1.0, 0.0, 1.0})));
    EXPECT_TRUE(std::isnan(analysis::openApertureTransmittance(0.0, {0.0, 0.36, 0.0, 1.0})));
    EXPECT_TRUE(std::isfinite(analysis::openApertureTransmittance(0.0, {0.0, 0.35, 0.0, 1.0})));
    EXPECT_TRUE(std::isnan(analysis::openApertureTransmittance(0.0, {0.0, 0.3, 0.0, 0.0})));
    EXPECT_FALSE(analysis::withinOpenApertureDomain(-1.0 / kAbsorptionScale));
    EXPECT_TRUE(analysis::withinOpenApertureDomain(-0.35));
}

TEST(ModelTest, ClosedApertureAbsorptionAtFocus) {
    // Pure absorber: the closed-aperture dip is a third of q0, shallower than the open-aperture dip
    const ZscanParameters params{0.0, 0.1, 0.0, 3.0};
    EXPECT_DOUBLE_EQ(analysis::closedApertureTransmittance(0.0, params), 1.0 - 0.1 / 3.0);
    EXPECT_LT(analysis::openApertureTransmittance(0.0, params), analysis::closedApertureTransmittance(0.0, params));
}

TEST(ModelTest, GradientsMatchFiniteDifferences) {
    const ZscanParameters params{0.6, 0.2, 1.0, 2.5};
    const double h = 1e-6;
    for (double z : {-4.0, -1.0, 0.5, 3.0}) {
        for (auto gradient_fn : {&analysis::openApertureGradient, &analysis::closedApertureGradient}) {
            const auto g = gradient_fn(z, params);
            auto numeric = [&](ZscanParameters shifted_up, ZscanParameters shifted_down) {
                return (gradient_fn(z, shifted_up).value - gradient_fn(z, shifted_down).value) / (2.0 * h);
            };
            ZscanParameters up = params, down = params;
            up.delta_phi0 += h; down.delta_phi0 -= h;
            EXPECT_NEAR(g.d_delta_phi0, numeric(up, down), 1e-6);
            up = params; down = params;
            up.q0 += h; down.q0 -= h;
            EXPECT_NEAR(g.d_q0, numeric(up, down), 1e-6);
            up = params; down = params;
            up.z0 += h; down.z0 -= h;
            EXPECT_NEAR(g.d_z0, numeric(up, down), 1e-6);
            up = params; down = params;
            up.rayleigh_range += h; down.rayleigh_range -= h;
            EXPECT_NEAR(g.d_rayleigh_range, numeric(up, down), 1e-6);
        }
    }
}

class FitEngineTest : public ::testing::Test {
protected:
    const ZscanParameters truth_{0.8, 0.1, 1.5, 3.0};
    const CurvePair curves_ = modelCurves(truth_);
    FitConfig config_;
};

TEST_F(FitEngineTest, InitialGuessFromExtrema) {
    const auto guess = analysis::estimateInitialGuess(curves_, 532.0, config_);
    EXPECT_GT(guess.delta_phi0, 0.0);
    EXPECT_NEAR(guess.delta_phi0, truth_.delta_phi0, 0.1);
    EXPECT_NEAR(guess.q0, truth_.q0, 0.02);
    EXPECT_NEAR(guess.z0, truth_.z0, 0.5);
    EXPECT_NEAR(guess.rayleigh_range, truth_.rayleigh_range, 0.5);
}

TEST_F(FitEngineTest, InitialGuessUsesConfiguredGeometry) {
    const double pi = std::acos(-1.0);
    config_.beam_waist_um = 20.0;
    const auto from_waist = analysis::estimateInitialGuess(curves_, 500.0, config_);
    EXPECT_NEAR(from_waist.rayleigh_range, pi * 20e-6 * 20e-6 / 500e-9 * 1e3, 1e-12);

    config_.rayleigh_range_mm = 4.2;
    const auto given = analysis::estimateInitialGuess(curves_, 500.0, config_);
    EXPECT_DOUBLE_EQ(given.rayleigh_range, 4.2);
}

TEST_F(FitEngineTest, RecoversModelParameters) {
    const auto guess = analysis::estimateInitialGuess(curves_, 532.0, config_);
    const auto result = analysis::fitCurves(curves_, guess, config_);

    EXPECT_TRUE(result.converged);
    EXPECT_FALSE(result.q0_out_of_range);
    EXPECT_EQ(result.geometry_source, GeometrySource::OpenAperture);
    EXPECT_NEAR(result.delta_phi0.value, truth_.delta_phi0, 1e-3);
    EXPECT_NEAR(result.q0.value, truth_.q0, 1e-4);
    EXPECT_NEAR(result.z0.value, truth_.z0, 0.01 * truth_.rayleigh_range);
    EXPECT_NEAR(result.rayleigh_range.value, truth_.rayleigh_range, 0.01 * truth_.rayleigh_range);
    EXPECT_LT(result.rss, 1e-12);
    EXPECT_FALSE(result.delta_phi0.fixed);
    EXPECT_EQ(result.open_aperture.points, 201u);
    EXPECT_EQ(result.closed_aperture.points, 201u);
}

TEST_F(FitEngineTest, RecoversAbsorptionCoefficient) {
    PhysicalConstants constants;
    constants.sample_length_m = 1e-3;
    constants.linear_transmittance = 1.0;
    constants.peak_irradiance = 1e13;
    constants.wavelength_m = 532e-9;
    const double beta = 1e-11;

    // q0 = beta I0 L_eff / 2^(3/2)
    const ZscanParameters truth{0.4, beta * constants.peak_irradiance * constants.sample_length_m / kAbsorptionScale,
                                0.0, 3.0};
    const auto curves = modelCurves(truth);
    const auto guess = analysis::estimateInitialGuess(curves, 532.0, config_);
    const auto result = analysis::fitCurves(curves, guess, config_);
    ASSERT_TRUE(result.converged);
    EXPECT_NEAR(result.q0.value, truth.q0, 1e-8);

    const auto derived = analysis::deriveNonlinearCoefficients(result, constants);
    EXPECT_NEAR(derived.beta, beta, 1e-6 * beta);
}

TEST_F(FitEngineTest, FitWindowLeavesOutsidePointsAlone) {
    CurvePair curves = curves_;
    for (auto* curve : {&curves.closed_aperture, &curves.open_aperture}) {
        for (auto& p : curve->points) {
            if (p.position > 12.0) {
                p.transmittance = 1.3;
            }
        }
    }
    config_.window_start_mm = -12.0;
    config_.window_end_mm = 12.0;

    const auto guess = analysis::estimateInitialGuess(curves, 532.0, config_);
    const auto result = analysis::fitCurves(curves, guess, config_);
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.open_aperture.points, 121u);
    EXPECT_EQ(result.closed_aperture.points, 121u);
    EXPECT_NEAR(result.delta_phi0.value, truth_.delta_phi0, 1e-3);
    EXPECT_NEAR(result.q0.value, truth_.q0, 1e-4);
    EXPECT_NEAR(result.z0.value, truth_.z0, 0.01 * truth_.rayleigh_range);
}

TEST_F(FitEngineTest, BaselineOffsetIsFittedPerCurve) {
    CurvePair curves = curves_;
    for (auto& p : curves.open_aperture.points) {
        p.transmittance += 0.02;
    }
    for (auto& p : curves.closed_aperture.points) {
        p.transmittance -= 0.015;
    }

    const auto plain = analysis::fitCurves(curves, analysis::estimateInitialGuess(curves, 532.0, config_), config_);
    EXPECT_TRUE(plain.open_aperture.baseline_offset.fixed);
    EXPECT_EQ(plain.open_aperture.baseline_offset.value, 0.0);

    config_.fit_baseline_offset = true;
    const auto guess = analysis::estimateInitialGuess(curves, 532.0, config_);
    const auto result = analysis::fitCurves(curves, guess, config_);
    EXPECT_TRUE(result.converged);
    EXPECT_FALSE(result.open_aperture.baseline_offset.fixed);
    EXPECT_NEAR(result.open_aperture.baseline_offset.value, 0.02, 1e-6);
    EXPECT_NEAR(result.closed_aperture.baseline_offset.value, -0.015, 1e-6);
    EXPECT_NEAR(result.delta_phi0.value, truth_.delta_phi0, 1e-3);
    EXPECT_NEAR(result.q0.value, truth_.q0, 1e-4);
    EXPECT_NEAR(result.rayleigh_range.value, truth_.rayleigh_range, 0.01 * truth_.rayleigh_range);
}

TEST_F(FitEngineTest, RepeatedFitsAreIdentical) {
    const auto guess = analysis::estimateInitialGuess(curves_, 532.0, config_);
    const auto first = analysis::fitCurves(curves_, guess, config_);
    const auto second = analysis::fitCurves(curves_, guess, config_);

    EXPECT_EQ(first.delta_phi0.value, second.delta_phi0.value);
    EXPECT_EQ(first.q0.value, second.q0.value);
    EXPECT_EQ(first.z0.value, second.z0.value);
    EXPECT_EQ(first.rayleigh_range.value, second.rayleigh_range.value);
    EXPECT_EQ(first.delta_phi0.std_error, second.delta_phi0.std_error);
    EXPECT_EQ(first.rss, second.rss);
    EXPECT_EQ(first.iterations, second.iterations);
}

TEST_F(FitEngineTest, FixedConstraintKeepsOpenApertureFocus) {
    const auto guess = analysis::estimateInitialGuess(curves_, 532.0, config_);
    const auto result = analysis::fitCurves(curves_, guess, config_);

    EXPECT_EQ(result.z0.value, result.open_aperture.focal_position);
    EXPECT_EQ(result.closed_aperture.focal_position, result.open_aperture.focal_position);
    EXPECT_EQ(result.rayleigh_range.value, result.open_aperture.rayleigh_range);
}

TEST_F(FitEngineTest, LooseConstraintStaysNearOpenApertureFocus) {
    const auto record = analysis::loadRecord(dataPath("RIO3BiFF-P_0.00.txt"));
    const auto curves = analysis::normalize(record, NormalizationConfig{});
    const auto guess = analysis::estimateInitialGuess(curves, record.wavelength_nm, config_);

    const auto fixed = analysis::fitCurves(curves, guess, config_);
    config_.focal_constraint = FocalConstraint::Loose;
    const auto loose = analysis::fitCurves(curves, guess, config_);

    EXPECT_TRUE(loose.converged);
    EXPECT_EQ(loose.open_aperture.focal_position, fixed.open_aperture.focal_position);
    EXPECT_GT(fixed.z0.std_error, 0.0);
    EXPECT_LE(std::abs(loose.z0.value - fixed.z0.value), 2.0 * fixed.z0.std_error);
    EXPECT_NEAR(loose.delta_phi0.value, fixed.delta_phi0.value, 3.0 * fixed.delta_phi0.std_error);
}

TEST_F(FitEngineTest, RefractiveOnlyScanTakesGeometryFromClosedAperture) {
    const ZscanParameters truth{0.5, 0.0, -2.0, 2.5};
    const auto curves = modelCurves(truth);
    const auto guess = analysis::estimateInitialGuess(curves, 532.0, config_);
    const auto result = analysis::fitCurves(curves, guess, config_);

    EXPECT_EQ(result.geometry_source, GeometrySource::ClosedAperture);
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.q0.value, 0.0, 1e-9);
    EXPECT_NEAR(result.delta_phi0.value, truth.delta_phi0, 1e-3);
    EXPECT_NEAR(result.z0.value, truth.z0, 0.01 * truth.rayleigh_range);
    EXPECT_NEAR(result.rayleigh_range.value, truth.rayleigh_range, 0.01 * truth.rayleigh_range);
}

TEST_F(FitEngineTest, DipDeeperThanModelFlagsQ0OutOfRange) {
    CurvePair curves = modelCurves({0.3, 0.0, 0.0, 3.0});
    for (auto& p : curves.open_aperture.points) {
        const double x = p.position / 3.0;
        p.transmittance = 1.0 - 0.4 / (1.0 + x * x);
    }
    config_.max_iterations = 1000;
    const auto guess = analysis::estimateInitialGuess(curves, 532.0, config_);
    EXPECT_TRUE(analysis::withinOpenApertureDomain(guess.q0));

    const auto result = analysis::fitCurves(curves, guess, config_);
    EXPECT_TRUE(result.q0_out_of_range);
    EXPECT_TRUE(analysis::withinOpenApertureDomain(result.q0.value));
}

TEST_F(FitEngineTest, IterationBudgetExhaustionCarriesPartialResult) {
    config_.max_iterations = 1;
    const auto guess = analysis::estimateInitialGuess(curves_, 532.0, config_);
    try {
        analysis::fitCurves(curves_, guess, config_);
        FAIL() << "Expected FitDivergenceError";
    } catch (const FitDivergenceError& e) {
        EXPECT_FALSE(e.partial().converged);
        EXPECT_EQ(e.partial().open_aperture.iterations, 1);
        EXPECT_TRUE(std::isfinite(e.partial().q0.value));
    }
}

TEST_F(FitEngineTest, TooFewPointsIsIllConditioned) {
    const CurvePair curves = modelCurves(truth_, -5.0, 5.0, 3);
    try {
        analysis::fitCurves(curves, truth_, config_);
        FAIL() << "Expected IllConditionedError";
    } catch (const IllConditionedError& e) {
        EXPECT_EQ(e.partial().q0.value, truth_.q0);
    }
}

TEST_F(FitEngineTest, RejectsInitialGuessOutsideDomain) {
    EXPECT_THROW(analysis::fitCurves(curves_, {0.5, 0.4, 0.0, 3.0}, config_), std::invalid_argument);
    EXPECT_THROW(analysis::fitCurves(curves_, {0.5, 0.1, 0.0, -1.0}, config_), std::invalid_argument);
}

TEST(PipelineTest, FitsInstrumentFileAndDerivesCoefficients) {
    const auto record = analysis::loadRecord(dataPath("RIO3BiFF-P_0.00.txt"));
    const auto constants = zscan_test::testConstants();
    const auto result = analysis::fit(record, constants, AnalysisConfig{});

    EXPECT_TRUE(result.converged);
    EXPECT_LT(result.delta_phi0.value, 0.0);
    EXPECT_GT(result.q0.value, 0.0);
    EXPECT_NEAR(result.z0.value, 49.0, 0.25);
    ASSERT_TRUE(result.derived.has_value());
    EXPECT_LT(result.derived->n2, 0.0);
    EXPECT_GT(result.derived->beta, 0.0);

    // Wavelength comes from the record when the constants leave it unset
    PhysicalConstants explicit_wavelength = constants;
    explicit_wavelength.wavelength_m = 475e-9;
    const auto same = analysis::fit(record, explicit_wavelength, AnalysisConfig{});
    EXPECT_DOUBLE_EQ(same.derived->n2, result.derived->n2);
}

TEST(PipelineTest, RepeatedRecordFitsAreIdentical) {
    const auto record = analysis::loadRecord(dataPath("RIO3BiFF-P_0.50.txt"));
    const auto constants = zscan_test::testConstants();
    const auto first = analysis::fit(record, constants, AnalysisConfig{});
    const auto second = analysis::fit(record, constants, AnalysisConfig{});

    EXPECT_EQ(first.delta_phi0.value, second.delta_phi0.value);
    EXPECT_EQ(first.q0.value, second.q0.value);
    EXPECT_EQ(first.z0.value, second.z0.value);
    EXPECT_EQ(first.rayleigh_range.value, second.rayleigh_range.value);
    EXPECT_EQ(first.rss, second.rss);
    EXPECT_EQ(first.iterations, second.iterations);
    ASSERT_TRUE(first.derived && second.derived);
    EXPECT_EQ(first.derived->n2, second.derived->n2);
    EXPECT_EQ(first.derived->beta, second.derived->beta);
}

TEST(PipelineTest, InvalidConfigurationIsAConfigError) {
    const auto record = analysis::loadRecord(dataPath("RIO3BiFF-P_0.00.txt"));
    AnalysisConfig config;
    config.normalization.baseline_fraction = 0.8;
    EXPECT_THROW(analysis::fit(record, zscan_test::testConstants(), config), ConfigError);
}
