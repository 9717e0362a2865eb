#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace zscan {

constexpr std::size_t kChannelCount = 4;

/// Ratio of the on-axis absorption beta*I0*L_eff to q0, 2^(3/2) for a Gaussian pulse
constexpr double kAbsorptionScale = 2.8284271247461903;

/**
 * @brief Role of a photodetector channel in a Z-scan measurement
 */
enum class ChannelRole {
    ClosedAperture,   ///< Detector behind the limiting aperture
    Reference,        ///< Laser energy monitor
    OpenAperture,     ///< Detector collecting the whole beam
    Empty             ///< Unconnected input
};

const char* toString(ChannelRole role);

/**
 * @brief Channel role table of one instrument file
 *
 * Built at parse time from the CH1..CH4 header lines. Every role occupies
 * exactly one slot.
 */
class ChannelRoles {
public:
    explicit ChannelRoles(const std::array<ChannelRole, kChannelCount>& roles);

    ChannelRole roleOf(std::size_t slot) const;
    std::size_t slotOf(ChannelRole role) const;

private:
    std::array<ChannelRole, kChannelCount> roles_;
};

/**
 * @brief One row of the instrument table
 */
struct Sample {
    int index;                                  ///< Scan index (SNo.)
    std::array<double, kChannelCount> volts;    ///< CH1..CH4 voltages [V]
};

/**
 * @brief One parsed Z-scan, immutable once built
 */
struct MeasurementRecord {
    const std::string code;                     ///< Sample identifier
    const double concentration;                 ///< Concentration [%]
    const double wavelength_nm;                 ///< Laser wavelength [nm]
    const double start_pos;                     ///< First stage position [mm]
    const double end_pos;                       ///< Last stage position [mm]
    const ChannelRoles roles;                   ///< Slot to role mapping
    const std::vector<Sample> samples;          ///< Table rows, strictly increasing index
    const std::optional<double> silica_thickness_mm;  ///< Reference thickness, if recorded
    const int scans_averaged;                   ///< Number of scans averaged into this record
    const std::string description;              ///< Free-text experiment description
};

/**
 * @brief One point of a normalized transmittance curve
 */
struct CurvePoint {
    double position;        ///< Stage position [mm]
    double transmittance;   ///< Normalized transmittance, NaN where undefined
};

/**
 * @brief Normalized transmittance of one detector channel
 */
struct NormalizedCurve {
    ChannelRole channel;
    std::vector<CurvePoint> points;   ///< One point per sample, in sample order
    double baseline;                  ///< Far-field ratio the curve was divided by

    /// Points with a defined transmittance
    std::vector<CurvePoint> validPoints() const;
};

/**
 * @brief Closed- and open-aperture curves of one record
 */
struct CurvePair {
    NormalizedCurve closed_aperture;
    NormalizedCurve open_aperture;
};

/**
 * @brief Z-scan model parameters
 */
struct ZscanParameters {
    double delta_phi0;        ///< On-axis nonlinear phase shift at focus
    double q0;                ///< Nonlinear absorption parameter, |q0| < 1/2^(3/2)
    double z0;                ///< Focal position [mm]
    double rayleigh_range;    ///< Rayleigh range [mm]
};

/**
 * @brief Fitted value of one model parameter
 */
struct ParameterEstimate {
    double value = 0.0;
    double std_error = 0.0;   ///< 0 when held fixed, NaN when unavailable
    bool fixed = false;       ///< Not fitted in any stage, held at the initial value
};

/**
 * @brief Diagnostics of one fit stage
 */
struct StageSummary {
    double rss = 0.0;               ///< Residual sum of squares
    int iterations = 0;
    bool converged = false;
    std::size_t points = 0;         ///< Points used
    double focal_position = 0.0;    ///< z0 at the end of the stage [mm]
    double rayleigh_range = 0.0;    ///< zR at the end of the stage [mm]
    ParameterEstimate baseline_offset{0.0, 0.0, true};   ///< Constant added to the model curve
};

/**
 * @brief Curve the shared focal geometry was resolved from
 */
enum class GeometrySource {
    OpenAperture,
    ClosedAperture
};

/**
 * @brief Nonlinear coefficients derived from a fit
 */
struct DerivedQuantities {
    double n2;                  ///< Nonlinear refractive index [m^2/W]
    double n2_error;
    double beta;                ///< Nonlinear absorption coefficient [m/W]
    double beta_error;
    double effective_length;    ///< L_eff [m]
};

/**
 * @brief Result of fitting one record
 */
struct FitResult {
    ParameterEstimate delta_phi0;
    ParameterEstimate q0;
    ParameterEstimate z0;
    ParameterEstimate rayleigh_range;

    double rss = 0.0;             ///< Open- plus closed-aperture RSS
    int iterations = 0;           ///< Iterations over both stages
    bool converged = false;       ///< Both stages converged
    bool q0_out_of_range = false; ///< Optimum for q0 lies outside the open-aperture domain

    GeometrySource geometry_source = GeometrySource::OpenAperture;
    StageSummary open_aperture;
    StageSummary closed_aperture;

    std::optional<DerivedQuantities> derived;

    ZscanParameters parameters() const;
};

/**
 * @brief Base class of all errors raised by the library
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed or incomplete instrument file
 */
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message, std::size_t line = 0);

    /// 1-based line number of the offending line, 0 if not line-specific
    std::size_t line() const { return line_; }

private:
    std::size_t line_;
};

/**
 * @brief Unusable reference or empty-channel data
 */
class NormalizationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Fit did not produce trustworthy parameters
 */
class FitError : public Error {
public:
    FitError(const std::string& message, FitResult partial);

    /// Best-effort estimate at the point of failure
    const FitResult& partial() const { return partial_; }

private:
    FitResult partial_;
};

class FitDivergenceError : public FitError {
public:
    using FitError::FitError;
};

class IllConditionedError : public FitError {
public:
    using FitError::FitError;
};

/**
 * @brief Non-positive or missing physical constant
 */
class InvalidConstantsError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Unreadable or malformed configuration
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Configuration of the channel normalizer
 */
struct NormalizationConfig {
    double baseline_fraction = 0.1;             ///< Fraction of samples per side used as far field
    double max_zero_reference_fraction = 0.05;  ///< Allowed fraction of zero reference readings
    double reference_floor = 0.0;               ///< |ref| at or below this counts as zero [V]
    double empty_noise_threshold = 1e-3;        ///< Largest |V| tolerated on the empty channel
};

/**
 * @brief How the closed-aperture stage treats the focal geometry
 */
enum class FocalConstraint {
    Fixed,    ///< z0 and zR held at the open-aperture values
    Loose     ///< z0 and zR re-fitted under priors from the open-aperture fit
};

/**
 * @brief Configuration of the fit engine
 */
struct FitConfig {
    int max_iterations = 200;
    double tolerance = 1e-10;              ///< Relative RSS improvement that counts as converged
    double step_tolerance = 1e-12;         ///< Relative step size that counts as converged
    double lambda_init = 1e-3;
    double lambda_factor = 10.0;
    double singular_tolerance = 1e-12;     ///< Smallest accepted singular value ratio of the Jacobian
    FocalConstraint focal_constraint = FocalConstraint::Fixed;
    double loose_prior_floor = 0.01;       ///< Minimum prior width as a fraction of zR
    bool fit_rayleigh_range = true;
    std::optional<double> rayleigh_range_mm;   ///< Known zR
    std::optional<double> beam_waist_um;       ///< Known w0, used when zR is not given
    double open_aperture_signal_threshold = 0.005;
    int smoothing_window = 5;              ///< Moving-average width for the initial guess
    bool fit_baseline_offset = false;      ///< Fit a constant offset of each curve's far-field level
    double max_baseline_offset = 0.25;     ///< Largest accepted |offset|
    std::optional<double> window_start_mm; ///< Points before this position are left out of the fit
    std::optional<double> window_end_mm;   ///< Points after this position are left out of the fit
};

/**
 * @brief Configuration of the batch orchestrator
 */
struct BatchConfig {
    double max_relative_std_error = 0.5;
    double relative_error_floor = 1e-9;    ///< |value| below this skips the relative error check
    int threads = 0;                       ///< 0 keeps the OpenMP default
};

/**
 * @brief Configuration threaded through every analysis call
 */
struct AnalysisConfig {
    NormalizationConfig normalization;
    FitConfig fit;
    BatchConfig batch;
};

/**
 * @brief Physical constants needed for n2 and beta
 */
struct PhysicalConstants {
    double sample_length_m = 0.0;          ///< Optical path length in the sample [m]
    double linear_transmittance = 1.0;     ///< Unexcited transmittance, in (0, 1]
    double peak_irradiance = 0.0;          ///< On-axis peak irradiance at focus [W/m^2]
    double wavelength_m = 0.0;             ///< Vacuum wavelength [m], 0 takes it from the record
};

/**
 * @brief Key of a batch result
 */
struct ResultKey {
    std::string code;
    double concentration;
    double wavelength_nm;

    bool operator<(const ResultKey& other) const;
};

/**
 * @brief One fitted record of a batch
 */
struct BatchEntry {
    std::string source;                 ///< File identifier or record position
    FitResult result;
    bool reliable = true;
    std::vector<std::string> reasons;   ///< Why the entry is unreliable
};

enum class RecordErrorKind {
    Load,             ///< Source could not be read
    Parse,
    Normalization,
    Fit,              ///< Fit failed without a usable estimate
    Duplicate,        ///< Key already produced by an earlier record
    Cancelled         ///< Skipped after cancellation
};

const char* toString(RecordErrorKind kind);

/**
 * @brief A record that produced no result
 */
struct RecordError {
    std::string source;
    RecordErrorKind kind;
    std::string message;
};

/**
 * @brief Outcome of a batch run
 */
struct BatchResult {
    std::map<ResultKey, BatchEntry> results;
    std::vector<RecordError> errors;
    bool cancelled = false;

    const BatchEntry* find(const std::string& code, double concentration, double wavelength_nm) const;
    std::size_t unreliableCount() const;
};

/**
 * @brief Cooperative cancellation flag for batch runs
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/// Returns the text of a source; called concurrently from worker threads
using RecordLoader = std::function<std::string(const std::string& source)>;

/**
 * @brief Namespace containing pure functions for Z-scan analysis
 */
namespace analysis {

/**
 * @brief Parse one instrument file
 * @param text Full file contents
 * @return Parsed record
 * @throws ParseError if a required field is missing or malformed
 */
MeasurementRecord parseRecord(const std::string& text);

/**
 * @brief Read a file from disk
 * @throws ParseError if the file cannot be read
 */
std::string loadFileText(const std::string& path);

/**
 * @brief Read and parse an instrument file
 */
MeasurementRecord loadRecord(const std::string& path);

/**
 * @brief Stage position of a sample, interpolated over the index range
 * @param record Measurement record
 * @param i Sample position in the table
 * @return Position [mm]
 */
double positionAt(const MeasurementRecord& record, std::size_t i);

/**
 * @brief Arithmetic mean of repeated scans
 * @param records Scans with identical metadata and index columns
 * @return Record of mean voltages
 * @throws std::invalid_argument if the records cannot be combined
 */
MeasurementRecord averageRecords(const std::vector<MeasurementRecord>& records);

/**
 * @brief Normalize closed- and open-aperture channels against the reference
 * @param record Measurement record
 * @param config Normalizer configuration
 * @return Curves with far-field transmittance 1
 * @throws NormalizationError on unusable reference or empty-channel data
 * @throws ConfigError on a baseline fraction outside (0, 0.5]
 */
CurvePair normalize(const MeasurementRecord& record, const NormalizationConfig& config);

/**
 * @brief Open-aperture transmittance
 *
 * Series in 2^(3/2) q0 / (1 + x^2), which keeps T(z0) ~ 1 - q0 for a weak absorber.
 *
 * @param z Position [mm]
 * @param params Model parameters; only q0, z0 and zR are used
 * @return Normalized transmittance, NaN outside the model domain
 */
double openApertureTransmittance(double z, const ZscanParameters& params);

/**
 * @brief Closed-aperture transmittance
 * @param z Position [mm]
 * @param params Model parameters
 * @return Normalized transmittance
 */
double closedApertureTransmittance(double z, const ZscanParameters& params);

/**
 * @brief Model value and its derivatives with respect to the parameters
 */
struct ModelGradient {
    double value;
    double d_delta_phi0;
    double d_q0;
    double d_z0;
    double d_rayleigh_range;
};

/// Whether the open-aperture series converges at focus, |2^(3/2) q0| < 1
bool withinOpenApertureDomain(double q0);

ModelGradient openApertureGradient(double z, const ZscanParameters& params);
ModelGradient closedApertureGradient(double z, const ZscanParameters& params);

/**
 * @brief Initial parameter guess from curve extrema
 * @param curves Normalized curves
 * @param wavelength_nm Laser wavelength, used with a configured beam waist
 * @param config Fit configuration
 * @return Starting parameters for the fit
 */
ZscanParameters estimateInitialGuess(const CurvePair& curves, double wavelength_nm, const FitConfig& config);

/**
 * @brief Fit the Z-scan model to normalized curves
 *
 * Resolves the focal geometry from the open-aperture curve first, then fits
 * the closed-aperture curve under that geometry.
 *
 * @param curves Normalized curves
 * @param initial Starting parameters
 * @param config Fit configuration
 * @return Fit result without derived quantities
 * @throws FitDivergenceError if the iteration budget is exhausted
 * @throws IllConditionedError if the parameter covariance is singular
 */
FitResult fitCurves(const CurvePair& curves, const ZscanParameters& initial, const FitConfig& config);

/**
 * @brief Effective sample length under linear absorption
 * @param length_m Sample length [m]
 * @param linear_transmittance Unexcited transmittance
 * @return L_eff [m]
 */
double effectiveLength(double length_m, double linear_transmittance);

/**
 * @brief Check physical constants
 * @param constants Constants to check
 * @param require_wavelength Whether wavelength_m must be set
 * @throws InvalidConstantsError naming the first offending constant
 */
void validateConstants(const PhysicalConstants& constants, bool require_wavelength);

/**
 * @brief Derive n2 and beta from fitted parameters
 * @param result Fit result
 * @param constants Physical constants, wavelength_m required
 * @return n2, beta and their standard errors
 * @throws InvalidConstantsError on a non-positive constant
 */
DerivedQuantities deriveNonlinearCoefficients(const FitResult& result, const PhysicalConstants& constants);

/**
 * @brief Nonlinear refractive index of fused silica
 * @param wavelength_m Wavelength [m]
 * @return n2 [m^2/W]
 */
double fusedSilicaN2(double wavelength_m);

/**
 * @brief Peak irradiance from a reference-sample scan of known n2
 * @param reference Fit of the reference closed-aperture scan
 * @param wavelength_m Wavelength [m]
 * @param reference_length_m Reference sample length [m]
 * @param reference_n2 Reference n2 [m^2/W]
 * @return I0 [W/m^2]
 */
double calibratePeakIrradiance(const FitResult& reference, double wavelength_m,
                               double reference_length_m, double reference_n2);

/**
 * @brief Check an analysis configuration before any record is processed
 * @param config Analysis configuration
 * @throws ConfigError naming the first offending setting
 */
void validateConfig(const AnalysisConfig& config);

/**
 * @brief Parse, normalize, fit and derive one record
 * @param record Measurement record
 * @param constants Physical constants; wavelength taken from the record if unset
 * @param config Analysis configuration
 * @return Complete fit result
 */
FitResult fit(const MeasurementRecord& record, const PhysicalConstants& constants, const AnalysisConfig& config);

/**
 * @brief Fit a series of pre-parsed records
 * @param records Records, usually one sample code across concentrations or wavelengths
 * @param constants Physical constants shared by the batch
 * @param config Analysis configuration
 * @param cancel Optional cancellation token, checked before each record
 * @return Results and per-record errors
 * @throws InvalidConstantsError before any record is processed
 * @throws ConfigError before any record is processed
 */
BatchResult runBatch(const std::vector<MeasurementRecord>& records, const PhysicalConstants& constants,
                     const AnalysisConfig& config, const CancellationToken* cancel = nullptr);

/**
 * @brief Load, parse and fit a series of sources
 * @param sources Source identifiers passed to the loader
 * @param loader Thread-safe text loader
 */
BatchResult runBatch(const std::vector<std::string>& sources, const RecordLoader& loader,
                     const PhysicalConstants& constants, const AnalysisConfig& config,
                     const CancellationToken* cancel = nullptr);

} // namespace analysis

} // namespace zscan
