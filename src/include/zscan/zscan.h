/**
 * @file zscan.h
 * @brief C API for Z-scan data reduction
 *
 * This header provides a C-compatible interface for fitting Z-scan measurements.
 * The API parses one instrument file, normalizes the closed- and open-aperture
 * channels against the reference detector, fits the thin-sample Z-scan model and
 * derives the nonlinear refractive index n2 and the absorption coefficient beta.
 */

#pragma once

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Status codes returned by the C API
 */
typedef enum {
    ZSCAN_OK = 0,                   ///< Fit converged with well-defined errors
    ZSCAN_INVALID_ARGUMENT,         ///< Null pointer or invalid configuration value
    ZSCAN_PARSE_ERROR,              ///< Malformed instrument file
    ZSCAN_NORMALIZATION_ERROR,      ///< Unusable reference or empty-channel data
    ZSCAN_FIT_DIVERGED,             ///< Iteration budget exhausted, partial result filled
    ZSCAN_FIT_ILL_CONDITIONED,      ///< Singular covariance, partial result filled
    ZSCAN_INVALID_CONSTANTS,        ///< Non-positive physical constant
    ZSCAN_INTERNAL_ERROR            ///< Any other failure
} ZscanStatus;

/**
 * @brief Physical constants and the main fit settings
 */
typedef struct {
    double sample_length_m;         ///< Optical path length in the sample [m]
    double linear_transmittance;    ///< Unexcited transmittance, in (0, 1]
    double peak_irradiance;         ///< On-axis peak irradiance at focus [W/m^2]
    double wavelength_m;            ///< Wavelength [m], 0 takes it from the file
    double rayleigh_range_mm;       ///< Known Rayleigh range [mm], 0 if unknown
    int loose_focal_constraint;     ///< Non-zero re-fits z0 and zR in the closed-aperture stage
    int max_iterations;             ///< Iteration budget per stage
} ZscanConfig;

/**
 * @brief Fit results
 */
typedef struct {
    double delta_phi0;              ///< On-axis nonlinear phase shift
    double delta_phi0_error;
    double q0;                      ///< Nonlinear absorption parameter
    double q0_error;
    double z0;                      ///< Focal position [mm]
    double z0_error;
    double rayleigh_range;          ///< Rayleigh range [mm]
    double rayleigh_range_error;

    double n2;                      ///< Nonlinear refractive index [m^2/W]
    double n2_error;
    double beta;                    ///< Nonlinear absorption coefficient [m/W]
    double beta_error;
    double effective_length;        ///< L_eff [m]

    double rss;                     ///< Residual sum of squares
    int iterations;
    int converged;
    int q0_out_of_range;
} ZscanFitResult;

/**
 * @brief Create a configuration with default fit settings
 */
ZscanConfig* zscan_create_config(double sample_length_m, double linear_transmittance, double peak_irradiance);

/**
 * @brief Destroy a configuration
 */
void zscan_destroy_config(ZscanConfig* config);

/**
 * @brief Parse and fit one instrument file held in memory
 * @param text NUL-terminated file contents
 * @param config Configuration
 * @param result Output, filled on ZSCAN_OK and with the partial estimate on fit failures
 */
ZscanStatus zscan_fit_text(const char* text, const ZscanConfig* config, ZscanFitResult* result);

/**
 * @brief Human-readable name of a status code
 */
const char* zscan_status_string(ZscanStatus status);

/**
 * @brief Nonlinear refractive index of fused silica [m^2/W], -1 on invalid input
 */
double zscan_fused_silica_n2(double wavelength_m);

/**
 * @brief Effective sample length [m], -1 on invalid input
 */
double zscan_effective_length(double length_m, double linear_transmittance);

#ifdef __cplusplus
}
#endif
