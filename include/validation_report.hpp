/**
 * Validation Report
 *
 * Combines positive control, negative control and sensitivity results
 * into one overall status, a markdown report and weight tuning guidance.
 */

#ifndef VALIDATION_REPORT_HPP
#define VALIDATION_REPORT_HPP

#include "control_validation.hpp"
#include "sensitivity.hpp"
#include <string>

namespace genescore {

enum class OverallStatus {
    ALL_PASSED,
    PARTIAL_PASS_SENSITIVITY,   // Controls pass, ranking unstable
    PARTIAL_PASS_SPECIFICITY,   // Positive controls pass, negative controls fail
    FAILED                      // Positive controls fail
};

/**
 * Status line, e.g. "PARTIAL PASS (Specificity Issue)"
 */
std::string overall_status_to_string(OverallStatus status);

OverallStatus determine_overall_status(const PositiveControlResult& positive,
                                       const NegativeControlResult& negative,
                                       const SensitivitySummary& sensitivity);

/**
 * One-paragraph interpretation of an overall status
 */
std::string synthesize_verdict(OverallStatus status);

/**
 * Remediation guidance. Empty of suggestions when everything passes;
 * otherwise always ends with the circular validation disclosure.
 */
std::string recommend_weight_tuning(const PositiveControlResult& positive,
                                    const NegativeControlResult& negative,
                                    const SensitivitySummary& sensitivity);

/**
 * Markdown report over all three validation prongs
 * @param sensitivity_result Per-perturbation results, or nullptr when skipped
 */
std::string generate_comprehensive_validation_report(const PositiveControlResult& positive,
                                                     const NegativeControlResult& negative,
                                                     const SensitivityResult* sensitivity_result,
                                                     const SensitivitySummary& sensitivity);

/**
 * Write report text, creating parent directories and overwriting any existing file
 * @throws std::runtime_error if the file cannot be written
 */
void save_validation_report(const std::string& report_text, const std::string& output_path);

} // namespace genescore

#endif // VALIDATION_REPORT_HPP
