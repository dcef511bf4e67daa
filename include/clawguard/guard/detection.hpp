#pragma once

#include "clawguard/classifier/risk.hpp"

#include <string>

namespace clawguard::guard {

/// Emits a DetectionEvent and a RiskScoreMetric for a flagged assessment.
void report_detection(const std::string &guard, const std::string &source,
                      const classifier::RiskAssessment &assessment);

/// Advisory attached to a Warn verdict. `subject` names what was scanned, e.g.
/// "inter-agent message".
[[nodiscard]] std::string injection_advisory(const std::string &subject, double score);

} // namespace clawguard::guard
