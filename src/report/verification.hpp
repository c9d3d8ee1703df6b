#ifndef VERIFICATION_HPP
#define VERIFICATION_HPP

#include <string>
#include <vector>

namespace tfb_toolset {

// A single problem found while verifying a test type
struct VerificationIssue {
    std::string short_message;
    std::string message;        // Full detail, if the verifier gave one
};

// Result of verifying one test type of one framework
struct Verification {
    std::string framework_name;
    std::string type_name;      // e.g. "json", "plaintext", "db"
    std::vector<VerificationIssue> errors;
    std::vector<VerificationIssue> warnings;
};

enum class VerificationStatus {
    Pass,
    Warn,
    Error,
};

// Errors take precedence over warnings
inline VerificationStatus statusOf(const Verification& verification) {
    if (!verification.errors.empty()) return VerificationStatus::Error;
    if (!verification.warnings.empty()) return VerificationStatus::Warn;
    return VerificationStatus::Pass;
}

} // namespace tfb_toolset

#endif // VERIFICATION_HPP
