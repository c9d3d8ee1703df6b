#ifndef VERIFICATION_REPORTER_HPP
#define VERIFICATION_REPORTER_HPP

#include "report/verification.hpp"
#include "utils/logger.hpp"
#include "utils/toolset_error.hpp"
#include <map>
#include <string>
#include <vector>

namespace tfb_toolset {

// Framework name -> verifications in the order they were supplied.
// Ordered by framework name so the summary is reproducible.
using FrameworkGroups = std::map<std::string, std::vector<Verification>>;

class VerificationReporter {
public:
    // Transcript file the summary is appended to, inside the logger's
    // current log directory
    static constexpr const char* kLogFileName = "benchmark.txt";
    static constexpr size_t kLineWidth = 79;

    static FrameworkGroups groupByFramework(const std::vector<Verification>& verifications);

    // One summary row, e.g. "|       json         : ERROR - timeout"
    static std::string formatVerificationLine(const Verification& verification);

    // Print the verification summary through logger. Only the first error
    // (or warning) of each verification is shown; the full detail is in the
    // per-test transcripts.
    static bool renderSummary(const std::vector<Verification>& verifications,
                              Logger logger,
                              ToolsetError& error);
};

} // namespace tfb_toolset

#endif // VERIFICATION_REPORTER_HPP
