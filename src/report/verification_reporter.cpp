#include "report/verification_reporter.hpp"
#include "utils/ansi.hpp"
#include "utils/diagnostic_log.hpp"
#include <fmt/color.h>
#include <fmt/format.h>
#include <string_view>

namespace tfb_toolset {

namespace {

constexpr std::string_view kTitle = "Verification Summary";
constexpr std::string_view kColumn = "|";

} // namespace

FrameworkGroups VerificationReporter::groupByFramework(const std::vector<Verification>& verifications) {
    FrameworkGroups groups;
    for (const auto& verification : verifications) {
        groups[verification.framework_name].push_back(verification);
    }
    return groups;
}

std::string VerificationReporter::formatVerificationLine(const Verification& verification) {
    auto column = fmt::styled(kColumn, style::kStructure);
    auto type_name = fmt::styled(verification.type_name, style::kStructure);

    switch (statusOf(verification)) {
        case VerificationStatus::Error:
            return fmt::format("{:8}{:13}: {:5} - {}", column, type_name,
                               fmt::styled(std::string_view("ERROR"), style::kError),
                               verification.errors.front().short_message);
        case VerificationStatus::Warn:
            return fmt::format("{:8}{:13}: {:5} - {}", column, type_name,
                               fmt::styled(std::string_view("WARN"), style::kWarning),
                               verification.warnings.front().short_message);
        case VerificationStatus::Pass:
            break;
    }

    // Last column: unpadded so a PASS row never ends in whitespace
    return fmt::format("{:8}{:13}: {}", column, type_name,
                       fmt::styled(std::string_view("PASS"), style::kPass));
}

bool VerificationReporter::renderSummary(const std::vector<Verification>& verifications,
                                         Logger logger,
                                         ToolsetError& error) {
    ScopeStatus bound = logger.bindFile(kLogFileName);
    if (bound != ScopeStatus::Applied) {
        DiagnosticLog::warn(fmt::format("Verification summary not transcribed ({})", toString(bound)));
    }

    const FrameworkGroups groups = groupByFramework(verifications);
    DiagnosticLog::debug(fmt::format("Reporting {} verifications across {} frameworks",
                                     verifications.size(), groups.size()));

    const std::string border = stylize(std::string(kLineWidth, '='), style::kStructure);
    const std::string mid_line = stylize(std::string(kLineWidth, '-'), style::kStructure);

    if (!logger.writeLine(border, error) ||
        !logger.writeLine(stylize(kTitle, style::kStructure), error) ||
        !logger.writeLine(mid_line, error)) {
        return false;
    }

    for (const auto& [framework_name, framework_verifications] : groups) {
        std::string header = fmt::format("{} {}",
                                         fmt::styled(kColumn, style::kStructure),
                                         fmt::styled(std::string_view(framework_name), style::kStructure));
        if (!logger.writeLine(header, error)) {
            return false;
        }

        for (const auto& verification : framework_verifications) {
            if (!logger.writeLine(formatVerificationLine(verification), error)) {
                return false;
            }
        }
    }

    return logger.writeLine(border, error);
}

} // namespace tfb_toolset
