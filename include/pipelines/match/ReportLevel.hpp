#pragma once

// Standard
#include <istream>
#include <ostream>

namespace pipelines::match {

enum ReportLevel { EXON, TRANSCRIPT, GENE };
auto operator>>(std::istream& input, ReportLevel& level) -> std::istream&;
auto operator<<(std::ostream& output, const ReportLevel& level) -> std::ostream&;

}  // namespace pipelines::match
