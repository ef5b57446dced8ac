#include "ReportLevel.hpp"

// Standard
#include <algorithm>
#include <cctype>
#include <string>

namespace pipelines::match {

auto operator>>(std::istream &input, ReportLevel &level) -> std::istream & {
    std::string token;
    input >> token;

    std::ranges::transform(token, token.begin(),
                           [](unsigned char character) { return std::tolower(character); });

    if (token == "exon") {
        level = ReportLevel::EXON;
    } else if (token == "transcript") {
        level = ReportLevel::TRANSCRIPT;
    } else if (token == "gene") {
        level = ReportLevel::GENE;
    } else {
        input.setstate(std::ios_base::failbit);
    }
    return input;
}

auto operator<<(std::ostream &output, const ReportLevel &level) -> std::ostream & {
    switch (level) {
        case ReportLevel::EXON:
            return output << "exon";
        case ReportLevel::TRANSCRIPT:
            return output << "transcript";
        case ReportLevel::GENE:
            return output << "gene";
    }
    return output;
}

}  // namespace pipelines::match
