#include "ParameterOptions.hpp"

#include <boost/program_options/options_description.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

#include "Constants.hpp"

namespace pi = constants::pipelines;
namespace an = constants::annotation;

auto ParameterOptions::getGeneralOptions() -> po::options_description {
    po::options_description general(pi::GENERAL_DESCRIPTION);
    general.add_options()("gtf,g", po::value<std::string>(),
                          "gene annotation in GTF format, optionally gzip compressed (required)");
    general.add_options()("bed,b", po::value<std::string>(),
                          "regions in BED format, optionally gzip compressed (required)");
    general.add_options()("output,o", po::value<std::string>(),
                          "file the region to gene associations are written to (required)");
    general.add_options()("loglevel", po::value<std::string>()->default_value("info"),
                          "log level [debug, info, warning, error] (default: info)");
    general.add_options()("threads,j",
                          po::value<int>()->default_value(static_cast<int>(pi::defaultThreadCount)),
                          "number of matching threads, 0 uses one per hardware thread and 1 "
                          "matches sequentially (default: 8)");
    general.add_options()("batch-size", po::value<size_t>()->default_value(pi::defaultBatchSize),
                          "number of regions matched per chunk (default: 5000)");

    return general;
}

auto ParameterOptions::getMatchOptions() -> po::options_description {
    po::options_description match(pi::MATCH_DESCRIPTION);
    match.add_options()("report,r", po::value<std::string>()->default_value("exon"),
                        "report level [exon, transcript, gene] (default: exon)");
    match.add_options()("distance,q", po::value<int64_t>()->default_value(pi::defaultDistanceKb),
                        "maximum distance in kb at which a gene is still reported (default: 10)");
    match.add_options()("tss,t", po::value<int64_t>()->default_value(pi::defaultTssDistance),
                        "width in bp of the TSS zone upstream of a gene (default: 200)");
    match.add_options()("tts,s", po::value<int64_t>()->default_value(pi::defaultTtsDistance),
                        "width in bp of the TTS zone downstream of a gene (default: 0)");
    match.add_options()("promoter,p",
                        po::value<int64_t>()->default_value(pi::defaultPromoterDistance),
                        "width in bp of the promoter zone beyond the TSS zone (default: 1300)");
    match.add_options()("perc_area,v", po::value<double>()->default_value(pi::defaultPercArea),
                        "minimum percentage of an area covered by the region (default: 90, "
                        "range: 0-100)");
    match.add_options()("perc_region,w",
                        po::value<double>()->default_value(pi::defaultPercRegion),
                        "minimum percentage of the region inside an area (default: 50, range: "
                        "0-100)");
    match.add_options()("rules,R", po::value<std::string>()->default_value(pi::DEFAULT_RULES),
                        "priority of the areas used to resolve ties, comma separated list of "
                        "all eight area tags");
    match.add_options()("gene,G", po::value<std::string>()->default_value(an::DEFAULT_GENE_ID_KEY),
                        "GTF attribute holding the gene id (default: gene_id)");
    match.add_options()(
        "transcript,T", po::value<std::string>()->default_value(an::DEFAULT_TRANSCRIPT_ID_KEY),
        "GTF attribute holding the transcript id (default: transcript_id)");

    return match;
}

auto ParameterOptions::getOtherOptions() -> po::options_description {
    po::options_description other("Other");
    other.add_options()("version", "display the version number");
    other.add_options()("help,h", "display this help message");
    other.add_options()("config,c", po::value<std::string>(),
                        "configuration file that contains the parameters");

    return other;
}
