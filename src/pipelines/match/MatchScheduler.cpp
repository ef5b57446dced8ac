#include "MatchScheduler.hpp"

// Standard
#include <algorithm>
#include <exception>
#include <future>
#include <map>
#include <utility>

// seqan3
#include <seqan3/contrib/parallel/buffer_queue.hpp>

// Internal
#include "Constants.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

namespace pipelines::match {

using seqan3::contrib::fixed_buffer_queue;
using seqan3::contrib::queue_op_status;

auto MatchScheduler::run(annotation::RegionReader &reader, annotation::ResultWriter &writer) const
    -> MatchStatistics {
    if (threadCount == 1) {
        Logger::log(LogLevel::DEBUG, "Matching regions sequentially in chunks of ", batchSize);
        return runSequential(reader, writer);
    }

    Logger::log(LogLevel::DEBUG, "Matching regions with ", threadCount,
                " worker threads in chunks of ", batchSize);
    return runParallel(reader, writer);
}

auto MatchScheduler::matchRegion(const dataTypes::GenomicRegion &region,
                                 SearchCursor &cursor) const -> std::vector<dataTypes::Candidate> {
    const std::vector<dataTypes::Gene> *genes = geneAnnotation.genes(region.referenceID);
    if (genes == nullptr || genes->empty()) {
        cursor.skipChromosome(region.referenceID);
        return {};
    }

    const size_t startIndex = cursor.startIndex(
        region, *genes, geneAnnotation.maxLength(region.referenceID), lookbackDistance);

    return ruleEngine.reduce(classifier.classify(region, *genes, startIndex));
}

auto MatchScheduler::matchChunk(std::vector<dataTypes::GenomicRegion> regions,
                                SearchCursor &cursor) const -> MatchedChunk {
    const helper::Timer timer;

    MatchedChunk matched;
    matched.regionCount = regions.size();
    matched.results.reserve(regions.size());

    for (auto &region : regions) {
        auto candidates = matchRegion(region, cursor);
        if (!candidates.empty()) {
            matched.results.push_back({std::move(region), std::move(candidates)});
        }
    }

    matched.matchingMilliseconds = timer.elapsedMilliseconds();
    return matched;
}

auto MatchScheduler::writeChunk(annotation::ResultWriter &writer, const MatchedChunk &chunk)
    -> size_t {
    size_t lineCount = 0;
    for (const auto &result : chunk.results) {
        lineCount += writer.writeRegion(result.region, result.candidates);
    }
    return lineCount;
}

auto MatchScheduler::runSequential(annotation::RegionReader &reader,
                                   annotation::ResultWriter &writer) const -> MatchStatistics {
    MatchStatistics statistics;
    SearchCursor cursor;
    bool headerWritten = false;

    while (auto regions = reader.readChunk(batchSize)) {
        if (!headerWritten) {
            writer.writeHeader(reader.metadataColumnCount());
            headerWritten = true;
        }

        const MatchedChunk matched = matchChunk(std::move(regions.value()), cursor);
        statistics.regionCount += matched.regionCount;
        statistics.matchingMilliseconds += matched.matchingMilliseconds;
        statistics.lineCount += writeChunk(writer, matched);
    }

    if (!headerWritten) {
        writer.writeHeader(0);
    }

    writer.flush();
    return statistics;
}

auto MatchScheduler::runParallel(annotation::RegionReader &reader,
                                 annotation::ResultWriter &writer) const -> MatchStatistics {
    fixed_buffer_queue<WorkChunk> workQueue{constants::pipelines::workQueueCapacity};
    fixed_buffer_queue<MatchedChunk> resultQueue{constants::pipelines::resultQueueCapacity};

    // The metadata column count is only known once the first chunk has been read
    std::promise<size_t> headerPromise;
    std::future<size_t> headerFuture = headerPromise.get_future();

    auto closeQueues = [&workQueue, &resultQueue]() {
        workQueue.close();
        resultQueue.close();
    };

    auto matchWorker = [&]() -> MatchStatistics {
        MatchStatistics statistics;
        SearchCursor cursor;
        try {
            WorkChunk chunk;
            while (workQueue.wait_pop(chunk) != queue_op_status::closed) {
                MatchedChunk matched = matchChunk(std::move(chunk.regions), cursor);
                matched.sequenceNumber = chunk.sequenceNumber;

                statistics.regionCount += matched.regionCount;
                statistics.matchingMilliseconds += matched.matchingMilliseconds;

                if (resultQueue.wait_push(std::move(matched)) == queue_op_status::closed)
                    [[unlikely]] {
                    break;
                }
            }
        } catch (...) {
            closeQueues();
            throw;
        }
        return statistics;
    };

    auto orderedWriter = [&]() -> MatchStatistics {
        MatchStatistics statistics;
        try {
            writer.writeHeader(headerFuture.get());

            std::map<size_t, MatchedChunk> pendingChunks;
            size_t nextSequenceNumber = 0;

            MatchedChunk matched;
            while (resultQueue.wait_pop(matched) != queue_op_status::closed) {
                pendingChunks.emplace(matched.sequenceNumber, std::move(matched));
                statistics.maxPendingChunks =
                    std::max(statistics.maxPendingChunks, pendingChunks.size());

                for (auto next = pendingChunks.find(nextSequenceNumber);
                     next != pendingChunks.end();
                     next = pendingChunks.find(nextSequenceNumber)) {
                    statistics.lineCount += writeChunk(writer, next->second);
                    pendingChunks.erase(next);
                    ++nextSequenceNumber;
                }
            }

            writer.flush();
        } catch (...) {
            closeQueues();
            throw;
        }
        return statistics;
    };

    std::vector<std::future<MatchStatistics>> workerResults;
    workerResults.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workerResults.emplace_back(std::async(std::launch::async, matchWorker));
    }
    std::future<MatchStatistics> writerResult = std::async(std::launch::async, orderedWriter);

    std::exception_ptr firstError;
    bool headerSent = false;
    size_t sequenceNumber = 0;

    try {
        while (auto regions = reader.readChunk(batchSize)) {
            if (!headerSent) {
                headerPromise.set_value(reader.metadataColumnCount());
                headerSent = true;
            }

            if (workQueue.wait_push(WorkChunk{.sequenceNumber = sequenceNumber++,
                                              .regions = std::move(regions.value())}) ==
                queue_op_status::closed) [[unlikely]] {
                break;
            }
        }

        if (!headerSent) {
            headerPromise.set_value(0);
            headerSent = true;
        }
    } catch (...) {
        firstError = std::current_exception();
        if (!headerSent) {
            headerPromise.set_exception(firstError);
        }
        closeQueues();
    }

    workQueue.close();

    MatchStatistics statistics;
    for (auto &workerResult : workerResults) {
        try {
            statistics += workerResult.get();
        } catch (...) {
            if (!firstError) {
                firstError = std::current_exception();
            }
        }
    }

    resultQueue.close();

    try {
        statistics += writerResult.get();
    } catch (...) {
        if (!firstError) {
            firstError = std::current_exception();
        }
    }

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    Logger::log(LogLevel::DEBUG, "Matched ", sequenceNumber, " chunks, at most ",
                statistics.maxPendingChunks, " waited for reordering");

    return statistics;
}

}  // namespace pipelines::match
