#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <type_traits>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include "logging.hpp"

namespace chunking {

// Largest chunk the pipeline hands to a single worker
constexpr size_t MAX_CHUNK_SIZE = 128 * 1024 * 1024;

struct ChunkRange {
    size_t index;
    size_t offset;
    size_t length;
};

struct ChunkView {
    size_t index;
    const uint8_t* data;
    size_t size;
};

/**
 * @brief Bounded worker pool owned by the caller
 *
 * Wraps a TBB arena capped at the requested concurrency. Several threads may
 * submit work to the same pool; the pool itself holds no per-call state.
 *
 * @throws glifzip::ConfigurationError when workers < 1
 */
class WorkerPool {
public:
    explicit WorkerPool(int workers);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    int workers() const { return workers_; }

    template <typename F>
    void execute(F&& f) {
        arena_.execute(std::forward<F>(f));
    }

private:
    int workers_;
    tbb::task_arena arena_;
};

// Number of hardware threads, at least 1
int defaultWorkerCount();

/**
 * @brief Split [0, length) into ceil(length / chunkSize) consecutive ranges
 *
 * Depends only on length and chunkSize. An empty payload has no chunks.
 *
 * @throws glifzip::ConfigurationError when chunkSize is 0
 */
std::vector<ChunkRange> partition(size_t length, size_t chunkSize);

// Expected length of chunk `index` when `length` bytes are cut every `chunkSize`
size_t chunkLength(size_t length, size_t chunkSize, size_t index);

/**
 * @brief Deterministic parallel map over [0, count)
 *
 * Result i is fn(i) regardless of which worker ran it or when it finished.
 * The first exception cancels the outstanding tasks and is rethrown here;
 * nothing is returned in that case.
 */
template <typename Fn>
auto mapIndexed(WorkerPool& pool, size_t count, Fn&& fn)
    -> std::vector<std::invoke_result_t<Fn&, size_t>> {
    using Result = std::invoke_result_t<Fn&, size_t>;
    std::vector<Result> results(count);
    if (count == 0) {
        return results;
    }

    pool.execute([&] {
        tbb::task_group_context context;
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, count, 1),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    if (context.is_group_execution_cancelled()) return;
                    try {
                        results[i] = fn(i);
                    } catch (const std::exception& e) {
                        logging::err("Chunk {} failed: {}", i, e.what());
                        throw;
                    }
                }
            },
            tbb::simple_partitioner(),
            context);
    });

    return results;
}

/**
 * @brief Apply fn to every chunk of payload, results in chunk order
 */
template <typename Fn>
auto mapChunks(WorkerPool& pool, const uint8_t* payload, size_t length, size_t chunkSize, Fn&& fn)
    -> std::vector<std::invoke_result_t<Fn&, const ChunkView&>> {
    std::vector<ChunkRange> ranges = partition(length, chunkSize);
    return mapIndexed(pool, ranges.size(), [&](size_t i) {
        ChunkView view{ranges[i].index, payload + ranges[i].offset, ranges[i].length};
        return fn(view);
    });
}

// Join ordered pieces into one buffer
std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>>& pieces);

} // namespace chunking
