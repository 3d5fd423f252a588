#include "chunk_scheduler.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <thread>

namespace chunking {

namespace {

int checkedWorkers(int workers) {
    if (workers < 1) {
        throw glifzip::ConfigurationError("Worker count must be at least 1, got " + std::to_string(workers));
    }
    return workers;
}

} // namespace

WorkerPool::WorkerPool(int workers)
    : workers_(checkedWorkers(workers)), arena_(workers_) {
    logging::debug("Worker pool created with {} workers", workers_);
}

int defaultWorkerCount() {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<int>(hw);
}

std::vector<ChunkRange> partition(size_t length, size_t chunkSize) {
    if (chunkSize == 0) {
        throw glifzip::ConfigurationError("Chunk size must be at least 1 byte");
    }

    std::vector<ChunkRange> ranges;
    ranges.reserve(length / chunkSize + 1);
    for (size_t offset = 0, index = 0; offset < length; offset += chunkSize, index++) {
        ranges.push_back({index, offset, std::min(chunkSize, length - offset)});
    }
    return ranges;
}

size_t chunkLength(size_t length, size_t chunkSize, size_t index) {
    size_t offset = index * chunkSize;
    if (offset >= length) return 0;
    return std::min(chunkSize, length - offset);
}

std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>>& pieces) {
    size_t total = 0;
    for (const auto& piece : pieces) {
        total += piece.size();
    }

    std::vector<uint8_t> out(total);
    size_t offset = 0;
    for (const auto& piece : pieces) {
        if (!piece.empty()) {
            std::memcpy(out.data() + offset, piece.data(), piece.size());
        }
        offset += piece.size();
    }
    return out;
}

} // namespace chunking
