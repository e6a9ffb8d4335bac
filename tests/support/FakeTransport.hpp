#ifndef FAKETRANSPORT_HPP
#define FAKETRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Transport.hpp"

// One scripted attempt: write failAfterBytes of the body, then raise error
struct ScriptedFailure
{
    uint64_t failAfterBytes{0};
    TransferError error;
};

// In-memory stand-in for a server; writes deterministic bytes to the real destination
class FakeTransport : public Transport
{
public:
    explicit FakeTransport(uint64_t fileSize = 4096, size_t chunkSize = 1024);

    FetchResult fetch(DownloadTask &task,
                      const CancellationToken &token,
                      const ChunkCallback &onChunk) override;

    // Failures consumed in order by successive attempts on destination
    void script(const std::string &destination, std::vector<ScriptedFailure> failures);

    void setChunkDelay(std::chrono::milliseconds delay) { _chunkDelay = delay; }

    // Cancels token once this many chunks have been written across all tasks
    void cancelAfterChunks(size_t chunks, CancellationToken &token);

    size_t getMaxConcurrent() const { return _maxConcurrent.load(); }
    size_t getAttempts(const std::string &destination) const;
    std::vector<uint64_t> getStartOffsets(const std::string &destination) const;

    uint64_t getFileSize() const { return _fileSize; }

    static char byteAt(uint64_t position);

private:
    uint64_t _fileSize;
    size_t _chunkSize;
    std::chrono::milliseconds _chunkDelay{0};

    std::atomic<size_t> _active{0};
    std::atomic<size_t> _maxConcurrent{0};
    std::atomic<size_t> _chunksWritten{0};

    size_t _cancelAfter{0};
    CancellationToken *_cancelToken{nullptr};

    mutable std::mutex _mutex;
    std::map<std::string, std::deque<ScriptedFailure>> _scripts;
    std::map<std::string, std::vector<uint64_t>> _startOffsets;
};

// Reads a whole file into memory; empty if it does not exist
std::string readFile(const std::string &path);

// Expected contents of a fake download of the given size
std::string expectedContents(uint64_t size);

#endif
