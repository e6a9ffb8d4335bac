#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <cstddef>
#include <functional>
#include <string>

#include "core/CancellationToken.hpp"
#include "core/DownloadTask.hpp"
#include "util/http.hpp"

static constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;

enum class FetchResult
{
    COMPLETED,
    CANCELLED
};

// Invoked after every chunk has been durably written
using ChunkCallback = std::function<void(const DownloadTask &)>;

struct TransportOptions
{
    size_t chunkSize{DEFAULT_CHUNK_SIZE};
    long connectTimeoutSeconds{30};
    long lowSpeedLimitBytes{1};
    long lowSpeedTimeSeconds{60};
    bool verifyTls{true};
    bool followRedirects{true};
    std::string userAgent{DEFAULT_USER_AGENT};
};

// One resumable fetch of a single task. Every failure is raised as a TransferError.
class Transport
{
public:
    virtual ~Transport() = default;

    virtual FetchResult fetch(DownloadTask &task,
                              const CancellationToken &token,
                              const ChunkCallback &onChunk) = 0;
};

class CurlTransport : public Transport
{
public:
    explicit CurlTransport(TransportOptions options = TransportOptions());

    FetchResult fetch(DownloadTask &task,
                      const CancellationToken &token,
                      const ChunkCallback &onChunk) override;

    const TransportOptions &getOptions() const { return _options; }

private:
    TransportOptions _options;
};

#endif
