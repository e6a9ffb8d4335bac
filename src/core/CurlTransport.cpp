#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "core/Transport.hpp"
#include "aux/FileWriter.hpp"
#include "util/file.hpp"
#include "util/http.hpp"

namespace
{
    // State shared between curl_easy_perform and the libcurl callbacks of one attempt
    struct TransferContext
    {
        DownloadTask &task;
        const CancellationToken &token;
        const ChunkCallback &onChunk;
        CURL *curl;
        size_t chunkSize;

        uint64_t offset;                 // bytes already on disk when the request was sent
        http::ContentRange contentRange; // of the final response, if it sent one
        bool started = false;
        bool badStatus = false;
        std::string statusMessage;
        bool storageError = false;
        long httpStatus = 0;
        std::string storageMessage;
        std::string buffer;
        std::unique_ptr<FileWriter> writer;

        // Inspects the response once its headers are complete and opens the destination
        bool begin()
        {
            started = true;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpStatus);

            uint64_t keep = 0;
            if (httpStatus == 206)
            {
                // Partial content is only appended when it starts where the file ends
                bool aligned = contentRange.present ? contentRange.first == offset : offset == 0;
                if (!aligned)
                {
                    badStatus = true;
                    statusMessage = "partial content for " + task.getUrl() + " starts at byte " +
                                    (contentRange.present ? std::to_string(contentRange.first) : std::string("?")) +
                                    ", expected " + std::to_string(offset);
                    return false;
                }
                keep = offset;
            }
            else if (httpStatus == 200)
            {
                if (offset > 0)
                {
                    spdlog::info("Server ignored range request for {}; restarting from zero", task.getDestination());
                }
                offset = 0;
                task.setBytesTransferred(0);
            }
            else
            {
                badStatus = true;
                statusMessage = "unexpected HTTP status " + std::to_string(httpStatus) + " for " + task.getUrl();
                return false;
            }

            curl_off_t contentLength = -1;
            curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);

            if (httpStatus == 206 && contentRange.total > 0)
            {
                task.setExpectedTotalSize(contentRange.total);
            }
            else if (contentLength >= 0)
            {
                task.setExpectedTotalSize(keep + static_cast<uint64_t>(contentLength));
            }
            else if (keep == 0)
            {
                task.setExpectedTotalSize(0); // Unknown until the body ends
            }

            writer = std::make_unique<FileWriter>(task.getDestination(), keep);
            if (!writer->isOpen())
            {
                storageError = true;
                storageMessage = writer->getError();
                return false;
            }

            return true;
        }

        // Writes the staged bytes; only then are they counted as transferred
        bool flush()
        {
            if (buffer.empty() || !writer)
                return true;

            if (!writer->write(buffer.data(), buffer.size()))
            {
                storageError = true;
                storageMessage = writer->getError();
                return false;
            }

            task.addBytesTransferred(buffer.size());
            buffer.clear();

            if (onChunk)
            {
                onChunk(task);
            }
            return true;
        }
    };

    // Stages incoming body bytes and writes them out a chunk at a time
    size_t curlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *ctx = static_cast<TransferContext *>(userdata);
        size_t totalBytes = size * nmemb;

        if (!ctx->started && !ctx->begin())
        {
            return 0;
        }

        // Returning short makes libcurl abort the transfer
        if (ctx->token.isCancelled())
        {
            return 0;
        }

        ctx->buffer.append(ptr, totalBytes);
        if (ctx->buffer.size() >= ctx->chunkSize && !ctx->flush())
        {
            return 0;
        }

        return totalBytes;
    }

    // Checks the cancellation token while the transfer is idle or stalled
    int curlProgressCallback(void *clientp,
                             curl_off_t /* dltotal */,
                             curl_off_t /* dlnow */,
                             curl_off_t /* ultotal */,
                             curl_off_t /* ulnow */)
    {
        auto *ctx = static_cast<TransferContext *>(clientp);
        return ctx->token.isCancelled() ? 1 : 0;
    }
}

CurlTransport::CurlTransport(TransportOptions options)
    : _options(std::move(options))
{
    if (_options.chunkSize == 0)
    {
        _options.chunkSize = DEFAULT_CHUNK_SIZE;
    }
}

FetchResult CurlTransport::fetch(DownloadTask &task, const CancellationToken &token, const ChunkCallback &onChunk)
{
    const std::string &destination = task.getDestination();

    // Never trust a counter beyond what is actually on disk
    uint64_t offset = std::min(task.getBytesTransferred(), fileSize(destination));
    task.setBytesTransferred(offset);

    uint64_t expected = task.getExpectedTotalSize();
    if (expected > 0 && offset == expected)
    {
        FileWriter trim(destination, expected);
        if (!trim.isOpen())
        {
            throw TransferError(ErrorKind::STORAGE, trim.getError());
        }
        spdlog::debug("{} already holds all {} bytes", destination, expected);
        return FetchResult::COMPLETED;
    }

    if (token.isCancelled())
    {
        return FetchResult::CANCELLED;
    }

    if (!ensureParentDirectory(destination))
    {
        throw TransferError(ErrorKind::STORAGE, "cannot create directory for " + destination);
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), curl_easy_cleanup);
    if (!handle)
    {
        throw TransferError::fromCurl(CURLE_FAILED_INIT, task.getUrl());
    }
    CURL *curl = handle.get();

    TransferContext ctx{task, token, onChunk, curl, _options.chunkSize, offset};
    ctx.buffer.reserve(_options.chunkSize);

    http::HeaderList headers(task.getHeaders());
    if (offset > 0)
    {
        headers.append(http::rangeHeader(offset));
        spdlog::debug("Resuming {} at byte {}", destination, offset);
    }

    curl_easy_setopt(curl, CURLOPT_URL, task.getUrl().c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, _options.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, _options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L); // Required when running on worker threads
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, _options.connectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, _options.lowSpeedLimitBytes);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, _options.lowSpeedTimeSeconds);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, _options.verifyTls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, _options.verifyTls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, http::contentRangeHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx.contentRange);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, curlProgressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    CURLcode res = curl_easy_perform(curl);

    // Whatever arrived before a failure or cancellation is still a valid prefix
    ctx.flush();

    if (ctx.storageError)
    {
        throw TransferError(ErrorKind::STORAGE, ctx.storageMessage);
    }

    if (ctx.badStatus)
    {
        throw TransferError(ErrorKind::HTTP_STATUS, ctx.statusMessage, ctx.httpStatus);
    }

    if (res != CURLE_OK)
    {
        if (token.isCancelled() && (res == CURLE_ABORTED_BY_CALLBACK || res == CURLE_WRITE_ERROR))
        {
            spdlog::debug("Stopped {} at byte {}", destination, task.getBytesTransferred());
            return FetchResult::CANCELLED;
        }
        throw TransferError::fromCurl(res, task.getUrl());
    }

    // An empty body never reaches the write callback
    if (!ctx.started && !ctx.begin())
    {
        if (ctx.storageError)
        {
            throw TransferError(ErrorKind::STORAGE, ctx.storageMessage);
        }
        throw TransferError(ErrorKind::HTTP_STATUS, ctx.statusMessage, ctx.httpStatus);
    }

    uint64_t transferred = task.getBytesTransferred();
    uint64_t total = task.getExpectedTotalSize();
    if (total == 0)
    {
        task.setExpectedTotalSize(transferred);
    }
    else if (transferred < total)
    {
        throw TransferError(ErrorKind::TRUNCATED,
                            "received " + std::to_string(transferred) + " of " + std::to_string(total) + " bytes");
    }
    else if (transferred > total)
    {
        // The file no longer matches the resource; the caller discards it
        throw TransferError(ErrorKind::HTTP_STATUS,
                            "received " + std::to_string(transferred) + " bytes for " + task.getUrl() + ", " +
                                std::to_string(total) + " announced",
                            ctx.httpStatus);
    }

    return FetchResult::COMPLETED;
}
