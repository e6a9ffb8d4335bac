#ifndef HTTP_HPP
#define HTTP_HPP

#include <cstdint>
#include <string>
#include <curl/curl.h>

#include "core/DownloadTask.hpp"

static constexpr char DEFAULT_USER_AGENT[] = "bdm/1.0";

namespace http
{
    // Process-wide libcurl initialisation, held for the lifetime of main()
    class CurlGlobal
    {
    public:
        CurlGlobal();
        ~CurlGlobal();

        CurlGlobal(const CurlGlobal &) = delete;
        CurlGlobal &operator=(const CurlGlobal &) = delete;
    };

    // Owns a curl_slist built from a task's header set
    class HeaderList
    {
    public:
        explicit HeaderList(const HeaderMap &headers);
        ~HeaderList();

        HeaderList(const HeaderList &) = delete;
        HeaderList &operator=(const HeaderList &) = delete;

        void append(const std::string &line);
        curl_slist *get() const { return _list; }

    private:
        curl_slist *_list = nullptr;
    };

    std::string rangeHeader(uint64_t offset);

    // "Content-Range: bytes first-last/total" of one response
    struct ContentRange
    {
        bool present = false;
        uint64_t first = 0;
        uint64_t last = 0;
        uint64_t total = 0; // 0 when the server sent "*"
    };

    // false unless headerLine is a well-formed byte Content-Range with a satisfied range
    bool parseContentRange(const std::string &headerLine, ContentRange &range);

    // libcurl header callback; records the Content-Range into a ContentRange
    size_t contentRangeHeaderCallback(char *buffer, size_t size, size_t nmemb, void *userData);
}

#endif
