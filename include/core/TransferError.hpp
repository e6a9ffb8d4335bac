#ifndef TRANSFERERROR_HPP
#define TRANSFERERROR_HPP

#include <stdexcept>
#include <string>
#include <curl/curl.h>

enum class ErrorKind
{
    CONNECTION,
    TIMEOUT,
    TLS,
    HTTP_STATUS,
    TRUNCATED,
    MALFORMED_URL,
    UNSUPPORTED_PROTOCOL,
    STORAGE,
    EXHAUSTED
};

const char *errorKindName(ErrorKind kind);

// Raised by a transport for every failed attempt, tagged with its classification
class TransferError : public std::runtime_error
{
public:
    TransferError(ErrorKind kind, const std::string &message, long httpStatus = 0, CURLcode curlCode = CURLE_OK);

    ErrorKind getKind() const { return _kind; }
    long getHttpStatus() const { return _httpStatus; }
    CURLcode getCurlCode() const { return _curlCode; }

    // Builds the error matching a failed curl_easy_perform result
    static TransferError fromCurl(CURLcode code, const std::string &detail);

private:
    ErrorKind _kind;
    long _httpStatus;
    CURLcode _curlCode;
};

class ResumeStoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class CancelledError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif
