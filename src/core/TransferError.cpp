#include "core/TransferError.hpp"

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::CONNECTION:
        return "connection";
    case ErrorKind::TIMEOUT:
        return "timeout";
    case ErrorKind::TLS:
        return "tls";
    case ErrorKind::HTTP_STATUS:
        return "http-status";
    case ErrorKind::TRUNCATED:
        return "truncated";
    case ErrorKind::MALFORMED_URL:
        return "malformed-url";
    case ErrorKind::UNSUPPORTED_PROTOCOL:
        return "unsupported-protocol";
    case ErrorKind::STORAGE:
        return "storage";
    case ErrorKind::EXHAUSTED:
        return "exhausted";
    }
    return "unknown";
}

TransferError::TransferError(ErrorKind kind, const std::string &message, long httpStatus, CURLcode curlCode)
    : std::runtime_error(message),
      _kind(kind),
      _httpStatus(httpStatus),
      _curlCode(curlCode)
{
}

TransferError TransferError::fromCurl(CURLcode code, const std::string &detail)
{
    std::string message = curl_easy_strerror(code);
    if (!detail.empty())
    {
        message += ": " + detail;
    }

    switch (code)
    {
    case CURLE_OPERATION_TIMEDOUT:
        return TransferError(ErrorKind::TIMEOUT, message, 0, code);

    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_ENGINE_NOTFOUND:
    case CURLE_SSL_ENGINE_SETFAILED:
    case CURLE_SSL_ENGINE_INITFAILED:
    case CURLE_SSL_ISSUER_ERROR:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
    case CURLE_SSL_INVALIDCERTSTATUS:
    case CURLE_SSL_CRL_BADFILE:
    case CURLE_SSL_SHUTDOWN_FAILED:
        return TransferError(ErrorKind::TLS, message, 0, code);

    case CURLE_URL_MALFORMAT:
        return TransferError(ErrorKind::MALFORMED_URL, message, 0, code);

    case CURLE_UNSUPPORTED_PROTOCOL:
        return TransferError(ErrorKind::UNSUPPORTED_PROTOCOL, message, 0, code);

    case CURLE_PARTIAL_FILE:
        return TransferError(ErrorKind::TRUNCATED, message, 0, code);

    case CURLE_WRITE_ERROR:
        return TransferError(ErrorKind::STORAGE, message, 0, code);

    default:
        // Resolve, connect, send and receive failures all end up here
        return TransferError(ErrorKind::CONNECTION, message, 0, code);
    }
}
