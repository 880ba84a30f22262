#include "attachsync/transfer_exception.hpp"

TransferException::TransferException(std::string key, std::string di, bool retryable) :
    GenericException(), retryable(retryable), key(key), debuginfo(di), httpStatus(0), retryAfter(-1)
{

}

TransferException::TransferException(CURLcode c, std::string di) :
    GenericException(), key(curl_easy_strerror(c)), debuginfo(di), httpStatus(0), retryAfter(-1)
{
    if ((c == CURLE_COULDNT_RESOLVE_PROXY) ||
        (c == CURLE_COULDNT_RESOLVE_HOST) ||
        (c == CURLE_COULDNT_CONNECT) ||
        (c == CURLE_OPERATION_TIMEDOUT) ||
        (c == CURLE_PARTIAL_FILE) ||
        (c == CURLE_SSL_CONNECT_ERROR) ||
        (c == CURLE_GOT_NOTHING) ||
        (c == CURLE_SEND_ERROR) ||
        (c == CURLE_RECV_ERROR) ||
        (c == CURLE_AGAIN)) {
        retryable = true;
        offline = true;
    }
    if (c == CURLE_READ_ERROR) {
        key = TRANSFER_ERROR_MISSING_FILE;
    }
}

TransferException::TransferException(long httpStatus, std::string di, long retryAfter) :
    GenericException(), key("Invalid Response Code: " + std::to_string(httpStatus)), debuginfo(di), httpStatus(httpStatus), retryAfter(retryAfter)
{
    retryable = ((httpStatus != 403) && (httpStatus != 401));
}

bool TransferException::isRetryable() {
    return retryable;
}

bool TransferException::isOffline() {
    return offline;
}

bool TransferException::isForbidden() {
    return httpStatus == 403;
}

bool TransferException::isRateLimited() {
    return httpStatus == 429;
}

bool TransferException::isSourceNotFound() {
    return key == TRANSFER_ERROR_SOURCE_NOT_FOUND;
}

bool TransferException::isMissingFile() {
    return key == TRANSFER_ERROR_MISSING_FILE;
}

const char * TransferException::what() const noexcept {
    return key.c_str();
}

nlohmann::json TransferException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
        {"offline", offline},
        {"httpStatus", httpStatus},
    };
}
