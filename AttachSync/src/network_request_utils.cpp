#include "attachsync/network_request_utils.hpp"
#include "attachsync/transfer_exception.hpp"

#include <string.h>
#include <sys/stat.h>
#include <algorithm>

std::string FindLinuxCertsBundle() {
#ifdef __linux__
    std::string certificatePaths[] = {
        // Debian, Ubuntu, Arch: maintained by update-ca-certificates
        "/etc/ssl/certs/ca-certificates.crt",
        // Red Hat 5+, Fedora, Centos
        "/etc/pki/tls/certs/ca-bundle.crt",
        // Red Hat 4
        "/usr/share/ssl/certs/ca-bundle.crt",
        // FreeBSD (security/ca-root-nss package)
        "/usr/local/share/certs/ca-root-nss.crt",
        // OpenBSD
        "/etc/ssl/cert.pem",
        // OpenSUSE
        "/etc/ssl/ca-bundle.pem",
    };
    for (const auto path : certificatePaths) {
        struct stat buffer;
        if (stat (path.c_str(), &buffer) == 0) {
            return path;
        }
    }
#endif
    return "";
}

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    std::string * buffer = (std::string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    size_t newLength = oldLength + real_size;

    buffer->resize(newLength);
    std::copy((char*)contents, (char*)contents+real_size, buffer->begin() + oldLength);

    return real_size;
}

CURL * CreateJSONRequest(std::string url, std::string method, std::string authorization, const char * payloadChars) {
    CURL * curl_handle = curl_easy_init();
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);

    struct curl_slist *headers = NULL;

    headers = curl_slist_append(headers, "Accept: application/json");

    if (authorization != "") {
        headers = curl_slist_append(headers, ("Authorization: " + authorization).c_str());
    }
    if (payloadChars != nullptr && strlen(payloadChars) > 0) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payloadChars);
    }
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, method.c_str());

    return curl_handle;
}

const std::string PerformRequest(CURL * curl_handle) {
    // Ensure /all/ curl code paths run this code for RHEL and other linux distros
    std::string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }

    std::string result;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&result);
    CURLcode res = curl_easy_perform(curl_handle);
    ValidateRequestResp(res, curl_handle, result);
    return result;
}

const nlohmann::json PerformJSONRequest(CURL * curl_handle) {
    std::string result = PerformRequest(curl_handle);
    nlohmann::json resultJSON = nullptr;
    try {
        resultJSON = nlohmann::json::parse(result);
    } catch (nlohmann::json::exception &) {
        resultJSON = {{"text", result}};
    }
    curl_easy_cleanup(curl_handle);
    return resultJSON;
}

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp) {
    char * _url = nullptr;
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) != CURLE_OK || _url == nullptr) {
        curl_easy_cleanup(curl_handle);
        throw TransferException(res, "Unable to get URL");
    }
    std::string url { _url };

    if (res != CURLE_OK) {
        curl_easy_cleanup(curl_handle);
        throw TransferException(res, url);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code > 209) {
        curl_off_t retryAfter = 0;
        if (curl_easy_getinfo(curl_handle, CURLINFO_RETRY_AFTER, &retryAfter) != CURLE_OK) {
            retryAfter = 0;
        }
        curl_easy_cleanup(curl_handle); // note: cleans up _url;

        std::string debuginfo = url + " RETURNED " + resp;
        throw TransferException(http_code, debuginfo, retryAfter > 0 ? (long)retryAfter : -1);
    }
}
