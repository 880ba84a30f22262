#include "attachsync/curl_attachment_transfer_client.hpp"
#include "attachsync/attach_utils.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/network_request_utils.hpp"
#include "attachsync/transfer_exception.hpp"

#include <curl/curl.h>
#include "nlohmann/json.hpp"


static int _onTransferProgress(void * userp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    TransferProgressCallback * progress = (TransferProgressCallback *)userp;
    if (progress && *progress) {
        (*progress)((int64_t)(dlnow > 0 ? dlnow : ulnow));
    }
    return 0;
}

static void applyTransferOptions(CURL * curl_handle, TransferProgressCallback * progress) {
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);
    // abort transfers that move less than 1 byte/sec for a minute
    curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, _onTransferProgress);
    curl_easy_setopt(curl_handle, CURLOPT_XFERINFODATA, (void *)progress);

    std::string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }
}

static int cdnNumberFromResponse(const std::string & resp) {
    nlohmann::json json = nullptr;
    try {
        json = nlohmann::json::parse(resp);
    } catch (nlohmann::json::exception &) {
        throw TransferException(TRANSFER_ERROR_INVALID_RESPONSE, "Upload response was not JSON: " + resp, true);
    }
    if (!json.is_object() || !json.count("cdn") || !json["cdn"].is_number()) {
        throw TransferException(TRANSFER_ERROR_INVALID_RESPONSE, "Upload response had no cdn: " + resp, true);
    }
    return json["cdn"].get<int>();
}


CurlAttachmentTransferClient::CurlAttachmentTransferClient(std::string server, std::string filesDir) :
    _server(server), _filesDir(filesDir), logger(spdlog::get("logger"))
{
}

std::string CurlAttachmentTransferClient::urlForSource(const TransferDescriptor & source) {
    std::string cdn = "/cdn" + std::to_string(source.cdnNumber);
    if (source.tier == TransferTier::Transit) {
        return _server + cdn + "/attachments/" + source.cdnKey;
    }
    return _server + cdn + "/backups/media/" + source.mediaId;
}

TransferReceipt CurlAttachmentTransferClient::download(std::string attachmentId, int priority, const TransferDescriptor & source, TransferProgressCallback progress) {
    std::string suffix = (source.tier == TransferTier::MediaThumbnail) ? THUMBNAIL_MEDIA_NAME_SUFFIX : "";
    std::string localPath = _filesDir + FS_PATH_SEP + attachmentId + suffix;
    std::string url = urlForSource(source);

    logger->info("Downloading {} from {} tier (priority {})", attachmentId, TransferTierToString(source.tier), priority);

    FILE * file = fopen(localPath.c_str(), "wb");
    if (file == nullptr) {
        throw TransferException("local-write-failed", "Unable to open " + localPath + " for writing", false);
    }

    CURL * curl_handle = curl_easy_init();
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    struct curl_slist *headers = NULL;
    if (source.authorization != "") {
        headers = curl_slist_append(headers, ("Authorization: " + source.authorization).c_str());
        curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    }
    applyTransferOptions(curl_handle, &progress);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, fwrite);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)file);

    CURLcode res = curl_easy_perform(curl_handle);
    fclose(file);
    curl_slist_free_all(headers);

    curl_off_t downloaded = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_SIZE_DOWNLOAD_T, &downloaded);

    try {
        ValidateRequestResp(res, curl_handle, "");
    } catch (TransferException &) {
        ::remove(localPath.c_str());
        throw;
    }
    curl_easy_cleanup(curl_handle);

    TransferReceipt receipt;
    receipt.cdnNumber = source.cdnNumber;
    receipt.byteCount = (int64_t)downloaded;
    receipt.digest = source.digest;
    receipt.localPath = localPath;
    return receipt;
}

TransferReceipt CurlAttachmentTransferClient::copyFromTransitTier(const TransferDescriptor & destination) {
    nlohmann::json payload = {
        {"sourceAttachment", {{"cdn", destination.cdnNumber}, {"key", destination.cdnKey}}},
        {"objectLength", destination.byteCount},
        {"mediaId", destination.mediaId},
    };
    std::string payloadString = payload.dump();
    CURL * curl_handle = CreateJSONRequest(_server + "/v1/archives/media", "PUT", destination.authorization, payloadString.c_str());

    std::string resp;
    try {
        resp = PerformRequest(curl_handle);
    } catch (TransferException & ex) {
        if (ex.httpStatus == 410 || ex.httpStatus == 404) {
            throw TransferException(TRANSFER_ERROR_SOURCE_NOT_FOUND, ex.debuginfo, true);
        }
        throw;
    }
    curl_easy_cleanup(curl_handle);

    TransferReceipt receipt;
    receipt.cdnNumber = cdnNumberFromResponse(resp);
    receipt.byteCount = destination.byteCount;
    receipt.digest = destination.digest;
    receipt.localPath = "";
    return receipt;
}

TransferReceipt CurlAttachmentTransferClient::upload(std::string attachmentId, int priority, const TransferDescriptor & destination, TransferProgressCallback progress) {
    logger->info("Uploading {} to {} tier (priority {}{})", attachmentId, TransferTierToString(destination.tier), priority, destination.copyFromTransitTier ? ", copy" : "");

    if (destination.copyFromTransitTier) {
        TransferReceipt receipt = copyFromTransitTier(destination);
        if (progress) {
            progress(receipt.byteCount);
        }
        return receipt;
    }

    if (!AttachUtils::fileExists(destination.localPath)) {
        throw TransferException(TRANSFER_ERROR_MISSING_FILE, destination.localPath + " does not exist", false);
    }
    FILE * file = fopen(destination.localPath.c_str(), "rb");
    if (file == nullptr) {
        throw TransferException(TRANSFER_ERROR_MISSING_FILE, "Unable to open " + destination.localPath, false);
    }
    fseek(file, 0, SEEK_END);
    curl_off_t size = (curl_off_t)ftell(file);
    fseek(file, 0, SEEK_SET);

    CURL * curl_handle = curl_easy_init();
    curl_easy_setopt(curl_handle, CURLOPT_URL, (_server + "/v1/archives/media/upload/" + destination.mediaId).c_str());
    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "Content-Type: application/octet-stream");
    if (destination.authorization != "") {
        headers = curl_slist_append(headers, ("Authorization: " + destination.authorization).c_str());
    }
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_READFUNCTION, fread);
    curl_easy_setopt(curl_handle, CURLOPT_READDATA, (void *)file);
    curl_easy_setopt(curl_handle, CURLOPT_INFILESIZE_LARGE, size);
    applyTransferOptions(curl_handle, &progress);

    std::string resp;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&resp);

    CURLcode res = curl_easy_perform(curl_handle);
    fclose(file);
    curl_slist_free_all(headers);
    ValidateRequestResp(res, curl_handle, resp);
    curl_easy_cleanup(curl_handle);

    TransferReceipt receipt;
    receipt.cdnNumber = cdnNumberFromResponse(resp);
    receipt.byteCount = (int64_t)size;
    receipt.digest = destination.digest;
    receipt.localPath = destination.localPath;
    return receipt;
}
