/** main [AttachSync]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <time.h>
#include <sqlite3.h>

#include <SQLiteCpp/SQLiteCpp.h>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/stdout_sinks.h"
#include "optionparser.h"

#include "attachsync/attach_utils.hpp"
#include "attachsync/attachment_store.hpp"
#include "attachsync/attachment_store_transaction.hpp"
#include "attachsync/backup_attachment_download_manager.hpp"
#include "attachsync/backup_attachment_upload_manager.hpp"
#include "attachsync/backup_settings_store.hpp"
#include "attachsync/constants.hpp"
#include "attachsync/curl_attachment_transfer_client.hpp"
#include "attachsync/delta_stream.hpp"
#include "attachsync/http_backup_request_manager.hpp"
#include "attachsync/list_media_reconciler.hpp"
#include "attachsync/models/account.hpp"
#include "attachsync/models/attachment.hpp"
#include "attachsync/queue_status.hpp"
#include "attachsync/remote_config.hpp"
#include "attachsync/sha256_media_id_deriver.hpp"
#include "attachsync/thread_utils.hpp"
#include "attachsync/transfer_exception.hpp"
#include "attachsync/spd_log_extensions.hpp"

using nlohmann::json;
using option::Option;
using option::Descriptor;
using option::Parser;
using option::Stats;
using option::ArgStatus;

std::shared_ptr<BackupAttachmentUploadManager> uploadManager = nullptr;
std::shared_ptr<BackupAttachmentDownloadManager> downloadManager = nullptr;

std::thread * retryThread = nullptr;


struct CArg: public option::Arg
{
    static ArgStatus Required(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_ILLEGAL : option::ARG_OK;
    }
    static ArgStatus Optional(const Option& option, bool)
    {
        return option.arg == 0 ? option::ARG_IGNORE : option::ARG_OK;
    }
};

#define USAGE_STRING "USAGE: CONFIG_DIR_PATH=/path BACKUP_SERVER=https://backup.example.com attachsync [options]\n\nOptions:"

enum  optionIndex { UNKNOWN, HELP, ACCOUNT, CONFIG, SIGNALS, MODE, ORPHAN, VERBOSE };
const option::Descriptor usage[] =
{
    {UNKNOWN, 0,"" , "",        CArg::None,      USAGE_STRING },
    {HELP,    0,"" , "help",    CArg::None,      "  --help  \tPrint usage and exit." },
    {ACCOUNT, 0,"a", "account", CArg::Optional,  "  --account, -a  \tRequired: Account JSON with the aci, media root key and backup token." },
    {CONFIG,  0,"c", "config",  CArg::Optional,  "  --config, -c  \tOptional: Remote config JSON. Missing keys use defaults." },
    {SIGNALS, 0,"s", "signals", CArg::Optional,  "  --signals, -s  \tOptional: Device signals JSON applied before the first drain." },
    {MODE,    0,"m", "mode",    CArg::Required,  "  --mode, -m  \tRequired: sync, drain, reset, or migrate." },
    {ORPHAN,  0,"o", "orphan",  CArg::None,      "  --orphan, -o  \tOptional: allow the process to run without a parent bound to stdin." },
    {VERBOSE, 0,"v", "verbose", CArg::None,      "  --verbose, -v  \tOptional: log at debug level." },
    {0,0,0,0,0,0}
};

int runSingleFunctionAndExit(std::function<void()> fn) {
    json resp = {{"error", nullptr}};
    int code = 0;
    try {
        fn();
    } catch (TransferException & ex) {
        resp["error"] = ex.toJSON();
        code = 1;
    } catch (std::exception & ex) {
        resp["error"] = ex.what();
        code = 1;
    }
    std::cout << "\n" << resp.dump();
    return code;
}

// Deferred (backed-off) records and failed drains are picked up again here.
void runRetryLoop() {
    SetThreadName("retry");

    while (true) {
        AttachUtils::sleepWorkerUntilWakeOrSec(120);
        if (uploadManager) uploadManager->scheduleDrain();
        if (downloadManager) downloadManager->scheduleDrain();
    }
}

void applyDeviceSignals(const json & packet) {
    for (QueueStatusGate * gate : {uploadManager->gate(), downloadManager->gate()}) {
        gate->updateSignals(DeviceSignalsFromJSON(packet, gate->signals()));
    }
}

void enqueueAttachment(AttachmentStore & store, const json & packet) {
    auto logger = spdlog::get("logger");
    Attachment attachment{packet["attachment"]};
    time_t timestamp = TIMESTAMP_NONE;
    if (packet.count("timestamp") && packet["timestamp"].is_number()) {
        timestamp = (time_t)packet["timestamp"].get<int64_t>();
    }
    std::string direction = packet.count("direction") ? packet["direction"].get<std::string>() : "";

    AttachmentStoreTransaction tx(&store, "enqueueAttachment");

    // the parent sends attachments without version info. Adopt ours so the
    // save is an update when we've seen the attachment before.
    Query q = Query().equal("id", attachment.id());
    auto existing = store.find<Attachment>(q);
    attachment._data["v"] = existing ? existing->version() : 0;
    store.save(&attachment);

    if (direction == "upload" || direction == "") {
        uploadManager->enqueueIfNeeded(attachment, timestamp, tx);
    }
    if (direction == "download" || direction == "") {
        downloadManager->enqueueIfNeeded(attachment, timestamp, tx);
    }
    tx.commit();

    logger->info("Enqueued attachment {} ({})", attachment.id(), direction == "" ? "both" : direction);
}

void runListenOnMainThread(AttachmentStore & store) {
    auto logger = spdlog::get("logger");
    BackupSettingsStore settings;

    time_t lostCINAt = 0;

    while(true) {
        json packet = SharedDeltaStream()->waitForJSON();

        // cin is interrupted when the debugger attaches, and that's ok. If cin is
        // disconnected for more than 30 seconds, it means we have been orphaned and
        // we should exit.
        if (std::cin.good()) {
            lostCINAt = 0;
        } else {
            if (lostCINAt == 0) {
                lostCINAt = time(0);
            }
            if (time(0) - lostCINAt > 30) {
                std::exit(141);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(1000));
        }

        std::string type = packet.count("type") ? packet["type"].get<std::string>() : "";
        std::string direction = packet.count("direction") ? packet["direction"].get<std::string>() : "";

        try {
            if (type == "enqueue-attachment") {
                enqueueAttachment(store, packet);
            }

            if (type == "drain-now") {
                if (direction == "upload" || direction == "") uploadManager->scheduleDrain();
                if (direction == "download" || direction == "") downloadManager->scheduleDrain();
            }

            if (type == "cancel-all") {
                if (direction == "upload" || direction == "") uploadManager->cancelAll();
                if (direction == "download" || direction == "") downloadManager->cancelAll();
            }

            if (type == "device-signals") {
                applyDeviceSignals(packet);
            }

            if (type == "set-backup-plan") {
                AttachmentStoreTransaction tx(&store, "setBackupPlan");
                settings.setBackupPlan(packet["plan"].get<std::string>(), tx);
                tx.commit();
                uploadManager->scheduleDrain();
            }

            if (type == "set-upload-era") {
                AttachmentStoreTransaction tx(&store, "setUploadEra");
                settings.setUploadEra(packet["era"].get<std::string>(), tx);
                tx.commit();
                uploadManager->scheduleDrain();
            }

            if (type == "set-bandwidth-preference") {
                AttachmentStoreTransaction tx(&store, "setBandwidthPreference");
                settings.setMediaBandwidthPreference(packet["preference"].get<std::string>(), tx);
                tx.commit();
                downloadManager->scheduleDrain();
            }

            if (type == "set-backups-on-cellular") {
                AttachmentStoreTransaction tx(&store, "setBackupsOnCellular");
                settings.setBackupsOnCellular(packet["enabled"].get<bool>(), tx);
                tx.commit();
                uploadManager->scheduleDrain();
            }

            if (type == "set-optimize-local-storage") {
                AttachmentStoreTransaction tx(&store, "setOptimizeLocalStorage");
                settings.setOptimizeLocalStorage(packet["enabled"].get<bool>(), tx);
                tx.commit();
            }

            if (type == "wake-workers") {
                logger->info("Waking all workers...");
                AttachUtils::wakeAllWorkers();
            }

        } catch (TransferException & ex) {
            logger->error("Unable to handle {} packet: {}", type, ex.toJSON().dump());
        } catch (SQLite::Exception & ex) {
            logger->error("Unable to handle {} packet: {}", type, ex.what());
        } catch (json::exception & ex) {
            logger->error("Malformed {} packet: {}", type, ex.what());
        }
    }
}

int main(int argc, const char * argv[]) {
    SetThreadName("main");

    // indicate we use cout, not stdout
    std::cout.sync_with_stdio(false);

    // parse launch arguments, skip program name argv[0] if present
    argc-=(argc>0); argv+=(argc>0);
    option::Stats  stats(usage, argc, argv);
    option::Option options[20], buffer[20];
    option::Parser parse(usage, argc, argv, options, buffer);

    if (parse.error())
        return 1;

    if (options[HELP] || argc == 0 || !options[MODE]) {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // check required environment
    std::string eConfigDirPath = AttachUtils::getEnvUTF8("CONFIG_DIR_PATH");
    std::string eBackupServer = AttachUtils::getEnvUTF8("BACKUP_SERVER");

    if (eConfigDirPath == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // keep SQLite's temp files beside the database
    sqlite3_temp_directory = sqlite3_mprintf("%s", eConfigDirPath.c_str());

    std::string mode(options[MODE].arg);

    if (mode == "migrate") {
        return runSingleFunctionAndExit([](){
            AttachmentStore store;
            store.migrate();
        });
    }

    if (mode == "reset") {
        return runSingleFunctionAndExit([](){
            AttachmentStore store;
            store.migrate();
            store.resetQueues();
        });
    }

    if (eBackupServer == "") {
        option::printUsage(std::cout, usage);
        return 1;
    }

    // get the account via param or stdin
    std::shared_ptr<Account> account = nullptr;
    try {
        if (options[ACCOUNT].count() > 0 && options[ACCOUNT].arg) {
            account = std::make_shared<Account>(json::parse(options[ACCOUNT].arg));
        } else {
            std::cout << "\nWaiting for Account JSON:\n";
            std::string inputLine;
            getline(std::cin, inputLine);
            account = std::make_shared<Account>(json::parse(inputLine));
        }
    } catch (std::exception & ex) {
        json resp = { { "error", std::string("Account JSON is invalid: ") + ex.what() } };
        std::cout << "\n" << resp.dump();
        return 1;
    }

    if (account->valid() != "") {
        json resp = { { "error", "Account is missing required fields:" + account->valid() } };
        std::cout << "\n" << resp.dump();
        return 1;
    }

    RemoteConfig config;
    if (options[CONFIG].count() > 0 && options[CONFIG].arg) {
        config = RemoteConfig(json::parse(options[CONFIG].arg));
    }

    // setup logging to file or console
    std::vector<spdlog::sink_ptr> sinks;
    std::string pattern;

    if (!options[ORPHAN]) {
        // If we're attached to a parent process, log everything to a
        // rotating log file with the default logger format.
        pattern = "%P [%N] %+";
        std::string logPath = eConfigDirPath + FS_PATH_SEP + "attachsync-" + account->id() + ".log";
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 1048576 * 5, 3));
        sinks.push_back(std::make_shared<SPDFlusherSink>());
    } else {
        // If we're attached to a debugger / console, log everything to
        // stdout in an abbreviated format.
        pattern = "%l [%N]: %v";
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    // Always log critical errors to the stderr as well as a log file / stdout.
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    stderr_sink->set_level(spdlog::level::critical);
    sinks.push_back(stderr_sink);

    auto logger = std::make_shared<spdlog::logger>("logger", std::begin(sinks), std::end(sinks));
    logger->set_formatter(MakeFormatterWithThreadNames(pattern));
    logger->set_level(options[VERBOSE] ? spdlog::level::debug : spdlog::level::info);
    spdlog::register_logger(logger);

    // setup curl
    curl_global_init(CURL_GLOBAL_ALL);

    AttachmentStore store;
    store.migrate();

    DateProvider dateProvider = SystemDateProvider();
    HttpBackupRequestManager requests{eBackupServer, account, dateProvider};
    CurlAttachmentTransferClient client{eBackupServer, eConfigDirPath + FS_PATH_SEP + "files"};
    SHA256MediaIdDeriver deriver;
    ListMediaReconciler reconciler{&store, account, &requests, &deriver, config, dateProvider};

    uploadManager = std::make_shared<BackupAttachmentUploadManager>(&store, account, &requests, &client, &deriver, &reconciler, config, dateProvider);
    downloadManager = std::make_shared<BackupAttachmentDownloadManager>(&store, account, &requests, &client, &deriver, &reconciler, config, dateProvider);

    if (mode == "drain") {
        // launched on demand: assume the parent only runs us when ready
        DeviceSignals signals;
        signals.registeredAndReady = true;
        signals.connectivity = Connectivity::Wifi;
        json signalsJSON = json::object();
        if (options[SIGNALS].count() > 0 && options[SIGNALS].arg) {
            signalsJSON = json::parse(options[SIGNALS].arg);
        }
        uploadManager->gate()->updateSignals(DeviceSignalsFromJSON(signalsJSON, signals));
        downloadManager->gate()->updateSignals(DeviceSignalsFromJSON(signalsJSON, signals));

        int code = runSingleFunctionAndExit([&](){
            uploadManager->backUpAllAttachments();
            downloadManager->restoreAttachmentsIfNeeded();
        });
        uploadManager = nullptr;
        downloadManager = nullptr;
        return code;
    }

    if (mode == "sync") {
        logger->info("------------- Starting Sync ({}) ---------------", account->id());

        uploadManager->gate()->addObserver([](QueueStatus status) {
            SharedDeltaStream()->emitQueueStatus("upload", QueueStatusToString(status), 500);
        });
        downloadManager->gate()->addObserver([](QueueStatus status) {
            SharedDeltaStream()->emitQueueStatus("download", QueueStatusToString(status), 500);
        });
        uploadManager->progress()->addObserver([](int64_t completed, int64_t total) {
            SharedDeltaStream()->emitTransferProgress("upload", completed, total, 1000);
        });
        downloadManager->progress()->addObserver([](int64_t completed, int64_t total) {
            SharedDeltaStream()->emitTransferProgress("download", completed, total, 1000);
        });

        if (options[SIGNALS].count() > 0 && options[SIGNALS].arg) {
            applyDeviceSignals(json::parse(options[SIGNALS].arg));
        }

        uploadManager->beginObservingIfNeeded();
        downloadManager->beginObservingIfNeeded();

        retryThread = new std::thread(runRetryLoop);

        if (!options[ORPHAN]) {
            runListenOnMainThread(store);
        } else {
            retryThread->join(); // will block forever.
        }
    }

    return 0;
}
