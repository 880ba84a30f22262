#include "attachsync/attach_utils.hpp"

#include <stdlib.h>
#include <sys/stat.h>
#include <chrono>
#include <condition_variable>
#include <mutex>

static std::mutex workerWakeMtx;
static std::condition_variable workerWakeCv;
static long workerWakeGeneration = 0;

std::string AttachUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

bool AttachUtils::fileExists(std::string path) {
    struct stat buffer;
    return stat(path.c_str(), &buffer) == 0;
}

void AttachUtils::sleepWorkerUntilWakeOrSec(int sec) {
    std::unique_lock<std::mutex> lck(workerWakeMtx);
    long generation = workerWakeGeneration;
    workerWakeCv.wait_for(lck, std::chrono::seconds(sec), [generation]() {
        return workerWakeGeneration != generation;
    });
}

void AttachUtils::wakeAllWorkers() {
    std::lock_guard<std::mutex> lck(workerWakeMtx);
    workerWakeGeneration += 1;
    workerWakeCv.notify_all();
}
