#include "backup_manager.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

namespace portguard {

namespace {
const char* kComponent = "BackupManager";
}

BackupManager::BackupManager(FirewallBackend& backend, const GuardSettings& settings)
    : backend_(backend), settings_(settings) {
}

std::filesystem::path BackupManager::snapshotPath(AddressFamily family) const {
    return settings_.backupPath(family);
}

bool BackupManager::snapshotExists() const {
    return !existingSnapshotFiles().empty();
}

std::vector<std::filesystem::path> BackupManager::existingSnapshotFiles() const {
    std::vector<std::filesystem::path> existing;
    for (AddressFamily family : kAllFamilies) {
        std::error_code ec;
        const auto path = snapshotPath(family);
        // A path we cannot even stat is reported as present: fail closed
        if (std::filesystem::exists(path, ec) || ec) {
            existing.push_back(path);
        }
    }
    return existing;
}

Snapshot BackupManager::createSnapshot() {
    std::error_code ec;
    // Directory may already exist from an earlier clean run
    std::filesystem::create_directories(settings_.backup_directory, ec);
    if (ec) {
        throw BackupError("Cannot create backup directory " + settings_.backup_directory.string() +
                          ": " + ec.message());
    }
    std::cout << "Backup directory: " << settings_.backup_directory.string() << std::endl;

    // IPv4 then IPv6; the first failure aborts before any rule is touched
    for (AddressFamily family : kAllFamilies) {
        writeFamilySnapshot(family);
    }

    return Snapshot{snapshotPath(AddressFamily::IPv4), snapshotPath(AddressFamily::IPv6)};
}

void BackupManager::writeFamilySnapshot(AddressFamily family) {
    const std::string tool = familyToolName(family) + "-save";

    CommandResult result = backend_.dumpRules(family);
    if (!result.isSuccess()) {
        throw BackupError(tool + " failed: " + result.getErrorMessage());
    }

    const auto path = snapshotPath(family);
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw BackupError("Unable to open " + path.string() + " for writing");
    }

    // Written verbatim so iptables-restore can replay it as is
    file << result.stdout_output;
    file.flush();
    if (!file) {
        throw BackupError("Failed to write " + path.string());
    }

    std::cout << familyToString(family) << " backup: " << path.string() << std::endl;
    Logger::debug(kComponent, "Wrote " + std::to_string(result.stdout_output.size()) +
                              " bytes to " + path.string());
}

bool BackupManager::restore(AddressFamily family) {
    const auto path = snapshotPath(family);
    const std::string tool = familyToolName(family) + "-restore";

    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "  [WARN] " << familyToString(family) << " backup file not found: "
                  << path.string() << std::endl;
        return false;
    }

    // Read the whole dump once, each retry replays the same payload
    std::ostringstream payload;
    payload << file.rdbuf();
    const std::string dump = payload.str();

    const int attempts = settings_.retry.attempts;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        CommandResult result = backend_.restoreRules(family, dump);
        if (result.isSuccess()) {
            std::cout << "  [OK] " << familyToString(family) << " restored from backup" << std::endl;
            return true;
        }

        std::cout << "  [RETRY " << attempt << "/" << attempts << "] " << tool
                  << " failed: " << result.getErrorMessage() << std::endl;

        if (attempt < attempts) {
            std::this_thread::sleep_for(settings_.retry.backoff);
        }
    }

    Logger::error(kComponent, tool + " failed after " + std::to_string(attempts) + " attempts");
    return false;
}

void BackupManager::discard() {
    for (AddressFamily family : kAllFamilies) {
        const auto path = snapshotPath(family);
        std::error_code ec;
        // Missing files are fine here, only real errors are reported
        bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            Logger::warning(kComponent, "Could not remove backup file " + path.string() + ": " + ec.message());
        } else if (removed) {
            Logger::info(kComponent, "Removed: " + path.string());
        }
    }
}

} // namespace portguard
