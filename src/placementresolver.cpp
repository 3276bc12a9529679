#include "placementresolver.h"
#include "mediainfo.h"
#include "logger.h"
#include <filesystem>
#include <system_error>
#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

namespace MediaVault {

namespace {

int64_t fileModificationTime(const std::string& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    // file_time_type -> system_clock (C++17 no ofrece clock_cast)
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sctp.time_since_epoch()).count();
}

} // namespace

PlacementResolver::PlacementResolver(Database* database, const std::string& backupRoot)
    : m_database(database)
    , m_backupRoot(backupRoot)
{
}

int64_t PlacementResolver::effectiveDate(const std::string& sourcePath,
                                         const std::string& declaredName,
                                         int64_t& captureTime) const {
    captureTime = 0;

    if (MediaInfo::isPhoto(declaredName)) {
        captureTime = MediaInfo::readExifCaptureTime(sourcePath);
        if (captureTime != 0) {
            return captureTime;
        }
    }

    int64_t mtime = fileModificationTime(sourcePath);
    if (mtime > 0) {
        return mtime;
    }

    return Database::now();
}

std::string PlacementResolver::bucketDirectory(int year, int month) const {
    return (fs::path(m_backupRoot) / std::to_string(year) / MediaInfo::monthBucketName(month)).string();
}

std::string PlacementResolver::resolveCollision(const std::string& directory,
                                                const std::string& fileName,
                                                std::string& error) {
    fs::path candidate = fs::path(directory) / fileName;
    std::error_code ec;

    bool taken = fs::exists(candidate, ec);
    if (ec) {
        error = "Cannot check destination " + candidate.string() + ": " + ec.message();
        return "";
    }
    if (!taken) {
        return candidate.string();
    }

    std::string stem = fs::path(fileName).stem().string();
    std::string extension = fs::path(fileName).extension().string();

    for (int counter = 1; ; ++counter) {
        candidate = fs::path(directory) / (stem + "_" + std::to_string(counter) + extension);
        taken = fs::exists(candidate, ec);
        if (ec) {
            error = "Cannot check destination " + candidate.string() + ": " + ec.message();
            return "";
        }
        if (!taken) {
            LOG_DEBUG("Name collision for " + fileName + ", using " + candidate.filename().string());
            return candidate.string();
        }
    }
}

PlacementDecision PlacementResolver::resolve(const std::string& fingerprint,
                                             const std::string& sourcePath,
                                             const std::string& declaredName) const {
    PlacementDecision decision;

    if (!m_database) {
        decision.errorMessage = "Metadata store not available";
        return decision;
    }

    LookupResult lookup = m_database->getFileByFingerprint(fingerprint, decision.existing);
    if (lookup == LookupResult::Error) {
        decision.errorMessage = "Fingerprint lookup failed: " + m_database->lastError();
        return decision;
    }
    if (lookup == LookupResult::Found) {
        decision.resolution = Resolution::Existing;
        decision.destinationPath = decision.existing.backupPath;
        return decision;
    }

    decision.effectiveTime = effectiveDate(sourcePath, declaredName, decision.captureTime);

    std::time_t t = static_cast<std::time_t>(decision.effectiveTime);
    std::tm local{};
    localtime_r(&t, &local);
    decision.year = local.tm_year + 1900;
    decision.month = local.tm_mon + 1;

    std::string directory = bucketDirectory(decision.year, decision.month);
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        decision.errorMessage = "Cannot create destination directory " + directory + ": " + ec.message();
        LOG_ERROR(decision.errorMessage);
        return decision;
    }

    std::string fileName = fs::path(declaredName).filename().string();
    if (fileName.empty()) {
        fileName = fingerprint;
    }

    std::string collisionError;
    decision.destinationPath = resolveCollision(directory, fileName, collisionError);
    if (decision.destinationPath.empty()) {
        decision.errorMessage = collisionError;
        LOG_ERROR(decision.errorMessage);
        return decision;
    }
    decision.resolution = Resolution::New;
    return decision;
}

} // namespace MediaVault
