#include "devicelister.h"
#include "fingerprint.h"
#include "mediainfo.h"
#include "logger.h"
#include <filesystem>
#include <algorithm>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace MediaVault {

namespace {

const char* const MEDIA_ROOT_PATTERNS[] = {
    "DCIM",
    "Internal Storage/DCIM"
};

int64_t toEpochSeconds(fs::file_time_type ftime) {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sctp.time_since_epoch()).count();
}

} // namespace

std::string DirectoryDeviceLister::findMediaRoot(const std::string& mountPath) {
    std::error_code ec;
    for (const char* pattern : MEDIA_ROOT_PATTERNS) {
        fs::path candidate = fs::path(mountPath) / pattern;
        if (fs::is_directory(candidate, ec)) {
            return candidate.string();
        }
    }
    return "";
}

DeviceInfo DirectoryDeviceLister::describe(const std::string& mountPath, const std::string& name) {
    DeviceInfo device;
    device.mountPath = mountPath;
    device.name = name.empty() ? fs::path(mountPath).filename().string() : name;
    device.mediaRoot = findMediaRoot(mountPath);

    std::string digest = FingerprintEngine::sha256Hex(mountPath + "|" + device.name);
    device.deviceId = digest.substr(0, 16);
    return device;
}

std::vector<CandidateFile> DirectoryDeviceLister::listCandidateFiles(const DeviceInfo& device) {
    std::vector<CandidateFile> files;

    std::string root = device.mediaRoot.empty() ? findMediaRoot(device.mountPath) : device.mediaRoot;
    if (root.empty()) {
        LOG_WARNING("No DCIM folder found under " + device.mountPath);
        return files;
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG_ERROR("Cannot scan " + root + ": " + ec.message());
        return files;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG_WARNING("Error while scanning " + root + ": " + ec.message());
            ec.clear();
            continue;
        }

        const fs::directory_entry& entry = *it;
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || !MediaInfo::isSupportedMedia(entry.path().string())) {
            continue;
        }

        CandidateFile candidate;
        candidate.path = entry.path().string();
        candidate.size = static_cast<int64_t>(entry.file_size(entryEc));
        if (entryEc) {
            LOG_WARNING("Cannot stat " + candidate.path + ": " + entryEc.message());
            continue;
        }
        auto mtime = entry.last_write_time(entryEc);
        candidate.mtime = entryEc ? 0 : toEpochSeconds(mtime);
        files.push_back(candidate);
    }

    std::sort(files.begin(), files.end(), [](const CandidateFile& a, const CandidateFile& b) {
        return a.path < b.path;
    });

    LOG_INFO("Found " + std::to_string(files.size()) + " media files on " + device.name);
    return files;
}

} // namespace MediaVault
