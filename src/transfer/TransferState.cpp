/**
 * Build Fetch - Transfer State Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "TransferState.hpp"
#include "core/AcquisitionError.hpp"

#include <QDateTime>
#include <QFile>
#include <QSaveFile>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace buildfetch {

namespace {
    constexpr const char* PARTIAL_SUFFIX = ".part";
    constexpr const char* SIDECAR_SUFFIX = ".transfer.json";
    constexpr const char* LOCK_SUFFIX = ".lock";

std::filesystem::path withSuffix(const std::filesystem::path& path, const char* suffix) {
    std::filesystem::path result = path;
    result += suffix;
    return result;
}

} // anonymous namespace

const char* transferStatusLabel(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:    return "pending";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Paused:     return "paused";
        case TransferStatus::Completed:  return "completed";
        case TransferStatus::Failed:     return "failed";
    }
    return "pending";
}

std::optional<TransferStatus> parseTransferStatus(const std::string& label) {
    if (label == "pending") return TransferStatus::Pending;
    if (label == "in_progress") return TransferStatus::InProgress;
    if (label == "paused") return TransferStatus::Paused;
    if (label == "completed") return TransferStatus::Completed;
    if (label == "failed") return TransferStatus::Failed;
    return std::nullopt;
}

TransferState TransferState::fromJson(const std::string& json) {
    auto j = nlohmann::json::parse(json);

    TransferState state;
    state.sourceUrl = j.value("sourceUrl", "");
    state.localPath = j.value("localPath", "");
    if (j.contains("totalBytes") && !j["totalBytes"].is_null()) {
        state.totalBytes = j["totalBytes"].get<int64_t>();
    }
    state.bytesTransferred = j.value("bytesTransferred", int64_t(0));
    state.etag = j.value("etag", "");
    state.lastModified = j.value("lastModified", "");
    state.updatedAt = j.value("updatedAt", int64_t(0));

    auto status = parseTransferStatus(j.value("status", "pending"));
    if (!status) {
        throw std::invalid_argument("Unknown transfer status: " + j.value("status", ""));
    }
    state.status = *status;

    if (state.bytesTransferred < 0 ||
        (state.totalBytes && state.bytesTransferred > *state.totalBytes)) {
        throw std::invalid_argument("Inconsistent byte counts");
    }

    return state;
}

std::string TransferState::toJson() const {
    nlohmann::json j;
    j["sourceUrl"] = sourceUrl;
    j["localPath"] = localPath;
    if (totalBytes) {
        j["totalBytes"] = *totalBytes;
    } else {
        j["totalBytes"] = nullptr;
    }
    j["bytesTransferred"] = bytesTransferred;
    j["etag"] = etag;
    j["lastModified"] = lastModified;
    j["status"] = transferStatusLabel(status);
    j["updatedAt"] = updatedAt;
    return j.dump(2);
}

std::filesystem::path TransferFiles::partialPath(const std::filesystem::path& localPath) {
    return withSuffix(localPath, PARTIAL_SUFFIX);
}

std::filesystem::path TransferFiles::sidecarPath(const std::filesystem::path& localPath) {
    return withSuffix(localPath, SIDECAR_SUFFIX);
}

std::filesystem::path TransferFiles::lockPath(const std::filesystem::path& localPath) {
    return withSuffix(localPath, LOCK_SUFFIX);
}

std::optional<TransferState> TransferFiles::load(const std::filesystem::path& localPath) {
    QFile file(QString::fromStdString(sidecarPath(localPath).string()));
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        spdlog::warn("Cannot read transfer state {}: {}",
                     sidecarPath(localPath).string(), file.errorString().toStdString());
        return std::nullopt;
    }

    try {
        return TransferState::fromJson(file.readAll().toStdString());
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring corrupt transfer state {}: {}",
                     sidecarPath(localPath).string(), e.what());
        return std::nullopt;
    }
}

void TransferFiles::save(TransferState& state) {
    state.updatedAt = QDateTime::currentMSecsSinceEpoch();

    const std::filesystem::path path = sidecarPath(state.localPath);
    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        StorageError error("Cannot write transfer state: " + file.errorString().toStdString());
        error.withLocalPath(state.localPath);
        throw error;
    }

    QByteArray data = QByteArray::fromStdString(state.toJson());
    if (file.write(data) != data.size() || !file.commit()) {
        StorageError error("Cannot commit transfer state: " + file.errorString().toStdString());
        error.withLocalPath(state.localPath);
        throw error;
    }
}

void TransferFiles::discard(const std::filesystem::path& localPath) {
    std::error_code ec;
    std::filesystem::remove(partialPath(localPath), ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", partialPath(localPath).string(), ec.message());
    }
    std::filesystem::remove(sidecarPath(localPath), ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", sidecarPath(localPath).string(), ec.message());
    }
}

} // namespace buildfetch
