#include "backend/domain/models/CatalogInfo.h"

// LibraryInfo implementation
QJsonObject LibraryInfo::toJson() const {
    QJsonObject obj;
    obj["library_id"] = libraryId;
    obj["folder_path"] = folderPath;
    obj["name"] = name;
    obj["video_count"] = videoCount;
    obj["indexed_count"] = indexedCount;
    return obj;
}

LibraryInfo LibraryInfo::fromJson(const QJsonObject& json) {
    LibraryInfo lib;
    lib.libraryId = json.value("library_id").toString();
    lib.folderPath = json.value("folder_path").toString();
    lib.name = json.value("name").toString();
    lib.videoCount = json.value("video_count").toInt(0);
    lib.indexedCount = json.value("indexed_count").toInt(0);
    return lib;
}

bool LibraryInfo::operator==(const LibraryInfo& other) const {
    return libraryId == other.libraryId
        && folderPath == other.folderPath
        && name == other.name
        && videoCount == other.videoCount
        && indexedCount == other.indexedCount;
}

// VideoInfo implementation
QJsonObject VideoInfo::toJson() const {
    QJsonObject obj;
    obj["video_id"] = videoId;
    if (!libraryId.isEmpty()) obj["library_id"] = libraryId;
    if (!path.isEmpty()) obj["path"] = path;
    obj["filename"] = filename;
    if (fileSize >= 0) obj["file_size"] = static_cast<double>(fileSize);
    if (createdAtMs > 0) obj["created_at_ms"] = static_cast<double>(createdAtMs);
    if (durationMs > 0) obj["duration_ms"] = static_cast<double>(durationMs);
    obj["status"] = status;
    obj["progress"] = progress;
    if (!thumbnailPath.isEmpty()) obj["thumbnail_path"] = thumbnailPath;
    if (!errorCode.isEmpty()) obj["error_code"] = errorCode;
    if (!errorMessage.isEmpty()) obj["error_message"] = errorMessage;
    return obj;
}

VideoInfo VideoInfo::fromJson(const QJsonObject& json) {
    VideoInfo video;
    video.videoId = json.value("video_id").toString();
    video.libraryId = json.value("library_id").toString();
    video.path = json.value("path").toString();
    video.filename = json.value("filename").toString();
    // file_size is nullable on the engine side
    video.fileSize = json.value("file_size").isDouble() ? static_cast<qint64>(json.value("file_size").toDouble()) : -1;
    video.createdAtMs = static_cast<qint64>(json.value("created_at_ms").toDouble());
    video.durationMs = static_cast<qint64>(json.value("duration_ms").toDouble());
    video.status = json.value("status").toString();
    video.progress = json.value("progress").toDouble(0.0);
    video.thumbnailPath = json.value("thumbnail_path").toString();
    video.errorCode = json.value("error_code").toString();
    video.errorMessage = json.value("error_message").toString();
    return video;
}

bool VideoInfo::operator==(const VideoInfo& other) const {
    return videoId == other.videoId
        && libraryId == other.libraryId
        && path == other.path
        && filename == other.filename
        && fileSize == other.fileSize
        && createdAtMs == other.createdAtMs
        && durationMs == other.durationMs
        && status == other.status
        && progress == other.progress
        && thumbnailPath == other.thumbnailPath
        && errorCode == other.errorCode
        && errorMessage == other.errorMessage;
}

LibraryInfo makeAggregateLibrary(const QList<LibraryInfo>& libraries) {
    LibraryInfo all;
    all.libraryId = ALL_LIBRARIES_ID;
    all.name = QStringLiteral("All Libraries");
    for (const auto& lib : libraries) {
        all.videoCount += lib.videoCount;
        all.indexedCount += lib.indexedCount;
    }
    return all;
}
