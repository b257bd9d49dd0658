#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <optional>
#include <ctime>
#include <cstdint>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Stat snapshot used for stability sampling and change polling
 *
 * Equality covers inode and device, so a file replaced by a rename counts as
 * changed even when its size and modification time match.
 */
struct FileMetadata
{
    std::string file_path;
    std::time_t modification_time = 0;
    uint64_t file_size = 0;
    uint64_t inode = 0;
    uint64_t device_id = 0;

    bool operator==(const FileMetadata &other) const;
    bool operator!=(const FileMetadata &other) const;
};

/**
 * @brief Filesystem helpers shared by the watcher, the resolver and the transfer engine
 */
class FileUtils
{
public:
    /**
     * @brief Stat a regular file without reading its content
     * @param file_path Path to the file
     * @return FileMetadata if the path is an accessible regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief JSON text stored with a pending entry: extension and modification time
     */
    static std::string metadataToJson(const FileMetadata &metadata);

    /**
     * Lists all regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Scans a directory recursively and calls the provided function for each file
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    static bool isValidDirectory(const std::string &path);

    /**
     * @brief A mount point is usable when it exists, is a directory and can be listed
     */
    static bool isMountAccessible(const std::string &path);

    /**
     * Computes SHA256 hash of a file
     * @return Lowercase hex digest, empty on read failure
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief Keep only the basename and replace characters that are invalid on common filesystems
     */
    static std::string sanitizeFilename(const std::string &filename);

    // Case-insensitive match against an allow-list such as {".mkv", ".mp4"}
    static bool hasAllowedExtension(const std::string &path, const std::vector<std::string> &extensions);

    // Shell-style glob ('*', '?', '[...]'); a malformed pattern matches nothing
    static bool matchesGlob(const std::string &pattern, const std::string &name);

    /**
     * @brief Basenames of the regular files in a destination directory
     *
     * In-flight transfer temporaries are skipped. A missing directory yields an empty list.
     */
    static std::vector<std::string> listDestinationFiles(const std::string &dir_path);

    /**
     * @brief Name of the temporary file a transfer writes before its atomic commit
     */
    static std::string transferTempName(const std::string &final_filename, int64_t entry_id);
    static bool isTransferTemporary(const std::string &filename);

    static std::string formatFileSize(uint64_t bytes);
    static std::string toLower(const std::string &value);

private:
    static SimpleObservable<std::string> listFilesInternal(const std::string &dir_path, bool recursive);
};
