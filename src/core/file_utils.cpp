#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <nlohmann/json.hpp>
#include <Poco/Exception.h>
#include <Poco/Glob.h>
#include <algorithm>
#include <cctype>
#include <dirent.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    return listFilesInternal(dir_path, recursive);
}

SimpleObservable<std::string> FileUtils::listFilesInternal(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            std::error_code ec;
                            if (entry.is_regular_file(ec))
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::error_code ec;
    fs::recursive_directory_iterator it(dir_path, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        Logger::warn("Could not access directory: " + dir_path + ": " + ec.message());
        return;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
        {
            Logger::debug("Skipping unreadable entry under " + dir_path + ": " + ec.message());
            ec.clear();
            continue;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec))
        {
            onNext(it->path().string());
        }
    }
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

bool FileUtils::isMountAccessible(const std::string &path)
{
    if (path.empty() || !isValidDirectory(path))
    {
        return false;
    }
    DIR *dir = opendir(path.c_str());
    if (!dir)
    {
        return false;
    }
    closedir(dir);
    return true;
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 65536;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), bytes_read) != 1)
                return "";
        }
    }
    if (file.bad())
        return "";
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

bool FileMetadata::operator==(const FileMetadata &other) const
{
    return modification_time == other.modification_time &&
           file_size == other.file_size &&
           inode == other.inode &&
           device_id == other.device_id;
}

bool FileMetadata::operator!=(const FileMetadata &other) const
{
    return !(*this == other);
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time = st.st_mtime;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.inode = static_cast<uint64_t>(st.st_ino);
    metadata.device_id = static_cast<uint64_t>(st.st_dev);
    return metadata;
}

std::string FileUtils::metadataToJson(const FileMetadata &metadata)
{
    nlohmann::json meta = {
        {"extension", toLower(fs::path(metadata.file_path).extension().string())},
        {"modified_time", static_cast<int64_t>(metadata.modification_time)}};
    return meta.dump();
}

std::string FileUtils::sanitizeFilename(const std::string &filename)
{
    std::string name = fs::path(filename).filename().string();

    static const std::string invalid_chars = "<>:\"/\\|?*";
    for (char &c : name)
    {
        if (invalid_chars.find(c) != std::string::npos)
        {
            c = '_';
        }
    }

    size_t start = name.find_first_not_of(" .");
    size_t end = name.find_last_not_of(" .");
    if (start == std::string::npos)
    {
        return "sanitized_file";
    }
    return name.substr(start, end - start + 1);
}

bool FileUtils::hasAllowedExtension(const std::string &path, const std::vector<std::string> &extensions)
{
    std::string ext = toLower(fs::path(path).extension().string());
    if (ext.empty())
        return false;
    for (const auto &allowed : extensions)
    {
        if (toLower(allowed) == ext)
            return true;
    }
    return false;
}

bool FileUtils::matchesGlob(const std::string &pattern, const std::string &name)
{
    try
    {
        return Poco::Glob(pattern).match(name);
    }
    catch (const Poco::Exception &e)
    {
        Logger::warn("Invalid glob pattern '" + pattern + "': " + e.displayText());
        return false;
    }
}

std::vector<std::string> FileUtils::listDestinationFiles(const std::string &dir_path)
{
    std::vector<std::string> files;
    if (!isValidDirectory(dir_path))
    {
        return files;
    }

    std::error_code ec;
    for (fs::directory_iterator it(dir_path, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        std::string name = it->path().filename().string();
        if (isTransferTemporary(name))
            continue;
        files.push_back(name);
    }
    if (ec)
    {
        Logger::warn("Error listing destination directory " + dir_path + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string FileUtils::transferTempName(const std::string &final_filename, int64_t entry_id)
{
    return "." + final_filename + "." + std::to_string(entry_id) + ".tmp";
}

bool FileUtils::isTransferTemporary(const std::string &filename)
{
    const std::string suffix = ".tmp";
    return filename.size() > suffix.size() + 1 && filename[0] == '.' &&
           filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string FileUtils::formatFileSize(uint64_t bytes)
{
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4)
    {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return ss.str();
}

std::string FileUtils::toLower(const std::string &value)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return lowered;
}
