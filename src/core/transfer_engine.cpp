#include "core/transfer_engine.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace
{
    // Closes a POSIX descriptor on scope exit
    class FdGuard
    {
    public:
        explicit FdGuard(int fd) : fd_(fd) {}
        ~FdGuard()
        {
            if (fd_ >= 0)
                ::close(fd_);
        }
        FdGuard(const FdGuard &) = delete;
        FdGuard &operator=(const FdGuard &) = delete;

        int get() const { return fd_; }

        // Close explicitly so close() errors can be reported
        int release()
        {
            int rc = ::close(fd_);
            fd_ = -1;
            return rc;
        }

    private:
        int fd_;
    };

    std::string errnoText(int err)
    {
        return std::string(std::strerror(err));
    }

    void removeTemp(const std::string &temp_path)
    {
        std::error_code ec;
        fs::remove(temp_path, ec);
        if (ec)
        {
            Logger::warn("Could not remove temporary file " + temp_path + ": " + ec.message());
        }
    }
}

TransferEngine::TransferEngine(const TransferSettings &settings, const std::string &mount_root, bool verify_mount,
                               ErrorRecovery::Sleeper sleeper)
    : settings_(settings), mount_root_(mount_root), verify_mount_(verify_mount), sleeper_(std::move(sleeper))
{
    if (settings_.chunk_size_bytes == 0)
    {
        settings_.chunk_size_bytes = 1024 * 1024;
    }
}

void TransferEngine::setFaultInjector(FaultInjector injector)
{
    fault_injector_ = std::move(injector);
}

bool TransferEngine::isRetryable(TransferErrorCode code)
{
    return code == TransferErrorCode::IO_ERROR ||
           code == TransferErrorCode::COPY_VERIFICATION_FAILED ||
           code == TransferErrorCode::DESTINATION_UNAVAILABLE;
}

std::string TransferEngine::errorName(TransferErrorCode code)
{
    switch (code)
    {
    case TransferErrorCode::NONE:
        return "None";
    case TransferErrorCode::SOURCE_UNAVAILABLE:
        return "SourceUnavailable";
    case TransferErrorCode::DESTINATION_UNAVAILABLE:
        return "DestinationUnavailable";
    case TransferErrorCode::IO_ERROR:
        return "IoError";
    case TransferErrorCode::COPY_VERIFICATION_FAILED:
        return "CopyVerificationFailed";
    case TransferErrorCode::DESTINATION_CONFLICT:
        return "DestinationConflict";
    default:
        return "Unknown";
    }
}

TransferResult TransferEngine::copy(int64_t entry_id, const std::string &source_path,
                                    const std::string &destination_dir, const std::string &final_filename)
{
    BackoffPolicy policy;
    policy.max_attempts = settings_.max_attempts;
    policy.base_ms = settings_.backoff_base_ms;
    policy.max_ms = settings_.max_backoff_ms;

    TransferResult result = ErrorRecovery::retryWithBackoff(
        [&](int attempt)
        {
            auto r = attemptCopy(attempt, entry_id, source_path, destination_dir, final_filename);
            r.attempts = attempt;
            if (!r.success)
            {
                Logger::warn("Transfer attempt " + std::to_string(attempt) + " for entry " +
                             std::to_string(entry_id) + " failed: " + errorName(r.error) + ": " + r.error_message);
            }
            return r;
        },
        policy, "transfer of " + final_filename,
        [](const TransferResult &r)
        { return !r.success && isRetryable(r.error); },
        sleeper_);

    if (result.success)
    {
        Logger::info("File copied successfully: " + result.destination_path + " (" +
                     FileUtils::formatFileSize(result.bytes_copied) + ", " +
                     std::to_string(result.attempts) + " attempt(s))");
    }
    return result;
}

TransferResult TransferEngine::attemptCopy(int attempt, int64_t entry_id, const std::string &source_path,
                                           const std::string &destination_dir, const std::string &final_filename)
{
    TransferResult result;

    auto source_meta = FileUtils::getFileMetadata(source_path);
    if (!source_meta)
    {
        result.error = TransferErrorCode::SOURCE_UNAVAILABLE;
        result.error_message = "Source file not accessible: " + source_path;
        return result;
    }

    if (verify_mount_ && !mount_root_.empty() && !FileUtils::isMountAccessible(mount_root_))
    {
        result.error = TransferErrorCode::DESTINATION_UNAVAILABLE;
        result.error_message = "Network share not accessible: " + mount_root_;
        return result;
    }

    std::error_code ec;
    fs::create_directories(destination_dir, ec);
    if (ec || !FileUtils::isMountAccessible(destination_dir))
    {
        result.error = TransferErrorCode::DESTINATION_UNAVAILABLE;
        result.error_message = "Destination directory not usable: " + destination_dir +
                               (ec ? ": " + ec.message() : "");
        return result;
    }

    const std::string final_path = (fs::path(destination_dir) / final_filename).string();
    if (fs::exists(final_path, ec))
    {
        result.error = TransferErrorCode::DESTINATION_CONFLICT;
        result.error_message = "Destination file already exists: " + final_path;
        return result;
    }

    const std::string temp_path = (fs::path(destination_dir) / FileUtils::transferTempName(final_filename, entry_id)).string();
    Logger::info("Copying file: " + fs::path(source_path).filename().string() + " (" +
                 FileUtils::formatFileSize(source_meta->file_size) + ") -> " + final_path);

    result = streamToTemp(attempt, source_path, temp_path, source_meta->file_size);
    if (!result.success)
    {
        removeTemp(temp_path);
        return result;
    }

    // Verify size of what landed on disk
    auto temp_meta = FileUtils::getFileMetadata(temp_path);
    if (!temp_meta || temp_meta->file_size != source_meta->file_size)
    {
        result.success = false;
        result.error = TransferErrorCode::COPY_VERIFICATION_FAILED;
        result.error_message = "Size mismatch: source=" + std::to_string(source_meta->file_size) +
                               ", dest=" + (temp_meta ? std::to_string(temp_meta->file_size) : std::string("missing"));
        removeTemp(temp_path);
        return result;
    }

    if (settings_.verify_checksum)
    {
        std::string source_hash = FileUtils::computeFileHash(source_path);
        std::string temp_hash = FileUtils::computeFileHash(temp_path);
        if (source_hash.empty() || source_hash != temp_hash)
        {
            result.success = false;
            result.error = TransferErrorCode::COPY_VERIFICATION_FAILED;
            result.error_message = "Checksum mismatch for " + final_filename;
            removeTemp(temp_path);
            return result;
        }
        Logger::debug("Checksum verified for " + final_filename + ": " + source_hash);
    }

    if (!commitNoReplace(temp_path, final_path, result))
    {
        removeTemp(temp_path);
        return result;
    }

    result.destination_path = final_path;
    return result;
}

TransferResult TransferEngine::streamToTemp(int attempt, const std::string &source_path, const std::string &temp_path,
                                            uint64_t expected_size)
{
    TransferResult result;

    FdGuard in(::open(source_path.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0)
    {
        int err = errno;
        result.error = (err == ENOENT || err == EACCES) ? TransferErrorCode::SOURCE_UNAVAILABLE
                                                        : TransferErrorCode::IO_ERROR;
        result.error_message = "Cannot open source " + source_path + ": " + errnoText(err);
        return result;
    }

    FdGuard out(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (out.get() < 0)
    {
        int err = errno;
        result.error = TransferErrorCode::IO_ERROR;
        result.error_message = "Cannot create temporary file " + temp_path + ": " + errnoText(err);
        return result;
    }

    std::vector<char> buffer(settings_.chunk_size_bytes);
    uint64_t chunk_index = 0;
    while (true)
    {
        ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            int err = errno;
            result.error = TransferErrorCode::IO_ERROR;
            result.error_message = "Read failed on " + source_path + ": " + errnoText(err);
            return result;
        }
        if (n == 0)
            break;

        ssize_t written = 0;
        while (written < n)
        {
            ssize_t w = ::write(out.get(), buffer.data() + written, static_cast<size_t>(n - written));
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                int err = errno;
                result.error = TransferErrorCode::IO_ERROR;
                result.error_message = "Write failed on " + temp_path + ": " + errnoText(err);
                return result;
            }
            written += w;
        }
        result.bytes_copied += static_cast<uint64_t>(n);
        ++chunk_index;

        if (fault_injector_ && fault_injector_(attempt, chunk_index))
        {
            result.error = TransferErrorCode::IO_ERROR;
            result.error_message = "Injected I/O fault after chunk " + std::to_string(chunk_index);
            return result;
        }

        if (chunk_index % 100 == 0)
        {
            double progress = expected_size > 0 ? (100.0 * result.bytes_copied / expected_size) : 100.0;
            Logger::debug("Copy progress: " + std::to_string(static_cast<int>(progress)) + "% (" +
                          FileUtils::formatFileSize(result.bytes_copied) + " / " +
                          FileUtils::formatFileSize(expected_size) + ")");
        }
    }

    if (::fsync(out.get()) != 0)
    {
        int err = errno;
        result.error = TransferErrorCode::IO_ERROR;
        result.error_message = "fsync failed on " + temp_path + ": " + errnoText(err);
        return result;
    }
    if (out.release() != 0)
    {
        int err = errno;
        result.error = TransferErrorCode::IO_ERROR;
        result.error_message = "close failed on " + temp_path + ": " + errnoText(err);
        return result;
    }

    Logger::debug("Stream copy completed: " + FileUtils::formatFileSize(result.bytes_copied));
    result.success = true;
    return result;
}

bool TransferEngine::commitNoReplace(const std::string &temp_path, const std::string &final_path, TransferResult &result)
{
    if (::renameat2(AT_FDCWD, temp_path.c_str(), AT_FDCWD, final_path.c_str(), RENAME_NOREPLACE) == 0)
    {
        return true;
    }

    int err = errno;
    if (err == EEXIST)
    {
        result.success = false;
        result.error = TransferErrorCode::DESTINATION_CONFLICT;
        result.error_message = "Destination file already exists: " + final_path;
        return false;
    }

    if (err != EINVAL && err != ENOSYS)
    {
        result.success = false;
        result.error = TransferErrorCode::IO_ERROR;
        result.error_message = "Rename to " + final_path + " failed: " + errnoText(err);
        return false;
    }

    // Filesystem without RENAME_NOREPLACE (some network shares): check, then rename
    std::error_code ec;
    if (fs::exists(final_path, ec))
    {
        result.success = false;
        result.error = TransferErrorCode::DESTINATION_CONFLICT;
        result.error_message = "Destination file already exists: " + final_path;
        return false;
    }
    fs::rename(temp_path, final_path, ec);
    if (ec)
    {
        result.success = false;
        result.error = TransferErrorCode::IO_ERROR;
        result.error_message = "Rename to " + final_path + " failed: " + ec.message();
        return false;
    }
    return true;
}

bool TransferEngine::deleteSource(const std::string &source_path)
{
    std::error_code ec;
    if (!fs::exists(source_path, ec))
    {
        Logger::warn("Source file not found: " + source_path);
        return false;
    }
    if (!fs::remove(source_path, ec) || ec)
    {
        Logger::error("Error deleting source file " + source_path + ": " + ec.message());
        return false;
    }
    Logger::info("Deleted source file: " + source_path);
    return true;
}
