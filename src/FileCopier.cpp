#include "FileCopier.hpp"
#include <filesystem>
#include <algorithm>
#include <vector>
#include <system_error>

#ifdef _WIN32
#include <Windows.h>
#else

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

bool FileCopier::CopyFileRangeSupported = true;

void FileCopier::CheckCopyFileRangeSupport()
{
    int srcFd = open("/dev/null", O_RDONLY);
    int destFd = open("/dev/null", O_WRONLY);
    if (srcFd < 0 || destFd < 0) {
        if (srcFd >= 0) close(srcFd);
        if (destFd >= 0) close(destFd);
        CopyFileRangeSupported = false;
        return;
    }

    ssize_t result = copy_file_range(srcFd, nullptr, destFd, nullptr, 1, 0);
    CopyFileRangeSupported = (result >= 0 || errno != ENOSYS);

    close(srcFd);
    close(destFd);
}

namespace {
    struct CopyFileRangeInit
    {
        CopyFileRangeInit()
        {
            FileCopier::CheckCopyFileRangeSupport();
        }
    };

    static CopyFileRangeInit InitCopyFileRangeSupport;

    // Owns a descriptor for the duration of one copy.
    struct FdGuard
    {
        int Fd = -1;
        explicit FdGuard(int fd) : Fd(fd) {}
        ~FdGuard() { if (Fd >= 0) close(Fd); }
        FdGuard(const FdGuard&) = delete;
        FdGuard& operator=(const FdGuard&) = delete;
    };

    bool CopyByReadWrite(int srcFd, int destFd, off_t offset, std::string& Error)
    {
        if (lseek(srcFd, offset, SEEK_SET) < 0 || lseek(destFd, offset, SEEK_SET) < 0)
        {
            Error = std::string("seek failed: ") + strerror(errno);
            return false;
        }

        std::vector<char> buffer(1024 * 1024);
        while (true)
        {
            ssize_t readBytes = read(srcFd, buffer.data(), buffer.size());
            if (readBytes < 0)
            {
                if (errno == EINTR) continue;
                Error = std::string("read failed: ") + strerror(errno);
                return false;
            }
            if (readBytes == 0) break;

            ssize_t written = 0;
            while (written < readBytes)
            {
                ssize_t w = write(destFd, buffer.data() + written, static_cast<size_t>(readBytes - written));
                if (w < 0)
                {
                    if (errno == EINTR) continue;
                    Error = std::string("write failed: ") + strerror(errno);
                    return false;
                }
                written += w;
            }
        }
        return true;
    }
}
#endif

bool FileCopier::CopyPreservingMetadata(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error)
{
    std::error_code ec;
    if (Destination.has_parent_path())
    {
        std::filesystem::create_directories(Destination.parent_path(), ec);
        if (ec)
        {
            Error = "cannot create directory " + Destination.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

#ifdef _WIN32
    BOOL result = CopyFileExW(Source.wstring().c_str(), Destination.wstring().c_str(), nullptr, nullptr, nullptr, 0);
    if (!result)
    {
        DWORD err = GetLastError();
        Error = "CopyFileExW failed (Error: " + std::to_string(err) + ")";
        RemoveQuietly(Destination);
        return false;
    }
    return true;
#else
    FdGuard src(open(Source.c_str(), O_RDONLY));
    if (src.Fd < 0)
    {
        Error = "cannot open source: " + std::string(strerror(errno));
        return false;
    }

    struct stat statBuf;
    if (fstat(src.Fd, &statBuf) != 0)
    {
        Error = "cannot stat source: " + std::string(strerror(errno));
        return false;
    }

    bool ok = true;
    {
        FdGuard dest(open(Destination.c_str(), O_WRONLY | O_CREAT | O_TRUNC, statBuf.st_mode & 07777));
        if (dest.Fd < 0)
        {
            Error = "cannot open destination: " + std::string(strerror(errno));
            return false;
        }

        off_t copiedTotal = 0;
        bool useFallback = !CopyFileRangeSupported;
        while (!useFallback && copiedTotal < statBuf.st_size)
        {
            ssize_t copied = copy_file_range(src.Fd, nullptr, dest.Fd, nullptr, static_cast<size_t>(statBuf.st_size - copiedTotal), 0);
            if (copied < 0)
            {
                if (errno == EINTR) continue;
                if (errno == ENOSYS || errno == EXDEV || errno == EINVAL || errno == EOPNOTSUPP)
                {
                    useFallback = true;
                    break;
                }
                Error = std::string("copy_file_range failed: ") + strerror(errno);
                ok = false;
                break;
            }
            if (copied == 0) break;
            copiedTotal += copied;
        }

        if (ok && useFallback)
        {
            ok = CopyByReadWrite(src.Fd, dest.Fd, copiedTotal, Error);
        }

        if (ok)
        {
            // Permissions and timestamps: ownership is best effort and not required.
            if (fchmod(dest.Fd, statBuf.st_mode & 07777) != 0)
            {
                Error = std::string("fchmod failed: ") + strerror(errno);
                ok = false;
            }
        }
        if (ok)
        {
            struct timespec times[2] = { statBuf.st_atim, statBuf.st_mtim };
            if (futimens(dest.Fd, times) != 0)
            {
                Error = std::string("futimens failed: ") + strerror(errno);
                ok = false;
            }
        }
    }

    if (!ok)
    {
        RemoveQuietly(Destination);
    }
    return ok;
#endif
}

bool FileCopier::Move(const std::filesystem::path& Source, const std::filesystem::path& Destination, std::string& Error)
{
    std::error_code ec;
    if (Destination.has_parent_path())
    {
        std::filesystem::create_directories(Destination.parent_path(), ec);
        if (ec)
        {
            Error = "cannot create directory " + Destination.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::filesystem::rename(Source, Destination, ec);
    if (!ec)
    {
        return true;
    }
    if (ec != std::errc::cross_device_link)
    {
        Error = "rename failed: " + ec.message();
        return false;
    }

    if (!CopyPreservingMetadata(Source, Destination, Error))
    {
        return false;
    }
    std::filesystem::remove(Source, ec);
    if (ec)
    {
        Error = "copied but could not remove source: " + ec.message();
        return false;
    }
    return true;
}

bool FileCopier::RemoveQuietly(const std::filesystem::path& Path)
{
    std::error_code ec;
    return std::filesystem::remove(Path, ec) && !ec;
}

size_t FileCopier::RemoveEmptyDirectories(const std::filesystem::path& Root, Logger& Log)
{
    std::error_code ec;
    std::vector<std::filesystem::path> Directories;
    std::filesystem::recursive_directory_iterator It(Root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        Log.Warn("Empty folder cleanup skipped for " + Root.string() + ": " + ec.message());
        return 0;
    }
    for (; It != std::filesystem::recursive_directory_iterator(); It.increment(ec))
    {
        if (It->is_directory(ec) && !It->is_symlink(ec))
        {
            Directories.push_back(It->path());
        }
    }

    // Deeper paths first so parents emptied by the removal of their children go too.
    std::sort(Directories.begin(), Directories.end(), [](const std::filesystem::path& A, const std::filesystem::path& B) {
        return std::distance(A.begin(), A.end()) > std::distance(B.begin(), B.end());
    });

    size_t Removed = 0;
    for (const auto& Dir : Directories)
    {
        if (std::filesystem::is_empty(Dir, ec) && !ec)
        {
            if (std::filesystem::remove(Dir, ec))
            {
                Log.Info("[Cleanup] Removed empty folder: " + Dir.string());
                ++Removed;
            }
            else if (ec)
            {
                Log.Warn("[Cleanup] Failed to remove folder: " + Dir.string() + " - " + ec.message());
            }
        }
        ec.clear();
    }
    return Removed;
}
