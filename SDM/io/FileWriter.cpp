#include "FileWriter.h"

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#endif

FileWriter::FileWriter(const std::string& path)
    : filePath(path) {
}

FileWriter::~FileWriter() {
    close();
}

bool FileWriter::open(std::int64_t fileSize) {
    if (fileHandle >= 0)
        return true;

#ifdef _WIN32
    int flags = _O_BINARY | _O_RDWR | _O_CREAT | _O_TRUNC;
    int mode = _S_IREAD | _S_IWRITE;
    fileHandle = _open(filePath.c_str(), flags, mode);
#else
    int flags = O_RDWR | O_CREAT | O_TRUNC;
    int mode = 0644;
    fileHandle = ::open(filePath.c_str(), flags, mode);
#endif

    if (fileHandle < 0)
        return false;

    // Pre-allocate file size
    if (fileSize > 0) {
#ifdef _WIN32
        const bool sized = _chsize_s(fileHandle, fileSize) == 0;
#else
        const bool sized = ::ftruncate(fileHandle, static_cast<off_t>(fileSize)) == 0;
#endif
        if (!sized) {
            close();
            return false;
        }
    }

    return true;
}

bool FileWriter::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

#ifdef _WIN32
    std::lock_guard<std::mutex> lock(writeMutex);

    if (_lseeki64(fileHandle, static_cast<__int64>(offset), SEEK_SET) < 0)
        return false;
    return _write(fileHandle, data, static_cast<unsigned int>(size)) == static_cast<int>(size);
#else
    // pwrite leaves the shared file position alone, no lock needed
    while (size > 0) {
        ssize_t n = ::pwrite(fileHandle, data, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        data += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return true;
#endif
}

bool FileWriter::flush() {
    if (fileHandle < 0)
        return false;
#ifdef _WIN32
    return _commit(fileHandle) == 0;
#else
    return fsync(fileHandle) == 0;
#endif
}

void FileWriter::close() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _close(fileHandle);
#else
        ::close(fileHandle);
#endif
        fileHandle = -1;
    }
}
