#include "io/FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace PB::IO {

namespace {

void closeDescriptor(int fd) {
#ifdef _WIN32
    _close(fd);
#else
    ::close(fd);
#endif
}

} // namespace

auto fsyncFileDescriptor(int fd) -> Expected<void> {
#ifdef _WIN32
    if (_commit(fd) != 0) {
        return std::unexpected(Error{Error::Code::UnknownError, "_commit failed"});
    }
#else
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::UnknownError, "fsync failed"});
    }
#endif
    return {};
}

auto writeTextFileAtomic(std::filesystem::path const& path,
                         std::string const& text,
                         bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::UnknownError, "Failed to create directories"});
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

#ifdef _WIN32
    int fd = _open(tmpPath.string().c_str(), _O_CREAT | _O_TRUNC | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
#else
    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
#endif
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::NoSuchPath, "Failed to open temp file " + tmpPath.string()});
    }

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto const* ptr       = text.data() + totalWritten;
        auto const  remaining = text.size() - totalWritten;
#ifdef _WIN32
        auto written = _write(fd, ptr, static_cast<unsigned int>(remaining));
#else
        auto written = ::write(fd, ptr, remaining);
#endif
        if (written <= 0) {
            closeDescriptor(fd);
            return std::unexpected(Error{Error::Code::UnknownError, "Failed to write temp file"});
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            closeDescriptor(fd);
            return sync;
        }
    }

#ifdef _WIN32
    auto const closed = _close(fd);
#else
    auto const closed = ::close(fd);
#endif
    if (closed != 0) {
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to close temp file"});
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to rename temp file"});
    }
    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NoSuchPath, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to read file"});
    }
    return oss.str();
}

} // namespace PB::IO
