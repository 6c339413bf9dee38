#pragma once
#include "errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace sslproxy
{
struct FileDescriptor
{
    int fd;
    FileDescriptor(const char* filename, int flags, mode_t mode) :
        fd(::open(filename, flags, mode))
    {}
    ~FileDescriptor()
    {
        if (fd >= 0)
        {
            ::close(fd);
        }
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    operator int() const
    {
        return fd;
    }
};

inline void makePrivateDirectory(const std::filesystem::path& dir)
{
    if (dir.empty() || std::filesystem::exists(dir))
    {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        throw PersistenceError("Unable to create directory " + dir.string() +
                               ": " + ec.message());
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw PersistenceError("Unable to restrict directory " + dir.string() +
                               ": " + ec.message());
    }
}

// Creates or truncates path with 0600 permissions and writes data.
inline void writeOwnerOnly(const std::filesystem::path& path,
                           std::string_view data)
{
    makePrivateDirectory(path.parent_path());
    FileDescriptor file(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                        0600);
    if (file < 0)
    {
        throw PersistenceError("Unable to create " + path.string() + ": " +
                               std::strerror(errno));
    }
    if (::fchmod(file, 0600) != 0)
    {
        throw PersistenceError("Unable to restrict " + path.string() + ": " +
                               std::strerror(errno));
    }
    while (!data.empty())
    {
        auto written = ::write(file, data.data(), data.size());
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw PersistenceError("Unable to write " + path.string() + ": " +
                                   std::strerror(errno));
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
}

inline std::string readFile(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}
} // namespace sslproxy
