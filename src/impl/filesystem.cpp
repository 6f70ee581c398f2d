#include "filesystem.hpp"

namespace
{
    fs::file_type fileTypeFromMode(mode_t mode)
    {
        if (S_ISREG(mode))
            return fs::file_type::regular;
        if (S_ISDIR(mode))
            return fs::file_type::directory;
        if (S_ISLNK(mode))
            return fs::file_type::symlink;
        if (S_ISBLK(mode))
            return fs::file_type::block;
        if (S_ISCHR(mode))
            return fs::file_type::character;
        if (S_ISFIFO(mode))
            return fs::file_type::fifo;
        if (S_ISSOCK(mode))
            return fs::file_type::socket;
        return fs::file_type::unknown;
    }
}

bool FileSystem::exists(const fs::path &path) const
{
    std::error_code ec;
    return metadata(path, ec).has_value();
}

bool isNotFound(const std::error_code &ec)
{
    return ec == std::errc::no_such_file_or_directory;
}

std::optional<FileMetadata> LocalFileSystem::metadata(const fs::path &path,
                                                      std::error_code &ec) const
{
    // stat() would see the path cut short at the first NUL
    if (path.native().find('\0') != std::string::npos)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
    {
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }
    ec.clear();

    FileMetadata meta;
    meta.type = fileTypeFromMode(st.st_mode);
    meta.size = static_cast<std::uintmax_t>(st.st_size);
    meta.lastModified = st.st_mtime;
    meta.permissions = static_cast<fs::perms>(st.st_mode & 07777);
    return meta;
}

std::error_code LocalFileSystem::readDirectory(const fs::path &dir,
                                               std::vector<std::string> &names) const
{
    if (dir.native().find('\0') != std::string::npos)
    {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        return ec;
    }

    // an error while advancing ends the listing, names read so far are kept
    for (fs::directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
        {
            break;
        }
        names.push_back(it->path().filename().native());
    }
    return {};
}
