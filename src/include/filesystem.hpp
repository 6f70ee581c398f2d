#ifndef CASEPATH_FILESYSTEM_HPP
#define CASEPATH_FILESYSTEM_HPP

#include "common.hpp"

// Result of a metadata query on an existing entry
struct FileMetadata
{
    fs::file_type type = fs::file_type::unknown;
    std::uintmax_t size = 0;   // size in bytes
    time_t lastModified = 0;   // modification time, seconds since epoch
    fs::perms permissions = fs::perms::none;

    [[nodiscard]] bool isDirectory() const { return type == fs::file_type::directory; }
    [[nodiscard]] bool isRegularFile() const { return type == fs::file_type::regular; }
};

// Filesystem operations the resolver and the path cache depend on.
// Errors are reported through std::error_code, implementations never throw
// for filesystem conditions.
class FileSystem
{
public:
    virtual ~FileSystem() = default;

    // query metadata, following symbolic links
    [[nodiscard]] virtual std::optional<FileMetadata> metadata(const fs::path &path,
                                                               std::error_code &ec) const = 0;

    // list the entry names of a directory, "." and ".." excluded, in the
    // order the filesystem returns them
    [[nodiscard]] virtual std::error_code readDirectory(const fs::path &dir,
                                                        std::vector<std::string> &names) const = 0;

    [[nodiscard]] bool exists(const fs::path &path) const;
};

// true for the error a metadata query reports when the entry does not exist
[[nodiscard]] bool isNotFound(const std::error_code &ec);

// FileSystem backed by stat(2) and std::filesystem::directory_iterator
class LocalFileSystem : public FileSystem
{
public:
    [[nodiscard]] std::optional<FileMetadata> metadata(const fs::path &path,
                                                       std::error_code &ec) const override;
    [[nodiscard]] std::error_code readDirectory(const fs::path &dir,
                                                std::vector<std::string> &names) const override;
};

#endif // CASEPATH_FILESYSTEM_HPP
