#ifndef CASEPATH_RESOLVER_HPP
#define CASEPATH_RESOLVER_HPP

#include "common.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "path_cache.hpp"

// Resolves client supplied paths, in whatever case the client sent them,
// to the case-exact path of an existing entry under a base directory.
//
// resolve() never fails: when no match exists the returned path is the
// plain concatenation of base and the request, with every segment that
// could be matched replaced by its on-disk spelling. Verified paths are
// remembered in the shared PathCache so that later requests under the same
// directory skip the walk from the base.
//
// Thread-safe; calls block on filesystem I/O.
class Resolver
{
public:
    // outcome of resolving one segment inside a directory
    struct LookupResult
    {
        fs::path path;  // dir/segment, case-exact when matched
        bool terminal;  // stop case folding for the rest of the path
    };

    Resolver(PathCache &cache, const FileSystem &fileSystem);

    [[nodiscard]] fs::path resolve(const fs::path &base, std::string_view rawPath,
                                   bool caseInsensitive) const;

    // Resolve a single segment inside dir. Unless skipInitialCheck is set
    // the segment is first tried verbatim. Otherwise, or when it does not
    // exist, dir is scanned for an entry whose lowercase name matches.
    // Entries that differ only by case are ambiguous: the first one the
    // directory listing returns wins.
    [[nodiscard]] LookupResult lookup(const fs::path &dir, const std::string &segment,
                                      bool skipInitialCheck) const;

    // drop every leading '/'
    [[nodiscard]] static std::string_view stripLeadingRoots(std::string_view rawPath);

    // split a relative path on '/', skipping empty and "." segments
    [[nodiscard]] static std::vector<std::string> splitSegments(std::string_view relative);

    [[nodiscard]] PathCache &pathCache() const { return cache; }
    [[nodiscard]] const FileSystem &filesystem() const { return fileSystem; }

private:
    PathCache &cache;
    const FileSystem &fileSystem;
};

#endif // CASEPATH_RESOLVER_HPP
