#include "resolver.hpp"
#include "case_fold.hpp"

Resolver::Resolver(PathCache &cache, const FileSystem &fileSystem)
    : cache(cache), fileSystem(fileSystem)
{
}

std::string_view Resolver::stripLeadingRoots(std::string_view rawPath)
{
    const size_t start = rawPath.find_first_not_of('/');
    return start == std::string_view::npos ? std::string_view{} : rawPath.substr(start);
}

std::vector<std::string> Resolver::splitSegments(std::string_view relative)
{
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= relative.size())
    {
        size_t next = relative.find('/', pos);
        if (next == std::string_view::npos)
        {
            next = relative.size();
        }
        const std::string_view segment = relative.substr(pos, next - pos);
        if (!segment.empty() && segment != ".")
        {
            segments.emplace_back(segment);
        }
        pos = next + 1;
    }
    return segments;
}

fs::path Resolver::resolve(const fs::path &base, std::string_view rawPath,
                           bool caseInsensitive) const
{
    const std::string_view relative = stripLeadingRoots(rawPath);

    // plain concatenation, no filesystem access
    if (!caseInsensitive)
    {
        return relative.empty() ? base : base / fs::path(std::string(relative));
    }

    const std::vector<std::string> segments = splitSegments(relative);
    fs::path candidate = base;
    for (const auto &segment : segments)
    {
        candidate /= segment;
    }

    // case folding needs a rooted path that is valid text
    if (!candidate.is_absolute() || !CaseFold::isValidUtf8(candidate.native()))
    {
        return candidate;
    }

    // a filesystem root has no parent to search in
    if (!candidate.has_relative_path())
    {
        return candidate;
    }

    if (auto cached = cache.get(candidate))
    {
        return std::move(cached->first);
    }

    std::error_code ec;
    if (fileSystem.metadata(candidate, ec))
    {
        return candidate;
    }

    if (segments.empty())
    {
        return candidate;
    }

    // With a known parent directory only the last segment needs a scan.
    // A single segment lives directly in base, which the caller vouches for.
    fs::path parent = candidate.parent_path();
    bool parentExists = true;
    if (segments.size() > 1)
    {
        if (auto cached = cache.get(parent))
        {
            parent = std::move(cached->first);
        }
        else
        {
            parentExists = fileSystem.exists(parent);
            if (parentExists)
            {
                cache.insert(parent);
            }
        }
    }

    if (parentExists)
    {
        LookupResult result = lookup(parent, segments.back(), true);
        if (!result.terminal)
        {
            cache.insert(result.path);
        }
        return std::move(result.path);
    }

    // walk down from base one segment at a time
    fs::path current = base;
    bool terminal = false;
    const size_t lastSegment = segments.size() - 1;
    for (size_t idx = 0; idx < segments.size(); ++idx)
    {
        if (terminal)
        {
            current /= segments[idx];
            continue;
        }

        if (idx == lastSegment)
        {
            // remember the directory holding the final entry for siblings
            cache.insert(current);
        }

        LookupResult result = lookup(current, segments[idx], false);
        current = std::move(result.path);
        terminal = result.terminal;
    }

    if (!terminal)
    {
        cache.insert(current);
    }
    return current;
}

Resolver::LookupResult Resolver::lookup(const fs::path &dir, const std::string &segment,
                                        bool skipInitialCheck) const
{
    fs::path candidate = dir / segment;

    if (!skipInitialCheck)
    {
        std::error_code ec;
        if (fileSystem.metadata(candidate, ec))
        {
            return {std::move(candidate), false};
        }
        if (!isNotFound(ec))
        {
            if (Logger::getInstance()->enabled(Logger::LogLevel::DEBUG))
            {
                Logger::getInstance()->debug("Case folding stopped at " + candidate.native() +
                                             ": " + ec.message());
            }
            return {std::move(candidate), true};
        }
    }

    const auto wanted = CaseFold::toLower(segment);
    if (!wanted)
    {
        return {std::move(candidate), true};
    }

    std::vector<std::string> names;
    if (std::error_code ec = fileSystem.readDirectory(dir, names))
    {
        if (Logger::getInstance()->enabled(Logger::LogLevel::DEBUG))
        {
            Logger::getInstance()->debug("Cannot list directory " + dir.native() + ": " +
                                         ec.message());
        }
        return {std::move(candidate), true};
    }

    for (const auto &name : names)
    {
        // names that are not valid UTF-8 never match
        const auto folded = CaseFold::toLower(name);
        if (folded && *folded == *wanted)
        {
            return {dir / name, false};
        }
    }
    return {std::move(candidate), true};
}
