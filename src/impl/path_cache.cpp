#include "path_cache.hpp"
#include "case_fold.hpp"

PathCache::PathCache(size_t capacity, const FileSystem &fileSystem)
    : maxEntries(capacity), fileSystem(fileSystem)
{
    if (capacity == 0)
    {
        throw std::invalid_argument("Path cache capacity must be greater than zero");
    }
    cache.reserve(capacity);
}

void PathCache::updateLRU(CacheEntry &entry)
{
    // splice keeps the key node alive, so the iterator stays valid
    lruList.splice(lruList.begin(), lruList, entry.lruIterator);
}

void PathCache::insert(const fs::path &path)
{
    std::string key = CaseFold::foldPath(path);

    std::unique_lock<std::shared_mutex> lock(mutex);

    // replace existing entry in place and mark it most recently used
    auto it = cache.find(key);
    if (it != cache.end())
    {
        it->second.path = path;
        updateLRU(it->second);
        return;
    }

    // ensure space available
    while (!lruList.empty() && cache.size() >= maxEntries)
    {
        cache.erase(lruList.back());
        lruList.pop_back();
        evictions.fetch_add(1, std::memory_order_relaxed);
    }

    // add to lru first, then to the map
    lruList.push_front(key);
    try
    {
        cache.emplace(std::piecewise_construct,
                      std::forward_as_tuple(std::move(key)),
                      std::forward_as_tuple(path, lruList.begin()));
    }
    catch (const std::bad_alloc &)
    {
        // rollback on failure
        lruList.pop_front();
        throw;
    }
}

std::optional<std::pair<fs::path, FileMetadata>> PathCache::get(const fs::path &path)
{
    const std::string key = CaseFold::foldPath(path);

    fs::path exact;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto it = cache.find(key);
        if (it == cache.end())
        {
            misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        exact = it->second.path;
        updateLRU(it->second);
    }

    // validate outside the lock, stat may block on slow storage
    std::error_code ec;
    auto meta = fileSystem.metadata(exact, ec);
    if (!meta)
    {
        {
            std::unique_lock<std::shared_mutex> lock(mutex);
            auto it = cache.find(key);
            // leave the entry alone if another thread replaced it meanwhile
            if (it != cache.end() && it->second.path == exact)
            {
                lruList.erase(it->second.lruIterator);
                cache.erase(it);
            }
        }
        invalidations.fetch_add(1, std::memory_order_relaxed);
        if (Logger::getInstance()->enabled(Logger::LogLevel::DEBUG))
        {
            Logger::getInstance()->debug("Dropped stale cache entry: " + exact.native() +
                                         " (" + ec.message() + ")");
        }
        return std::nullopt;
    }

    hits.fetch_add(1, std::memory_order_relaxed);
    return std::make_pair(std::move(exact), *meta);
}

bool PathCache::exists(const fs::path &path) const
{
    const std::string key = CaseFold::foldPath(path);
    std::shared_lock<std::shared_mutex> lock(mutex);
    return cache.find(key) != cache.end();
}

bool PathCache::remove(const fs::path &path)
{
    const std::string key = CaseFold::foldPath(path);
    std::unique_lock<std::shared_mutex> lock(mutex);
    auto it = cache.find(key);
    if (it != cache.end())
    {
        lruList.erase(it->second.lruIterator);
        cache.erase(it);
        return true;
    }
    return false;
}

void PathCache::clear()
{
    std::unique_lock<std::shared_mutex> lock(mutex);
    cache.clear();
    lruList.clear();
}

size_t PathCache::count() const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return cache.size();
}

PathCache::Stats PathCache::stats() const
{
    Stats s;
    s.hits = hits.load(std::memory_order_relaxed);
    s.misses = misses.load(std::memory_order_relaxed);
    s.invalidations = invalidations.load(std::memory_order_relaxed);
    s.evictions = evictions.load(std::memory_order_relaxed);
    return s;
}
