#ifndef CASEPATH_PATH_CACHE_HPP
#define CASEPATH_PATH_CACHE_HPP

#include "common.hpp"
#include "filesystem.hpp"
#include "logger.hpp"

// Bounded LRU map from a case-folded path to the case-exact path last seen
// on disk. Entries are never invalidated eagerly: get() re-checks the stored
// path and drops the entry when it is gone. Paths that are not valid UTF-8
// are stored under their own bytes, so they only match themselves.
class PathCache
{
public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    struct Stats
    {
        uint64_t hits = 0;          // get() returned a validated entry
        uint64_t misses = 0;        // get() found no entry for the key
        uint64_t invalidations = 0; // get() dropped an entry that no longer exists
        uint64_t evictions = 0;     // entries pushed out by capacity
    };

private:
    // Cache entry structure for storing the case-exact path - O(1) access time
    struct CacheEntry
    {
        fs::path path;                                // case-exact path verified at insertion
        std::list<std::string>::iterator lruIterator; // iterator pointing to key's position in lru list

        CacheEntry(fs::path p, std::list<std::string>::iterator it)
            : path(std::move(p)), lruIterator(it) {}

        // disable copy and assignment operations
        CacheEntry(const CacheEntry &) = delete;
        CacheEntry &operator=(const CacheEntry &) = delete;
    };

    std::unordered_map<std::string, CacheEntry> cache; // main cache storage (folded key -> entry mapping)
    std::list<std::string> lruList;                    // LRU order tracking list (most recent -> least recent)
    mutable std::shared_mutex mutex;                   // mutex for thread-safe operations
    const size_t maxEntries;                           // maximum number of entries
    const FileSystem &fileSystem;                      // used to re-validate entries on lookup

    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> invalidations{0};
    std::atomic<uint64_t> evictions{0};

    // helper function to update LRU order - O(1) operation, caller holds the lock
    void updateLRU(CacheEntry &entry);

public:
    // throws std::invalid_argument when capacity is 0
    PathCache(size_t capacity, const FileSystem &fileSystem);

    // store path under its folded key, replacing any previous entry - O(1) average case
    void insert(const fs::path &path);

    // look up the case-exact path for path and validate it against the
    // filesystem - O(1) average case plus one metadata query
    [[nodiscard]] std::optional<std::pair<fs::path, FileMetadata>> get(const fs::path &path);

    // check if an entry is stored for path, without validation - O(1) average case
    [[nodiscard]] bool exists(const fs::path &path) const;

    // remove the entry stored for path - O(1) average case
    bool remove(const fs::path &path);

    // clear all items from cache
    void clear();

    // get number of items in cache - O(1)
    [[nodiscard]] size_t count() const;

    [[nodiscard]] size_t capacity() const { return maxEntries; }

    [[nodiscard]] Stats stats() const;

    PathCache(const PathCache &) = delete;
    PathCache &operator=(const PathCache &) = delete;
};

#endif // CASEPATH_PATH_CACHE_HPP
