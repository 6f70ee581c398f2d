#include <gtest/gtest.h>

#include "resolver.hpp"
#include "test_util.h"

class T_Resolver : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tmp.touch("Docs/Report.TXT", "report");
        tmp.touch("Docs/Notes.md");
        tmp.touch("Docs/Sub/Deep.txt");
        tmp.touch("Docs/Sub/Other.txt");
        tmp.touch("ReadMe.md");
        tmp.touch("exact.txt");
        base = tmp.path();
        files.reset();
    }

    TempDir tmp;
    fs::path base;
    CountingFileSystem files;
    PathCache cache{PathCache::DEFAULT_CAPACITY, files};
    Resolver resolver{cache, files};
};

TEST_F(T_Resolver, StripLeadingRoots)
{
    EXPECT_EQ("a/b", Resolver::stripLeadingRoots("/a/b"));
    EXPECT_EQ("a/b", Resolver::stripLeadingRoots("///a/b"));
    EXPECT_EQ("a/b/", Resolver::stripLeadingRoots("a/b/"));
    EXPECT_EQ("", Resolver::stripLeadingRoots("//"));
    EXPECT_EQ("", Resolver::stripLeadingRoots(""));
}

TEST_F(T_Resolver, SplitSegments)
{
    const std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(expected, Resolver::splitSegments("a/b/c"));
    EXPECT_EQ(expected, Resolver::splitSegments("a//b/./c/"));
    EXPECT_TRUE(Resolver::splitSegments("").empty());
    EXPECT_TRUE(Resolver::splitSegments("./").empty());
    EXPECT_EQ(std::vector<std::string>({"..", "x"}), Resolver::splitSegments("../x"));
}

TEST_F(T_Resolver, PassThroughWhenDisabled)
{
    EXPECT_EQ(base / "Some/Where", resolver.resolve(base, "/Some/Where", false));
    EXPECT_EQ(base / "docs/report.txt", resolver.resolve(base, "docs/report.txt", false));
    EXPECT_EQ(base / "a//b/", resolver.resolve(base, "//a//b/", false));
    EXPECT_EQ(base, resolver.resolve(base, "", false));

    EXPECT_EQ(0u, files.metadataCalls.load());
    EXPECT_EQ(0u, files.readDirectoryCalls.load());
    EXPECT_EQ(0u, cache.count());
}

TEST_F(T_Resolver, ExactMatchPreserved)
{
    EXPECT_EQ(base / "Docs" / "Report.TXT", resolver.resolve(base, "Docs/Report.TXT", true));
    EXPECT_EQ(base / "Docs" / "Report.TXT", resolver.resolve(base, "Docs/Report.TXT", false));
    EXPECT_EQ(0u, files.readDirectoryCalls.load());
}

TEST_F(T_Resolver, CaseRecovery)
{
    EXPECT_EQ(base / "Docs" / "Report.TXT", resolver.resolve(base, "docs/report.txt", true));
    EXPECT_EQ(base / "Docs" / "Sub" / "Deep.txt", resolver.resolve(base, "DOCS/sub/DEEP.TXT", true));
    EXPECT_EQ(base / "ReadMe.md", resolver.resolve(base, "README.MD", true));
}

TEST_F(T_Resolver, RootStripping)
{
    const fs::path expected = base / "Docs" / "Report.TXT";
    EXPECT_EQ(expected, resolver.resolve(base, "/docs/report.txt", true));
    EXPECT_EQ(expected, resolver.resolve(base, "//docs/report.txt", true));
    EXPECT_EQ(expected, resolver.resolve(base, "docs/report.txt", true));
}

TEST_F(T_Resolver, Idempotent)
{
    const fs::path first = resolver.resolve(base, "docs/sub/deep.txt", true);
    const fs::path second = resolver.resolve(base, "docs/sub/deep.txt", true);
    EXPECT_EQ(first, second);

    const fs::path missingFirst = resolver.resolve(base, "docs/nope/x", true);
    const fs::path missingSecond = resolver.resolve(base, "docs/nope/x", true);
    EXPECT_EQ(missingFirst, missingSecond);
}

TEST_F(T_Resolver, SecondLookupIsServedFromCache)
{
    ASSERT_EQ(base / "Docs" / "Report.TXT", resolver.resolve(base, "docs/report.txt", true));
    files.reset();

    EXPECT_EQ(base / "Docs" / "Report.TXT", resolver.resolve(base, "DOCS/REPORT.TXT", true));
    EXPECT_EQ(0u, files.readDirectoryCalls.load());
    // only the re-validation of the cached entry
    EXPECT_EQ(1u, files.metadataCalls.load());
}

TEST_F(T_Resolver, SiblingUsesParentPrefix)
{
    // the first walk scans base, Docs and Sub
    ASSERT_EQ(base / "Docs" / "Sub" / "Deep.txt", resolver.resolve(base, "docs/sub/deep.txt", true));
    EXPECT_EQ(3u, files.readDirectoryCalls.load());
    EXPECT_TRUE(cache.exists(base / "Docs" / "Sub"));

    // a sibling only needs its own directory scanned
    files.reset();
    EXPECT_EQ(base / "Docs" / "Sub" / "Other.txt", resolver.resolve(base, "DOCS/SUB/other.TXT", true));
    EXPECT_EQ(1u, files.readDirectoryCalls.load());
}

TEST_F(T_Resolver, SingleSegmentScansBaseOnce)
{
    EXPECT_EQ(base / "ReadMe.md", resolver.resolve(base, "readme.MD", true));
    EXPECT_EQ(1u, files.readDirectoryCalls.load());
    EXPECT_TRUE(cache.exists(base / "ReadMe.md"));
}

TEST_F(T_Resolver, UnresolvablePath)
{
    EXPECT_EQ(base / "nothing" / "here.txt", resolver.resolve(base, "nothing/here.txt", true));
    EXPECT_EQ(base / "nothing" / "here.txt", resolver.resolve(base, "/nothing//here.txt", true));
    EXPECT_EQ(0u, cache.count());
}

TEST_F(T_Resolver, PartiallyResolvedPath)
{
    // the directory is matched, the missing file keeps the requested spelling
    EXPECT_EQ(base / "Docs" / "Missing.TXT", resolver.resolve(base, "docs/Missing.TXT", true));
    EXPECT_FALSE(cache.exists(base / "Docs" / "Missing.TXT"));
    EXPECT_TRUE(cache.exists(base / "Docs"));
}

TEST_F(T_Resolver, FileUsedAsDirectoryIsTerminal)
{
    // stat below a regular file fails with ENOTDIR, the rest stays verbatim
    const fs::path underFile = resolver.resolve(base, "exact.txt/Foo", true);
    EXPECT_EQ(base / "exact.txt" / "Foo", underFile);
    EXPECT_FALSE(cache.exists(underFile));
    EXPECT_FALSE(files.exists(underFile));

    cache.clear();
    const fs::path folded = resolver.resolve(base, "EXACT.TXT/foo/bar", true);
    EXPECT_EQ(base / "exact.txt" / "foo" / "bar", folded);
    EXPECT_FALSE(cache.exists(folded));
    EXPECT_FALSE(cache.exists(base / "exact.txt" / "foo"));
    EXPECT_EQ(0u, cache.count());
}

TEST_F(T_Resolver, EmbeddedNulIsNeverFound)
{
    const std::string request("docs/Report.TXT\0.jpg", 20);
    const fs::path resolved = resolver.resolve(base, request, true);
    EXPECT_EQ(base / "Docs" / std::string("Report.TXT\0.jpg", 15), resolved);
    EXPECT_FALSE(files.exists(resolved));
    EXPECT_FALSE(cache.exists(resolved));
    EXPECT_FALSE(cache.get(resolved).has_value());

    // the exact spelling is not found either, and nothing but its directory is cached
    cache.clear();
    const fs::path exact = base / std::string("Docs/Report.TXT\0.jpg", 20);
    EXPECT_EQ(exact, resolver.resolve(base, exact.native().substr(base.native().size()), true));
    EXPECT_FALSE(cache.exists(exact));
    EXPECT_LE(cache.count(), 1u);
}

TEST_F(T_Resolver, EmbeddedNulIsInvalidArgument)
{
    LocalFileSystem local;
    std::error_code ec;
    EXPECT_FALSE(local.metadata(base / std::string("exact.txt\0x", 11), ec).has_value());
    EXPECT_EQ(std::errc::invalid_argument, ec);
    EXPECT_FALSE(isNotFound(ec));

    std::vector<std::string> names;
    EXPECT_EQ(std::errc::invalid_argument,
              local.readDirectory(base / std::string("Docs\0", 5), names));
    EXPECT_TRUE(names.empty());
}

TEST_F(T_Resolver, TerminalPropagation)
{
    tmp.touch("Locked/Inner/File.txt");
    DeniedSubtreeFileSystem denied(base / "Locked");
    PathCache deniedCache(PathCache::DEFAULT_CAPACITY, denied);
    Resolver deniedResolver(deniedCache, denied);

    EXPECT_EQ(base / "Locked" / "inner" / "FILE.txt",
              deniedResolver.resolve(base, "Locked/inner/FILE.txt", true));
    EXPECT_EQ(base / "Locked" / "inner" / "deeper" / "FILE.txt",
              deniedResolver.resolve(base, "locked/inner/deeper/FILE.txt", true));
    EXPECT_EQ(0u, deniedCache.count());
}

TEST_F(T_Resolver, UnreadableDirectoryStopsFolding)
{
    tmp.touch("Locked/File.txt");
    DeniedSubtreeFileSystem denied(base / "Locked");
    PathCache deniedCache(PathCache::DEFAULT_CAPACITY, denied);
    Resolver deniedResolver(deniedCache, denied);

    // the listing of Locked itself fails
    auto result = deniedResolver.lookup(base / "Locked", "file.txt", true);
    EXPECT_TRUE(result.terminal);
    EXPECT_EQ(base / "Locked" / "file.txt", result.path);
}

TEST_F(T_Resolver, LookupExactMatchSkipsScan)
{
    auto result = resolver.lookup(base / "Docs", "Notes.md", false);
    EXPECT_FALSE(result.terminal);
    EXPECT_EQ(base / "Docs" / "Notes.md", result.path);
    EXPECT_EQ(0u, files.readDirectoryCalls.load());
}

TEST_F(T_Resolver, LookupSkipInitialCheckScans)
{
    auto result = resolver.lookup(base / "Docs", "notes.MD", true);
    EXPECT_FALSE(result.terminal);
    EXPECT_EQ(base / "Docs" / "Notes.md", result.path);
    EXPECT_EQ(0u, files.metadataCalls.load());
    EXPECT_EQ(1u, files.readDirectoryCalls.load());
}

TEST_F(T_Resolver, LookupNoMatchIsTerminal)
{
    auto result = resolver.lookup(base / "Docs", "absent", false);
    EXPECT_TRUE(result.terminal);
    EXPECT_EQ(base / "Docs" / "absent", result.path);
}

TEST_F(T_Resolver, InvalidUtf8RequestIsNotFolded)
{
    const std::string raw = "docs/Caf\xe9.txt";
    EXPECT_EQ(base / raw, resolver.resolve(base, raw, true));
    EXPECT_EQ(0u, files.metadataCalls.load());
    EXPECT_EQ(0u, files.readDirectoryCalls.load());
}

TEST_F(T_Resolver, InvalidUtf8EntriesAreSkipped)
{
    tmp.touch("Mixed/Caf\xe9");
    tmp.touch("Mixed/Target.txt");
    EXPECT_EQ(base / "Mixed" / "Target.txt", resolver.resolve(base, "mixed/target.TXT", true));

    auto result = resolver.lookup(base / "Mixed", "caf\xe9", true);
    EXPECT_TRUE(result.terminal);
}

TEST_F(T_Resolver, DuplicateFoldPicksOne)
{
    tmp.touch("Dup/file.txt");
    tmp.touch("Dup/FILE.txt");
    const fs::path resolved = resolver.resolve(base, "dup/File.Txt", true);
    EXPECT_TRUE(resolved == base / "Dup" / "file.txt" || resolved == base / "Dup" / "FILE.txt");
}

TEST_F(T_Resolver, DeletedEntryIsResolvedAgain)
{
    ASSERT_EQ(base / "Docs" / "Report.TXT", resolver.resolve(base, "docs/report.txt", true));

    fs::rename(base / "Docs" / "Report.TXT", base / "Docs" / "report.Txt");

    EXPECT_EQ(base / "Docs" / "report.Txt", resolver.resolve(base, "docs/REPORT.txt", true));
    EXPECT_EQ(1u, cache.stats().invalidations);
}

TEST_F(T_Resolver, RootAndRelativeBases)
{
    EXPECT_EQ(fs::path("/"), resolver.resolve("/", "", true));
    EXPECT_EQ(fs::path("/"), resolver.resolve("/", "//", true));
    EXPECT_EQ(fs::path("relative/base/x"), resolver.resolve("relative/base", "x", true));
    EXPECT_EQ(0u, files.metadataCalls.load());
    EXPECT_EQ(0u, files.readDirectoryCalls.load());
}

TEST_F(T_Resolver, ConcurrentResolution)
{
    const std::vector<std::pair<std::string, fs::path>> cases = {
        {"docs/report.txt", base / "Docs" / "Report.TXT"},
        {"DOCS/NOTES.MD", base / "Docs" / "Notes.md"},
        {"docs/sub/deep.TXT", base / "Docs" / "Sub" / "Deep.txt"},
        {"Docs/Sub/OTHER.txt", base / "Docs" / "Sub" / "Other.txt"},
        {"readme.md", base / "ReadMe.md"},
        {"no/such/file", base / "no" / "such" / "file"},
    };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&, t]
                             {
            for (int round = 0; round < 100; ++round)
            {
                const auto &[input, expected] = cases[(t + round) % cases.size()];
                if (resolver.resolve(base, input, true) != expected)
                {
                    failures++;
                }
            } });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(0, failures.load());
    EXPECT_LE(cache.count(), cache.capacity());
}
