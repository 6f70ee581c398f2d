#include "common.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "parser.hpp"
#include "path_cache.hpp"
#include "resolver.hpp"
#include "router.hpp"
#include "thread_pool.hpp"

namespace
{
    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " <config.json> [--url] [path...]\n"
                  << "Resolves each path under the configured base directory and prints\n"
                  << "one JSON object per line. Paths are read from stdin when none are given.\n"
                  << "  --url   treat inputs as request targets (percent-encoded, query allowed)\n";
    }

    json resolveOne(const std::string &input, bool asUrl, const Config &config,
                    const Resolver &resolver, const Router &router)
    {
        json result = {{"input", input}};

        fs::path resolved;
        if (asUrl)
        {
            auto routed = router.route(input);
            if (!routed)
            {
                result["error"] = "malformed percent escape";
                return result;
            }
            resolved = std::move(*routed);
        }
        else
        {
            resolved = resolver.resolve(config.baseDir, input, config.caseInsensitive);
        }

        result["resolved"] = resolved.native();
        result["exists"] = resolver.filesystem().exists(resolved);
        return result;
    }
}

auto main(int argc, char *argv[]) -> int
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        Config config = Parser::getInstance()->parseConfig(argv[1]);

        bool asUrl = false;
        std::vector<std::string> inputs;
        for (int i = 2; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (arg == "--url")
            {
                asUrl = true;
            }
            else
            {
                inputs.emplace_back(arg);
            }
        }

        if (inputs.empty())
        {
            std::string line;
            while (std::getline(std::cin, line))
            {
                if (!line.empty())
                {
                    inputs.push_back(std::move(line));
                }
            }
        }

        LocalFileSystem fileSystem;
        PathCache cache(config.cache.capacity, fileSystem);
        Resolver resolver(cache, fileSystem);
        Router router(config.baseDir, resolver, config.caseInsensitive, config.indexFile);

        ThreadPool pool(static_cast<size_t>(config.threadCount));
        std::vector<std::future<json>> results;
        results.reserve(inputs.size());
        for (const auto &input : inputs)
        {
            results.push_back(pool.enqueue([&, input]()
                                           { return resolveOne(input, asUrl, config, resolver, router); }));
        }

        // print in input order, invalid UTF-8 in file names is replaced
        for (auto &result : results)
        {
            std::cout << result.get().dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
        }
        std::cout.flush();
        pool.stop();

        const auto stats = cache.stats();
        Logger::getInstance()->info(
            "Resolved " + std::to_string(inputs.size()) + " paths, cache entries: " +
            std::to_string(cache.count()) + "/" + std::to_string(cache.capacity()) +
            ", hits: " + std::to_string(stats.hits) +
            ", misses: " + std::to_string(stats.misses) +
            ", invalidations: " + std::to_string(stats.invalidations) +
            ", evictions: " + std::to_string(stats.evictions));
    }
    catch (const std::exception &e)
    {
        Logger::getInstance()->error("Fatal error: " + std::string(e.what()));
        Logger::destroyInstance();
        return EXIT_FAILURE;
    }

    Logger::destroyInstance();
    return EXIT_SUCCESS;
}
