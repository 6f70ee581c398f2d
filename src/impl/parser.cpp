#include "parser.hpp"

Config Parser::parseConfig(const std::string &configFilePath)
{
    // open configuration file
    std::ifstream file(configFilePath);
    if (!file.is_open())
    {
        Logger::getInstance()->error("Could not open config file: " + configFilePath);
        throw std::runtime_error("Could not open config file!");
    }

    // parse JSON configuration
    json configJson;
    try
    {
        file >> configJson;
    }
    catch (const json::parse_error &e)
    {
        Logger::getInstance()->error("JSON parsing error: " + std::string(e.what()));
        throw std::runtime_error("Failed to parse configuration file");
    }

    // the logger takes its settings from the same file, so set them up
    // before the first message of this run is queued
    Logger::configure(parseLogOptions(configJson));
    Logger::getInstance()->info("Reading configuration from: " + configFilePath);

    return parseConfigJson(configJson);
}

Logger::Options Parser::parseLogOptions(const json &configJson)
{
    Logger::Options options;
    if (!configJson.is_object() || !configJson.contains("log") || configJson["log"].is_null())
    {
        return options;
    }

    const json &logJson = configJson["log"];
    try
    {
        options.filePath = logJson.value("file", options.filePath);
        options.console = logJson.value("console", options.console);
        const std::string levelName = logJson.value("level", std::string("info"));
        const auto level = Logger::parseLevel(levelName);
        if (!level)
        {
            throw std::runtime_error("Invalid log level: " + levelName);
        }
        options.minLevel = *level;
    }
    catch (const json::type_error &e)
    {
        throw std::runtime_error("Invalid log section: " + std::string(e.what()));
    }
    return options;
}

Config Parser::parseConfigJson(const json &configJson)
{
    if (!configJson.is_object())
    {
        Logger::getInstance()->error("Configuration root must be a JSON object");
        throw std::runtime_error("Incomplete configuration file");
    }

    // check if all required fields exist and are not null
    const std::array<std::string, 2> requiredFields = {"base_dir", "case_insensitive"};
    for (const auto &field : requiredFields)
    {
        if (!configJson.contains(field) || configJson[field].is_null())
        {
            Logger::getInstance()->error("Missing or null field: " + field);
            throw std::runtime_error("Incomplete configuration file");
        }
    }

    // create a Config object and populate it with values from JSON
    Config config;
    try
    {
        config.baseDir = configJson["base_dir"].get<std::string>();
        config.caseInsensitive = configJson["case_insensitive"].get<bool>();
        config.threadCount = configJson.value("thread_count", config.threadCount);
        config.indexFile = configJson.value("index_file", config.indexFile);
        if (configJson.contains("cache") && !configJson["cache"].is_null())
        {
            const json &cacheJson = configJson["cache"];
            if (cacheJson.contains("capacity"))
            {
                // reject negative numbers before they wrap around
                const auto capacity = cacheJson["capacity"].get<long long>();
                if (capacity <= 0)
                {
                    throw std::runtime_error("Invalid cache capacity: " + std::to_string(capacity));
                }
                config.cache.capacity = static_cast<size_t>(capacity);
            }
        }
        config.log = parseLogOptions(configJson);
    }
    catch (const json::exception &e)
    {
        Logger::getInstance()->error("Invalid configuration value: " + std::string(e.what()));
        throw std::runtime_error("Invalid configuration file");
    }
    catch (const std::runtime_error &e)
    {
        Logger::getInstance()->error(e.what());
        throw;
    }

    // validate configuration values
    const auto validateConfig = [](const Config &cfg)
    {
        // validate base directory
        std::error_code ec;
        if (cfg.baseDir.empty() || !fs::is_directory(cfg.baseDir, ec))
        {
            throw std::runtime_error("Base directory does not exist: " + cfg.baseDir);
        }

        // validate thread count
        if (cfg.threadCount <= 0 || cfg.threadCount > 1000)
        {
            throw std::runtime_error("Invalid thread count: " + std::to_string(cfg.threadCount));
        }

        // validate index file name, it must be a single path segment
        if (cfg.indexFile.empty() || cfg.indexFile.find('/') != std::string::npos)
        {
            throw std::runtime_error("Invalid index file: " + cfg.indexFile);
        }
    };

    try
    {
        validateConfig(config);
    }
    catch (const std::runtime_error &e)
    {
        Logger::getInstance()->error(e.what());
        throw;
    }

    // log successful configuration loading
    Logger::getInstance()->success("Configuration loaded successfully");

    return config;
}
