#include "router.hpp"

Router::Router(const std::string &staticFolder, const Resolver &resolver,
               bool caseInsensitive, std::string indexFile)
    : staticFolder(staticFolder), resolver(resolver),
      caseInsensitive(caseInsensitive), indexFile(std::move(indexFile))
{
    Logger::getInstance()->info("Router initialized with static folder: " + staticFolder +
                                (caseInsensitive ? " (case-insensitive)" : ""));
}

std::optional<std::string> Router::percentDecode(std::string_view encoded)
{
    const auto hexValue = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::string decoded;
    decoded.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i)
    {
        if (encoded[i] != '%')
        {
            decoded += encoded[i];
            continue;
        }
        if (i + 2 >= encoded.size())
        {
            return std::nullopt;
        }
        const int high = hexValue(encoded[i + 1]);
        const int low = hexValue(encoded[i + 2]);
        if (high < 0 || low < 0)
        {
            return std::nullopt;
        }
        decoded += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return decoded;
}

std::optional<fs::path> Router::route(std::string_view target) const
{
    // query and fragment never name a file
    const size_t end = target.find_first_of("?#");
    if (end != std::string_view::npos)
    {
        target = target.substr(0, end);
    }

    const auto decoded = percentDecode(target);
    if (!decoded)
    {
        Logger::getInstance()->warning("Malformed escape in request target: " + std::string(target));
        return std::nullopt;
    }

    fs::path filePath = resolver.resolve(staticFolder, *decoded, caseInsensitive);

    // directory targets serve their index file
    std::error_code ec;
    const auto meta = resolver.filesystem().metadata(filePath, ec);
    if (meta && meta->isDirectory())
    {
        filePath = resolver.resolve(filePath, indexFile, caseInsensitive);
    }

    Logger::getInstance()->debug("Routed " + std::string(target) + " -> " + filePath.native());
    return filePath;
}
