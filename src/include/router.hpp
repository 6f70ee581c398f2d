#ifndef CASEPATH_ROUTER_HPP
#define CASEPATH_ROUTER_HPP

#include "common.hpp"
#include "logger.hpp"
#include "resolver.hpp"

// Maps request targets ("/Docs/Report%20A.TXT?x=1") to files under the
// static folder, folding case the way the resolver does.
class Router
{
public:
    Router(const std::string &staticFolder, const Resolver &resolver,
           bool caseInsensitive, std::string indexFile = "index.html");

    // std::nullopt when the target carries a malformed percent escape
    [[nodiscard]] std::optional<fs::path> route(std::string_view target) const;

    // decode %XX escapes into raw bytes, std::nullopt on a malformed escape
    [[nodiscard]] static std::optional<std::string> percentDecode(std::string_view encoded);

private:
    fs::path staticFolder;    // path to static files
    const Resolver &resolver; // case folding resolver shared with other routers
    bool caseInsensitive;
    std::string indexFile;    // served for directory targets
};

#endif // CASEPATH_ROUTER_HPP
