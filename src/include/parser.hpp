#ifndef CASEPATH_PARSER_HPP
#define CASEPATH_PARSER_HPP

#include "common.hpp"
#include "config.hpp"
#include "logger.hpp"

class Parser
{
public:
    // delete copy constructor and assignment operator
    Parser(const Parser &) = delete;
    Parser &operator=(const Parser &) = delete;

    // get singleton instance
    static Parser *getInstance()
    {
        static Parser instance;
        return &instance;
    }

    // parse configuration file
    [[nodiscard]] Config parseConfig(const std::string &configFilePath);

    // parse an already loaded JSON document
    [[nodiscard]] Config parseConfigJson(const json &configJson);

private:
    // read the "log" section, applied to the Logger before anything is logged
    [[nodiscard]] static Logger::Options parseLogOptions(const json &configJson);

    // private constructor for singleton
    Parser() = default;
};

#endif // CASEPATH_PARSER_HPP
