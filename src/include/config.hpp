#ifndef CASEPATH_CONFIG_HPP
#define CASEPATH_CONFIG_HPP

#include "common.hpp"
#include "logger.hpp"

struct Config
{
    std::string baseDir;                  // directory that request paths are resolved under
    bool caseInsensitive = false;         // fold case when resolving
    int threadCount = 4;                  // worker threads for batch resolution
    std::string indexFile = "index.html"; // file served for directory requests
    struct
    {
        size_t capacity = 1024; // maximum number of cached paths
    } cache;
    Logger::Options log; // log file, level and console output
};

#endif // CASEPATH_CONFIG_HPP
