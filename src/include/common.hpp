#ifndef CASEPATH_COMMON_HPP
#define CASEPATH_COMMON_HPP

// Standard C++ headers
#include <algorithm>          // efficient algorithms
#include <array>              // fixed-size arrays
#include <atomic>             // atomic operations
#include <chrono>             // measuring time
#include <condition_variable> // blocking thread synchronization
#include <cstdint>            // fixed-width integer types
#include <deque>              // double-ended queue
#include <filesystem>         // filesystem operations
#include <fstream>            // file reading operations
#include <functional>         // function objects
#include <future>             // asynchronous tasks
#include <iomanip>            // stream formatting
#include <iostream>           // std::cout, std::cerr - for console output
#include <limits>             // numeric limits
#include <list>               // doubly linked list for cache implementation
#include <memory>             // smart pointers
#include <memory_resource>    // memory resource management
#include <mutex>              // thread synchronization
#include <optional>           // optional type
#include <queue>              // queue data structure
#include <shared_mutex>       // shared mutexes
#include <sstream>            // string stream manipulations
#include <stdexcept>          // standard exceptions like std::runtime_error
#include <string>             // owning strings
#include <string_view>        // efficient string handling without ownership
#include <system_error>       // std::error_code for filesystem failures
#include <thread>             // multithreading support
#include <unordered_map>      // unordered associative container (Hash Table)
#include <utility>            // std::pair, std::move
#include <vector>             // dynamic array

// System headers
#include <cerrno>     // errno values for filesystem error classification
#include <cstring>    // strerror()
#include <ctime>      // handling timestamps
#include <pthread.h>  // POSIX threads
#include <sys/stat.h> // stat - to get file status
#include <unistd.h>   // POSIX primitives

// Third-party headers
#include <nlohmann/json.hpp> // JSON parsing

namespace fs = std::filesystem; // Alias for filesystem namespace
using json = nlohmann::json;    // Alias for JSON namespace

#endif // CASEPATH_COMMON_HPP
