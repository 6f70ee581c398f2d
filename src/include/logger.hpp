#ifndef CASEPATH_LOGGER_HPP
#define CASEPATH_LOGGER_HPP

#include "common.hpp"

class Logger
{
public:
    // Log levels ordered by severity, SUCCESS is always emitted
    enum class LogLevel
    {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        SUCCESS
    };

    // Output settings, applied when the instance is created
    struct Options
    {
        std::string filePath{"casepath.log"}; // empty disables the file sink
        LogLevel minLevel{LogLevel::INFO};     // messages below this level are dropped
        bool console{true};                    // mirror messages to stderr
    };

private:
    // ANSI escape codes for colors
    static constexpr std::array<const char *, 9> COLORS = {
        "\033[0m",  // RESET
        "\033[30m", // BLACK
        "\033[31m", // RED
        "\033[32m", // GREEN
        "\033[33m", // YELLOW
        "\033[34m", // BLUE
        "\033[35m", // MAGENTA
        "\033[36m", // CYAN
        "\033[37m", // WHITE
    };

    // Special symbols
    static constexpr const char *CHECK_MARK = "✅";
    static constexpr const char *CROSS_MARK = "❌";
    static constexpr const char *INFO_MARK = "\U0001F535";
    static constexpr const char *WARN_MARK = "⚠️";

    // Constant string views for log levels
    static constexpr std::string_view LOG_LEVELS[] = {
        "DEBUG",
        "INFO",
        "WARNING",
        "ERROR",
        "SUCCESS"};

    struct LogMessage
    {
        std::string message;
        LogLevel level;
        std::string source;
        std::chrono::system_clock::time_point timestamp;

        LogMessage(std::string msg, LogLevel lvl, std::string src)
            : message(std::move(msg)), level(lvl), source(std::move(src)),
              timestamp(std::chrono::system_clock::now()) {}
    };

    // Memory management and synchronization members
    std::pmr::unsynchronized_pool_resource pool;
    std::pmr::deque<LogMessage> messageQueue{&pool};

    mutable std::shared_mutex mutex;
    std::ofstream logFile;
    std::condition_variable_any queueCV;
    Options options;
    std::jthread loggerThread;

    static inline std::unique_ptr<Logger> instance;
    static inline std::once_flag initFlag;
    static Options pendingOptions;

    [[nodiscard]] static std::string formatSuccess(const std::string &msg);
    [[nodiscard]] static std::string formatError(const std::string &msg);
    [[nodiscard]] static std::string formatInfo(const std::string &msg);
    [[nodiscard]] static std::string formatWarning(const std::string &msg);
    [[nodiscard]] static std::string formatDebug(const std::string &msg);
    [[nodiscard]] std::string formatLogMessage(const LogMessage &msg);

    explicit Logger(Options opts);
    void processLogs(std::stop_token st);
    void drainQueue();
    void writeLogMessage(const LogMessage &msg);

public:
    // must be called before the first getInstance() to take effect
    static void configure(Options opts);
    static Logger *getInstance();
    static void destroyInstance();

    [[nodiscard]] static std::optional<LogLevel> parseLevel(std::string_view name);
    [[nodiscard]] bool enabled(LogLevel level) const;

    void log(std::string_view message, LogLevel level = LogLevel::INFO,
             std::string_view source = "-");
    void error(std::string_view message, std::string_view source = "-");
    void warning(std::string_view message, std::string_view source = "-");
    void success(std::string_view message, std::string_view source = "-");
    void info(std::string_view message, std::string_view source = "-");
    void debug(std::string_view message, std::string_view source = "-");

    ~Logger();

    // Delete copy and move operations
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
};

#endif // CASEPATH_LOGGER_HPP
