#include "logger.hpp"

Logger::Options Logger::pendingOptions;

// Helper functions for formatting with colors
std::string Logger::formatSuccess(const std::string &msg)
{
    return std::string(COLORS[3]) + CHECK_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatError(const std::string &msg)
{
    return std::string(COLORS[2]) + CROSS_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatInfo(const std::string &msg)
{
    return std::string(COLORS[5]) + INFO_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatWarning(const std::string &msg)
{
    return std::string(COLORS[4]) + WARN_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatDebug(const std::string &msg)
{
    return std::string(COLORS[6]) + msg + COLORS[0];
}

Logger::Logger(Options opts)
    : options(std::move(opts))
{
    if (!options.filePath.empty())
    {
        logFile.open(options.filePath, std::ios::app);
        if (!logFile.is_open() && options.console)
        {
            std::cerr << formatWarning("Could not open log file: " + options.filePath) << std::endl;
        }
    }
    loggerThread = std::jthread([this](std::stop_token st)
                                { processLogs(st); });
    log("Logger initialized", LogLevel::DEBUG);
}

void Logger::processLogs(std::stop_token st)
{
    while (!st.stop_requested())
    {
        std::vector<LogMessage> messages;
        messages.reserve(100);

        {
            std::unique_lock lock(mutex);
            auto pred = [this, &st]
            {
                return !messageQueue.empty() || st.stop_requested();
            };

            if (queueCV.wait_for(lock, std::chrono::seconds(1), pred)) // wait for 1 second
            {
                while (!messageQueue.empty() && messages.size() < 100)
                {
                    messages.push_back(std::move(messageQueue.front())); // move message to vector
                    messageQueue.pop_front();                            // remove message from queue
                }
            }
        }

        for (const auto &msg : messages)
        {
            writeLogMessage(msg);
        }
        if (!messages.empty() && logFile.is_open())
        {
            logFile.flush();
        }
    }
}

// flush whatever the worker left behind, only called once the worker has joined
void Logger::drainQueue()
{
    std::unique_lock lock(mutex);
    while (!messageQueue.empty())
    {
        writeLogMessage(messageQueue.front());
        messageQueue.pop_front();
    }
    if (logFile.is_open())
    {
        logFile.flush();
    }
}

void Logger::writeLogMessage(const LogMessage &msg)
{
    std::string fileMessage = formatLogMessage(msg);
    if (logFile.is_open())
    {
        logFile << fileMessage << '\n';
    }

    if (!options.console)
    {
        return;
    }

    std::string consoleMessage;
    switch (msg.level)
    {
    case LogLevel::ERROR:
        consoleMessage = formatError(fileMessage);
        break;
    case LogLevel::WARNING:
        consoleMessage = formatWarning(fileMessage);
        break;
    case LogLevel::SUCCESS:
        consoleMessage = formatSuccess(fileMessage);
        break;
    case LogLevel::DEBUG:
        consoleMessage = formatDebug(fileMessage);
        break;
    default:
        consoleMessage = formatInfo(fileMessage);
        break;
    }
    // stdout carries the tool's results, diagnostics go to stderr
    std::cerr << consoleMessage << std::endl;
}

std::string Logger::formatLogMessage(const LogMessage &msg)
{
    auto time = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  msg.timestamp.time_since_epoch()) %
              1000;

    std::tm localTime{};
    localtime_r(&time, &localTime);

    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "[%Y-%m-%d %H:%M:%S]", &localTime);

    std::ostringstream oss;
    oss << timestamp << "."
        << std::setfill('0') << std::setw(3) << ms.count()
        << " [" << LOG_LEVELS[static_cast<int>(msg.level)] << "] "
        << "[" << msg.source << "] "
        << msg.message;

    return oss.str();
}

void Logger::configure(Options opts)
{
    pendingOptions = std::move(opts);
}

Logger *Logger::getInstance()
{
    std::call_once(initFlag, []()
                   { instance = std::unique_ptr<Logger>(new Logger(pendingOptions)); });
    return instance.get();
}

std::optional<Logger::LogLevel> Logger::parseLevel(std::string_view name)
{
    if (name == "debug")
        return LogLevel::DEBUG;
    if (name == "info")
        return LogLevel::INFO;
    if (name == "warning")
        return LogLevel::WARNING;
    if (name == "error")
        return LogLevel::ERROR;
    return std::nullopt;
}

bool Logger::enabled(LogLevel level) const
{
    return level == LogLevel::SUCCESS || level >= options.minLevel;
}

void Logger::log(std::string_view message, LogLevel level, std::string_view source)
{
    if (!enabled(level))
    {
        return;
    }

    {
        std::unique_lock lock(mutex);
        messageQueue.emplace_back(std::string(message), level, std::string(source));
    }
    queueCV.notify_one();
}

void Logger::error(std::string_view message, std::string_view source)
{
    log(message, LogLevel::ERROR, source);
}

void Logger::warning(std::string_view message, std::string_view source)
{
    log(message, LogLevel::WARNING, source);
}

void Logger::success(std::string_view message, std::string_view source)
{
    log(message, LogLevel::SUCCESS, source);
}

void Logger::info(std::string_view message, std::string_view source)
{
    log(message, LogLevel::INFO, source);
}

void Logger::debug(std::string_view message, std::string_view source)
{
    log(message, LogLevel::DEBUG, source);
}

void Logger::destroyInstance()
{
    instance.reset();
}

Logger::~Logger()
{
    loggerThread.request_stop();
    queueCV.notify_all();
    if (loggerThread.joinable())
    {
        loggerThread.join();
    }
    drainQueue();
    if (logFile.is_open())
    {
        logFile.close();
    }
}
