/**
 * @file Logger.h
 * @brief Thread-safe file logger writing to ./<command>.log; a silent no-op until initialized.
 *
 * The logger is only a sink. Whether library code emits a line is decided by the
 * Verbosity value carried in the caller's configuration, never by a global toggle.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <exception>
#include <string>

/** @brief Per-call diagnostic verbosity passed explicitly through configuration structs. */
enum class Verbosity { Quiet = 0, Normal = 1, Verbose = 2 };

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Initialize using argv[0] to derive <command>.log path.
    static void initFromArgv0(const char* argv0);
    // Initialize explicitly with a filename (relative or absolute).
    static void init(const std::string& filename);
    // Flush and close the log file; safe to call multiple times.
    static void shutdown();
    // Whether a log file is currently open.
    static bool isInitialized();

    static void log(Level lvl, const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void debug(const std::string& msg);

    static void logException(const std::string& where, const std::exception& e);
    static void logUnknownException(const std::string& where);

    // Control log level (default: Info). Also honors LOG_LEVEL env (debug, info, warn, error, none)
    static void setLevel(Level lvl);
    static Level level();

    /** @brief Parse a level name (case-insensitive); returns false and leaves @p out untouched if unknown. */
    static bool parseLevel(const std::string& text, Level& out);
    /** @brief Upper-case tag used in log lines ("DEBUG", "INFO", ...). */
    static const char* levelName(Level lvl);

private:
    static void logImpl(Level lvl, const std::string& msg);
};

/** @brief Emit @p msg at Debug level when @p v is Verbose. */
void logVerbose(Verbosity v, const std::string& msg);
/** @brief Emit @p msg at Warn level unless @p v is Quiet. */
void logWarning(Verbosity v, const std::string& msg);
