/**
 * @file Config.h
 * @brief Declares BotConfig: tunables for the bot and the arena, read from defaults, environment and argv.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>
#include <vector>

#include "Logger.h"

/**
 * @struct BotConfig
 * @brief Settings shared by the lightcycle bot and the arena.
 *
 * Precedence: built-in defaults, then LIGHTCYCLE_* environment variables, then command-line flags.
 * Values that fail to parse or fall outside their valid range keep the previous value.
 */
struct BotConfig {
    // Board
    int width{30};
    int height{20};

    // Decision
    int timeoutMs{1750};       /**< aggregator wait bound */
    int spaceDepth{12};        /**< SpaceStrategy flood-fill depth */
    float distanceWeight{1.0f};
    float spaceWeight{2.0f};
    float wallHugWeight{2.0f};
    int workers{0};            /**< worker threads; 0 = one per strategy */

    // Arena
    int players{2};
    unsigned seed{0};          /**< 0 = random */
    int stepDelayMs{120};

    // Logging
    Logger::Level logLevel{Logger::Level::Info};
    std::string logFile;       /**< empty = executable default sink */

    /** @brief Overlay LIGHTCYCLE_* environment variables. */
    void applyEnvironment();
    /**
     * @brief Overlay flags from argv (argv[0] skipped); "--name=value" and "-x value" forms.
     * @return arguments that were not recognized, in order.
     */
    std::vector<std::string> applyArgs(int argc, const char* const* argv);

    /** @brief One-line summary for the startup log. */
    std::string describe() const;
    /** @brief Usage text listing every flag and its environment variable. */
    static std::string usage(const std::string& program);
};

/** @brief Parse a whole string as a float; false on garbage, trailing characters or overflow. */
bool parseFloat(const char* s, float& out);
/** @brief Parse a whole string as a base-10 int; false on garbage, trailing characters or overflow. */
bool parseInt(const char* s, int& out);
