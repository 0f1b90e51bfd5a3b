#ifndef _OUI_LOG_H_
#define _OUI_LOG_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <stdint.h>
#include <string.h>

enum oui_log_level {
    OUI_LOG_NONE = 0,
    OUI_LOG_CRITICAL, /**< Fatal error condition */
    OUI_LOG_ERROR,    /**< Non-fatal error condition */
    OUI_LOG_WARNING,  /**< Unexpected event or condition */
    OUI_LOG_INFO,     /**< Informational messages */
    OUI_LOG_DEBUG,    /**< Debugging messages */
    OUI_LOG_TRACE,    /**< Trace level messages */
    OUI_LOG_MAX,
};

/**
 * Get the application log level
 *
 * @return
 *   The current system log level
 */
enum oui_log_level oui_log_level_get(void);

/**
 * Set the application log level
 *
 * @param level
 *   A value between OUI_LOG_NONE (0) and OUI_LOG_MAX (7)
 */
void oui_log_level_set(enum oui_log_level level);

/**
 * Retrieve the log level from the command line
 *
 * @param[in] argc
 *   The number of cli arguments
 * @param[in] argv
 *   Array of cli strings
 *
 * @return
 *   log level found in cli arguments (may be OUI_LOG_NONE)
 */
enum oui_log_level oui_log_level_find(int argc, char* const argv[]);

/**
 * Maximum length (in chars) of a log level value.
 */
static const size_t OUI_LOG_MAX_LEVEL_LENGTH = 8;

/**
 * Parse a log level argument to the associated enum value.
 *
 * @param[in] arg
 *   Log level argument to parse; either a number or a level name
 *
 * @return
 *   log level found in arg, OUI_LOG_NONE otherwise
 */
enum oui_log_level parse_log_optarg(const char* arg);

/**
 * Get the full function name from the full function signature string
 *
 * @param[in] signature
 *   The full function signature
 * @param[out] function
 *   Buffer for function name; should be at least as long as signature
 */
void oui_log_function_name(const char* signature, char* function);

/**
 * Macro to possibly write a message to the log
 * Note: this is the preferred way to do logging, since logging arguments will
 * not be evaluated unless they will actually get logged.
 *
 * @param level
 *   The level of the message
 * @param format
 *   The printf format string, followed by variable arguments
 */
#define OUI_LOG(level, format, ...)                                            \
    do {                                                                       \
        if (level <= oui_log_level_get()) {                                    \
            char function_[strlen(__PRETTY_FUNCTION__) + 1];                   \
            oui_log_function_name(__PRETTY_FUNCTION__, function_);             \
            oui_log(level, function_, format, ##__VA_ARGS__);                  \
        }                                                                      \
    } while (0)

/**
 * Write a message to the log
 *
 * @param level
 *   The level of the message
 * @param tag
 *   Additional information to add to message
 * @param format
 *   The printf format string, followed by variable arguments
 * @return
 *   -  0: Success
 *   - !0: Error
 */
int oui_log(enum oui_log_level level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

int oui_vlog(enum oui_log_level level,
             const char* tag,
             const char* format,
             va_list argp);

#ifdef __cplusplus
}
#endif

#endif /* _OUI_LOG_H_ */
