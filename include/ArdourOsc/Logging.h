#ifndef ARDOUR_OSC_LOGGING_H
#define ARDOUR_OSC_LOGGING_H

#include <stdarg.h>

#include <string>
#include <vector>

/*
 * Process wide logger. Every emitted line has the form
 * "[YYYY-mm-dd HH:MM:SS.mmm] [LEVEL] text" and goes to stderr, to the log
 * file when one is open, to a bounded history of recent lines and to the
 * optional callback. All functions may be called from any thread.
 */

typedef enum
{
    LOG_ERROR = 0,
    LOG_WARNING = 1,
    LOG_INFO = 2,   // default
    LOG_DEBUG = 3
} log_level_t;

/*
 * Receives each formatted line after it was written. Runs on the logging
 * thread without the logger's lock held.
 */
typedef void (*log_callback_t)(log_level_t level, const char *message);

/**
 * @brief Set up the logger
 *
 * @param filename File to append lines to, NULL or "" for none
 * @param debug_enabled Non-zero starts at LOG_DEBUG instead of LOG_INFO
 * @param callback Line observer, may be NULL
 * @return 0, or -1 if the file could not be opened (stderr still works)
 */
int log_init(const char *filename, int debug_enabled, log_callback_t callback);

/**
 * @brief Close the file, forget the callback and history, back to LOG_INFO
 */
void log_cleanup(void);

/**
 * @brief Lines above this level are dropped before formatting
 */
void log_set_level(log_level_t level);

log_level_t log_get_level(void);

/**
 * @brief Switch between LOG_DEBUG and LOG_INFO
 *
 * Disabling only lowers the level when it is currently LOG_DEBUG.
 *
 * @return 1 if debug was on before the call, else 0
 */
int log_set_debug(int enabled);

/**
 * @brief Map "error", "warning" (or "warn"), "info" or "debug" to a level
 *
 * Case insensitive. @p level is untouched for an unknown name.
 *
 * @return 0 when the name is known, -1 otherwise
 */
int log_level_from_string(const char *name, log_level_t *level);

void log_message(log_level_t level, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

void log_message_v(log_level_t level, const char *fmt, va_list args);

#define log_error(fmt, ...) log_message(LOG_ERROR, fmt, ##__VA_ARGS__)
#define log_warning(fmt, ...) log_message(LOG_WARNING, fmt, ##__VA_ARGS__)
#define log_info(fmt, ...) log_message(LOG_INFO, fmt, ##__VA_ARGS__)
#define log_debug(fmt, ...) log_message(LOG_DEBUG, fmt, ##__VA_ARGS__)

/**
 * @brief Copy up to @p max_messages of the most recent lines, oldest first
 *
 * The history holds the last 100 emitted lines.
 *
 * @param messages Replaced with the copied lines
 * @return Number of lines copied
 */
int log_get_recent(std::vector<std::string> &messages, int max_messages);

/**
 * @brief Drop the history; always returns 0
 */
int log_clear_history(void);

/**
 * @brief Close the current file and start appending to @p filename
 *
 * @param filename New file, NULL or "" to stop writing to a file
 * @return 0, or -1 if the new file could not be opened
 */
int log_set_file(const char *filename);

#endif /* ARDOUR_OSC_LOGGING_H */
