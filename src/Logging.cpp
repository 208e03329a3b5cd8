#include "ArdourOsc/Logging.h"

#include <stdio.h>
#include <strings.h>
#include <time.h>

#include <algorithm>
#include <deque>
#include <mutex>

namespace
{
	const size_t LOG_HISTORY_SIZE = 100;
	const log_level_t LOG_DEFAULT_LEVEL = LOG_INFO;

	std::mutex g_logMutex;
	FILE *g_logFile = nullptr;
	log_level_t g_logLevel = LOG_DEFAULT_LEVEL;
	log_callback_t g_callback = nullptr;
	std::deque<std::string> g_history;

	const char *levelName(log_level_t level)
	{
		switch (level)
		{
		case LOG_ERROR:
			return "ERROR";
		case LOG_WARNING:
			return "WARNING";
		case LOG_INFO:
			return "INFO";
		case LOG_DEBUG:
			return "DEBUG";
		}
		return "UNKNOWN";
	}

	// "2024-05-01 12:34:56.789"
	std::string timestamp()
	{
		struct timespec now;
		clock_gettime(CLOCK_REALTIME, &now);
		struct tm local;
		localtime_r(&now.tv_sec, &local);

		char date[32];
		strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
		char result[48];
		snprintf(result, sizeof(result), "%s.%03ld", date, now.tv_nsec / 1000000L);
		return result;
	}

	// Caller holds g_logMutex
	int openFileLocked(const char *filename)
	{
		if (g_logFile)
		{
			fclose(g_logFile);
			g_logFile = nullptr;
		}
		if (!filename || !*filename)
			return 0;

		g_logFile = fopen(filename, "a");
		if (!g_logFile)
		{
			fprintf(stderr, "Failed to open log file %s\n", filename);
			return -1;
		}
		return 0;
	}
}

int log_init(const char *filename, int debug_enabled, log_callback_t callback)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	g_callback = callback;
	g_logLevel = debug_enabled ? LOG_DEBUG : LOG_DEFAULT_LEVEL;
	return openFileLocked(filename);
}

void log_cleanup(void)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	if (g_logFile)
	{
		fclose(g_logFile);
		g_logFile = nullptr;
	}
	g_callback = nullptr;
	g_history.clear();
	g_logLevel = LOG_DEFAULT_LEVEL;
}

void log_set_level(log_level_t level)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	g_logLevel = level;
}

log_level_t log_get_level(void)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	return g_logLevel;
}

int log_set_debug(int enabled)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	int previous = g_logLevel >= LOG_DEBUG ? 1 : 0;
	if (enabled)
		g_logLevel = LOG_DEBUG;
	else if (g_logLevel >= LOG_DEBUG)
		g_logLevel = LOG_DEFAULT_LEVEL;
	return previous;
}

int log_level_from_string(const char *name, log_level_t *level)
{
	if (!name || !level)
		return -1;

	if (strcasecmp(name, "error") == 0)
		*level = LOG_ERROR;
	else if (strcasecmp(name, "warning") == 0 || strcasecmp(name, "warn") == 0)
		*level = LOG_WARNING;
	else if (strcasecmp(name, "info") == 0)
		*level = LOG_INFO;
	else if (strcasecmp(name, "debug") == 0)
		*level = LOG_DEBUG;
	else
		return -1;
	return 0;
}

void log_message(log_level_t level, const char *fmt, ...)
{
	va_list args;
	va_start(args, fmt);
	log_message_v(level, fmt, args);
	va_end(args);
}

void log_message_v(log_level_t level, const char *fmt, va_list args)
{
	if (!fmt)
		return;

	{
		std::lock_guard<std::mutex> lock(g_logMutex);
		if (level > g_logLevel)
			return;
	}

	va_list copy;
	va_copy(copy, args);
	int needed = vsnprintf(nullptr, 0, fmt, copy);
	va_end(copy);
	if (needed < 0)
		return;

	std::string text(static_cast<size_t>(needed) + 1, '\0');
	vsnprintf(&text[0], text.size(), fmt, args);
	text.resize(static_cast<size_t>(needed));

	std::string line = "[" + timestamp() + "] [" + levelName(level) + "] " + text;

	log_callback_t callback = nullptr;
	{
		std::lock_guard<std::mutex> lock(g_logMutex);
		fprintf(stderr, "%s\n", line.c_str());
		if (g_logFile)
		{
			fprintf(g_logFile, "%s\n", line.c_str());
			fflush(g_logFile);
		}

		g_history.push_back(line);
		while (g_history.size() > LOG_HISTORY_SIZE)
			g_history.pop_front();

		callback = g_callback;
	}

	// Called unlocked so the callback may log itself
	if (callback)
		callback(level, line.c_str());
}

int log_get_recent(std::vector<std::string> &messages, int max_messages)
{
	messages.clear();
	if (max_messages <= 0)
		return 0;

	std::lock_guard<std::mutex> lock(g_logMutex);
	size_t count = std::min(g_history.size(), static_cast<size_t>(max_messages));
	messages.assign(g_history.end() - static_cast<std::ptrdiff_t>(count), g_history.end());
	return static_cast<int>(count);
}

int log_clear_history(void)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	g_history.clear();
	return 0;
}

int log_set_file(const char *filename)
{
	std::lock_guard<std::mutex> lock(g_logMutex);
	return openFileLocked(filename);
}
