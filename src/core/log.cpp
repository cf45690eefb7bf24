#include "log.h"
#include <systemd/sd-journal.h>
#include <cstdio>
#include <mutex>

bool DEBUG_MODE = false;

namespace {
// Plugins may be applied from worker threads.
std::mutex g_logMutex;

void echo(const char *tag, const char *msg) {
    std::fprintf(stderr, "[%s] %s\n", tag, msg);
    std::fflush(stderr);
}
} // namespace

void enable_debug_logging() {
    DEBUG_MODE = true;
}

void log_info(const char *msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (DEBUG_MODE)
        echo("INFO", msg);
    sd_journal_print(LOG_INFO, "%s", msg);
}

void log_error(const char *msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (DEBUG_MODE)
        echo("ERROR", msg);
    sd_journal_print(LOG_ERR, "%s", msg);
}

void log_warning(const char *msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (DEBUG_MODE)
        echo("WARNING", msg);
    sd_journal_print(LOG_WARNING, "%s", msg);
}

void log_debug(const char *msg) {
    if (!DEBUG_MODE)
        return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    echo("DEBUG", msg);
    sd_journal_print(LOG_DEBUG, "%s", msg);
}
