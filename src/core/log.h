// File: src/core/log.h
#pragma once

// Journal-backed logging shared by every part of powermodes.
// With DEBUG_MODE set, messages are also echoed to stderr (stdout belongs to
// the commands we run).

extern bool DEBUG_MODE;

void enable_debug_logging();

void log_info(const char *msg);
void log_error(const char *msg);
void log_warning(const char *msg);
void log_debug(const char *msg);
