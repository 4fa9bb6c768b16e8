/*
 * Stdio_Status Implementation - printf-based status output
 * Lines share the drivers' "[TAG] message" shape; problems carry a
 * severity word after the tag.
 */

#include "utils/stdio_status.hpp"

#include <cstdio>

static const char *severity_label(StatusSeverity sev) {
    switch (sev) {
        case StatusSeverity::Info:    return "INFO";
        case StatusSeverity::Warning: return "WARN";
        case StatusSeverity::Error:   return "ERROR";
        case StatusSeverity::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

void Stdio_Status::show_status(const char *tag, const char *msg) {
    printf("[%s] %s\n", tag, msg);
}

void Stdio_Status::show_error(const char *tag, const char *msg, StatusSeverity sev) {
    printf("[%s] %s: %s\n", tag, severity_label(sev), msg);
    /* Error and worse may precede a hang; get them onto the wire now */
    if (sev == StatusSeverity::Error || sev == StatusSeverity::Fatal) {
        fflush(stdout);
    }
}

void Stdio_Status::flush() {
    fflush(stdout);
}
