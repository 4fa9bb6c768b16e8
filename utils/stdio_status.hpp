/*
 * Stdio_Status - printf-based status output
 * Writes tagged diagnostic lines to the stdio console (UART on target)
 */

#ifndef STDIO_STATUS_HPP
#define STDIO_STATUS_HPP

#include "status_interface.hpp"

class Stdio_Status final : public Status_Interface {
public:
    void show_status(const char *tag, const char *msg) override;
    void show_error(const char *tag, const char *msg, StatusSeverity sev) override;
    void flush() override;
};

#endif // STDIO_STATUS_HPP
