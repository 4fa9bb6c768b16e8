/*
 * Status_Interface - Operator-facing diagnostic output
 * Decouples bus bring-up and loop reporting from the console transport
 */

#ifndef STATUS_INTERFACE_HPP
#define STATUS_INTERFACE_HPP

#include <cstdint>

enum class StatusSeverity : uint8_t { Info, Warning, Error, Fatal };

class Status_Interface {
public:
    virtual ~Status_Interface() = default;
    virtual void show_status(const char *tag, const char *msg) = 0;
    virtual void show_error(const char *tag, const char *msg, StatusSeverity sev) = 0;
    virtual void flush() = 0;
};

#endif // STATUS_INTERFACE_HPP
