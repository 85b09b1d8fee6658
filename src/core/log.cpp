#include "core/log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace station {

namespace {

bool enabled_from_env() {
    const char* value = std::getenv("STATION_LOG");
    if (!value) return true;
    return std::strcmp(value, "0") != 0;
}

std::atomic<bool>& enabled_flag() {
    static std::atomic<bool> flag{enabled_from_env()};
    return flag;
}

}

bool logging_enabled() {
    return enabled_flag().load();
}

void set_logging_enabled(bool enabled) {
    enabled_flag().store(enabled);
}

void log_message(const char* tag, const char* fmt, ...) {
    if (!logging_enabled()) return;

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    fprintf(stderr, "[%s] %s\n", tag, buffer);
}

}
