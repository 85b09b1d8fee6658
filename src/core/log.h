#pragma once

namespace station {

// Diagnostics go to stderr with a "[tag]" prefix. STATION_LOG=0 silences them.
bool logging_enabled();
void set_logging_enabled(bool enabled);

void log_message(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}
