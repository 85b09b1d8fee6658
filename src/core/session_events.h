#pragma once

#include "core/types.h"
#include <string>
#include <variant>

namespace station {

struct OutputEvent {
    SessionId session_id;
    std::string data;
};

// exit_code is the child's status for Exited sessions and -1 for Closed ones.
struct ExitEvent {
    SessionId session_id;
    int exit_code = -1;
    bool closed = false;
};

using SessionEvent = std::variant<OutputEvent, ExitEvent>;

}
