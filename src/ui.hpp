#pragma once

#include "config.hpp"
#include "session.hpp"

// Runs the window on the calling thread until the session terminates.
// Returns the process exit code.
int UI_Run(Session &session, const Config &config);
