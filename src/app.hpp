#pragma once

#include <cstdio>

#include "config.hpp"
#include "data.hpp"
#include "session.hpp"

enum {
  EXIT_BAD_PATTERN = 2,
};

// Resolves FILENAME or the glob, reads every document and checks the output
// destination. Prints the error and returns EXIT_FAILURE on any failure.
int App_LoadInputs(DocumentList &out, const Config &config);

// Non-interactive run: prints the matching lines to `out`, exports when an
// output path is configured, then quits the session
int App_RunBatch(Session &session, const Config &config, FILE *out);
