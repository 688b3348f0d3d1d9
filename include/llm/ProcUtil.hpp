#pragma once
#include <string>

namespace procutil {

struct ProcResult {
    int exit_code = -1;
    std::string output;   // stdout (stderr too when the command redirects it)
};

// Runs a shell command line and captures stdout.
// exit_code is -1 when the process could not be started.
ProcResult run_capture(const std::string& cmdline);

// Single-quotes an argument for /bin/sh.
std::string shell_quote(const std::string& s);

// POSTs a JSON body through the curl binary and returns the response body.
// The payload goes through a private temp file (avoids argv quoting limits).
// Throws std::runtime_error on spawn failure, non-zero curl exit or HTTP error.
std::string curl_post_json(const std::string& url, const std::string& body, int timeout_seconds);

} // namespace procutil
