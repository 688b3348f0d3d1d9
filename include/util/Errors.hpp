#pragma once
#include <stdexcept>
#include <string>

namespace netmatch {

// Requester / target id not present. Caller-correctable, never retried.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

// Rejected input (max_results <= 0, bad weights, network not loaded).
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Parse / rerank / bulk-embed failure. The message stays generic; upstream
// detail only goes to the log.
class CollaboratorError : public std::runtime_error {
public:
    explicit CollaboratorError(const std::string& what) : std::runtime_error(what) {}
};

// Dangling or inconsistent population data at load time.
class DataIntegrityError : public std::runtime_error {
public:
    explicit DataIntegrityError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace netmatch
