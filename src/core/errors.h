#pragma once

#include <stdexcept>
#include <string>

namespace nanoflow::core {

// Base of all orchestrator errors
class NanoflowError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Defect in the pipeline definition or environment. Never retried.
class ConfigurationError : public NanoflowError {
public:
    using NanoflowError::NanoflowError;
};

class ContextNotFoundError : public ConfigurationError {
public:
    explicit ContextNotFoundError(const std::string& context_id)
        : ConfigurationError("Unknown runtime context: " + context_id)
        , context_id_(context_id) {
    }

    const std::string& context_id() const { return context_id_; }

private:
    std::string context_id_;
};

class ContextConflictError : public ConfigurationError {
public:
    ContextConflictError(const std::string& requested, const std::string& active)
        : ConfigurationError("Runtime context '" + requested +
                             "' conflicts with active context '" + active + "'")
        , requested_(requested)
        , active_(active) {
    }

    const std::string& requested() const { return requested_; }
    const std::string& active() const { return active_; }

private:
    std::string requested_;
    std::string active_;
};

class ExecutableNotFoundError : public ConfigurationError {
public:
    ExecutableNotFoundError(const std::string& executable, const std::string& context_id)
        : ConfigurationError("Executable '" + executable +
                             "' not found in runtime context '" + context_id + "'") {
    }
};

// Checkpoint could not be durably written or read
class PersistenceError : public NanoflowError {
public:
    using NanoflowError::NanoflowError;
};

// Another live process holds the writer lock for the run
class ConcurrentWriterError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

} // namespace nanoflow::core
