#pragma once
#include <stdexcept>
#include <string>

namespace arena {

// Base of every error the engine raises. Step-internal failures are caught at
// the step boundary and recorded in state; only configuration errors reach
// callers of the factory and registry.
class ArenaError : public std::runtime_error {
public:
    explicit ArenaError(const std::string& what) : std::runtime_error(what) {}
};

class GenerationError : public ArenaError {
public:
    explicit GenerationError(const std::string& what) : ArenaError(what) {}
};

class ToolNotFoundError : public ArenaError {
public:
    explicit ToolNotFoundError(const std::string& name)
        : ArenaError("Tool '" + name + "' not found"), name_(name) {}
    const std::string& name() const { return name_; }
private:
    std::string name_;
};

class ToolExecutionError : public ArenaError {
public:
    explicit ToolExecutionError(const std::string& what) : ArenaError(what) {}
};

class DuplicateToolError : public ArenaError {
public:
    explicit DuplicateToolError(const std::string& name)
        : ArenaError("Tool '" + name + "' already registered") {}
};

class UnknownStrategyError : public ArenaError {
public:
    explicit UnknownStrategyError(const std::string& name)
        : ArenaError("Unknown strategy: " + name) {}
};

class NotFoundError : public ArenaError {
public:
    explicit NotFoundError(const std::string& what) : ArenaError(what) {}
};

class ConfigError : public ArenaError {
public:
    explicit ConfigError(const std::string& what) : ArenaError(what) {}
};

class TimeoutError : public ArenaError {
public:
    explicit TimeoutError(const std::string& what) : ArenaError(what) {}
};

class CancelledError : public ArenaError {
public:
    explicit CancelledError(const std::string& what) : ArenaError(what) {}
};

} // namespace arena
