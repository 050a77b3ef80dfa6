#pragma once
#include <stdexcept>
#include <string>

// bad node count, chunk count, policy name or command line value
class ConfigurationError : public std::invalid_argument
{
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

// a state that could not have been produced by NetworkState::create + step()
class InvalidStateError : public std::logic_error
{
public:
    explicit InvalidStateError(const std::string& what)
        : std::logic_error(what) {}
};
