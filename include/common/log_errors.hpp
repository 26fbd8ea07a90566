#pragma once
#include <stdexcept>
#include <string>

// Log file could not be opened, written or closed.
class IoFailure : public std::runtime_error {
public:
  explicit IoFailure(const std::string& what) : std::runtime_error(what) {}
};

// Message template and arguments do not match. Nothing was enqueued.
class FormatFailure : public std::runtime_error {
public:
  explicit FormatFailure(const std::string& what) : std::runtime_error(what) {}
};

// Operation on a writer that is closed, or shutdown with no live instance.
class InvalidState : public std::logic_error {
public:
  explicit InvalidState(const std::string& what) : std::logic_error(what) {}
};
