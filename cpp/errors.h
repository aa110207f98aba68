#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// The word list (or a serialized automaton) could not be turned into a
// Gaddag. No partial automaton is ever returned.
class ConstructionError : public std::runtime_error {
 public:
  explicit ConstructionError(const std::string& what) : std::runtime_error(what) {}
};

// A move does not fit the current board or the rack it was generated from.
class IllegalMoveError : public std::runtime_error {
 public:
  explicit IllegalMoveError(const std::string& what) : std::runtime_error(what) {}
};

// Move generation was stopped by the caller. Moves found so far are dropped.
class CancellationError : public std::runtime_error {
 public:
  explicit CancellationError(const std::string& what) : std::runtime_error(what) {}
};

#endif  // ERRORS_H
