#ifndef PUZZLE_ERRORS_HPP
#define PUZZLE_ERRORS_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

// Base class for every error raised by the search core
class PuzzleError : public std::runtime_error {
public:
    explicit PuzzleError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed board: wrong size, duplicate/missing labels, label out of [0,8]
class InvalidBoardError : public PuzzleError {
public:
    explicit InvalidBoardError(const std::string& what) : PuzzleError(what) {}
};

// The blank cannot slide in the requested direction
class IllegalMoveError : public PuzzleError {
public:
    explicit IllegalMoveError(const std::string& what) : PuzzleError(what) {}
};

// Frontier exhausted without reaching the goal
class UnsolvableError : public PuzzleError {
public:
    explicit UnsolvableError(const std::string& what) : PuzzleError(what) {}
};

// Search aborted because the step budget or the time limit ran out
class SearchBudgetExceededError : public PuzzleError {
public:
    SearchBudgetExceededError(const std::string& what, std::size_t expanded, std::chrono::milliseconds elapsed)
        : PuzzleError(what), nodes_expanded_(expanded), elapsed_(elapsed) {}

    std::size_t nodes_expanded() const { return nodes_expanded_; }
    std::chrono::milliseconds elapsed() const { return elapsed_; }

private:
    std::size_t nodes_expanded_;
    std::chrono::milliseconds elapsed_;
};

#endif // PUZZLE_ERRORS_HPP
