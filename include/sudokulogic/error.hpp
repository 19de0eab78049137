/**
 * @file error.hpp
 * @brief sudokulogic error handling.
 *
 * Every engine operation reports failures with an Error code. Throwing
 * convenience helpers (grid parsing from strings) use the exception
 * hierarchy below, which is compiled out with SUDOKULOGIC_NO_EXCEPTIONS=1.
 */

#ifndef SUDOKULOGIC_ERROR_HPP
#define SUDOKULOGIC_ERROR_HPP

#include "config.hpp"

#if !SUDOKULOGIC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace sudokulogic {

/**
 * @brief Error codes returned by engine operations.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument (malformed grid text, digit value)
    Inconsistent = -2 ///< Candidate constraint violation: the grid cannot be completed
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Inconsistent:
        return "Candidate constraint violation";
    default:
        return "Unknown error";
    }
}

#if !SUDOKULOGIC_NO_EXCEPTIONS

/**
 * @brief Base exception for sudokulogic errors.
 */
class SudokuException : public std::runtime_error {
public:
    explicit SudokuException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public SudokuException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : SudokuException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for grids that cannot be completed.
 */
class InconsistentGridException : public SudokuException {
public:
    explicit InconsistentGridException(const std::string& message)
        : SudokuException(message, Error::Inconsistent) {}
};

/**
 * @brief Convert an error code into the matching exception.
 *
 * @param error Error code (Error::Ok is a no-op)
 * @param context Prefix for the exception message
 * @throws InvalidArgumentException for Error::InvalidArg
 * @throws InconsistentGridException for Error::Inconsistent
 */
inline void throw_on_error(Error error, const std::string& context) {
    switch (error) {
    case Error::Ok:
        return;
    case Error::InvalidArg:
        throw InvalidArgumentException(context + ": " + error_string(error));
    case Error::Inconsistent:
        throw InconsistentGridException(context + ": " + error_string(error));
    default:
        throw SudokuException(context + ": " + error_string(error), error);
    }
}

#endif // !SUDOKULOGIC_NO_EXCEPTIONS

} // namespace sudokulogic

#endif // SUDOKULOGIC_ERROR_HPP
