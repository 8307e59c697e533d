#pragma once
#include <stdexcept>
#include <string>

namespace seasonfit {

/* Bad sizes, unknown model names, malformed parameter vectors, …
 * Always thrown before any numeric work is done.                       */
class InputValidationError : public std::invalid_argument {
public:
    explicit InputValidationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/* The linear solve inside the optimizer reported something we do not
 * know how to interpret.  Never mapped onto a FitStatus.               */
class UnknownSolverStatus : public std::runtime_error {
public:
    UnknownSolverStatus(const std::string& where, int code)
        : std::runtime_error(where + ": unknown solver status " +
                             std::to_string(code)),
          code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

} // namespace seasonfit
