// ivl/basic/internal_error.hpp - Invariant violations inside the front end
//
// Errors in user programs go to a DiagnosticBag. InternalError is thrown
// only when the front end itself reaches a state that a correct
// implementation can never reach (an unsatisfiable bit-vector constraint
// after a successful occurs check, type checking an unresolved program,
// a leftover proxy after a clean type check, ...).
//
#pragma once

#include <stdexcept>
#include <string>

namespace ivl
{

class InternalError : public std::logic_error
{
public:
  explicit InternalError(const std::string & what) : std::logic_error(what) {}
  explicit InternalError(const char * what) : std::logic_error(what) {}
};

}  // namespace ivl
