
#ifndef INCLUDE_ERRORS_H_
#define INCLUDE_ERRORS_H_

#include <stdexcept>
#include <string>

namespace semichart {

// two splits of one chart cell satisfy the constraint set of one batch element
class AmbiguousConstraint: public std::runtime_error
{
public:
    AmbiguousConstraint(const std::string& message)
    : std::runtime_error(message) {}
};

class NoEnclosingConstituent: public std::runtime_error
{
public:
    NoEnclosingConstituent(const std::string& message)
    : std::runtime_error(message) {}
};

class MalformedTree: public std::runtime_error
{
public:
    MalformedTree(const std::string& message)
    : std::runtime_error(message) {}
};

class DimensionMismatch: public std::runtime_error
{
public:
    DimensionMismatch(const std::string& message)
    : std::runtime_error(message) {}
};

// a root query reached a cell that no forced split decided
class UnresolvedRoot: public std::runtime_error
{
public:
    UnresolvedRoot(const std::string& message)
    : std::runtime_error(message) {}
};

} // namespace semichart

#endif
