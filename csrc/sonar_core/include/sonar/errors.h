#pragma once

#include <stdexcept>
#include <string>

namespace sonar {

// Input violates a mathematical precondition of the model
// (negative speed, non-positive range, zero onset speed, ...).
class DomainError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// Requested profile name is not in the registry.
class NotFoundError : public std::out_of_range {
public:
    explicit NotFoundError(const std::string& name)
        : std::out_of_range("unknown submarine profile: '" + name + "'"),
          name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace sonar
