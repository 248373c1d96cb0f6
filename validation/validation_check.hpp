#pragma once

#include "request.hpp"

#include <functional>
#include <memory>
#include <string>

namespace pqgate {

// A named, weighted legitimacy check. execute() returns a score in [0, 1]
// (boolean checks return 0 or 1) and may be called concurrently from
// several worker threads.
class ValidationCheck {
public:
    virtual ~ValidationCheck() = default;

    virtual const std::string &name() const = 0;
    virtual double weight() const = 0;
    virtual double execute(const AuthenticationRequest &request) = 0;
};

// Adapter for checks expressed as a callable.
class FunctionCheck : public ValidationCheck {
public:
    using Fn = std::function<double(const AuthenticationRequest &)>;

    FunctionCheck(std::string name, double weight, Fn fn)
        : name_(std::move(name)), weight_(weight), fn_(std::move(fn)) {}

    const std::string &name() const override { return name_; }
    double weight() const override { return weight_; }
    double execute(const AuthenticationRequest &request) override { return fn_(request); }

private:
    std::string name_;
    double weight_;
    Fn fn_;
};

inline std::shared_ptr<ValidationCheck> make_check(std::string name, double weight,
                                                   FunctionCheck::Fn fn) {
    return std::make_shared<FunctionCheck>(std::move(name), weight, std::move(fn));
}

} // namespace pqgate
