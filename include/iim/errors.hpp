#pragma once
#include <stdexcept>
#include <string>

namespace iim {

struct Error : std::runtime_error {
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

struct InputShapeError : Error {
  explicit InputShapeError(const std::string& msg) : Error("input shape: " + msg) {}
};

struct UnknownSectorError : Error {
  explicit UnknownSectorError(const std::string& name)
    : Error("unknown sector: " + name), sector(name) {}

  std::string sector;
};

struct InvalidPerturbationError : Error {
  explicit InvalidPerturbationError(const std::string& msg) : Error("invalid perturbation: " + msg) {}
};

struct SingularOperatorError : Error {
  explicit SingularOperatorError(const std::string& msg) : Error("singular interdependency operator: " + msg) {}
};

struct InvalidOrderError : Error {
  explicit InvalidOrderError(int order)
    : Error("interdependency order must be >= 0, got " + std::to_string(order)) {}
};

struct ConfigError : Error {
  explicit ConfigError(const std::string& msg) : Error("config: " + msg) {}
};

struct IoError : Error {
  explicit IoError(const std::string& msg) : Error(msg) {}
};

}
