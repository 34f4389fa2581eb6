#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace h2site {

// Request-level rejections. Only these reach the caller as failures; every
// data-layer problem degrades instead (fallback data, skipped records).
class RequestError : public std::runtime_error {
public:
  RequestError(std::string kind, const std::string& msg)
      : std::runtime_error(msg), kind_(std::move(kind)) {}

  // "InvalidRegion" / "InvalidCriteria"
  const std::string& kind() const { return kind_; }

private:
  std::string kind_;
};

class InvalidRegionError final : public RequestError {
public:
  explicit InvalidRegionError(const std::string& msg) : RequestError("InvalidRegion", msg) {}
};

class InvalidCriteriaError final : public RequestError {
public:
  explicit InvalidCriteriaError(const std::string& msg) : RequestError("InvalidCriteria", msg) {}
};

// Bad engine configuration (file unreadable, non-monotone proximity curve...).
class ConfigError final : public std::runtime_error {
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace h2site
