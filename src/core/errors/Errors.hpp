#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vireo {

/**
 * @brief Root of every error raised by the engine itself.
 * Transport failures stay boost::system::error_code values and never reach this hierarchy.
 */
class VireoError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Unknown reverse name, or nothing registered for the requested path.
class ReverseNotFound : public VireoError {
   public:
    ReverseNotFound() : VireoError("Route not found") {}

    explicit ReverseNotFound(const std::string& name)
        : VireoError("Failed to build url for " + name + ". Check your route names."),
          name_(name) {}

    const std::string& name() const noexcept { return name_; }

   private:
    std::string name_;
};

/**
 * @brief The path exists, but not under the requested method.
 * Carries the methods that would have matched so the caller can render a 405.
 */
class MethodNotAllowed : public VireoError {
   public:
    explicit MethodNotAllowed(std::vector<std::string> allowed)
        : VireoError("Method not allowed"), allowed_(std::move(allowed)) {}

    const std::vector<std::string>& allowed() const noexcept { return allowed_; }

   private:
    std::vector<std::string> allowed_;
};

class DuplicatedBlueprint : public VireoError {
   public:
    DuplicatedBlueprint()
        : VireoError(
              "You cannot add a blueprint twice. Use more prefixes or different hierarchy.") {}
};

class ConflictingPrefixes : public VireoError {
   public:
    explicit ConflictingPrefixes(const std::string& prefix)
        : VireoError("Prefix \"" + prefix + "\" conflicts with an already existing prefix") {}
};

class RouteConfigurationError : public VireoError {
   public:
    using VireoError::VireoError;
};

class StreamAlreadyConsumed : public VireoError {
   public:
    StreamAlreadyConsumed() : VireoError("Stream already consumed.") {}
};

class ConfigError : public VireoError {
   public:
    using VireoError::VireoError;
};

}  // namespace vireo
