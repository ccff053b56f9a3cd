#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace fabplan::util {

/*
  Central error types.

  Per-step errors (NoCompatibleTool) are absorbed by the orchestrator and
  turned into diagnostics. Everything else aborts the planning cycle.
*/

class NoCompatibleTool : public std::runtime_error {
 public:
  explicit NoCompatibleTool(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidDescriptor : public std::runtime_error {
 public:
  explicit InvalidDescriptor(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingLayoutReference : public std::runtime_error {
 public:
  explicit MissingLayoutReference(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MaskExtractionFailed : public std::runtime_error {
 public:
  explicit MaskExtractionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Knowledge store or mask service could not be reached. Callers should retry
// later rather than replan.
class CollaboratorUnavailable : public std::runtime_error {
 public:
  CollaboratorUnavailable(std::string collaborator, const std::string& msg)
      : std::runtime_error(collaborator + ": " + msg), collaborator_(std::move(collaborator)) {
  }

  const std::string& Collaborator() const {
    return collaborator_;
  }

 private:
  std::string collaborator_;
};

class FlowFailed : public std::runtime_error {
 public:
  FlowFailed(std::uint32_t order_index, std::string state, const std::string& cause)
      : std::runtime_error("planning failed at change " + std::to_string(order_index) + " (" + state + "): " + cause),
        order_index_(order_index),
        state_(std::move(state)),
        cause_(cause) {
  }

  std::uint32_t OrderIndex() const {
    return order_index_;
  }

  const std::string& State() const {
    return state_;
  }

  const std::string& Cause() const {
    return cause_;
  }

 private:
  std::uint32_t order_index_;
  std::string   state_;
  std::string   cause_;
};

} // namespace fabplan::util
