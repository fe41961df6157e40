#pragma once
#include <stdexcept>
#include <string>

#include "types.hpp"

// Fatal pipeline faults. Expected terminations (end of stream, user stop) are not errors
// and never travel through this hierarchy.
class PipelineError : public std::runtime_error {
public:
  PipelineError(FaultKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}
  FaultKind kind() const noexcept { return kind_; }

private:
  FaultKind kind_;
};

class SourceUnavailable : public PipelineError {
public:
  explicit SourceUnavailable(const std::string& what)
      : PipelineError(FaultKind::SourceUnavailable, what) {}
};

class InvalidFrame : public PipelineError {
public:
  explicit InvalidFrame(const std::string& what) : PipelineError(FaultKind::InvalidFrame, what) {}
};

class InferenceFailure : public PipelineError {
public:
  explicit InferenceFailure(const std::string& what)
      : PipelineError(FaultKind::InferenceFailure, what) {}
};

class SinkFailure : public PipelineError {
public:
  explicit SinkFailure(const std::string& what) : PipelineError(FaultKind::SinkFailure, what) {}
};
