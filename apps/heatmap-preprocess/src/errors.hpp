#ifndef HEATMAP_PREPROCESS_ERRORS_HPP
#define HEATMAP_PREPROCESS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace heatmap {

// Fatal errors. Any of these aborts the run before an artifact is written.
class PipelineError : public std::runtime_error {
 public:
  explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

class MissingColumnError : public PipelineError {
 public:
  MissingColumnError(const std::string& field, const std::string& message)
      : PipelineError(message), field_(field) {}

  const std::string& field() const { return field_; }

 private:
  std::string field_;
};

class InvalidRangeError : public PipelineError {
 public:
  using PipelineError::PipelineError;
};

class InputError : public PipelineError {
 public:
  using PipelineError::PipelineError;
};

class OutputError : public PipelineError {
 public:
  using PipelineError::PipelineError;
};

} // namespace heatmap

#endif
