#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace acp::saga {

// What a step tells the executor after it ran
enum class Flow {
  Continue,  // run the next step
  Finish     // the saga is done, skip the remaining steps
};

// One unit of work. Steps share state through whatever their closures capture.
struct Step {
  std::string name;
  std::function<Flow()> run;

  // Undo for a completed run; empty for read-only steps
  std::function<void()> compensate;

  bool read_only() const {
    return !compensate;
  }
};

Step read_only(std::string name, std::function<Flow()> run);

Step compensating(std::string name, std::function<Flow()> run, std::function<void()> compensate);

struct Outcome {
  bool success = false;
  bool finished_early = false;
  std::string error;
  std::string failed_step;
  size_t steps_completed = 0;
  size_t steps_compensated = 0;
};

// Runs a flat list of steps in order. When a step throws, the compensations of
// every completed step run in reverse order before the failure is reported. A
// compensation that throws is logged and the unwind carries on.
class Executor {
 public:
  explicit Executor(std::string saga_name);

  Outcome run(const std::vector<Step>& steps) const;

 private:
  size_t unwind(const std::vector<const Step*>& completed) const;

  std::string name_;
};

// Value of a saga, or the error and the step that raised it
template <typename T>
struct SagaResult {
  std::optional<T> value;
  std::optional<std::string> error;
  std::optional<std::string> failed_step;

  bool ok() const {
    return value.has_value();
  }

  static SagaResult success(T val) {
    return SagaResult{std::move(val), std::nullopt, std::nullopt};
  }

  static SagaResult failure(std::string err, std::string step) {
    return SagaResult{std::nullopt, std::move(err), std::move(step)};
  }
};

}  // namespace acp::saga
