#include "saga/saga.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace acp::saga {

Step read_only(std::string name, std::function<Flow()> run) {
  return Step{std::move(name), std::move(run), nullptr};
}

Step compensating(std::string name, std::function<Flow()> run, std::function<void()> compensate) {
  return Step{std::move(name), std::move(run), std::move(compensate)};
}

Executor::Executor(std::string saga_name) : name_(std::move(saga_name)) {}

Outcome Executor::run(const std::vector<Step>& steps) const {
  Outcome outcome;
  std::vector<const Step*> completed;

  spdlog::info("[Saga] {}: starting ({} steps)", name_, steps.size());

  for (const auto& step : steps) {
    spdlog::debug("[Saga] {}: executing {}step {}", name_, step.read_only() ? "read-only " : "", step.name);

    Flow flow = Flow::Continue;
    try {
      flow = step.run ? step.run() : Flow::Continue;
    } catch (const std::exception& e) {
      spdlog::error("[Saga] {}: step {} failed, rolling back: {}", name_, step.name, e.what());
      outcome.error = e.what();
      outcome.failed_step = step.name;
      outcome.steps_compensated = unwind(completed);
      return outcome;
    } catch (...) {
      spdlog::error("[Saga] {}: step {} failed, rolling back: unknown error", name_, step.name);
      outcome.error = "unknown error";
      outcome.failed_step = step.name;
      outcome.steps_compensated = unwind(completed);
      return outcome;
    }

    ++outcome.steps_completed;
    if (!step.read_only()) {
      completed.push_back(&step);
    }
    spdlog::debug("[Saga] {}: step completed: {}", name_, step.name);

    if (flow == Flow::Finish) {
      outcome.finished_early = true;
      break;
    }
  }

  outcome.success = true;
  spdlog::info("[Saga] {}: completed ({} steps, {} compensable)", name_, outcome.steps_completed, completed.size());
  return outcome;
}

size_t Executor::unwind(const std::vector<const Step*>& completed) const {
  spdlog::info("[Saga] {}: rolling back {} step(s)", name_, completed.size());

  size_t compensated = 0;
  for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
    const Step* step = *it;
    try {
      spdlog::debug("[Saga] {}: rolling back step {}", name_, step->name);
      step->compensate();
      ++compensated;
    } catch (const std::exception& e) {
      spdlog::error("[Saga] {}: failed to roll back step {}: {}", name_, step->name, e.what());
    } catch (...) {
      spdlog::error("[Saga] {}: failed to roll back step {}: unknown error", name_, step->name);
    }
  }

  spdlog::info("[Saga] {}: rollback completed ({}/{} steps)", name_, compensated, completed.size());
  return compensated;
}

}  // namespace acp::saga
