#pragma once

#include "labrun/config/run_config.hpp"
#include "labrun/core/error.hpp"
#include "labrun/engine/engine.hpp"
#include "labrun/runner/instance.hpp"

namespace labrun {

class ResultCollector {
public:
  ResultCollector(const RunConfig& config, IEngine& engine);

  // The instance must already be out of the running set (exited, or stopped
  // by the enforcer). `reason` is recorded as given.
  [[nodiscard]] auto collect(Instance instance, ExitReason reason)
      -> Result<FinishedInstance>;

private:
  const RunConfig& config_;
  IEngine& engine_;
};

}  // namespace labrun
