#include "judge/strategy_selector.hpp"
#include <glog/logging.h>
#include "sandbox/container_runner.hpp"
#include "sandbox/native_runner.hpp"

namespace codejudge {
using namespace std;

strategy_selector::strategy_selector(unique_ptr<sandbox_runner> native, unique_ptr<sandbox_runner> sandboxed)
    : native(move(native)), sandboxed(move(sandboxed)) {}

strategy_selector::strategy_selector(const engine_config &config)
    : strategy_selector(make_unique<native_runner>(config), make_unique<container_runner>(config)) {}

sandbox_runner &strategy_selector::select(const language_adapter &adapter, const runnable_artifact &artifact) const {
    if (adapter.strategy() == runner_strategy::NATIVE) {
        if (native->is_available(artifact))
            return *native;
        LOG(WARNING) << "Toolchain " << artifact.toolchain << " for " << language_name(adapter.lang())
                     << " is not available on this host, falling back to sandboxed execution";
    }
    return *sandboxed;
}

}  // namespace codejudge
