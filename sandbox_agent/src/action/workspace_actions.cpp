#include "action_base.hpp"
#include "action_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace ipc::actions {

class PingAction final : public ActionHandler {
public:
    const char* name() const override { return "ping"; }

    nlohmann::json handle(ActionContext&) override {
        return nlohmann::json{{"pong", true}};
    }
};

class SetWorkspaceAction final : public ActionHandler {
public:
    const char* name() const override { return "setWorkspace"; }

    nlohmann::json handle(ActionContext& ctx) override {
        std::string path = require_string(ctx, "path");

        // Older hosts name the host-side path after their platform.
        std::string host_path;
        for (const char* key : {"altPath", "macPath", "windowsPath"}) {
            if (auto value = optional_string(ctx, key)) {
                host_path = *value;
                break;
            }
        }

        ctx.state.set_workspace(path, host_path);
        return success_payload();
    }
};

class ShutdownAction final : public ActionHandler {
public:
    const char* name() const override { return "shutdown"; }

    nlohmann::json handle(ActionContext& ctx) override {
        ctx.state.begin_shutdown();
        ctx.close_after_send = true;
        LOG4CPLUS_INFO(action_logger(), "Shutdown requested");
        return success_payload();
    }
};

void register_workspace_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<PingAction>());
    registry.add(std::make_unique<SetWorkspaceAction>());
    registry.add(std::make_unique<ShutdownAction>());
}

} // namespace ipc::actions
