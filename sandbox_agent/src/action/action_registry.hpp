#pragma once

#include "action_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ipc::actions {

/// Method name -> handler table. Filled once at startup, read-only afterwards.
class ActionRegistry {
public:
    /// @throws std::invalid_argument for a null handler or an already registered method
    void add(std::unique_ptr<ActionHandler> handler);

    ActionHandler* find(const std::string& method) const;
    size_t size() const { return handlers_.size(); }

    /// Registered method names in sorted order.
    std::vector<std::string> methods() const;

private:
    std::unordered_map<std::string, std::unique_ptr<ActionHandler>> handlers_;
};

void register_workspace_actions(ActionRegistry& registry);
void register_file_actions(ActionRegistry& registry);
void register_exec_actions(ActionRegistry& registry);

} // namespace ipc::actions
