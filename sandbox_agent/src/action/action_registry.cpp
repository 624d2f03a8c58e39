#include "action_registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace ipc::actions {

void ActionRegistry::add(std::unique_ptr<ActionHandler> handler) {
    if (!handler) {
        throw std::invalid_argument("Cannot register a null action handler");
    }
    std::string method = handler->name();
    auto [it, inserted] = handlers_.emplace(method, std::move(handler));
    if (!inserted) {
        throw std::invalid_argument("Method registered twice: " + method);
    }
}

ActionHandler* ActionRegistry::find(const std::string& method) const {
    auto it = handlers_.find(method);
    return it == handlers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ActionRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace ipc::actions
