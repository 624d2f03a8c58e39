#include "action_base.hpp"
#include "action_registry.hpp"

#include "../file_ops.hpp"
#include "../json_codec.hpp"

namespace ipc::actions {

class ReadFileAction final : public ActionHandler {
public:
    const char* name() const override { return "readFile"; }

    nlohmann::json handle(ActionContext& ctx) override {
        auto guard = ctx.state.guard();
        return nlohmann::json{{"content", sandbox::read_file(guard, require_string(ctx, "path"))}};
    }
};

class WriteFileAction final : public ActionHandler {
public:
    const char* name() const override { return "writeFile"; }

    nlohmann::json handle(ActionContext& ctx) override {
        auto guard = ctx.state.guard();
        sandbox::write_file(guard, require_string(ctx, "path"), require_string(ctx, "content"));
        return success_payload();
    }
};

class ListDirectoryAction final : public ActionHandler {
public:
    const char* name() const override { return "listDirectory"; }

    nlohmann::json handle(ActionContext& ctx) override {
        auto guard = ctx.state.guard();
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : sandbox::list_directory(guard, require_string(ctx, "path"))) {
            nlohmann::json item = {
                {"name", entry.name},
                {"isDirectory", entry.is_directory},
            };
            if (entry.size) {
                item["size"] = *entry.size;
            }
            entries.push_back(std::move(item));
        }
        return nlohmann::json{{"entries", std::move(entries)}};
    }
};

class FileExistsAction final : public ActionHandler {
public:
    const char* name() const override { return "fileExists"; }

    // Never fails, whatever the parameters look like.
    nlohmann::json handle(ActionContext& ctx) override {
        bool exists = false;
        if (const nlohmann::json* path = ipc::codec::find_key(ctx.params, "path"); path && path->is_string()) {
            exists = sandbox::file_exists(ctx.state.guard(), path->get<std::string>());
        }
        return nlohmann::json{{"exists", exists}};
    }
};

class DeleteFileAction final : public ActionHandler {
public:
    const char* name() const override { return "deleteFile"; }

    nlohmann::json handle(ActionContext& ctx) override {
        auto guard = ctx.state.guard();
        sandbox::delete_file(guard, require_string(ctx, "path"));
        return success_payload();
    }
};

class CreateDirectoryAction final : public ActionHandler {
public:
    const char* name() const override { return "createDirectory"; }

    nlohmann::json handle(ActionContext& ctx) override {
        auto guard = ctx.state.guard();
        sandbox::create_directory(guard, require_string(ctx, "path"));
        return success_payload();
    }
};

class CopyFileAction final : public ActionHandler {
public:
    const char* name() const override { return "copyFile"; }

    nlohmann::json handle(ActionContext& ctx) override {
        auto guard = ctx.state.guard();
        sandbox::copy_file(guard, require_string(ctx, "src"), require_string(ctx, "dest"));
        return success_payload();
    }
};

void register_file_actions(ActionRegistry& registry) {
    registry.add(std::make_unique<ReadFileAction>());
    registry.add(std::make_unique<WriteFileAction>());
    registry.add(std::make_unique<ListDirectoryAction>());
    registry.add(std::make_unique<FileExistsAction>());
    registry.add(std::make_unique<DeleteFileAction>());
    registry.add(std::make_unique<CreateDirectoryAction>());
    registry.add(std::make_unique<CopyFileAction>());
}

} // namespace ipc::actions
