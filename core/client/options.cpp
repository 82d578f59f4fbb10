#include "options.hpp"

namespace mlld {
namespace client {

namespace {

// Fields shared by process and execute
template <typename Options>
void add_common_params(nlohmann::json &params, const Options &opts) {
    if (opts.state) {
        params["state"] = *opts.state;
    }
    if (opts.dynamic_modules) {
        nlohmann::json modules = nlohmann::json::object();
        for (const auto &[name, module] : *opts.dynamic_modules) {
            modules[name] = module;
        }
        params["dynamicModules"] = std::move(modules);
    }
    if (opts.dynamic_module_source) {
        params["dynamicModuleSource"] = *opts.dynamic_module_source;
    }
    if (opts.mode) {
        params["mode"] = *opts.mode;
    }
    if (opts.allow_absolute_paths) {
        params["allowAbsolutePaths"] = *opts.allow_absolute_paths;
    }
}

}  // namespace

nlohmann::json build_process_params(const std::string &script, const ProcessOptions &opts) {
    nlohmann::json params = {{"script", script}};
    if (opts.file_path) {
        params["filePath"] = *opts.file_path;
    }
    if (opts.payload) {
        params["payload"] = *opts.payload;
    }
    add_common_params(params, opts);
    return params;
}

nlohmann::json build_execute_params(const std::string &filepath, const std::optional<nlohmann::json> &payload,
                                    const ExecuteOptions &opts) {
    nlohmann::json params = {{"filepath", filepath}};
    if (payload) {
        params["payload"] = *payload;
    }
    add_common_params(params, opts);
    return params;
}

}  // namespace client
}  // namespace mlld
