#include "tool_registry.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcvox {

namespace {

json empty_object_schema() {
    return json{{"type", "OBJECT"}, {"properties", json::object()}};
}

} // namespace

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("[Tools] Refusing to register a null tool");
        return false;
    }

    const std::string name = tool->name();
    if (by_name_.count(name) > 0) {
        Logger::warn("[Tools] Duplicate tool name '" + name + "' ignored");
        return false;
    }

    by_name_.emplace(name, ordered_.size());
    ordered_.push_back(std::move(tool));
    LOG_TOOLS("Registered " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : ordered_[it->second];
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(ordered_.size());
    for (const auto& tool : ordered_) {
        names.push_back(tool->name());
    }
    return names;
}

std::string ToolRegistry::get_function_declarations_json() const {
    json declarations = json::array();

    for (const auto& tool : ordered_) {
        json parameters;
        try {
            parameters = json::parse(tool->parameter_schema());
        } catch (const json::exception& e) {
            Logger::error("[Tools] Bad parameter schema for '" + tool->name() + "': " + e.what());
            parameters = empty_object_schema();
        }
        if (!parameters.is_object()) {
            parameters = empty_object_schema();
        }

        declarations.push_back({
            {"name", tool->name()},
            {"description", tool->description()},
            {"parameters", parameters}
        });
    }

    return declarations.dump();
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return by_name_.count(name) > 0;
}

void ToolRegistry::clear() {
    ordered_.clear();
    by_name_.clear();
}

} // namespace calcvox
