#pragma once

#include "tool.h"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

namespace calcvox {

/**
 * @brief Tools offered to the agent, in declaration order
 *
 * Lookup is by wire function name. The declaration list sent in the session
 * setup follows registration order.
 */
class ToolRegistry {
public:
    /**
     * @brief Add a tool
     * @return false for a null tool or a name that is already taken
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /// @return The tool, or nullptr for an unknown name
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /// Names in registration order
    std::vector<std::string> get_tool_names() const;

    /**
     * @brief Function declarations for the session setup
     * @return JSON array of {name, description, parameters}
     */
    std::string get_function_declarations_json() const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return ordered_.size(); }

    void clear();

private:
    std::vector<std::shared_ptr<Tool>> ordered_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace calcvox
