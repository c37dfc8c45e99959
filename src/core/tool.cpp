#include <sitemirror/core/tool.hpp>
#include <sitemirror/core/dispatcher.hpp>

namespace sitemirror {

std::vector<AgentTool> ToolProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    
    const std::vector<std::string> action_list = actions();
    const std::string id = tool_id();
    const std::string desc = description();
    
    for (size_t i = 0; i < action_list.size(); ++i) {
        const std::string action = action_list[i];
        ToolProvider* self = const_cast<ToolProvider*>(this);

        AgentTool tool;
        tool.name = id + "_" + action;
        tool.description = desc + " - " + action + " action";
        tool.params.push_back(ToolParamSchema("params", "object", "Action parameters", false));
        tool.execute = [self, action](const Json& params) -> AgentToolResult {
            Json inner = params.contains("params") ? params["params"] : params;
            ToolResult result = self->execute(action, inner);
            if (!result.success) {
                return AgentToolResult::fail(result.error);
            }
            return AgentToolResult::ok(result.data.dump(2));
        };
        tools.push_back(tool);
    }
    
    return tools;
}

} // namespace sitemirror
