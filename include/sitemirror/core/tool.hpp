#ifndef SITEMIRROR_CORE_TOOL_HPP
#define SITEMIRROR_CORE_TOOL_HPP

#include "plugin.hpp"
#include "json.hpp"
#include <string>
#include <vector>

namespace sitemirror {

struct AgentTool;

// Tool result structure
struct ToolResult {
    bool success;
    Json data;
    std::string error;
    
    ToolResult() : success(false) {}
    
    static ToolResult ok(const Json& result) {
        ToolResult r;
        r.success = true;
        r.data = result;
        return r;
    }
    
    static ToolResult fail(const std::string& err) {
        ToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// A plugin offering named actions to the agent dispatcher
class ToolProvider : public Plugin {
public:
    virtual ~ToolProvider() {}
    
    virtual const char* tool_id() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;
    
    // Agent-facing tools. The default wraps every action as "<tool_id>_<action>"
    // taking a free-form params object.
    virtual std::vector<AgentTool> get_agent_tools() const;
    
    bool supports(const std::string& action) const {
        std::vector<std::string> acts = actions();
        for (size_t i = 0; i < acts.size(); ++i) {
            if (acts[i] == action) return true;
        }
        return false;
    }
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_TOOL_HPP
