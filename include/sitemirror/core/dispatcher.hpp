/*
 * sitemirror - Tool dispatch for agent conversations
 *
 * Tool Call Format:
 *   <tool_call name="tool_name">
 *     {"param1": "value1"}
 *   </tool_call>
 *
 * The body may also be a bare string or a JSON array; those bind to the
 * tool's declared parameters in order:
 *   <tool_call name="cloneWebsiteToZip">["https://example.com"]</tool_call>
 *
 * Tool Result Format (the observation fed back to the conversation):
 *   <tool_result name="tool_name" success="true">
 *     ... result content ...
 *   </tool_result>
 */
#ifndef SITEMIRROR_CORE_DISPATCHER_HPP
#define SITEMIRROR_CORE_DISPATCHER_HPP

#include "json.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <map>
#include <functional>

namespace sitemirror {

class ToolProvider;

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;
    
    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

struct AgentToolResult {
    bool success;
    std::string output;     // Text shown to the model
    std::string error;
    
    AgentToolResult() : success(false) {}
    
    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }
    
    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

typedef std::function<AgentToolResult(const Json& params)> ToolExecutor;

struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;
    
    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
};

struct ParsedToolCall {
    std::string tool_name;
    Json params;
    std::string raw_content;  // Raw content between <tool_call> tags
    size_t start_pos;
    size_t end_pos;
    bool valid;
    std::string parse_error;
    
    ParsedToolCall() : start_pos(0), end_pos(0), valid(false) {}
};

struct DispatcherConfig {
    size_t max_tool_result_size;    // Longer outputs are cut (default: 15000)
    
    DispatcherConfig() : max_tool_result_size(15000) {}
    
    static DispatcherConfig from_config(const Config& cfg);
};

class ToolDispatcher {
public:
    explicit ToolDispatcher(const DispatcherConfig& config = DispatcherConfig());
    
    void register_tool(const AgentTool& tool);
    void register_tool(const std::string& name, const std::string& desc, ToolExecutor executor);
    
    // Register every agent tool of a provider
    void register_provider(const ToolProvider& provider);
    
    const std::map<std::string, AgentTool>& tools() const { return tools_; }
    
    // Tools section for the system prompt
    std::string build_tools_prompt() const;
    
    std::vector<ParsedToolCall> parse_tool_calls(const std::string& response) const;
    
    AgentToolResult execute_tool(const ParsedToolCall& call);
    
    std::string format_tool_result(const std::string& tool_name, const AgentToolResult& result) const;
    
    // Execute every tool call in a model response and return the
    // concatenated <tool_result> blocks (empty if there were none)
    std::string dispatch(const std::string& response);

    // Map a string or array input onto the tool's parameter names. Objects
    // pass through unchanged. Returns false when nothing can be bound.
    static bool bind_params(const AgentTool& tool, const Json& input, Json& out, std::string& error);
    
    const DispatcherConfig& config() const { return config_; }

private:
    std::map<std::string, AgentTool> tools_;
    DispatcherConfig config_;
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_DISPATCHER_HPP
