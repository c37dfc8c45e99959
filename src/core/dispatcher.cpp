#include <sitemirror/core/dispatcher.hpp>
#include <sitemirror/core/tool.hpp>
#include <sitemirror/core/logger.hpp>
#include <sstream>
#include <cctype>

namespace sitemirror {

namespace {

struct JsonParseResult {
    bool ok;
    std::string used;
    std::string error;
    Json value;
};

std::string trim_whitespace(const std::string& input) {
    size_t start = input.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

std::string remove_trailing_commas(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == ',') {
            size_t j = i + 1;
            while (j < input.size() && isspace(static_cast<unsigned char>(input[j]))) {
                ++j;
            }
            if (j < input.size() && (input[j] == '}' || input[j] == ']')) {
                continue;  // skip trailing comma
            }
        }
        out.push_back(input[i]);
    }
    return out;
}

JsonParseResult try_parse_json(const std::string& raw) {
    JsonParseResult res;
    res.ok = false;
    res.used = raw;

    try {
        res.value = Json::parse(raw);
        res.ok = true;
        return res;
    } catch (const Json::parse_error& e) {
        res.error = e.what();
    }

    // Recovery: strip code fences and take the outermost object or array
    std::string cleaned = raw;
    size_t fence_pos = std::string::npos;
    while ((fence_pos = cleaned.find("```")) != std::string::npos) {
        cleaned.erase(fence_pos, 3);
    }
    cleaned = trim_whitespace(cleaned);

    const char* pairs[2][2] = { { "{", "}" }, { "[", "]" } };
    for (size_t p = 0; p < 2; ++p) {
        size_t first = cleaned.find(pairs[p][0]);
        size_t last = cleaned.rfind(pairs[p][1]);
        if (first == std::string::npos || last == std::string::npos || last <= first) {
            continue;
        }
        std::string sanitized = remove_trailing_commas(cleaned.substr(first, last - first + 1));
        try {
            res.value = Json::parse(sanitized);
            res.ok = true;
            res.used = sanitized;
            res.error.clear();
            return res;
        } catch (const Json::parse_error& e) {
            res.error = e.what();
            res.used = sanitized;
        }
    }

    return res;
}

} // namespace

DispatcherConfig DispatcherConfig::from_config(const Config& cfg) {
    DispatcherConfig dc;
    int64_t max_size = cfg.get_int("agent.max_tool_result_size",
                                   static_cast<int64_t>(dc.max_tool_result_size));
    if (max_size > 0) dc.max_tool_result_size = static_cast<size_t>(max_size);
    return dc;
}

ToolDispatcher::ToolDispatcher(const DispatcherConfig& config) : config_(config) {}

void ToolDispatcher::register_tool(const AgentTool& tool) {
    LOG_DEBUG("[Dispatcher] Registering tool: %s", tool.name.c_str());
    tools_[tool.name] = tool;
}

void ToolDispatcher::register_tool(const std::string& name, const std::string& desc, ToolExecutor executor) {
    AgentTool tool(name, desc, executor);
    register_tool(tool);
}

void ToolDispatcher::register_provider(const ToolProvider& provider) {
    std::vector<AgentTool> provided = provider.get_agent_tools();
    for (size_t i = 0; i < provided.size(); ++i) {
        register_tool(provided[i]);
    }
    LOG_INFO("[Dispatcher] Registered %zu tools from %s", provided.size(), provider.name());
}

std::string ToolDispatcher::build_tools_prompt() const {
    if (tools_.empty()) {
        return "";
    }
    
    std::ostringstream oss;
    oss << "## Available Tools\n\n";
    oss << "Use this exact format to call a tool:\n\n";
    oss << "<tool_call name=\"TOOLNAME\">\n";
    oss << "{\"param\": \"value\"}\n";
    oss << "</tool_call>\n\n";
    
    if (tools_.count("cloneWebsiteToZip")) {
        oss << "Clone a website example:\n";
        oss << "<tool_call name=\"cloneWebsiteToZip\">\n";
        oss << "{\"url\": \"https://example.com\"}\n";
        oss << "</tool_call>\n\n";
    }
    
    oss << "CRITICAL: The name MUST be one of the tool names below.\n";
    oss << "CRITICAL: JSON params must be valid - no extra escaping needed.\n\n";
    oss << "### Tools:\n\n";
    
    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin();
         it != tools_.end(); ++it) {
        const AgentTool& tool = it->second;
        oss << "**" << tool.name << "**: " << tool.description << "\n";
        
        if (!tool.params.empty()) {
            oss << "  Parameters:\n";
            for (size_t i = 0; i < tool.params.size(); ++i) {
                const ToolParamSchema& param = tool.params[i];
                oss << "  - `" << param.name << "` (" << param.type;
                if (param.required) oss << ", required";
                oss << "): " << param.description << "\n";
            }
        }
        oss << "\n";
    }
    
    return oss.str();
}

std::vector<ParsedToolCall> ToolDispatcher::parse_tool_calls(const std::string& response) const {
    std::vector<ParsedToolCall> calls;
    
    size_t pos = 0;
    while (pos < response.size()) {
        size_t start = response.find("<tool_call", pos);
        if (start == std::string::npos) break;
        
        size_t name_start = response.find("name=\"", start);
        if (name_start == std::string::npos || name_start > start + 50) {
            LOG_DEBUG("[Dispatcher] No name attribute near <tool_call at %zu, skipping", start);
            pos = start + 10;
            continue;
        }
        name_start += 6;  // Skip past name="
        
        size_t name_end = response.find("\"", name_start);
        if (name_end == std::string::npos) {
            pos = start + 10;
            continue;
        }
        
        std::string tool_name = response.substr(name_start, name_end - name_start);
        
        size_t tag_end = response.find(">", name_end);
        if (tag_end == std::string::npos) {
            pos = start + 10;
            continue;
        }
        tag_end++;
        
        size_t close_tag = response.find("</tool_call>", tag_end);
        if (close_tag == std::string::npos) {
            LOG_DEBUG("[Dispatcher] Unterminated tool call '%s', skipping", tool_name.c_str());
            pos = tag_end;
            continue;
        }
        std::string content = trim_whitespace(response.substr(tag_end, close_tag - tag_end));
        
        ParsedToolCall call;
        call.tool_name = tool_name;
        call.start_pos = start;
        call.end_pos = close_tag + 12;  // Length of </tool_call>
        call.raw_content = content;
        
        if (content.empty()) {
            call.params = Json::object();
            call.valid = true;
        } else {
            JsonParseResult parsed = try_parse_json(content);
            if (parsed.ok) {
                call.params = parsed.value;
                call.valid = true;
                if (parsed.used != content) {
                    LOG_DEBUG("[Dispatcher] Recovered JSON for '%s': %s",
                              tool_name.c_str(), parsed.used.c_str());
                }
            } else {
                // Left for execute_tool, which may bind the raw text positionally
                call.valid = false;
                call.parse_error = std::string("JSON parse error: ") + parsed.error;
                LOG_DEBUG("[Dispatcher] Tool call body for '%s' is not JSON: %s",
                          tool_name.c_str(), content.c_str());
            }
        }
        
        calls.push_back(call);
        pos = call.end_pos;
        
        LOG_DEBUG("[Dispatcher] Parsed tool call: %s (valid=%s)",
                  tool_name.c_str(), call.valid ? "yes" : "no");
    }
    
    return calls;
}

bool ToolDispatcher::bind_params(const AgentTool& tool, const Json& input, Json& out, std::string& error) {
    if (input.is_object()) {
        out = input;
        return true;
    }

    Json values = Json::array();
    if (input.is_array()) {
        values = input;
    } else if (input.is_null()) {
        out = Json::object();
        return true;
    } else {
        values.push_back(input);
    }

    if (values.size() > tool.params.size()) {
        std::ostringstream oss;
        oss << tool.name << " takes " << tool.params.size() << " argument(s), got " << values.size();
        error = oss.str();
        return false;
    }

    out = Json::object();
    for (size_t i = 0; i < values.size(); ++i) {
        out[tool.params[i].name] = values[i];
    }
    return true;
}

AgentToolResult ToolDispatcher::execute_tool(const ParsedToolCall& call) {
    std::map<std::string, AgentTool>::iterator it = tools_.find(call.tool_name);
    if (it == tools_.end()) {
        std::string error = "Unknown tool: " + call.tool_name + "\nAvailable tools: ";
        for (std::map<std::string, AgentTool>::const_iterator t = tools_.begin(); t != tools_.end(); ++t) {
            if (t != tools_.begin()) error += ", ";
            error += t->first;
        }
        return AgentToolResult::fail(error);
    }
    const AgentTool& tool = it->second;

    // Unparseable body: treat the raw text as a single positional argument
    Json input = call.valid ? call.params : Json(call.raw_content);
    if (!call.valid && tool.params.empty()) {
        return AgentToolResult::fail("Invalid tool call: " + call.parse_error);
    }

    Json params;
    std::string bind_error;
    if (!bind_params(tool, input, params, bind_error)) {
        return AgentToolResult::fail("Invalid tool call: " + bind_error);
    }

    for (size_t i = 0; i < tool.params.size(); ++i) {
        if (tool.params[i].required && !params.contains(tool.params[i].name)) {
            return AgentToolResult::fail("Missing required parameter: " + tool.params[i].name);
        }
    }
    
    LOG_INFO("[Dispatcher] Executing tool: %s", call.tool_name.c_str());
    LOG_DEBUG("[Dispatcher] Tool params: %s", params.dump().c_str());
    
    try {
        AgentToolResult result = tool.execute(params);
        LOG_DEBUG("[Dispatcher] Tool %s result: success=%s, output_len=%zu",
                  call.tool_name.c_str(), result.success ? "yes" : "no",
                  result.output.size());
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("[Dispatcher] Tool %s threw exception: %s", call.tool_name.c_str(), e.what());
        return AgentToolResult::fail(std::string("Tool exception: ") + e.what());
    }
}

std::string ToolDispatcher::format_tool_result(const std::string& tool_name,
                                               const AgentToolResult& result) const {
    std::ostringstream oss;
    oss << "<tool_result name=\"" << tool_name << "\" success=\""
        << (result.success ? "true" : "false") << "\">\n";
    
    if (result.success) {
        if (result.output.size() > config_.max_tool_result_size) {
            oss << result.output.substr(0, config_.max_tool_result_size);
            oss << "\n... [truncated " << (result.output.size() - config_.max_tool_result_size)
                << " characters] ...";
        } else {
            oss << result.output;
        }
    } else {
        oss << "Error: " << result.error;
    }
    
    oss << "\n</tool_result>";
    return oss.str();
}

std::string ToolDispatcher::dispatch(const std::string& response) {
    std::vector<ParsedToolCall> calls = parse_tool_calls(response);
    std::string observations;
    for (size_t i = 0; i < calls.size(); ++i) {
        AgentToolResult result = execute_tool(calls[i]);
        if (!observations.empty()) observations += "\n";
        observations += format_tool_result(calls[i].tool_name, result);
    }
    return observations;
}

} // namespace sitemirror
