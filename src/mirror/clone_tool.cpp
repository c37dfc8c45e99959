#include <sitemirror/mirror/clone_tool.hpp>
#include <sitemirror/core/errors.hpp>
#include <sitemirror/core/logger.hpp>

namespace sitemirror {

const char* const CloneTool::AGENT_TOOL_NAME = "cloneWebsiteToZip";

CloneTool::CloneTool(Cloner& cloner) : cloner_(cloner) {}

const char* CloneTool::name() const { return "clone"; }
const char* CloneTool::version() const { return "1.0.0"; }
const char* CloneTool::description() const {
    return "Mirror a web page with its assets into a zip archive";
}

const char* CloneTool::tool_id() const { return "clone"; }

std::vector<std::string> CloneTool::actions() const {
    std::vector<std::string> result;
    result.push_back("clone");
    return result;
}

std::vector<AgentTool> CloneTool::get_agent_tools() const {
    std::vector<AgentTool> tools;
    CloneTool* self = const_cast<CloneTool*>(this);
    
    AgentTool tool;
    tool.name = AGENT_TOOL_NAME;
    tool.description = "Clone a website (HTML, CSS, JS, images, fonts) into a downloadable zip archive. "
                       "Pages that need JavaScript are rendered in a headless browser.";
    tool.params.push_back(ToolParamSchema("url", "string",
                                          "Page to clone (must start with http:// or https://)", true));
    tool.execute = [self](const Json& params) -> AgentToolResult {
        ToolResult result = self->execute("clone", params);
        if (!result.success) {
            return AgentToolResult::fail(result.error);
        }
        return AgentToolResult::ok(result.data.dump(2));
    };
    tools.push_back(tool);
    
    return tools;
}

bool CloneTool::init(const Config& cfg) {
    (void)cfg;
    initialized_ = true;
    LOG_DEBUG("Clone tool ready (output=%s, public=%s)",
              cloner_.config().output_dir.c_str(), cloner_.config().public_dir.c_str());
    return true;
}

void CloneTool::shutdown() {
    initialized_ = false;
}

ToolResult CloneTool::execute(const std::string& action, const Json& params) {
    if (action == "clone") {
        return do_clone(params);
    }
    return ToolResult::fail("Unknown action: " + action);
}

ToolResult CloneTool::do_clone(const Json& params) {
    if (!params.is_object() || !params.contains("url") || !params["url"].is_string()) {
        return ToolResult::fail("Missing required parameter: url");
    }
    std::string url = params["url"].get<std::string>();

    try {
        CloneResult result = cloner_.clone_website(url);
        return ToolResult::ok(result.to_json());
    } catch (const CloneError& e) {
        LOG_ERROR("Clone of %s failed (%s): %s", url.c_str(), clone_error_kind_str(e.kind()), e.what());
        return ToolResult::fail(e.what());
    }
}

} // namespace sitemirror
