#ifndef SITEMIRROR_MIRROR_CLONE_TOOL_HPP
#define SITEMIRROR_MIRROR_CLONE_TOOL_HPP

#include <sitemirror/core/tool.hpp>
#include <sitemirror/core/dispatcher.hpp>
#include <sitemirror/mirror/cloner.hpp>
#include <string>
#include <vector>

namespace sitemirror {

// Exposes Cloner::clone_website to the agent as "cloneWebsiteToZip"
class CloneTool : public ToolProvider {
public:
    static const char* const AGENT_TOOL_NAME;

    explicit CloneTool(Cloner& cloner);

    // Plugin interface
    const char* name() const;
    const char* version() const;
    const char* description() const;

    bool init(const Config& cfg);
    void shutdown();

    // Tool interface
    const char* tool_id() const;
    std::vector<std::string> actions() const;
    
    std::vector<AgentTool> get_agent_tools() const;

    // action "clone", params {"url": "..."}
    ToolResult execute(const std::string& action, const Json& params);

private:
    Cloner& cloner_;

    ToolResult do_clone(const Json& params);
};

} // namespace sitemirror

#endif // SITEMIRROR_MIRROR_CLONE_TOOL_HPP
