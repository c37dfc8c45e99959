#include <sitemirror/core/dispatcher.hpp>

#include <gtest/gtest.h>
#include <stdexcept>

using namespace sitemirror;

namespace {

AgentTool echo_tool() {
    AgentTool tool("echo", "Echo the url back", [](const Json& params) -> AgentToolResult {
        return AgentToolResult::ok(params["url"].get<std::string>());
    });
    tool.params.push_back(ToolParamSchema("url", "string", "Value to echo", true));
    return tool;
}

ParsedToolCall single_call(const ToolDispatcher& d, const std::string& response) {
    std::vector<ParsedToolCall> calls = d.parse_tool_calls(response);
    EXPECT_EQ(1u, calls.size());
    return calls.empty() ? ParsedToolCall() : calls[0];
}

} // namespace

TEST(ToolDispatcherTest, ParsesObjectArguments) {
    ToolDispatcher d;
    ParsedToolCall call = single_call(d,
        "Sure.\n<tool_call name=\"echo\">\n{\"url\": \"https://ex.com\"}\n</tool_call>\nDone.");
    EXPECT_EQ("echo", call.tool_name);
    EXPECT_TRUE(call.valid);
    EXPECT_EQ("https://ex.com", call.params["url"].get<std::string>());
}

TEST(ToolDispatcherTest, RecoversFencedJsonWithTrailingComma) {
    ToolDispatcher d;
    ParsedToolCall call = single_call(d,
        "<tool_call name=\"echo\">```json\n{\"url\": \"https://ex.com\",}\n```</tool_call>");
    EXPECT_TRUE(call.valid);
    EXPECT_EQ("https://ex.com", call.params["url"].get<std::string>());
}

TEST(ToolDispatcherTest, BindsStringAndArrayPositionally) {
    ToolDispatcher d;
    d.register_tool(echo_tool());

    AgentToolResult a = d.execute_tool(single_call(d, "<tool_call name=\"echo\">\"https://a.ex\"</tool_call>"));
    EXPECT_TRUE(a.success);
    EXPECT_EQ("https://a.ex", a.output);

    AgentToolResult b = d.execute_tool(single_call(d, "<tool_call name=\"echo\">[\"https://b.ex\"]</tool_call>"));
    EXPECT_TRUE(b.success);
    EXPECT_EQ("https://b.ex", b.output);

    // Not JSON at all: the raw text is the single argument
    AgentToolResult c = d.execute_tool(single_call(d, "<tool_call name=\"echo\">https://c.ex</tool_call>"));
    EXPECT_TRUE(c.success);
    EXPECT_EQ("https://c.ex", c.output);
}

TEST(ToolDispatcherTest, BindParamsRejectsTooManyArguments) {
    Json out;
    std::string error;
    EXPECT_FALSE(ToolDispatcher::bind_params(echo_tool(), Json::parse("[\"a\", \"b\"]"), out, error));
    EXPECT_FALSE(error.empty());

    EXPECT_TRUE(ToolDispatcher::bind_params(echo_tool(), Json::parse("{\"url\": \"x\"}"), out, error));
    EXPECT_EQ("x", out["url"].get<std::string>());
}

TEST(ToolDispatcherTest, MissingRequiredParameterFails) {
    ToolDispatcher d;
    d.register_tool(echo_tool());

    AgentToolResult r = d.execute_tool(single_call(d, "<tool_call name=\"echo\">{}</tool_call>"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ("Missing required parameter: url", r.error);
}

TEST(ToolDispatcherTest, UnknownToolListsAvailableTools) {
    ToolDispatcher d;
    d.register_tool(echo_tool());

    AgentToolResult r = d.execute_tool(single_call(d, "<tool_call name=\"nope\">{}</tool_call>"));
    EXPECT_FALSE(r.success);
    EXPECT_NE(std::string::npos, r.error.find("Unknown tool: nope"));
    EXPECT_NE(std::string::npos, r.error.find("echo"));
}

TEST(ToolDispatcherTest, ThrowingToolBecomesFailure) {
    ToolDispatcher d;
    d.register_tool("boom", "Always throws", [](const Json&) -> AgentToolResult {
        throw std::runtime_error("kaput");
    });

    AgentToolResult r = d.execute_tool(single_call(d, "<tool_call name=\"boom\">{}</tool_call>"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ("Tool exception: kaput", r.error);
}

TEST(ToolDispatcherTest, FormatsObservations) {
    DispatcherConfig config;
    config.max_tool_result_size = 10;
    ToolDispatcher d(config);

    EXPECT_EQ("<tool_result name=\"t\" success=\"true\">\nshort\n</tool_result>",
              d.format_tool_result("t", AgentToolResult::ok("short")));
    EXPECT_EQ("<tool_result name=\"t\" success=\"false\">\nError: bad\n</tool_result>",
              d.format_tool_result("t", AgentToolResult::fail("bad")));

    std::string cut = d.format_tool_result("t", AgentToolResult::ok(std::string(25, 'z')));
    EXPECT_NE(std::string::npos, cut.find("[truncated 15 characters]"));
}

TEST(ToolDispatcherTest, DispatchRunsEveryCall) {
    ToolDispatcher d;
    d.register_tool(echo_tool());

    std::string out = d.dispatch(
        "<tool_call name=\"echo\">\"one\"</tool_call> and <tool_call name=\"echo\">\"two\"</tool_call>");
    EXPECT_NE(std::string::npos, out.find("one"));
    EXPECT_NE(std::string::npos, out.find("two"));
    EXPECT_EQ("", d.dispatch("no tools here"));
}

TEST(ToolDispatcherTest, ToolsPromptDescribesParameters) {
    ToolDispatcher d;
    EXPECT_EQ("", d.build_tools_prompt());

    d.register_tool(echo_tool());
    std::string prompt = d.build_tools_prompt();
    EXPECT_NE(std::string::npos, prompt.find("**echo**: Echo the url back"));
    EXPECT_NE(std::string::npos, prompt.find("`url` (string, required)"));
}
