#ifndef _MuRuntime_cli_commands_h_
#define _MuRuntime_cli_commands_h_

#include <optional>
#include <string>
#include <vector>

#include "json.h"
#include "protocol.h"

namespace MuRuntime {

#define MURUNTIME_VERSION "0.3.0"

// A submitted line of the form "mu <name> [args...]"
struct CliCommand {
    std::string name;
    std::vector<std::string> args;
};

enum class CliActionKind {
    LOCAL,      // answered without the worker
    REQUEST,    // becomes one worker request
    INVALID
};

struct CliAction {
    CliActionKind kind = CliActionKind::INVALID;
    std::string text;                       // LOCAL output or INVALID message
    RequestType request = RequestType::QUERY;
    Json payload = Json::object();
};

bool is_cli_line(const std::string& line);
std::optional<CliCommand> parse_cli_line(const std::string& line);

// Decide how a command is served; which_text answers "mu which"
CliAction plan_cli_command(const CliCommand& cmd, const std::string& which_text);

// Human-readable rendering of a successful worker reply
std::string render_cli_result(const CliCommand& cmd, const Response& resp);

std::string cli_help_text();

} // namespace MuRuntime

#endif
