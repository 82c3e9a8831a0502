#include "MuRuntime.h"

namespace MuRuntime {

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream ss(line);
    std::string w;
    while (ss >> w) out.push_back(w);
    return out;
}

std::optional<long> parse_long(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    return v;
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (*end != '\0' || !std::isfinite(v)) return std::nullopt;
    return v;
}

CliAction invalid(const std::string& message) {
    CliAction a;
    a.kind = CliActionKind::INVALID;
    a.text = message;
    return a;
}

CliAction local(const std::string& text) {
    CliAction a;
    a.kind = CliActionKind::LOCAL;
    a.text = text;
    return a;
}

CliAction request(RequestType type, Json payload) {
    CliAction a;
    a.kind = CliActionKind::REQUEST;
    a.request = type;
    a.payload = std::move(payload);
    return a;
}

std::string format_value(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

void render_pins(std::ostringstream& ss, const Json& pins) {
    for (const auto& [key, p] : pins.as_object()) {
        ss << "  pin " << std::setw(2) << key << "  " << std::left << std::setw(6)
           << p["mode"].as_string() << std::right << "  " << (p["value"].as_bool() ? "1" : "0") << "\n";
    }
}

void render_sensors(std::ostringstream& ss, const Json& sensors) {
    for (const auto& [id, s] : sensors.as_object()) {
        ss << "  " << id << " (" << s["type"].as_string() << ") = " << format_value(s["value"].as_number())
           << "  [" << format_value(s["range"]["min"].as_number()) << ", "
           << format_value(s["range"]["max"].as_number()) << "]"
           << (s["isActive"].as_bool(true) ? "" : " inactive") << "\n";
    }
}

} // namespace

bool is_cli_line(const std::string& line) {
    auto words = split_words(line);
    return !words.empty() && words[0] == "mu";
}

std::optional<CliCommand> parse_cli_line(const std::string& line) {
    auto words = split_words(line);
    if (words.empty() || words[0] != "mu") return std::nullopt;
    CliCommand cmd;
    cmd.name = words.size() > 1 ? words[1] : "help";
    if (words.size() > 2) cmd.args.assign(words.begin() + 2, words.end());
    return cmd;
}

CliAction plan_cli_command(const CliCommand& cmd, const std::string& which_text) {
    const auto& a = cmd.args;

    if (cmd.name == "help") return local(cli_help_text());
    if (cmd.name == "version") return local("MuRuntime " MURUNTIME_VERSION "\n");
    if (cmd.name == "which") return local(which_text + "\n");

    if (cmd.name == "status") {
        Json p = Json::object();
        p["queryType"] = "health";
        return request(RequestType::QUERY, p);
    }

    if (cmd.name == "reset") return request(RequestType::RESET, Json::object());

    if (cmd.name == "hw") {
        std::string type = a.empty() ? "full_state" : a[0];
        if (type != "full_state" && type != "pins" && type != "sensors")
            return invalid("usage: mu hw [full_state|pins|sensors]");
        Json p = Json::object();
        p["queryType"] = type;
        return request(RequestType::HARDWARE_QUERY, p);
    }

    if (cmd.name == "pin") {
        if (a.size() < 2 || a.size() > 3) return invalid("usage: mu pin <n> <0|1> [input|output]");
        auto n = parse_long(a[0]);
        if (!n || *n < 0) return invalid("invalid pin number: " + a[0]);
        if (a[1] != "0" && a[1] != "1") return invalid("pin value must be 0 or 1");
        Json entry = Json::object();
        entry["pin"] = *n;
        entry["value"] = a[1] == "1";
        if (a.size() == 3) {
            if (a[2] != "input" && a[2] != "output") return invalid("pin mode must be input or output");
            entry["mode"] = a[2];
        }
        Json pins = Json::array();
        pins.push_back(entry);
        Json p = Json::object();
        p["pins"] = pins;
        return request(RequestType::HARDWARE_SET, p);
    }

    if (cmd.name == "sensor") {
        if (a.size() != 2) return invalid("usage: mu sensor <id> <value>");
        auto v = parse_double(a[1]);
        if (!v) return invalid("invalid sensor value: " + a[1]);
        Json entry = Json::object();
        entry["id"] = a[0];
        entry["value"] = *v;
        Json sensors = Json::array();
        sensors.push_back(entry);
        Json p = Json::object();
        p["sensors"] = sensors;
        return request(RequestType::HARDWARE_SET, p);
    }

    if (cmd.name == "board") {
        if (a.size() != 1) return invalid("usage: mu board <boardId>");
        Json profile = Json::object();
        profile["boardId"] = a[0];
        Json p = Json::object();
        p["boardProfile"] = profile;
        return request(RequestType::CONFIGURE, p);
    }

    return invalid("Unknown command: mu " + cmd.name + " (try 'mu help')");
}

std::string render_cli_result(const CliCommand& cmd, const Response& resp) {
    const Json& r = resp.result ? *resp.result : Json();
    std::ostringstream ss;

    if (cmd.name == "status") {
        ss << "worker " << r["status"].as_string("unknown")
           << ", interpreter " << (r["initialized"].as_bool() ? "initialized" : "not initialized") << "\n";
    } else if (cmd.name == "reset") {
        ss << "runtime reset (" << r["status"].as_string() << ")\n";
    } else if (cmd.name == "hw") {
        const Json& state = r["state"];
        if (state.has("pins")) {
            ss << "pins:\n";
            render_pins(ss, state["pins"]);
        }
        if (state.has("sensors")) {
            ss << "sensors:\n";
            render_sensors(ss, state["sensors"]);
        }
    } else if (cmd.name == "pin" || cmd.name == "sensor") {
        ss << r["changesApplied"].as_int() << " change(s) applied\n";
    } else if (cmd.name == "board") {
        ss << "board profile " << r["boardProfile"].as_string() << " configured\n";
    } else {
        ss << r.dump() << "\n";
    }
    return ss.str();
}

std::string cli_help_text() {
    return
        "Commands:\n"
        "  mu help                        this text\n"
        "  mu version                     runtime version\n"
        "  mu which                       active transport\n"
        "  mu status                      worker health\n"
        "  mu reset                       restart interpreter, restore default hardware\n"
        "  mu hw [full_state|pins|sensors]  show simulated hardware\n"
        "  mu pin <n> <0|1> [input|output]  set an existing pin\n"
        "  mu sensor <id> <value>         set an existing sensor\n"
        "  mu board <boardId>             select board profile\n"
        "Keys: Tab complete, Up/Down history, Ctrl-C interrupt, Ctrl-D soft restart, Ctrl-E paste mode\n";
}

} // namespace MuRuntime
