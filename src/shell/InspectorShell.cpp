#include "InspectorShell.hpp"
#include "mcp/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace mcp_inspector {

namespace {

const char* const kReset = "\x1b[0m";
const char* const kGreen = "\x1b[32m";
const char* const kRed = "\x1b[31m";
const char* const kCyan = "\x1b[36m";
const char* const kDarkGray = "\x1b[90m";

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string trim_lower(const std::string& raw) {
    std::string text = trim(raw);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string timestamp() {
    return SpdlogSessionLog::format_time(std::chrono::system_clock::now());
}

std::string field_or(const json& item, const char* key) {
    if (item.is_object() && item.contains(key) && item[key].is_string()) {
        return item[key].get<std::string>();
    }
    return "";
}

} // namespace

InspectorShell::InspectorShell(McpClient& client,
                               ServerConfig config,
                               std::istream& in,
                               std::ostream& out,
                               std::shared_ptr<SpdlogSessionLog> session_log,
                               ShellOptions options)
    : client_(client),
      config_(std::move(config)),
      in_(in),
      out_(out),
      session_log_(std::move(session_log)),
      options_(std::move(options)),
      prompter_(in, out) {}

TimeoutDecisionPrompt InspectorShell::make_timeout_prompt(std::istream& in,
                                                          std::ostream& out,
                                                          std::chrono::milliseconds extension) {
    return [&in, &out, extension](std::chrono::milliseconds elapsed, const std::string& method) {
        auto waited = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
        auto more = std::chrono::duration_cast<std::chrono::seconds>(extension).count();
        out << "Timed out waiting for " << method << " (after " << waited << "s). Wait "
            << more << "s more? [Y/n]: " << std::flush;

        std::string line;
        if (!std::getline(in, line)) {
            return TimeoutDecision::Extend;
        }
        std::string choice = trim_lower(line);
        if (choice.empty() || choice == "y" || choice == "yes") {
            return TimeoutDecision::Extend;
        }
        return TimeoutDecision::Abandon;
    };
}

std::optional<std::string> InspectorShell::result_preview(const json& result, std::size_t max_length) {
    if (!result.is_object() || !result.contains("content") || !result["content"].is_array() ||
        result["content"].empty()) {
        return std::nullopt;
    }
    const json& first = result["content"][0];
    std::string text = first.is_object() ? field_or(first, "text") : first.dump();
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.size() > max_length) {
        text = text.substr(0, max_length) + "…";
    }
    return text;
}

int InspectorShell::run(const std::optional<std::string>& preferred) {
    std::optional<ServerSpec> spec;
    if (preferred) {
        spec = config_.find(*preferred);
        if (!spec) {
            out_ << "Unknown server: " << *preferred << std::endl;
            return 1;
        }
    } else {
        spec = choose_server();
    }
    if (!spec) {
        out_ << "No server selected." << std::endl;
        return 1;
    }

    if (!connect_or_choose_again(*spec)) {
        print_and_log("Initialize failed; cannot continue.");
        return 1;
    }

    menu_loop();
    client_.disconnect();
    return 0;
}

std::optional<ServerSpec> InspectorShell::choose_server() {
    const auto& servers = config_.servers();
    if (servers.empty()) {
        return std::nullopt;
    }
    if (servers.size() == 1) {
        print_and_log("[" + timestamp() + "] Using server: " + servers[0].name + " -> " +
                      servers[0].command_line() + " (cwd=" + servers[0].working_directory.value_or(".") + ")");
        return servers[0];
    }

    out_ << "Available MCP servers:" << std::endl;
    for (size_t i = 0; i < servers.size(); ++i) {
        out_ << i << ": " << servers[i].name << " -> " << servers[i].command_line()
             << " (cwd=" << servers[i].working_directory.value_or(".") << ")" << std::endl;
    }
    auto index = read_index("Select server index (or blank to cancel): ", servers.size());
    if (!index) {
        return std::nullopt;
    }
    print_and_log("[" + timestamp() + "] Selected server: " + servers[*index].name);
    return servers[*index];
}

bool InspectorShell::connect(const ServerSpec& spec) {
    // The previous session logs its shutdown under its own name
    client_.disconnect();
    if (session_log_) {
        session_log_->set_server_name(spec.name);
    }
    auto result = run_operation("Initialize", "Connect to " + spec.name + " and send initialize", [&] {
        client_.connect(spec);
        return client_.server_info();
    });
    if (!result) {
        return false;
    }
    summary("Initialized", "Send notifications/initialized", true);
    std::string server_name = field_or(*result, "name");
    if (!server_name.empty()) {
        print_and_log("Server: " + server_name + " " + field_or(*result, "version"));
    }
    return true;
}

bool InspectorShell::connect_or_choose_again(ServerSpec spec) {
    while (!connect(spec)) {
        if (last_error_kind_ != ErrorKind::Spawn || config_.servers().size() < 2) {
            return false;
        }
        print_and_log("[" + timestamp() + "] Command not found: " + spec.command +
                      ". Please choose another server.");
        auto next = choose_server();
        if (!next) {
            return false;
        }
        spec = std::move(*next);
    }
    return true;
}

void InspectorShell::menu_loop() {
    while (true) {
        out_ << std::endl;
        if (last_status_ &&
            std::chrono::steady_clock::now() - last_status_time_ > std::chrono::milliseconds(750)) {
            out_ << *last_status_ << std::endl;
        }
        if (last_preview_) {
            print_and_log(*last_preview_);
        }
        print_and_log(paint(kCyan, "=== MCP Inspector Menu ==="));
        if (auto server = client_.current_server()) {
            out_ << paint(kGreen, "Connected to: " + server->name) << " ["
                 << to_string(client_.state()) << "]" << std::endl;
            out_ << "Working directory: " << server->working_directory.value_or(".") << std::endl;
        }
        out_ << std::endl
             << "[t] List and call tools" << std::endl
             << "[r] List and read resources" << std::endl
             << "[p] List and get prompts" << std::endl
             << "[o] Show recent stdout/stderr" << std::endl
             << "[l] Show session log path" << std::endl
             << "[s] Switch server" << std::endl
             << "[q] Quit" << std::endl
             << "> " << std::flush;

        std::string raw;
        if (!std::getline(in_, raw)) {
            return;
        }
        std::string choice = trim_lower(raw);
        log_note("[USER] menu choice: " + (choice.empty() ? std::string("enter") : choice));

        if (choice == "q") {
            return;
        }
        try {
            if (choice == "t") {
                if (!tools_menu()) {
                    return;
                }
            } else if (choice == "r") {
                resources_menu();
            } else if (choice == "p") {
                prompts_menu();
            } else if (choice == "o") {
                show_output();
            } else if (choice == "l") {
                out_ << "Log file: " << (options_.log_path.empty() ? "(disabled)" : options_.log_path) << std::endl;
            } else if (choice == "s") {
                switch_server();
            } else {
                out_ << "Unknown option." << std::endl;
            }
        } catch (const json::exception& e) {
            report_error(std::string("Malformed data from server: ") + e.what());
        }
    }
}

bool InspectorShell::tools_menu() {
    std::optional<json> tools;
    while (true) {
        if (!tools) {
            tools = run_operation("Tools/List", "Request available tools", [&] { return client_.list_tools(); });
        }
        if (!tools || tools->empty()) {
            out_ << "No tools available or tools/list failed." << std::endl;
            return true;
        }

        out_ << paint(kCyan, "--- Tools ---") << std::endl;
        for (size_t i = 0; i < tools->size(); ++i) {
            out_ << "[" << i << "] " << field_or((*tools)[i], "name") << std::endl;
        }
        out_ << "[r] refresh    [b] back to main    [q] quit" << std::endl << "> " << std::flush;

        std::string selection = trim_lower(read_line());
        if (selection.empty() || selection == "b") {
            return true;
        }
        if (selection == "q") {
            return false;
        }
        if (selection == "r") {
            tools.reset();
            continue;
        }

        size_t index;
        try {
            index = std::stoul(selection);
        } catch (const std::exception&) {
            out_ << "Invalid selection." << std::endl;
            continue;
        }
        if (index >= tools->size()) {
            out_ << "Index out of range." << std::endl;
            continue;
        }

        const json& tool = (*tools)[index];
        std::string name = field_or(tool, "name");
        json schema = tool.is_object() ? tool.value("inputSchema", json::object()) : json::object();
        json arguments = prompter_.prompt(schema);

        auto result = run_operation("Tools/Call", "Call " + name, [&] { return client_.call_tool(name, arguments); });
        if (result) {
            out_ << result->dump(2) << std::endl;
            auto preview = result_preview(*result, options_.preview_length);
            last_preview_ = preview ? std::optional<std::string>("Result preview: " + *preview) : std::nullopt;
        }

        out_ << "Call another tool? [Enter=yes / b=back]: " << std::flush;
        if (trim_lower(read_line()) == "b") {
            return true;
        }
    }
}

void InspectorShell::resources_menu() {
    auto resources = run_operation("Resources/List", "Request available resources",
                                   [&] { return client_.list_resources(); });
    if (!resources || resources->empty()) {
        out_ << "No resources available or resources/list failed." << std::endl;
        return;
    }

    out_ << paint(kCyan, "--- Resources ---") << std::endl;
    for (size_t i = 0; i < resources->size(); ++i) {
        out_ << "[" << i << "] " << field_or((*resources)[i], "uri") << std::endl;
    }
    auto index = read_index("Select resource index to read (or blank to cancel): ", resources->size());
    if (!index) {
        return;
    }
    std::string uri = field_or((*resources)[*index], "uri");
    if (uri.empty()) {
        out_ << "Selected resource has no uri." << std::endl;
        return;
    }

    auto result = run_operation("Resources/Read", "Read " + uri, [&] { return client_.read_resource(uri); });
    if (result) {
        out_ << result->dump(2) << std::endl;
        last_preview_ = "Read " + uri + ": ok";
    }
}

void InspectorShell::prompts_menu() {
    auto prompts = run_operation("Prompts/List", "Request available prompts",
                                 [&] { return client_.list_prompts(); });
    if (!prompts || prompts->empty()) {
        out_ << "No prompts available or prompts/list failed." << std::endl;
        return;
    }

    out_ << paint(kCyan, "--- Prompts ---") << std::endl;
    for (size_t i = 0; i < prompts->size(); ++i) {
        out_ << "[" << i << "] " << field_or((*prompts)[i], "name") << std::endl;
    }
    auto index = read_index("Select prompt index to get (or blank to cancel): ", prompts->size());
    if (!index) {
        return;
    }
    const json& prompt = (*prompts)[*index];
    std::string name = field_or(prompt, "name");

    std::optional<json> arguments;
    // MCP lists prompt arguments as [{name, description, required}]
    if (prompt.contains("arguments") && prompt["arguments"].is_array() && !prompt["arguments"].empty()) {
        json schema = {{"properties", json::object()}, {"required", json::array()}};
        for (const auto& argument : prompt["arguments"]) {
            std::string arg_name = field_or(argument, "name");
            if (arg_name.empty()) {
                continue;
            }
            schema["properties"][arg_name] = {{"type", "string"}};
            if (argument.contains("required") && argument["required"].is_boolean() &&
                argument["required"].get<bool>()) {
                schema["required"].push_back(arg_name);
            }
        }
        arguments = prompter_.prompt(schema);
    } else {
        out_ << "Enter JSON for prompt arguments (or blank for none): " << std::flush;
        std::string raw = read_line();
        if (!raw.empty()) {
            json parsed = json::parse(raw, nullptr, false);
            if (parsed.is_discarded()) {
                out_ << "Invalid JSON; ignoring arguments." << std::endl;
            } else {
                arguments = parsed;
            }
        }
    }

    auto result = run_operation("Prompts/Get", "Get " + name, [&] { return client_.get_prompt(name, arguments); });
    if (result) {
        out_ << result->dump(2) << std::endl;
        last_preview_ = "Prompt " + name + ": ok";
    }
}

void InspectorShell::show_output() {
    auto lines = client_.recent_output(options_.output_lines);
    out_ << "[" << timestamp() << "] --- Recent output (" << lines.size() << " lines) ---" << std::endl;
    for (const auto& line : lines) {
        std::string prefix = SpdlogSessionLog::format_time(line.timestamp) + " " + to_string(line.stream) + ": ";
        if (line.stream == StreamKind::Stderr) {
            out_ << paint(kDarkGray, prefix + line.text) << std::endl;
        } else {
            out_ << prefix << line.text << std::endl;
        }
    }
    log_note("[Shown recent stdout/stderr]");
}

void InspectorShell::switch_server() {
    auto spec = choose_server();
    if (!spec) {
        return;
    }
    if (!connect_or_choose_again(*spec)) {
        print_and_log("Initialize failed on switched server.");
    }
}

std::optional<json> InspectorShell::run_operation(const std::string& title,
                                                  const std::string& attempted,
                                                  const std::function<json()>& operation) {
    last_error_kind_.reset();
    try {
        json result = operation();
        summary(title, attempted, true);
        last_preview_.reset();
        return result;
    } catch (const RemoteError& e) {
        last_error_kind_ = e.kind();
        summary(title, attempted, false);
        report_error("Error: code=" + std::to_string(e.code()) + " message=" + e.remote_message() +
                     " data=" + (e.data() ? e.data()->dump() : std::string("None")));
    } catch (const McpError& e) {
        last_error_kind_ = e.kind();
        summary(title, attempted, false);
        report_error(std::string(to_string(e.kind())) + ": " + e.what());
    } catch (const std::logic_error& e) {
        summary(title, attempted, false);
        report_error(e.what());
    } catch (const json::exception& e) {
        summary(title, attempted, false);
        report_error(std::string("Malformed data from server: ") + e.what());
    }
    return std::nullopt;
}

void InspectorShell::summary(const std::string& title, const std::string& attempted, bool success) {
    std::string status = success ? paint(kGreen, "SUCCESS") : paint(kRed, "ERROR");
    std::string line = "[" + timestamp() + "] " + title + ": " + attempted + " -> " + status;
    out_ << line << std::endl;
    log_note(title + ": " + attempted + " -> " + (success ? "SUCCESS" : "ERROR"));
    last_status_ = line;
    last_status_time_ = std::chrono::steady_clock::now();
}

void InspectorShell::report_error(const std::string& line) {
    print_and_log(line);
    last_preview_ = line;
}

std::optional<std::size_t> InspectorShell::read_index(const std::string& prompt, std::size_t count) {
    out_ << prompt << std::flush;
    std::string selection = read_line();
    if (selection.empty()) {
        return std::nullopt;
    }
    size_t index;
    try {
        index = std::stoul(selection);
    } catch (const std::exception&) {
        out_ << "Invalid index." << std::endl;
        return std::nullopt;
    }
    if (index >= count) {
        out_ << "Index out of range." << std::endl;
        return std::nullopt;
    }
    return index;
}

std::string InspectorShell::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        return "";
    }
    return trim(line);
}

void InspectorShell::print_and_log(const std::string& line) {
    out_ << line << std::endl;
    log_note(line);
}

void InspectorShell::log_note(const std::string& line) {
    if (session_log_) {
        static const std::regex ansi("\x1b\\[[0-9;]*m");
        session_log_->note(std::chrono::system_clock::now(), std::regex_replace(line, ansi, ""));
    }
}

std::string InspectorShell::paint(const char* color, const std::string& text) const {
    if (!options_.color) {
        return text;
    }
    return color + text + kReset;
}

} // namespace mcp_inspector
