#include <tabwright/cdp/commands.hpp>
#include <sstream>

namespace tabwright {

namespace commands {

Command enable_page() {
    return Command("Page.enable", Json::object());
}

Command enable_runtime() {
    return Command("Runtime.enable", Json::object());
}

Command navigate(const std::string& url) {
    Json params = Json::object();
    params["url"] = url;
    return Command("Page.navigate", params);
}

Command activate_target(const std::string& target_id) {
    Json params = Json::object();
    params["targetId"] = target_id;
    return Command("Target.activateTarget", params);
}

Command bring_to_front() {
    return Command("Page.bringToFront", Json::object());
}

Command set_lifecycle_state(const std::string& state) {
    Json params = Json::object();
    params["state"] = state;
    return Command("Page.setWebLifecycleState", params);
}

Command set_focus_emulation(bool enabled) {
    Json params = Json::object();
    params["enabled"] = enabled;
    return Command("Emulation.setFocusEmulationEnabled", params);
}

Command set_idle_override(bool user_active, bool screen_unlocked) {
    Json params = Json::object();
    params["isUserActive"] = user_active;
    params["isScreenUnlocked"] = screen_unlocked;
    return Command("Emulation.setIdleOverride", params);
}

Command dispatch_mouse_event(const std::string& type, double x, double y) {
    Json params = Json::object();
    params["type"] = type;
    params["x"] = x;
    params["y"] = y;
    params["button"] = "none";
    params["pointerType"] = "mouse";
    return Command("Input.dispatchMouseEvent", params);
}

Command evaluate(const std::string& expression, bool return_by_value) {
    Json params = Json::object();
    params["expression"] = expression;
    params["returnByValue"] = return_by_value;
    return Command("Runtime.evaluate", params);
}

Command scroll_by(int dx, int dy) {
    std::ostringstream ss;
    ss << "window.scrollBy(" << dx << ", " << dy << ");";
    return evaluate(ss.str(), false);
}

} // namespace commands

Json evaluation_value(const Json& evaluate_result) {
    if (!evaluate_result.is_object()) return Json();
    if (evaluate_result.contains("exceptionDetails")) return Json();
    const Json& remote = json_at(evaluate_result, "result");
    return json_at(remote, "value");
}

std::string evaluation_exception(const Json& evaluate_result) {
    const Json& details = json_at(evaluate_result, "exceptionDetails");
    if (details.is_null()) return "";
    std::string description = json_string(json_at(details, "exception"), "description");
    if (!description.empty()) return description;
    std::string text = json_string(details, "text");
    return text.empty() ? std::string("script threw") : text;
}

} // namespace tabwright
