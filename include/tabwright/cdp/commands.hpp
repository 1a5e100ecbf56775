#ifndef TABWRIGHT_CDP_COMMANDS_HPP
#define TABWRIGHT_CDP_COMMANDS_HPP

#include <tabwright/core/json.hpp>
#include <string>

namespace tabwright {

// ============================================================================
// Outbound command builders
// ============================================================================
//
// Each builder returns the method name and params for one DevTools command.
// Nothing is sent here; pass the result to CommandSender::call.

struct Command {
    std::string method;
    Json params;
    
    Command() : params(Json::object()) {}
    Command(const std::string& m, const Json& p) : method(m), params(p) {}
};

namespace commands {

Command enable_page();
Command enable_runtime();
Command navigate(const std::string& url);

Command activate_target(const std::string& target_id);
Command bring_to_front();
Command set_lifecycle_state(const std::string& state);
Command set_focus_emulation(bool enabled);
Command set_idle_override(bool user_active, bool screen_unlocked);

// type: mouseMoved, mousePressed, mouseReleased, mouseWheel
Command dispatch_mouse_event(const std::string& type, double x, double y);

Command evaluate(const std::string& expression, bool return_by_value);

// Fixed page-side snippets built from typed values only
Command scroll_by(int dx, int dy);

} // namespace commands

// result.result.value of a Runtime.evaluate response; null when the value is
// missing or the script threw (exceptionDetails present)
Json evaluation_value(const Json& evaluate_result);

// Description of a thrown exception in an evaluate result, empty if none
std::string evaluation_exception(const Json& evaluate_result);

} // namespace tabwright

#endif // TABWRIGHT_CDP_COMMANDS_HPP
