#ifndef TABWRIGHT_EXTRACT_EXTRACTION_SCRIPT_HPP
#define TABWRIGHT_EXTRACT_EXTRACTION_SCRIPT_HPP

#include <tabwright/core/json.hpp>
#include <string>

namespace tabwright {

// What to look for on the page. Every field reaches the page as a JSON
// argument, never as script text.
struct ExtractionQuery {
    std::string container;        // scope for the item lookup
    std::string item;             // one match per index
    std::string link_selector;    // inside the item; empty = the item itself
    std::string link_attribute;   // read before falling back to href
    std::string required_field;   // decides ExtractionRecord::success

    ExtractionQuery()
        : container("div#search")
        , item("div[data-lpage]")
        , link_attribute("data-lpage")
        , required_field("link")
    {}

    Json to_json() const;
};

// Viewport rectangle reported with an "ok" payload
struct ItemRect {
    double x;
    double y;
    double width;
    double height;

    ItemRect() : x(0), y(0), width(0), height(0) {}

    bool degenerate() const { return !(width > 0) || !(height > 0); }
    double center_x() const { return x + width / 2; }
    double center_y() const { return y + height / 2; }

    // Missing or non-numeric members leave a degenerate rect
    static ItemRect from_json(const Json& rect);
};

namespace extraction_script {

// Returns {status, count, fields, rect} for item `index`. Status is one of
// waiting_for_container, waiting_for_item, out_of_range, ok.
std::string item_expression(const ExtractionQuery& query, int index);

// Fires mouseover/mouseenter/mousemove on item `index`; evaluates to true
// when the item exists.
std::string hover_expression(const ExtractionQuery& query, int index);

// Outlines item `index`; evaluates to true when the item exists.
std::string highlight_expression(const ExtractionQuery& query, int index,
                                 const std::string& color = "red");

// Logs `message` in the page console and prefixes the page title with
// `tag`; evaluates to {previousTitle, newTitle}.
std::string notify_expression(const std::string& message,
                              const std::string& tag = "[tabwright]");

// Wraps a fixed function source as "(<source>)(<args as ASCII JSON>)"
std::string invoke(const char* function_source, const Json& args);

} // namespace extraction_script

// A field counts as present when it is a non-empty string, or any other
// non-null value
bool has_required_field(const Json& fields, const std::string& name);

} // namespace tabwright

#endif // TABWRIGHT_EXTRACT_EXTRACTION_SCRIPT_HPP
