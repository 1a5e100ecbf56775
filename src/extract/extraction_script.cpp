#include <tabwright/extract/extraction_script.hpp>

namespace tabwright {

namespace {

// Page-side functions. Each takes one argument object built from
// ExtractionQuery::to_json() plus "index".

const char* kItemFunction = R"JS(function (a) {
  var root = document.querySelector(a.container);
  if (!root) return { status: "waiting_for_container" };
  var items = root.querySelectorAll(a.item);
  if (!items.length) return { status: "waiting_for_item", count: 0 };
  if (a.index >= items.length) return { status: "out_of_range", count: items.length };
  var el = items[a.index];
  var linkEl = a.link_selector ? el.querySelector(a.link_selector) : el;
  var link = null;
  if (linkEl) {
    link = (a.link_attribute && linkEl.getAttribute(a.link_attribute)) || linkEl.getAttribute("href") || null;
  }
  var img = el.querySelector("img");
  var r = el.getBoundingClientRect();
  return {
    status: "ok",
    index: a.index,
    count: items.length,
    fields: {
      link: link,
      text: (el.innerText || "").trim().slice(0, 500) || null,
      image: img ? (img.currentSrc || img.src || null) : null,
      alt: img ? (img.getAttribute("alt") || null) : null,
      title: el.getAttribute("title") || (linkEl && linkEl.getAttribute("title")) || null
    },
    rect: { x: r.left, y: r.top, width: r.width, height: r.height }
  };
})JS";

const char* kHoverFunction = R"JS(function (a) {
  var root = document.querySelector(a.container);
  if (!root) return false;
  var el = root.querySelectorAll(a.item)[a.index];
  if (!el) return false;
  var r = el.getBoundingClientRect();
  var opts = { bubbles: true, cancelable: true, view: window,
               clientX: r.left + r.width / 2, clientY: r.top + r.height / 2 };
  ["mouseover", "mouseenter", "mousemove"].forEach(function (type) {
    el.dispatchEvent(new MouseEvent(type, opts));
  });
  return true;
})JS";

const char* kHighlightFunction = R"JS(function (a) {
  var root = document.querySelector(a.container);
  if (!root) return false;
  var el = root.querySelectorAll(a.item)[a.index];
  if (!el) return false;
  el.style.outline = "3px solid " + a.color;
  el.style.outlineOffset = "-3px";
  return true;
})JS";

const char* kNotifyFunction = R"JS(function (a) {
  console.log(a.tag, a.message);
  var previousTitle = document.title || "";
  var newTitle = a.tag + " " + a.message;
  document.title = newTitle;
  return { previousTitle: previousTitle, newTitle: newTitle };
})JS";

Json indexed_args(const ExtractionQuery& query, int index) {
    Json args = query.to_json();
    args["index"] = index;
    return args;
}

} // anonymous namespace

Json ExtractionQuery::to_json() const {
    Json j = Json::object();
    j["container"] = container;
    j["item"] = item;
    j["link_selector"] = link_selector;
    j["link_attribute"] = link_attribute;
    j["required_field"] = required_field;
    return j;
}

ItemRect ItemRect::from_json(const Json& rect) {
    ItemRect r;
    if (!rect.is_object()) return r;

    const Json& x = json_at(rect, "x");
    const Json& y = json_at(rect, "y");
    const Json& w = json_at(rect, "width");
    const Json& h = json_at(rect, "height");
    if (!x.is_number() || !y.is_number() || !w.is_number() || !h.is_number()) {
        return r;
    }
    r.x = x.get<double>();
    r.y = y.get<double>();
    r.width = w.get<double>();
    r.height = h.get<double>();
    return r;
}

namespace extraction_script {

std::string invoke(const char* function_source, const Json& args) {
    return std::string("(") + function_source + ")(" + json_dump_ascii(args) + ")";
}

std::string item_expression(const ExtractionQuery& query, int index) {
    return invoke(kItemFunction, indexed_args(query, index));
}

std::string hover_expression(const ExtractionQuery& query, int index) {
    return invoke(kHoverFunction, indexed_args(query, index));
}

std::string highlight_expression(const ExtractionQuery& query, int index,
                                 const std::string& color) {
    Json args = indexed_args(query, index);
    args["color"] = color;
    return invoke(kHighlightFunction, args);
}

std::string notify_expression(const std::string& message, const std::string& tag) {
    Json args = Json::object();
    args["message"] = message;
    args["tag"] = tag;
    return invoke(kNotifyFunction, args);
}

} // namespace extraction_script

bool has_required_field(const Json& fields, const std::string& name) {
    const Json& value = json_at(fields, name);
    if (value.is_null()) return false;
    if (value.is_string()) return !value.get<std::string>().empty();
    return true;
}

} // namespace tabwright
