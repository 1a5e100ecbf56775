#include <tabwright/cdp/target_resolver.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>

namespace tabwright {

TargetResolver::TargetResolver(const std::string& endpoint)
    : endpoint_(strip_trailing(endpoint, '/')) {
    http_.set_timeout(5000);
}

std::vector<TargetDescriptor> TargetResolver::list_targets() {
    std::string url = endpoint_ + "/json/list";
    LOG_DEBUG("Fetching targets from %s", url.c_str());
    
    HttpResponse resp = http_.get(url);
    if (!resp.ok()) {
        throw TransportError("cannot list targets at " + url + ": " + resp.error);
    }
    
    Json body = resp.json();
    if (!body.is_array()) {
        throw TransportError("unexpected /json/list payload from " + url);
    }
    return parse_targets(body);
}

TargetDescriptor TargetResolver::select(const std::string& target_id) {
    TargetDescriptor target = choose(list_targets(), target_id);
    if (target_id.empty()) {
        LOG_INFO("Using first page target: %s", format_target(target).c_str());
    } else {
        LOG_INFO("Using provided target: %s", format_target(target).c_str());
    }
    return target;
}

std::vector<TargetDescriptor> TargetResolver::parse_targets(const Json& list) {
    std::vector<TargetDescriptor> targets;
    if (!list.is_array()) return targets;
    
    for (size_t i = 0; i < list.size(); ++i) {
        const Json& item = list[i];
        if (!item.is_object()) continue;
        
        TargetDescriptor t;
        t.id = json_string(item, "id");
        t.type = json_string(item, "type");
        t.url = json_string(item, "url");
        t.title = json_string(item, "title");
        t.channel_address = json_string(item, "webSocketDebuggerUrl");
        targets.push_back(t);
    }
    return targets;
}

TargetDescriptor TargetResolver::choose(const std::vector<TargetDescriptor>& targets,
                                        const std::string& target_id) {
    if (!target_id.empty()) {
        for (size_t i = 0; i < targets.size(); ++i) {
            if (targets[i].id == target_id) return targets[i];
        }
        throw ConfigError("No tab found with targetId=" + target_id + ".");
    }
    
    for (size_t i = 0; i < targets.size(); ++i) {
        if (targets[i].type == "page") return targets[i];
    }
    throw ConfigError("No page targets exposed by the remote browser.");
}

std::string TargetResolver::format_target(const TargetDescriptor& target) {
    std::string out = (target.url.empty() ? std::string("about:blank") : target.url);
    out += " (targetId=" + target.id + ")";
    if (!target.title.empty()) {
        out += "  title='" + target.title + "'";
    }
    return out;
}

} // namespace tabwright
