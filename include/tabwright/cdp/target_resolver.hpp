#ifndef TABWRIGHT_CDP_TARGET_RESOLVER_HPP
#define TABWRIGHT_CDP_TARGET_RESOLVER_HPP

#include <tabwright/core/http_client.hpp>
#include <tabwright/core/types.hpp>
#include <string>
#include <vector>

namespace tabwright {

// Maps a debugging endpoint (http://host:port) plus an optional target id
// to a connectable TargetDescriptor.
class TargetResolver {
public:
    explicit TargetResolver(const std::string& endpoint);
    
    // GET <endpoint>/json/list. Throws TransportError when unreachable.
    std::vector<TargetDescriptor> list_targets();
    
    // Exact id match, or the first "page" target when id is empty.
    // Throws ConfigError when nothing matches.
    TargetDescriptor select(const std::string& target_id);
    
    const std::string& endpoint() const { return endpoint_; }
    
    static std::vector<TargetDescriptor> parse_targets(const Json& list);
    static TargetDescriptor choose(const std::vector<TargetDescriptor>& targets,
                                   const std::string& target_id);
    static std::string format_target(const TargetDescriptor& target);

private:
    std::string endpoint_;
    HttpClient http_;
};

} // namespace tabwright

#endif // TABWRIGHT_CDP_TARGET_RESOLVER_HPP
