#ifndef TABWRIGHT_CDP_COMMAND_SENDER_HPP
#define TABWRIGHT_CDP_COMMAND_SENDER_HPP

#include <tabwright/core/json.hpp>
#include <string>

namespace tabwright {

// The one operation background routines and the extractor need from the
// channel. call() returns the response's "result" member and throws a
// ChannelError subclass otherwise. Safe to call from several threads at once.
class CommandSender {
public:
    virtual ~CommandSender() {}
    
    virtual Json call(const std::string& method, const Json& params = Json::object()) = 0;
};

} // namespace tabwright

#endif // TABWRIGHT_CDP_COMMAND_SENDER_HPP
