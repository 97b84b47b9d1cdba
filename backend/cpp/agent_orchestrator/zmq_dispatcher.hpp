#ifndef ZMQ_DISPATCHER_HPP
#define ZMQ_DISPATCHER_HPP

#include "dispatcher.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <string>

// Sends each execution to a worker service over ZeroMQ and waits for its
// verdict. Request: {"task": {...}, "agents": [...]}; reply:
// {"success": bool, "duration_ms": number}. Every execution gets its own REQ
// socket, so executions overlap on the worker. timeout_ms bounds reaching the
// worker; the reply may take that long on top of the task's expected run time.
// If the worker is unreachable, silent past that or answers with something
// malformed, the execution goes to the fallback dispatcher instead.
class ZmqDispatcher : public Dispatcher {
public:
    ZmqDispatcher(const std::string& endpoint, int timeout_ms, std::shared_ptr<Dispatcher> fallback);
    ~ZmqDispatcher() override;

    std::future<DispatchResult> dispatch(const Task& task, const std::vector<Agent>& agents) override;

    static DispatchResult parseReply(const std::string& reply);
    static int replyTimeoutMs(const Task& task, int timeout_ms);

private:
    DispatchResult request(const std::string& payload, int reply_timeout_ms);

    zmq::context_t zmq_context_; // ZeroMQ context shared by the per-execution sockets
    std::string endpoint_;
    int timeout_ms_;
    std::shared_ptr<Dispatcher> fallback_;
};

#endif // ZMQ_DISPATCHER_HPP
