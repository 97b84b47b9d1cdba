#include "zmq_dispatcher.hpp"
#include "json_codec.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

ZmqDispatcher::ZmqDispatcher(const std::string& endpoint, int timeout_ms, std::shared_ptr<Dispatcher> fallback)
    : zmq_context_(1), endpoint_(endpoint), timeout_ms_(timeout_ms), fallback_(std::move(fallback)) {
    if (!fallback_) {
        throw std::invalid_argument("ZmqDispatcher requires a fallback dispatcher");
    }
    if (timeout_ms_ <= 0) {
        throw std::invalid_argument("Worker timeout must be positive");
    }
}

ZmqDispatcher::~ZmqDispatcher() = default;

int ZmqDispatcher::replyTimeoutMs(const Task& task, int timeout_ms) {
    // Longest run the simulator would pick for this task, or the submitter's estimate if larger
    const double expected = std::max(task.estimated_duration, task.complexity * 1000.0 + 2000.0);
    return timeout_ms + static_cast<int>(std::ceil(expected));
}

std::future<DispatchResult> ZmqDispatcher::dispatch(const Task& task, const std::vector<Agent>& agents) {
    nlohmann::json request_body = {{"task", task}, {"agents", agents}};
    std::string payload = request_body.dump();
    const int reply_timeout_ms = replyTimeoutMs(task, timeout_ms_);

    return std::async(std::launch::async, [this, payload, reply_timeout_ms, task, agents]() {
        try {
            return request(payload, reply_timeout_ms);
        } catch (const std::exception& e) {
            std::cerr << "Warning: worker dispatch of " << task.id << " failed: " << e.what() << ", using fallback"
                      << std::endl;
            return fallback_->dispatch(task, agents).get();
        }
    });
}

DispatchResult ZmqDispatcher::request(const std::string& payload, int reply_timeout_ms) {
    // A fresh socket per exchange; a REQ socket left behind by a missed reply is simply dropped
    zmq::socket_t socket(zmq_context_, zmq::socket_type::req);
    socket.set(zmq::sockopt::linger, 0);
    socket.set(zmq::sockopt::immediate, 1);
    socket.set(zmq::sockopt::sndtimeo, timeout_ms_);
    socket.set(zmq::sockopt::rcvtimeo, reply_timeout_ms);
    socket.connect(endpoint_);

    auto sent = socket.send(zmq::buffer(payload), zmq::send_flags::none);
    if (!sent.has_value()) {
        throw std::runtime_error("Worker service at " + endpoint_ + " did not accept the request");
    }

    zmq::message_t reply;
    auto received = socket.recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
        throw std::runtime_error("No response from worker service within " + std::to_string(reply_timeout_ms) +
                                 " ms");
    }
    return parseReply(std::string(static_cast<char*>(reply.data()), reply.size()));
}

DispatchResult ZmqDispatcher::parseReply(const std::string& reply) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(reply);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid worker response: " + std::string(e.what()));
    }
    if (!response.is_object() || !response.contains("success") || !response["success"].is_boolean()) {
        throw std::runtime_error("Invalid worker response: missing or invalid success");
    }
    if (!response.contains("duration_ms") || !response["duration_ms"].is_number()) {
        throw std::runtime_error("Invalid worker response: missing or invalid duration_ms");
    }
    return DispatchResult{response["success"].get<bool>(), response["duration_ms"].get<double>()};
}
