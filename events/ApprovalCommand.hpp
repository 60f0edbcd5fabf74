#pragma once
#include "EventSink.hpp"
#include <chrono>
#include <string>

// Runs `<command> <collage_path> <event_id>`: exit 0 approves, exit 1
// rejects, anything else (or the timeout) lets the event through ungated.
class CommandApprovalGate : public ApprovalGate {
    std::string command;
    std::chrono::seconds timeout;

public:
    CommandApprovalGate(std::string cmd, std::chrono::seconds limit)
        : command(std::move(cmd)), timeout(limit) {}

    ApprovalState evaluate(const Event& ev, const std::string& collagePath) override;
};
