#include "ApprovalCommand.hpp"
#include "supervisor/Logger.hpp"
#include "supervisor/Process.hpp"

ApprovalState CommandApprovalGate::evaluate(const Event& ev, const std::string& collagePath) {
    Process p;
    p.name = "approval:" + ev.id;
    p.argv = {command, collagePath, ev.id};
    if (!p.start()) {
        logWarn("Approval", ev.id + ": cannot run " + command);
        return ApprovalState::TimedOut;
    }
    if (!p.waitExit(std::chrono::duration_cast<std::chrono::milliseconds>(timeout))) {
        logWarn("Approval", ev.id + ": no answer within " + std::to_string(timeout.count()) + "s");
        p.stop(std::chrono::milliseconds(1000));
        return ApprovalState::TimedOut;
    }
    switch (p.exitCode()) {
        case 0: return ApprovalState::Approved;
        case 1: return ApprovalState::Rejected;
        default:
            logWarn("Approval", ev.id + ": unexpected exit " + std::to_string(p.exitCode()));
            return ApprovalState::TimedOut;
    }
}
