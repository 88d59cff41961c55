#include "command_dispatcher.hpp"
#include "fleet_log.hpp"
#include <exception>
#include <memory>
#include <utility>

using namespace fleetdeck::protocol;

namespace fleetdeck::control {

CommandDispatcher::CommandDispatcher(SessionState& state, TaskScheduler& tasks,
                                     SignalingChannel* signaling, Options opts)
    : state_(state), tasks_(tasks), signaling_(signaling), opts_(opts) {}

CommandDispatcher::~CommandDispatcher() {
    cancelPending();
}

void CommandDispatcher::dispatch(const DeviceId& source, const ControlCommand& cmd) {
    // 1. primary channel, unconditional
    sendPrimary(source, cmd);

    // 2. mirror path, gated by the source's own selection membership
    auto targets = mirrorTargets(source);
    if (targets.empty()) return;
    sendMirror(targets, cmd);
}

std::vector<DeviceId> CommandDispatcher::mirrorTargets(const DeviceId& source) const {
    if (!state_.groupSync()) return {};
    if (!state_.selection().contains(source)) return {};
    return state_.selection().others(source);
}

void CommandDispatcher::sendTo(const DeviceId& device, const ControlCommand& cmd) {
    if (sendPrimary(device, cmd)) return;
    sendMirror({device}, cmd);
}

size_t CommandDispatcher::broadcast(const ControlCommand& cmd) {
    const auto checked = state_.selection().members();
    std::vector<DeviceId> via_signaling;
    for (const auto& id : checked) {
        if (!sendPrimary(id, cmd)) via_signaling.push_back(id);
    }
    if (!via_signaling.empty()) sendMirror(via_signaling, cmd);
    FLOG_DEBUG("Dispatch", "broadcast %s to %zu devices (%zu via signaling)",
               kindName(cmd.kind), checked.size(), via_signaling.size());
    return checked.size();
}

void CommandDispatcher::flushPending() {
    auto due = std::move(pending_);
    pending_.clear();
    for (auto& [id, send] : due) {
        tasks_.cancel(id);
        send();
    }
}

void CommandDispatcher::cancelPending() {
    for (auto& [id, send] : pending_) tasks_.cancel(id);
    pending_.clear();
}

bool CommandDispatcher::sendPrimary(const DeviceId& device, const ControlCommand& cmd) {
    auto transport = state_.connections().transport(device);
    if (!transport || !transport->isOpen()) {
        stats_.primary_skipped++;
        FLOG_TRACE("Dispatch", "%s: primary channel not open, %s skipped",
                   device.c_str(), kindName(cmd.kind));
        return false;
    }
    try {
        transport->send(cmd);
    } catch (const std::exception& e) {
        FLOG_ERROR("Dispatch", "%s: primary send of %s failed: %s",
                   device.c_str(), kindName(cmd.kind), e.what());
        return false;
    }
    stats_.primary_sent++;
    return true;
}

void CommandDispatcher::sendMirror(const std::vector<DeviceId>& targets, const ControlCommand& cmd) {
    switch (cmd.kind) {
    case CommandKind::TouchUp:
        sendGroupLater(opts_.mirror_up_delay, targets, cmd);
        break;
    case CommandKind::KeyPress:
    case CommandKind::HomePress: {
        const std::string key = cmd.kind == CommandKind::HomePress ? std::string(KEY_HOME) : cmd.key;
        sendGroupNow(targets, ControlCommand::keyPhase(CommandKind::KeyDown, key));
        sendGroupLater(opts_.key_release_delay, targets,
                       ControlCommand::keyPhase(CommandKind::KeyUp, key));
        break;
    }
    default:
        sendGroupNow(targets, cmd);
        break;
    }
}

void CommandDispatcher::sendGroupNow(const std::vector<DeviceId>& targets, const ControlCommand& cmd) {
    if (!signaling_ || !signaling_->isAvailable()) {
        stats_.mirror_skipped++;
        FLOG_TRACE("Dispatch", "signaling unavailable, mirrored %s skipped", kindName(cmd.kind));
        return;
    }
    try {
        signaling_->sendGroupCommand(targets, cmd);
    } catch (const std::exception& e) {
        FLOG_ERROR("Dispatch", "mirrored %s failed: %s", kindName(cmd.kind), e.what());
        return;
    }
    stats_.mirror_sent++;
}

void CommandDispatcher::sendGroupLater(std::chrono::milliseconds delay, std::vector<DeviceId> targets,
                                       ControlCommand cmd) {
    auto send = [this, targets = std::move(targets), cmd = std::move(cmd)] {
        sendGroupNow(targets, cmd);
    };
    auto id = std::make_shared<TaskId>(NO_TASK);
    *id = tasks_.postDelayed(delay, [this, id] {
        auto it = pending_.find(*id);
        if (it == pending_.end()) return;
        auto fn = std::move(it->second);
        pending_.erase(it);
        fn();
    });
    pending_[*id] = std::move(send);
}

} // namespace fleetdeck::control
