#pragma once

#include <memory>
#include <optional>
#include <string>
#include "control/command_dispatcher.hpp"
#include "control/session_state.hpp"
#include "input/move_throttler.hpp"
#include "scheduler.hpp"
#include "transport.hpp"

namespace fleetdeck::input {

/**
 * Turns one tile's host pointer/key events into control commands:
 *   pointer -> CoordinateMapper -> MoveThrottler -> CommandDispatcher
 *
 * Only one touch session exists at a time (SessionState::beginTouch). Ending
 * a session, whether by pointer up, pointer leave or cancel(), always runs:
 *   1. flush the queued move
 *   2. send the terminal up (final pointer position, else the last position)
 *   3. cancel the scheduled frame
 *   4. release the session
 */
class TouchController {
public:
    TouchController(control::SessionState& state, control::CommandDispatcher& dispatcher,
                    FrameScheduler& frames, double epsilon = MoveThrottler::DEFAULT_EPSILON);
    ~TouchController();

    TouchController(const TouchController&) = delete;
    TouchController& operator=(const TouchController&) = delete;

    // Return false when the event was ignored
    bool pointerDown(const DeviceId& id, const PointerEvent& ev);
    bool pointerMove(const DeviceId& id, const PointerEvent& ev);
    bool pointerUp(const DeviceId& id, const PointerEvent& ev);
    void pointerLeave(const DeviceId& id);

    void contextAction(const DeviceId& id);   // home button
    void keyDown(const DeviceId& id, const std::string& key);
    void keyUp(const DeviceId& id, const std::string& key);

    // Ends the active session, if any
    void cancel();
    // Ends the session only if it belongs to `id` (device removal)
    void cancelFor(const DeviceId& id);

    bool hasSession() const { return state_.touch().active; }
    std::optional<NormalizedPoint> map(const DeviceId& id, const PointerPosition& pos) const;

    const MoveThrottler& throttler() const { return throttler_; }
    void setEpsilon(double eps) { throttler_.setEpsilon(eps); }

    // Adapter delivering one tile's host events to this controller
    std::unique_ptr<InputSink> sinkFor(const DeviceId& id);

private:
    bool ownsSession(const DeviceId& id) const;
    void finish(std::optional<NormalizedPoint> final_pos);

    control::SessionState& state_;
    control::CommandDispatcher& dispatcher_;
    MoveThrottler throttler_;
};

} // namespace fleetdeck::input
