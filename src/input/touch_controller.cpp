#include "touch_controller.hpp"
#include "fleet_log.hpp"
#include "input/coordinate_mapper.hpp"

using namespace fleetdeck::protocol;

namespace fleetdeck::input {

namespace {

class TileInputSink : public InputSink {
public:
    TileInputSink(TouchController& controller, DeviceId id)
        : controller_(controller), id_(std::move(id)) {}

    void onPointerDown(const PointerEvent& ev) override { controller_.pointerDown(id_, ev); }
    void onPointerMove(const PointerEvent& ev) override { controller_.pointerMove(id_, ev); }
    void onPointerUp(const PointerEvent& ev) override { controller_.pointerUp(id_, ev); }
    void onPointerLeave() override { controller_.pointerLeave(id_); }
    void onKeyDown(const std::string& key) override { controller_.keyDown(id_, key); }
    void onKeyUp(const std::string& key) override { controller_.keyUp(id_, key); }
    void onContextAction() override { controller_.contextAction(id_); }

private:
    TouchController& controller_;
    DeviceId id_;
};

} // namespace

TouchController::TouchController(control::SessionState& state, control::CommandDispatcher& dispatcher,
                                 FrameScheduler& frames, double epsilon)
    : state_(state), dispatcher_(dispatcher),
      throttler_(frames, [this](const NormalizedPoint& p) {
          if (!state_.touch().active) return;
          dispatcher_.dispatch(state_.touch().device_id, ControlCommand::touch(CommandKind::TouchMove, p));
      }, epsilon) {}

TouchController::~TouchController() {
    cancel();
}

std::optional<NormalizedPoint> TouchController::map(const DeviceId& id, const PointerPosition& pos) const {
    VideoSurface* surface = state_.connections().surface(id);
    if (!surface) return std::nullopt;
    return mapPointer(pos, surface->boundingRect(), surface->intrinsicSize(), surface->rotation());
}

bool TouchController::ownsSession(const DeviceId& id) const {
    const auto& t = state_.touch();
    return t.active && t.device_id == id;
}

bool TouchController::pointerDown(const DeviceId& id, const PointerEvent& ev) {
    if (ev.button != 0 || state_.touch().active) return false;

    auto pos = map(id, ev.position);
    if (!pos) return false;   // letterbox or no video yet
    if (!state_.beginTouch(id, *pos)) return false;

    throttler_.reset();
    FLOG_TRACE("Touch", "%s down (%.4f, %.4f)", id.c_str(), pos->x, pos->y);
    dispatcher_.dispatch(id, ControlCommand::touch(CommandKind::TouchDown, *pos));
    return true;
}

bool TouchController::pointerMove(const DeviceId& id, const PointerEvent& ev) {
    if (!ownsSession(id)) return false;
    auto pos = map(id, ev.position);
    if (!pos) return false;
    state_.updateTouch(*pos);
    throttler_.push(*pos);
    return true;
}

bool TouchController::pointerUp(const DeviceId& id, const PointerEvent& ev) {
    if (!ownsSession(id)) return false;
    finish(map(id, ev.position));
    return true;
}

void TouchController::pointerLeave(const DeviceId& id) {
    if (!ownsSession(id)) return;
    finish(std::nullopt);
}

void TouchController::contextAction(const DeviceId& id) {
    dispatcher_.dispatch(id, ControlCommand::home());
}

void TouchController::keyDown(const DeviceId& id, const std::string& key) {
    dispatcher_.dispatch(id, ControlCommand::keyPhase(CommandKind::KeyDown, key));
}

void TouchController::keyUp(const DeviceId& id, const std::string& key) {
    dispatcher_.dispatch(id, ControlCommand::keyPhase(CommandKind::KeyUp, key));
}

void TouchController::cancel() {
    if (!state_.touch().active) return;
    finish(std::nullopt);
}

void TouchController::cancelFor(const DeviceId& id) {
    if (ownsSession(id)) finish(std::nullopt);
}

void TouchController::finish(std::optional<NormalizedPoint> final_pos) {
    const DeviceId device = state_.touch().device_id;

    throttler_.flush();
    const NormalizedPoint up = final_pos ? *final_pos : state_.touch().last_position;
    dispatcher_.dispatch(device, ControlCommand::touch(CommandKind::TouchUp, up));
    throttler_.reset();
    state_.endTouch();

    FLOG_TRACE("Touch", "%s up (%.4f, %.4f)", device.c_str(), up.x, up.y);
}

std::unique_ptr<InputSink> TouchController::sinkFor(const DeviceId& id) {
    return std::make_unique<TileInputSink>(*this, id);
}

} // namespace fleetdeck::input
