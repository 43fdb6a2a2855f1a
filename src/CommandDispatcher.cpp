#include "CommandDispatcher.hpp"

const char* intentName(ControlIntent intent) {
    switch (intent) {
        case ControlIntent::Start:         return "Start";
        case ControlIntent::Stop:          return "Stop";
        case ControlIntent::IncreaseSpeed: return "Speed up";
        case ControlIntent::DecreaseSpeed: return "Speed down";
    }
    return "Unknown";
}

CommandDispatcher::CommandDispatcher(DeviceController& controllerRef, RenderSink& feedbackRef,
                                     const SpeedSteps& stepsRef) :
    controller(controllerRef), feedback(feedbackRef), steps(stepsRef), failureCount(0)
{}

bool CommandDispatcher::dispatch(ControlIntent intent) {
    bool ok = false;
    switch (intent) {
        case ControlIntent::Start:         ok = controller.start(); break;
        case ControlIntent::Stop:          ok = controller.stop(); break;
        case ControlIntent::IncreaseSpeed: ok = controller.setSpeed(steps.increase); break;
        case ControlIntent::DecreaseSpeed: ok = controller.setSpeed(steps.decrease); break;
    }
    if (!ok) {
        ++failureCount;
        feedback.showNotice(std::string(intentName(intent)) + " failed");
    }
    return ok;
}
