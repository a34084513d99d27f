#include "TaskScheduler.hpp"
#include <stdexcept>
#include <utility>
#include <trantor/net/EventLoop.h>

EventLoopScheduler::EventLoopScheduler(trantor::EventLoop* loop) : loop_(loop) {
    if (!loop_) {
        throw std::invalid_argument("EventLoopScheduler requires an event loop");
    }
}

void EventLoopScheduler::post(Task task) {
    loop_->queueInLoop(std::move(task));
}

void EventLoopScheduler::runAfter(double delaySeconds, Task task) {
    loop_->runAfter(delaySeconds, std::move(task));
}
