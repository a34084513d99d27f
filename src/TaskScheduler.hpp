#pragma once
#include <functional>

namespace trantor {
class EventLoop;
}

// Single logical thread of control for one client session.
class TaskScheduler {
public:
    using Task = std::function<void()>;

    virtual ~TaskScheduler() = default;

    // Runs 'task' on the scheduler thread after the current handler returns.
    virtual void post(Task task) = 0;
    virtual void runAfter(double delaySeconds, Task task) = 0;
};

class EventLoopScheduler : public TaskScheduler {
public:
    explicit EventLoopScheduler(trantor::EventLoop* loop);

    void post(Task task) override;
    void runAfter(double delaySeconds, Task task) override;

    trantor::EventLoop* loop() const { return loop_; }

private:
    trantor::EventLoop* loop_;
};
