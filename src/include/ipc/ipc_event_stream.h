#pragma once

#include <core/model/feedback.h>
#include <deque>
#include <ipc/model.h>
#include <mutex>
#include <optional>
#include <vector>

namespace shuttle::ipc {

// Operations flow in from the frontend, feedback flows out to it.
// Both queues are FIFO and safe to use from any thread.
class IpcEventStream {
    using Feedback = core::Feedback;

public:
    void PostOperation(Operation&& operation);
    void PostOperation(const Operation& operation);
    void PostFeedback(Feedback&& feedback);
    void PostFeedback(const Feedback& feedback);

    std::optional<Operation> PollOperation();
    std::optional<Feedback> PollFeedback();

    // Takes every pending feedback at once, in posting order
    std::vector<Feedback> DrainFeedback();

private:
    std::mutex mutex_;
    std::deque<Operation> operations_;
    std::deque<Feedback> feedbacks_;
};

} // namespace shuttle::ipc
