#pragma once

#include <core/model/feedback.h>
#include <deque>
#include <ipc/model.h>
#include <mutex>
#include <optional>

namespace puresend::ipc {

// Operations from the front end in, feedback from the engine out. Either side may post
// from another thread.
class IpcEventStream {
    using Feedback = core::Feedback;

public:
    void PostOperation(Operation&& operation);
    void PostOperation(const Operation& operation);
    void PostFeedback(Feedback&& feedback);
    void PostFeedback(const Feedback& feedback);

    std::optional<Operation> PollOperation();
    std::optional<Feedback> PollFeedback();

private:
    std::mutex mutex_;
    std::deque<Operation> operations_;
    std::deque<Feedback> feedbacks_;
};

} // namespace puresend::ipc
