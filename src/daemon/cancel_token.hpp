#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

namespace foldermind {

// Shared between a folder and the job working on it. Jobs poll it between
// documents and between chunks.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken makeCancelToken()
{
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool isCancelled(const CancelToken &token)
{
    return token && token->load();
}

class JobCancelledError : public std::runtime_error {
public:
    JobCancelledError()
        : std::runtime_error("job cancelled")
    {
    }
};

inline void throwIfCancelled(const CancelToken &token)
{
    if (isCancelled(token)) {
        throw JobCancelledError();
    }
}

} // namespace foldermind
