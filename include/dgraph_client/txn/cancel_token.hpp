#pragma once

#include <atomic>
#include <memory>

namespace dgraph_client {

// ---------------------------------------------------------------------------
// CancelToken: shared cancellation flag. Copies observe the same flag, so a
// caller keeps one copy and hands another to the operation.
// ---------------------------------------------------------------------------
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const noexcept { flag_->store(true); }
    [[nodiscard]] bool IsCancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace dgraph_client
