#include <semgraph/execution/execution_context.h>
#include <algorithm>

namespace semgraph {

ExecutionContext::ExecutionContext(std::shared_ptr<const GraphStore> store, size_t batch_size,
                                   std::chrono::milliseconds timeout, size_t check_interval)
    : store_(std::move(store)),
      local_vocab_(store_->shared_vocabulary()),
      batch_size_(std::max<size_t>(batch_size, 1)),
      timeout_(timeout),
      check_interval_(std::max<size_t>(check_interval, 1)),
      deadline_(Clock::now() + timeout) {}

arrow::Status ExecutionContext::CheckDeadline() const {
    if (Clock::now() >= deadline_) {
        return arrow::Status::Cancelled("Query timed out after ", timeout_.count(), " ms");
    }
    return arrow::Status::OK();
}

arrow::Status ExecutionContext::Tick(size_t rows) {
    ticks_since_check_ += rows;
    if (ticks_since_check_ >= check_interval_) {
        ticks_since_check_ = 0;
        return CheckDeadline();
    }
    return arrow::Status::OK();
}

} // namespace semgraph
