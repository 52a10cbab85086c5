#pragma once

#include "core/clock.hpp"
#include "graph/graph_snapshot.hpp"
#include "store/graph_store.hpp"

#include <atomic>
#include <memory>

namespace netmap {

/**
 * @brief Materializes a GraphSnapshot for one scope from the store
 *
 * Reads run on a worker thread and are abandoned after `read_timeout`;
 * a timeout or any store error surfaces as StoreUnavailable. A timeout of
 * zero, or a store that bounds its own reads, reads inline. At most
 * kMaxPendingReads abandoned reads may still be running; further loads fail
 * fast until one of them returns.
 */
class GraphBuilder {
public:
    GraphBuilder(std::shared_ptr<GraphStore> store,
                 std::shared_ptr<Clock> clock,
                 Duration read_timeout);

    SnapshotPtr load(const Scope& scope) const;

    /**
     * @brief Worker reads that have not returned yet
     */
    int pending_reads() const { return pending_->load(); }

    static constexpr int kMaxPendingReads = 4;

private:
    std::shared_ptr<GraphStore> store_;
    std::shared_ptr<Clock> clock_;
    Duration read_timeout_;
    // Shared with workers, which may outlive the builder
    std::shared_ptr<std::atomic<int>> pending_ = std::make_shared<std::atomic<int>>(0);
};

} // namespace netmap
