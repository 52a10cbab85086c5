#include "graph/graph_builder.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <future>
#include <system_error>
#include <thread>

namespace netmap {

namespace {

struct ScopeRows {
    std::vector<Entity> entities;
    std::vector<Relationship> relationships;
};

ScopeRows read_scope(GraphStore& store, const Scope& scope) {
    ScopeRows rows;
    rows.entities = store.load_entities(scope);
    rows.relationships = store.load_relationships(scope);
    return rows;
}

} // namespace

GraphBuilder::GraphBuilder(std::shared_ptr<GraphStore> store,
                           std::shared_ptr<Clock> clock,
                           Duration read_timeout)
    : store_(std::move(store)), clock_(std::move(clock)), read_timeout_(read_timeout) {
    if (!store_) {
        throw InvalidArgument("GraphBuilder requires a store");
    }
    if (!clock_) {
        clock_ = default_clock();
    }
}

SnapshotPtr GraphBuilder::load(const Scope& scope) const {
    ScopeRows rows;

    try {
        if (read_timeout_.count() <= 0 || store_->bounds_own_reads()) {
            rows = read_scope(*store_, scope);
        } else {
            if (pending_->load() >= kMaxPendingReads) {
                NETMAP_LOG_ERROR("store reads still pending; refusing new read", {
                    log::StringField("scope", scope),
                    log::IntField("pending", pending_->load())});
                throw StoreUnavailable("store is not answering: " +
                                       std::to_string(pending_->load()) + " reads still pending");
            }

            // The worker owns a reference to the store so an abandoned read
            // can finish safely after we give up on it.
            auto store = store_;
            auto task = std::make_shared<std::packaged_task<ScopeRows()>>(
                [store, scope]() { return read_scope(*store, scope); });
            std::future<ScopeRows> result = task->get_future();
            auto pending = pending_;
            pending->fetch_add(1);
            try {
                std::thread([task, pending]() {
                    (*task)();
                    pending->fetch_sub(1);
                }).detach();
            } catch (const std::system_error&) {
                pending->fetch_sub(1);
                throw;
            }

            if (result.wait_for(read_timeout_) != std::future_status::ready) {
                NETMAP_LOG_ERROR("store read timed out", {
                    log::StringField("scope", scope),
                    log::IntField("timeout_ms", read_timeout_.count())});
                throw StoreUnavailable("store read timed out after " +
                                       std::to_string(read_timeout_.count()) + " ms");
            }
            rows = result.get();
        }
    } catch (const StoreUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreUnavailable(std::string("store read failed: ") + e.what());
    }

    auto snapshot = std::make_shared<const GraphSnapshot>(
        scope, std::move(rows.entities), std::move(rows.relationships), clock_->now());

    if (snapshot->dangling_edges() > 0) {
        NETMAP_LOG_WARN("skipped relationships with missing endpoints", {
            log::StringField("scope", scope),
            log::IntField("dangling", static_cast<std::int64_t>(snapshot->dangling_edges()))});
    }
    NETMAP_LOG_DEBUG("snapshot loaded", {
        log::StringField("scope", scope),
        log::IntField("nodes", static_cast<std::int64_t>(snapshot->num_nodes())),
        log::IntField("edges", static_cast<std::int64_t>(snapshot->num_edges()))});
    return snapshot;
}

} // namespace netmap
