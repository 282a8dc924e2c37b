#include "wccforest/forest/batch_coordinator.h"
#include "wccforest/forest/union_find_forest.h"
#include "wccforest/storage/background_processor.h"
#include "wccforest/common/logger.h"

#include <absl/container/flat_hash_map.h>

#include <algorithm>
#include <deque>
#include <map>
#include <random>
#include <sstream>
#include <thread>

namespace wccforest {
namespace forest {

std::vector<core::EventId> WorkGroup::event_ids() const {
    std::vector<core::EventId> ids;
    ids.reserve(events.size());
    for (const auto& event : events) {
        ids.push_back(event.id);
    }
    return ids;
}

const char* group_status_name(GroupStatus status) {
    switch (status) {
        case GroupStatus::PENDING: return "PENDING";
        case GroupStatus::SUCCEEDED: return "SUCCEEDED";
        case GroupStatus::FAILED: return "FAILED";
        case GroupStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string BatchReport::to_string() const {
    std::ostringstream oss;
    oss << "groups=" << groups.size()
        << " succeeded=" << groups_succeeded
        << " failed=" << groups_failed
        << " cancelled=" << groups_cancelled
        << " attempts=" << total_attempts
        << " processed_events=" << processed_event_ids.size();
    if (aborted) {
        oss << " aborted";
    }
    if (fatal_error) {
        oss << " error=\"" << *fatal_error << "\"";
    }
    return oss.str();
}

BatchCoordinator::BatchCoordinator(std::shared_ptr<storage::GraphStore> store,
                                   std::shared_ptr<oracle::WccOracle> oracle,
                                   const core::BatchConfig& config)
    : store_(std::move(store)), oracle_(std::move(oracle)), config_(config) {
    if (config_.num_workers == 0) {
        config_.num_workers = 1;
    }
    if (config_.max_queue_size == 0) {
        config_.max_queue_size = 1;
    }
}

std::vector<uint64_t> BatchCoordinator::traverse_components(const oracle::OracleGraph& graph) {
    std::vector<std::vector<size_t>> adjacency(graph.num_nodes);
    for (const auto& [a, b] : graph.edges) {
        adjacency[a].push_back(b);
        adjacency[b].push_back(a);
    }
    
    const uint64_t unlabeled = graph.num_nodes;
    std::vector<uint64_t> labels(graph.num_nodes, unlabeled);
    for (size_t start = 0; start < graph.num_nodes; ++start) {
        if (labels[start] != unlabeled) {
            continue;
        }
        labels[start] = start;
        std::deque<size_t> frontier{start};
        while (!frontier.empty()) {
            size_t node = frontier.front();
            frontier.pop_front();
            for (size_t next : adjacency[node]) {
                if (labels[next] == unlabeled) {
                    labels[next] = start;
                    frontier.push_back(next);
                }
            }
        }
    }
    return labels;
}

core::Result<std::vector<uint64_t>> BatchCoordinator::label(const oracle::OracleGraph& graph) {
    if (oracle_) {
        auto labels = oracle_->label(graph);
        if (labels.ok() && labels.value().size() == graph.num_nodes) {
            return labels;
        }
        std::string reason = labels.ok() ? "label count mismatch" : labels.error();
        if (!config_.fallback_to_direct_traversal) {
            WCCFOREST_ERROR("WCC oracle {} failed: {}", oracle_->name(), reason);
            return core::Result<std::vector<uint64_t>>::error(
                "WCC oracle unavailable: " + reason, core::Error::Code::UNAVAILABLE);
        }
        WCCFOREST_WARN("WCC oracle {} failed ({}), falling back to direct traversal", oracle_->name(), reason);
    } else if (!config_.fallback_to_direct_traversal) {
        return core::Result<std::vector<uint64_t>>::error("No WCC oracle configured",
                                                          core::Error::Code::UNAVAILABLE);
    }
    return core::Result<std::vector<uint64_t>>(traverse_components(graph));
}

core::Result<std::vector<WorkGroup>> BatchCoordinator::plan() {
    auto unprocessed = store_->unprocessed_events();
    if (!unprocessed.ok()) {
        return core::Result<std::vector<WorkGroup>>::error_from(unprocessed);
    }
    auto events_result = store_->get_events(unprocessed.value());
    if (!events_result.ok()) {
        return core::Result<std::vector<WorkGroup>>::error_from(events_result);
    }
    auto events = events_result.take_value();
    std::sort(events.begin(), events.end(),
              [](const core::Event& a, const core::Event& b) { return core::chronologically_before(a, b); });
    
    oracle::OracleGraph graph;
    absl::flat_hash_map<core::EventId, size_t> event_node;
    absl::flat_hash_map<core::EventId, size_t> head_node;
    for (const auto& event : events) {
        event_node[event.id] = graph.add_node();
    }
    
    for (const auto& event : events) {
        auto predecessors = store_->precedence_predecessors(event.id);
        if (!predecessors.ok()) {
            return core::Result<std::vector<WorkGroup>>::error_from(predecessors);
        }
        auto next_events = store_->precedence_successors(event.id);
        if (!next_events.ok()) {
            return core::Result<std::vector<WorkGroup>>::error_from(next_events);
        }
        size_t node = event_node[event.id];
        std::vector<core::EventId> neighbours = predecessors.take_value();
        // Successors already processed come from late arrivals
        for (core::EventId next : next_events.value()) {
            if (event_node.find(next) == event_node.end()) {
                neighbours.push_back(next);
            }
        }
        for (core::EventId neighbour : neighbours) {
            auto neighbour_it = event_node.find(neighbour);
            if (neighbour_it != event_node.end()) {
                graph.add_edge(neighbour_it->second, node);
                continue;
            }
            auto head = TemporalForest::find_head(*store_, neighbour);
            if (!head.ok()) {
                return core::Result<std::vector<WorkGroup>>::error_from(head);
            }
            auto head_it = head_node.find(head.value());
            if (head_it == head_node.end()) {
                head_it = head_node.emplace(head.value(), graph.add_node()).first;
            }
            graph.add_edge(head_it->second, node);
        }
    }
    
    auto labels = label(graph);
    if (!labels.ok()) {
        return core::Result<std::vector<WorkGroup>>::error_from(labels);
    }
    
    // Events are visited chronologically, so group ids follow first events
    std::map<uint64_t, size_t> group_of_label;
    std::vector<WorkGroup> groups;
    for (const auto& event : events) {
        uint64_t component = labels.value()[event_node[event.id]];
        auto it = group_of_label.find(component);
        if (it == group_of_label.end()) {
            it = group_of_label.emplace(component, groups.size()).first;
            WorkGroup group;
            group.group_id = groups.size();
            groups.push_back(std::move(group));
        }
        groups[it->second].events.push_back(event);
    }
    
    std::mt19937_64 rng(config_.shuffle_seed ? *config_.shuffle_seed : std::random_device{}());
    std::shuffle(groups.begin(), groups.end(), rng);
    
    WCCFOREST_INFO("Planned {} work groups over {} unprocessed events ({} planning edges, {} existing heads)",
                   groups.size(), events.size(), graph.edges.size(), head_node.size());
    return core::Result<std::vector<WorkGroup>>(std::move(groups));
}

void BatchCoordinator::run_group(const WorkGroup& group, GroupReport& report,
                                 std::vector<core::EventId>& processed) {
    const auto ids = group.event_ids();
    
    for (uint32_t attempt = 0; ; ++attempt) {
        if (stopping()) {
            report.status = GroupStatus::CANCELLED;
            report.error = "Group cancelled before completion";
            report.error_code = core::Error::Code::CANCELLED;
            return;
        }
        
        ++report.attempts;
        auto outcomes = TemporalForest::merge_group(store_, ids);
        if (outcomes.ok()) {
            for (const auto& outcome : outcomes.value()) {
                if (!outcome.skipped) {
                    processed.push_back(outcome.event);
                }
            }
            report.status = GroupStatus::SUCCEEDED;
            report.error.reset();
            report.error_code = core::Error::Code::UNKNOWN;
            return;
        }
        
        report.error = outcomes.error();
        report.error_code = outcomes.error_code();
        
        if (outcomes.error_code() == core::Error::Code::STRUCTURAL_VIOLATION) {
            WCCFOREST_CRITICAL("Group {} hit a structural violation, aborting batch: {}",
                               group.group_id, outcomes.error());
            {
                std::lock_guard<std::mutex> lock(fatal_mutex_);
                if (!fatal_error_) {
                    fatal_error_ = outcomes.error();
                }
            }
            aborted_.store(true);
            report.status = GroupStatus::FAILED;
            return;
        }
        
        if (!core::is_transient(outcomes.error_code()) || attempt >= config_.max_group_retries) {
            WCCFOREST_ERROR("Group {} failed after {} attempts: {}",
                            group.group_id, report.attempts, outcomes.error());
            report.status = GroupStatus::FAILED;
            return;
        }
        
        core::Duration backoff = std::min<core::Duration>(
            config_.retry_backoff_ms * (core::Duration{1} << std::min<uint32_t>(attempt, 30)),  // 2^n
            config_.max_backoff_ms);
        WCCFOREST_WARN("Group {} failed (attempt {}), retrying in {}ms. Error: {}",
                       group.group_id, report.attempts, backoff, outcomes.error());
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
    }
}

BatchReport BatchCoordinator::process_groups(const std::vector<WorkGroup>& groups) {
    cancelled_.store(false);
    aborted_.store(false);
    {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        fatal_error_.reset();
    }
    
    BatchReport report;
    report.groups.resize(groups.size());
    std::vector<std::vector<core::EventId>> processed(groups.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        report.groups[i].group_id = groups[i].group_id;
        report.groups[i].event_ids = groups[i].event_ids();
    }
    
    storage::BackgroundProcessorConfig pool_config;
    pool_config.num_workers = config_.num_workers;
    pool_config.max_queue_size = config_.max_queue_size;
    storage::BackgroundProcessor pool(pool_config);
    auto started = pool.initialize();
    if (!started.ok()) {
        WCCFOREST_ERROR("Failed to start merge workers: {}", started.error());
        report.fatal_error = started.error();
        for (auto& group_report : report.groups) {
            group_report.status = GroupStatus::FAILED;
            group_report.error = started.error();
            group_report.error_code = started.error_code();
            ++report.groups_failed;
        }
        return report;
    }
    
    auto make_task = [&](size_t i) {
        GroupReport& group_report = report.groups[i];
        storage::BackgroundTask task(
            "merge-group-" + std::to_string(groups[i].group_id),
            [this, &groups, &group_report, &processed, i]() {
                run_group(groups[i], group_report, processed[i]);
                return core::Result<void>();
            });
        task.on_complete = [&group_report](const core::Result<void>& result) {
            // Thrown out of the group or abandoned at shutdown
            if (!result.ok() && group_report.status == GroupStatus::PENDING) {
                group_report.status = result.error_code() == core::Error::Code::CANCELLED
                    ? GroupStatus::CANCELLED : GroupStatus::FAILED;
                group_report.error = result.error();
                group_report.error_code = result.error_code();
            }
        };
        return task;
    };
    
    for (size_t i = 0; i < groups.size(); ++i) {
        while (true) {
            auto submitted = pool.submitTask(make_task(i));
            if (submitted.ok()) {
                break;
            }
            if (submitted.error_code() != core::Error::Code::RESOURCE_EXHAUSTED || stopping()) {
                GroupReport& group_report = report.groups[i];
                group_report.status = stopping() ? GroupStatus::CANCELLED : GroupStatus::FAILED;
                group_report.error = submitted.error();
                group_report.error_code = submitted.error_code();
                break;
            }
            // Queue full; let the workers drain it
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    
    auto finished = pool.waitForCompletion(config_.wait_timeout);
    if (!finished.ok()) {
        WCCFOREST_ERROR("Batch did not finish within {}ms, cancelling remaining groups",
                        config_.wait_timeout.count());
        report.fatal_error = "Batch timed out";
        cancelled_.store(true);
        // Cancelled groups stop at their next attempt
        while (!pool.waitForCompletion(config_.wait_timeout).ok()) {
            WCCFOREST_WARN("Still waiting for {} queued merge groups", pool.getQueueSize());
        }
    }
    
    auto pool_stats = pool.getStats();
    WCCFOREST_DEBUG("Merge pool: {} tasks submitted, {} processed, {} rejected while the queue was full",
                    pool_stats.tasks_submitted, pool_stats.tasks_processed, pool_stats.tasks_rejected);
    
    auto stopped = pool.shutdown();
    if (!stopped.ok()) {
        WCCFOREST_WARN("Merge worker shutdown: {}", stopped.error());
    }
    
    for (size_t i = 0; i < groups.size(); ++i) {
        const auto& group_report = report.groups[i];
        report.total_attempts += group_report.attempts;
        switch (group_report.status) {
            case GroupStatus::SUCCEEDED:
                ++report.groups_succeeded;
                report.processed_event_ids.insert(report.processed_event_ids.end(),
                                                  processed[i].begin(), processed[i].end());
                break;
            case GroupStatus::CANCELLED:
                ++report.groups_cancelled;
                break;
            case GroupStatus::FAILED:
            case GroupStatus::PENDING:
                ++report.groups_failed;
                break;
        }
    }
    std::sort(report.processed_event_ids.begin(), report.processed_event_ids.end());
    
    report.aborted = aborted_.load();
    {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        if (fatal_error_) {
            report.fatal_error = fatal_error_;
        }
    }
    
    if (report.aborted) {
        WCCFOREST_CRITICAL("Batch aborted: {}", report.to_string());
    } else {
        WCCFOREST_INFO("Batch finished: {}", report.to_string());
    }
    return report;
}

core::Result<BatchReport> BatchCoordinator::run() {
    auto groups = plan();
    if (!groups.ok()) {
        return core::Result<BatchReport>::error_from(groups);
    }
    return core::Result<BatchReport>(process_groups(groups.value()));
}

void BatchCoordinator::cancel() {
    cancelled_.store(true);
}

} // namespace forest
} // namespace wccforest
