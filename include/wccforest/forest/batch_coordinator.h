#ifndef WCCFOREST_FOREST_BATCH_COORDINATOR_H_
#define WCCFOREST_FOREST_BATCH_COORDINATOR_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "wccforest/core/config.h"
#include "wccforest/core/result.h"
#include "wccforest/core/types.h"
#include "wccforest/oracle/wcc_oracle.h"
#include "wccforest/storage/graph_store.h"

namespace wccforest {
namespace forest {

/**
 * @brief One unit of work: the unprocessed events of one planning component
 */
struct WorkGroup {
    uint64_t group_id = 0;
    std::vector<core::Event> events;   // Ascending (timestamp, id)
    
    std::vector<core::EventId> event_ids() const;
};

enum class GroupStatus {
    PENDING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* group_status_name(GroupStatus status);

struct GroupReport {
    uint64_t group_id = 0;
    std::vector<core::EventId> event_ids;
    uint32_t attempts = 0;
    GroupStatus status = GroupStatus::PENDING;
    std::optional<std::string> error;
    core::Error::Code error_code = core::Error::Code::UNKNOWN;
};

struct BatchReport {
    std::vector<GroupReport> groups;
    std::vector<core::EventId> processed_event_ids;   // Newly processed, ascending id
    uint64_t groups_succeeded = 0;
    uint64_t groups_failed = 0;
    uint64_t groups_cancelled = 0;
    uint64_t total_attempts = 0;
    bool aborted = false;                       // A structural violation stopped the run
    std::optional<std::string> fatal_error;
    
    bool ok() const { return groups_failed == 0 && groups_cancelled == 0 && !aborted; }
    std::string to_string() const;
};

/**
 * @brief Parallel application of forest merges
 * 
 * Plans work groups with the bulk WCC oracle over the unprocessed events,
 * shuffles them and runs each group as one atomic merge on the worker pool.
 * Transient failures are retried per group with bounded exponential backoff.
 * A structural violation aborts the run: groups that have not started yet
 * finish as CANCELLED.
 */
class BatchCoordinator {
public:
    BatchCoordinator(std::shared_ptr<storage::GraphStore> store,
                     std::shared_ptr<oracle::WccOracle> oracle,
                     const core::BatchConfig& config = core::BatchConfig::Default());
    
    /**
     * @brief Partition the unprocessed events into independent work groups
     * 
     * Every unprocessed event is linked to its unprocessed precedence
     * predecessors and to the current head of each processed one, so events
     * extending the same head always share a group.
     */
    core::Result<std::vector<WorkGroup>> plan();
    
    /**
     * @brief Plan and process every unprocessed event
     */
    core::Result<BatchReport> run();
    
    /**
     * @brief Process the given groups, e.g. the failed groups of an earlier run
     */
    BatchReport process_groups(const std::vector<WorkGroup>& groups);
    
    /**
     * @brief Groups that have not started yet finish as CANCELLED
     * 
     * Applies to the run in progress.
     */
    void cancel();
    
    const core::BatchConfig& config() const { return config_; }

private:
    core::Result<std::vector<uint64_t>> label(const oracle::OracleGraph& graph);
    void run_group(const WorkGroup& group, GroupReport& report, std::vector<core::EventId>& processed);
    bool stopping() const { return cancelled_.load() || aborted_.load(); }
    
    // Connected components by direct BFS, used when the oracle is unavailable
    static std::vector<uint64_t> traverse_components(const oracle::OracleGraph& graph);
    
    std::shared_ptr<storage::GraphStore> store_;
    std::shared_ptr<oracle::WccOracle> oracle_;
    core::BatchConfig config_;
    
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> aborted_{false};
    std::mutex fatal_mutex_;
    std::optional<std::string> fatal_error_;
};

} // namespace forest
} // namespace wccforest

#endif // WCCFOREST_FOREST_BATCH_COORDINATOR_H_
