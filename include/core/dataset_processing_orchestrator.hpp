#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "core/artifact_store.hpp"
#include "core/dataset_types.hpp"
#include "core/error_recovery.hpp"
#include "core/processing_result.hpp"
#include "core/sequence_reconstructor.hpp"

/**
 * @brief Records of a batch split into standalone images and frame groups
 *
 * Frame groups are kept in the order their upload index was first seen.
 */
struct PartitionedDataset
{
    std::vector<PairRecord> single_images;
    std::vector<FrameGroup> frame_groups;
};

struct OrchestratorOptions
{
    int max_threads = 1;                                                     // 1 processes items strictly in partition order
    std::chrono::milliseconds item_timeout = std::chrono::milliseconds(300000); // 0 disables the per-item deadline
    size_t max_abandoned_workers = 8;                                        // timed-out items still running before new items are refused
};

/**
 * @brief Processes a dataset batch into blended images and reconstructed videos.
 *
 * Error Handling Policy:
 * - An empty batch is the only validation failure reported as success=false.
 * - Each standalone image and each frame group is an isolated item: its
 *   failure is logged with the offending path or group id and the item is
 *   left out of the report. The batch continues.
 * - An unexpected exception outside any item is reported as success=false.
 * - No retries.
 */
class DatasetProcessingOrchestrator
{
public:
    static constexpr const char *EMPTY_BATCH_MESSAGE = "No data pairs found in dataset";

    explicit DatasetProcessingOrchestrator(std::shared_ptr<const ArtifactStore> store,
                                           OrchestratorOptions options = OrchestratorOptions());

    /**
     * @brief Process every record of a batch for one user
     * @param user_id Owner of all produced artifacts
     * @param batch Parsed records (including those rejected while parsing)
     * @return Aggregated report; images and videos appear in partition order
     */
    BatchReport processDataset(const std::string &user_id, const DatasetBatch &batch) const;

    /**
     * @brief Parse the `data` object of a request and process it
     *
     * A `data` value whose structure cannot be parsed is reported as success=false.
     */
    BatchReport processDataset(const std::string &user_id, const nlohmann::json &data) const;

    /**
     * @brief Split records into standalone images and frame groups keyed by upload index
     */
    static PartitionedDataset partition(const std::vector<PairRecord> &pairs);

    /**
     * @brief Output file name for a standalone image: processed_<stem>.png
     */
    static std::string outputNameFor(const std::string &image_path);

    const OrchestratorOptions &options() const { return options_; }

    /**
     * @brief Wait for item workers, including timed-out ones, to finish
     * @return false if some were still running when the timeout expired
     */
    bool waitForWorkers(std::chrono::milliseconds timeout) const;

    const WorkerRegistry &workers() const { return *workers_; }

private:
    static Result<ProcessedImageResult> processSingleImage(const std::shared_ptr<const ArtifactStore> &store,
                                                           const PairRecord &record, const std::string &user_id);
    static Result<ProcessedVideoResult> processFrameGroup(const std::shared_ptr<const ArtifactStore> &store,
                                                          const FrameGroup &group, const std::string &user_id);

    // Runs job(i) for i in [0, count), on a bounded task arena when max_threads > 1
    void runJobs(size_t count, const std::function<void(size_t)> &job) const;

    std::shared_ptr<const ArtifactStore> store_;
    OrchestratorOptions options_;
    std::shared_ptr<WorkerRegistry> workers_;
};
