#include "core/dataset_processing_orchestrator.hpp"
#include "core/raster_blender.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

DatasetProcessingOrchestrator::DatasetProcessingOrchestrator(std::shared_ptr<const ArtifactStore> store,
                                                             OrchestratorOptions options)
    : store_(std::move(store)), options_(options)
{
    if (!store_)
    {
        throw std::invalid_argument("DatasetProcessingOrchestrator requires an artifact store");
    }
    if (options_.max_threads < 1)
    {
        options_.max_threads = 1;
    }
    if (options_.max_abandoned_workers < 1)
    {
        options_.max_abandoned_workers = 1;
    }
    workers_ = std::make_shared<WorkerRegistry>(options_.max_abandoned_workers);
}

bool DatasetProcessingOrchestrator::waitForWorkers(std::chrono::milliseconds timeout) const
{
    if (workers_->waitForIdle(timeout))
    {
        return true;
    }
    Logger::warn("Item workers still running after " + std::to_string(timeout.count()) + "ms: " +
                 std::to_string(workers_->running()) + " (" + std::to_string(workers_->abandoned()) + " timed out)");
    return false;
}

PartitionedDataset DatasetProcessingOrchestrator::partition(const std::vector<PairRecord> &pairs)
{
    PartitionedDataset result;
    std::unordered_map<std::string, size_t> group_positions;

    for (const auto &record : pairs)
    {
        if (!record.isFrame())
        {
            result.single_images.push_back(record);
            continue;
        }

        auto it = group_positions.find(record.upload_index);
        if (it == group_positions.end())
        {
            group_positions.emplace(record.upload_index, result.frame_groups.size());
            result.frame_groups.push_back(FrameGroup{record.upload_index, {record}});
        }
        else
        {
            result.frame_groups[it->second].frames.push_back(record);
        }
    }
    return result;
}

std::string DatasetProcessingOrchestrator::outputNameFor(const std::string &image_path)
{
    std::string stem = std::filesystem::path(image_path).stem().string();
    if (stem.empty())
    {
        stem = "image";
    }
    return "processed_" + stem + ".png";
}

Result<ProcessedImageResult> DatasetProcessingOrchestrator::processSingleImage(
    const std::shared_ptr<const ArtifactStore> &store, const PairRecord &record, const std::string &user_id)
{
    auto image = store->loadRaster(record.image_path);
    if (!image)
        return Result<ProcessedImageResult>::failFrom(image);

    auto mask = store->loadRaster(record.mask_path);
    if (!mask)
        return Result<ProcessedImageResult>::failFrom(mask);

    auto blended = RasterBlender::blend(image.value, mask.value);
    if (!blended)
        return Result<ProcessedImageResult>::failFrom(blended);

    auto saved = store->saveImage(blended.value, user_id, outputNameFor(record.image_path));
    if (!saved)
        return Result<ProcessedImageResult>::failFrom(saved);

    return Result<ProcessedImageResult>::ok(ProcessedImageResult{record.image_path, saved.value});
}

Result<ProcessedVideoResult> DatasetProcessingOrchestrator::processFrameGroup(
    const std::shared_ptr<const ArtifactStore> &store, const FrameGroup &group, const std::string &user_id)
{
    SequenceReconstructor reconstructor(store);
    auto output = reconstructor.reconstruct(group, user_id, group.upload_index);
    if (!output)
        return Result<ProcessedVideoResult>::failFrom(output);

    return Result<ProcessedVideoResult>::ok(ProcessedVideoResult{group.upload_index, output.value});
}

void DatasetProcessingOrchestrator::runJobs(size_t count, const std::function<void(size_t)> &job) const
{
    if (options_.max_threads <= 1 || count <= 1)
    {
        for (size_t i = 0; i < count; ++i)
        {
            job(i);
        }
        return;
    }

    tbb::task_arena arena(options_.max_threads);
    arena.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, count, 1),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              job(i);
                                          }
                                      }); });
}

BatchReport DatasetProcessingOrchestrator::processDataset(const std::string &user_id, const nlohmann::json &data) const
{
    auto batch = DatasetCodec::parseDatasetBatch(data);
    if (!batch)
    {
        Logger::error("Error in dataset processing for user " + user_id + ": " + batch.error_message);
        return BatchReport::fatal(batch.error_message);
    }
    return processDataset(user_id, batch.value);
}

BatchReport DatasetProcessingOrchestrator::processDataset(const std::string &user_id, const DatasetBatch &batch) const
{
    if (batch.submittedCount() == 0)
    {
        Logger::warn("Dataset for user " + user_id + " contains no pairs");
        return BatchReport::fatal(EMPTY_BATCH_MESSAGE);
    }

    try
    {
        Logger::info("Starting dataset processing for user: " + user_id + " (" +
                     std::to_string(batch.submittedCount()) + " pairs)");

        BatchReport report;
        report.success = true;

        for (const auto &rejected : batch.malformed)
        {
            Logger::error("Skipping malformed record " + rejected.subject + ": " + rejected.message);
            report.failures.push_back(rejected);
        }

        const PartitionedDataset parts = partition(batch.pairs);
        const size_t image_count = parts.single_images.size();
        const size_t group_count = parts.frame_groups.size();

        Logger::debug("Partitioned dataset into " + std::to_string(image_count) + " single images and " +
                      std::to_string(group_count) + " frame groups");

        std::vector<Result<ProcessedImageResult>> image_results(image_count);
        std::vector<Result<ProcessedVideoResult>> video_results(group_count);

        // Jobs own copies of their inputs and share ownership of the store, so a
        // timed-out job left running never touches this stack frame.
        const auto timeout = options_.item_timeout;
        std::shared_ptr<const ArtifactStore> store = store_;
        const std::shared_ptr<WorkerRegistry> &workers = workers_;

        runJobs(image_count + group_count, [&](size_t i)
                {
            const bool is_image = i < image_count;
            try
            {
                if (is_image)
                {
                    PairRecord record = parts.single_images[i];
                    image_results[i] = ErrorRecovery::callWithTimeout(
                        [store, record, user_id]()
                        { return processSingleImage(store, record, user_id); },
                        timeout, "image " + record.image_path, workers);
                }
                else
                {
                    FrameGroup group = parts.frame_groups[i - image_count];
                    video_results[i - image_count] = ErrorRecovery::callWithTimeout(
                        [store, group, user_id]()
                        { return processFrameGroup(store, group, user_id); },
                        timeout, "video " + group.upload_index, workers);
                }
            }
            catch (const OperationTimeoutError &e)
            {
                if (is_image)
                    image_results[i] = Result<ProcessedImageResult>::fail(ErrorKind::TIMEOUT, e.what());
                else
                    video_results[i - image_count] = Result<ProcessedVideoResult>::fail(ErrorKind::TIMEOUT, e.what());
            }
            catch (const std::exception &e)
            {
                if (is_image)
                    image_results[i] = Result<ProcessedImageResult>::fail(ErrorKind::IO_ERROR, e.what());
                else
                    video_results[i - image_count] = Result<ProcessedVideoResult>::fail(ErrorKind::IO_ERROR, e.what());
            } });

        for (size_t i = 0; i < image_count; ++i)
        {
            const auto &outcome = image_results[i];
            const auto &record = parts.single_images[i];
            if (outcome)
            {
                report.images.push_back(outcome.value);
            }
            else
            {
                Logger::error("Error processing single image " + record.image_path + " [" +
                              errorKindName(outcome.error_kind) + "]: " + outcome.error_message);
                report.failures.push_back({record.image_path, outcome.error_kind, outcome.error_message});
            }
        }

        for (size_t g = 0; g < group_count; ++g)
        {
            const auto &outcome = video_results[g];
            const auto &group = parts.frame_groups[g];
            if (outcome)
            {
                report.videos.push_back(outcome.value);
            }
            else
            {
                Logger::error("Error processing video " + group.upload_index + " [" +
                              errorKindName(outcome.error_kind) + "]: " + outcome.error_message);
                report.failures.push_back({"video " + group.upload_index, outcome.error_kind, outcome.error_message});
            }
        }

        Logger::info("Dataset processing completed. Images: " + std::to_string(report.images.size()) +
                     ", Videos: " + std::to_string(report.videos.size()) +
                     ", Skipped: " + std::to_string(report.failures.size()));
        return report;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error in dataset processing: " + std::string(e.what()));
        return BatchReport::fatal(e.what());
    }
}
