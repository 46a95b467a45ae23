#include "services/analysis/batch_analyzer.hpp"
#include "services/analysis/worker_pool.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <utility>

namespace dentescope::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("BatchAnalyzer");
    return logger;
}

using Clock = std::chrono::steady_clock;
using Outcome = std::expected<AnalysisResult, core::AnalysisError>;

/// State shared between the collecting thread and possibly late tasks
struct BatchState {
    std::mutex mutex;
    std::condition_variable finished;
    std::vector<std::optional<Outcome>> outcomes;
    size_t remaining = 0;
};
}  // anonymous namespace

class BatchAnalyzer::Impl {
public:
    Impl(std::shared_ptr<ToothAnalyzer> analyzer,
         unsigned int workerCount,
         std::chrono::milliseconds timeout)
        : analyzer_(std::move(analyzer))
        , timeout_(timeout)
        , pool_(workerCount) {}

    BatchResult analyze(std::vector<ImageInput> inputs, const core::AnalysisOptions& options) {
        const auto start = Clock::now();
        const auto deadline = options.deadline.value_or(start + timeout_);

        auto shared = std::make_shared<const std::vector<ImageInput>>(std::move(inputs));
        auto state = std::make_shared<BatchState>();
        state->outcomes.resize(shared->size());
        state->remaining = shared->size();

        core::AnalysisOptions itemOptions = options;
        itemOptions.deadline = deadline;

        getLogger()->info("Analyzing {} image(s) on {} worker(s) with {}", shared->size(),
                          pool_.size(), analyzer_ ? analyzer_->name() : "no analyzer");

        for (size_t index = 0; index < shared->size(); ++index) {
            auto task = [analyzer = analyzer_, shared, state, itemOptions, index] {
                auto outcome = runOne(analyzer, (*shared)[index], itemOptions);
                std::lock_guard lock(state->mutex);
                state->outcomes[index] = std::move(outcome);
                if (--state->remaining == 0) {
                    state->finished.notify_all();
                }
            };
            if (!pool_.submit(std::move(task))) {
                std::lock_guard lock(state->mutex);
                state->outcomes[index] = Outcome(std::unexpect, core::AnalysisError{
                    core::AnalysisError::Code::InternalError, "worker pool is shutting down"
                });
                --state->remaining;
            }
        }

        BatchResult result;
        result.items.reserve(shared->size());
        {
            std::unique_lock lock(state->mutex);
            const bool completed = state->finished.wait_until(
                lock, deadline, [&state] { return state->remaining == 0; });
            if (!completed) {
                getLogger()->warn("Batch deadline reached with {} item(s) unfinished",
                                  state->remaining);
            }

            for (size_t index = 0; index < shared->size(); ++index) {
                const auto& input = (*shared)[index];
                BatchItemResult item;
                item.fileName = input.name;
                item.fileSize = input.bytes.size();
                if (state->outcomes[index]) {
                    item.outcome = *state->outcomes[index];
                } else {
                    item.outcome = std::unexpected(core::AnalysisError{
                        core::AnalysisError::Code::Timeout,
                        std::format("'{}' did not finish before the batch deadline",
                                    input.name)
                    });
                }
                result.items.push_back(std::move(item));
            }
        }

        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        result.summary = summarize(result.items, elapsed);

        getLogger()->info("Batch finished: {}/{} processed, {} failed in {}ms",
                          result.summary.processedFiles, result.summary.totalFiles,
                          result.summary.failedFiles, elapsed.count());
        return result;
    }

    size_t workerCount() const noexcept { return pool_.size(); }

private:
    static Outcome runOne(const std::shared_ptr<ToothAnalyzer>& analyzer,
                          const ImageInput& input,
                          const core::AnalysisOptions& options) {
        if (!analyzer) {
            return std::unexpected(core::AnalysisError{
                core::AnalysisError::Code::InternalError, "no analyzer configured"
            });
        }
        try {
            auto outcome = analyzer->analyze(input, options);
            if (!outcome) {
                getLogger()->warn("'{}' failed: {}", input.name, outcome.error().toString());
            }
            return outcome;
        } catch (const std::exception& e) {
            getLogger()->error("'{}' raised an exception: {}", input.name, e.what());
            return std::unexpected(core::AnalysisError{
                core::AnalysisError::Code::InternalError, e.what()
            });
        }
    }

    std::shared_ptr<ToothAnalyzer> analyzer_;
    std::chrono::milliseconds timeout_;
    WorkerPool pool_;
};

BatchAnalyzer::BatchAnalyzer(std::shared_ptr<ToothAnalyzer> analyzer,
                             unsigned int workerCount,
                             std::chrono::milliseconds timeout)
    : impl_(std::make_unique<Impl>(std::move(analyzer), workerCount, timeout)) {}

BatchAnalyzer::~BatchAnalyzer() = default;

BatchAnalyzer::BatchAnalyzer(BatchAnalyzer&&) noexcept = default;
BatchAnalyzer& BatchAnalyzer::operator=(BatchAnalyzer&&) noexcept = default;

BatchResult BatchAnalyzer::analyze(std::vector<ImageInput> inputs,
                                   const core::AnalysisOptions& options) {
    return impl_->analyze(std::move(inputs), options);
}

size_t BatchAnalyzer::workerCount() const noexcept {
    return impl_->workerCount();
}

BatchSummary BatchAnalyzer::summarize(const std::vector<BatchItemResult>& items,
                                      std::chrono::milliseconds elapsed) {
    BatchSummary summary;
    summary.totalFiles = items.size();
    summary.totalProcessingTimeMs = elapsed.count();

    double differenceSum = 0.0;
    size_t pairCount = 0;
    for (const auto& item : items) {
        if (!item.succeeded()) {
            ++summary.failedFiles;
            continue;
        }
        ++summary.processedFiles;
        for (const auto& pair : item.outcome->pairs) {
            differenceSum += std::abs(pair.widthDifference.valueMm);
            ++pairCount;
            ++summary.severityCounts[static_cast<size_t>(pair.widthDifference.severity)];
        }
    }
    if (pairCount > 0) {
        summary.averageWidthDifference = differenceSum / static_cast<double>(pairCount);
    }
    return summary;
}

}  // namespace dentescope::services
