// Concurrent resolution of one batch of file promises into a staging
// directory. One instance per batch: Idle -> AwaitingPromises -> Completed.
#pragma once
#include "FilePromise.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dropshelf {

// Order of resolved paths inside the outcome.
//  - Completion: the order in which promises finished (reference behavior)
//  - Submission: the order in which promises were handed in
enum class ResultOrder { Completion, Submission };

struct ResolverOptions {
    int maxConcurrent = 4;     // worker threads per batch (>= 1)
    int promiseTimeoutMs = 0;  // 0 = no per-promise deadline
    ResultOrder order = ResultOrder::Completion;
};

// One promise that contributed nothing (ResolutionError).
struct PromiseFailure {
    std::size_t index = 0; // position in the submitted list
    std::string error;
    bool timedOut = false;
    bool canceled = false;
};

struct ResolutionOutcome {
    std::vector<std::string> paths;
    std::vector<PromiseFailure> failures;
    std::size_t submitted = 0;
    bool canceled = false;

    // false means NoPromisesResolved
    bool succeeded() const { return !paths.empty(); }
};

class PromiseResolver {
public:
    enum class State { Idle, AwaitingPromises, Completed };
    // Called exactly once, on the worker thread that finished last. It must
    // not destroy the resolver; hand the outcome to another thread instead.
    using CompletionCB = std::function<void(const ResolutionOutcome &)>;

    explicit PromiseResolver(ResolverOptions opt = {});
    // Cancels outstanding promises and joins the workers.
    ~PromiseResolver();

    PromiseResolver(const PromiseResolver &) = delete;
    PromiseResolver &operator=(const PromiseResolver &) = delete;

    // Starts resolving. Fails when the resolver is not Idle, the list is
    // empty, or no worker thread could be started.
    bool start(FilePromiseList promises, const std::string &stagingDir,
               CompletionCB onFinished, std::string &err);

    // Cooperative: running promises see shouldCancel() == true, queued ones
    // are failed without being started.
    void cancel();
    bool isCanceled() const { return canceled_.load(); }

    // Blocks until Completed. Returns immediately when Idle.
    void wait();
    // Same with a bound; true when Completed (or Idle) within timeoutMs.
    bool waitFor(int timeoutMs);

    State state() const;
    std::size_t pending() const;
    // Valid once state() == Completed.
    ResolutionOutcome outcome() const;

    const ResolverOptions &options() const { return opt_; }

private:
    void workerLoop();
    void resolveOne(std::size_t index);
    void finishOne(std::size_t index, std::optional<std::string> path,
                   std::optional<PromiseFailure> failure);
    void joinWorkers();

    ResolverOptions opt_;
    FilePromiseList promises_;
    std::string stagingDir_;
    CompletionCB onFinished_;

    std::vector<std::thread> workers_;
    std::atomic<std::size_t> nextIndex_{0};
    std::atomic<bool> canceled_{false};

    // mtx_ protects state_, pending_ and the accumulators below
    mutable std::mutex mtx_;
    std::condition_variable doneCv_;
    State state_ = State::Idle;
    std::size_t pending_ = 0;
    std::vector<std::string> completionPaths_;
    std::vector<std::optional<std::string>> slotPaths_;
    std::vector<PromiseFailure> failures_;
    ResolutionOutcome outcome_;
};

} // namespace dropshelf
