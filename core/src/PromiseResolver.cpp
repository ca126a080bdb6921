// Bounded worker pool per batch; results accumulate under one mutex and a
// counting barrier hands them over once every promise finished.
#include "dropshelf/PromiseResolver.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

namespace dropshelf {

PromiseResolver::PromiseResolver(ResolverOptions opt) : opt_(opt) {
    if (opt_.maxConcurrent < 1)
        opt_.maxConcurrent = 1;
    if (opt_.promiseTimeoutMs < 0)
        opt_.promiseTimeoutMs = 0;
}

PromiseResolver::~PromiseResolver() {
    cancel();
    joinWorkers();
}

void PromiseResolver::joinWorkers() {
    for (auto &t : workers_) {
        if (t.joinable())
            t.join();
    }
    workers_.clear();
}

bool PromiseResolver::start(FilePromiseList promises,
                            const std::string &stagingDir,
                            CompletionCB onFinished, std::string &err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != State::Idle) {
            err = "Resolver already used for another batch";
            return false;
        }
        if (promises.empty()) {
            err = "Nothing to resolve";
            return false;
        }
        promises_ = std::move(promises);
        stagingDir_ = stagingDir;
        onFinished_ = std::move(onFinished);
        pending_ = promises_.size();
        completionPaths_.clear();
        completionPaths_.reserve(promises_.size());
        slotPaths_.assign(promises_.size(), std::nullopt);
        failures_.clear();
        state_ = State::AwaitingPromises;
    }

    const std::size_t n = std::min<std::size_t>(
        promises_.size(), static_cast<std::size_t>(opt_.maxConcurrent));
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        try {
            workers_.emplace_back(&PromiseResolver::workerLoop, this);
        } catch (const std::system_error &e) {
            if (!workers_.empty())
                break; // fewer workers, same queue
            std::lock_guard<std::mutex> lk(mtx_);
            state_ = State::Idle;
            pending_ = 0;
            promises_.clear();
            onFinished_ = nullptr;
            err = std::string("Could not start resolver worker: ") + e.what();
            return false;
        }
    }
    return true;
}

void PromiseResolver::workerLoop() {
    for (;;) {
        const std::size_t index = nextIndex_.fetch_add(1);
        if (index >= promises_.size())
            return;
        resolveOne(index);
    }
}

void PromiseResolver::resolveOne(std::size_t index) {
    const FilePromisePtr &promise = promises_[index];
    if (!promise) {
        finishOne(index, std::nullopt, PromiseFailure{index, "Null promise"});
        return;
    }
    if (canceled_.load()) {
        PromiseFailure f{index, "Canceled before start"};
        f.canceled = true;
        finishOne(index, std::nullopt, std::move(f));
        return;
    }

    using SteadyClock = std::chrono::steady_clock;
    const bool hasDeadline = opt_.promiseTimeoutMs > 0;
    const auto deadline =
        SteadyClock::now() + std::chrono::milliseconds(opt_.promiseTimeoutMs);
    auto expired = [hasDeadline, deadline] {
        return hasDeadline && SteadyClock::now() >= deadline;
    };
    FilePromise::CancelCB shouldCancel = [this, expired] {
        return canceled_.load() || expired();
    };

    std::string path;
    std::string err;
    bool ok = false;
    try {
        ok = promise->materialize(stagingDir_, path, err, shouldCancel);
    } catch (const std::exception &e) {
        ok = false;
        err = std::string("Promise threw: ") + e.what();
    }

    if (ok && !path.empty()) {
        finishOne(index, std::move(path), std::nullopt);
        return;
    }
    PromiseFailure f{index, err.empty() ? "Promise produced no file" : err};
    f.canceled = canceled_.load();
    f.timedOut = !f.canceled && expired();
    finishOne(index, std::nullopt, std::move(f));
}

void PromiseResolver::finishOne(std::size_t index,
                                std::optional<std::string> path,
                                std::optional<PromiseFailure> failure) {
    CompletionCB cb;
    ResolutionOutcome snapshot;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (path) {
            if (opt_.order == ResultOrder::Submission)
                slotPaths_[index] = *path;
            else
                completionPaths_.push_back(std::move(*path));
        }
        if (failure)
            failures_.push_back(std::move(*failure));
        if (--pending_ > 0)
            return;

        // Barrier reached: every promise reported exactly once.
        outcome_ = ResolutionOutcome{};
        outcome_.submitted = promises_.size();
        outcome_.canceled = canceled_.load();
        if (opt_.order == ResultOrder::Submission) {
            for (auto &slot : slotPaths_) {
                if (slot)
                    outcome_.paths.push_back(std::move(*slot));
            }
        } else {
            outcome_.paths = std::move(completionPaths_);
        }
        std::sort(failures_.begin(), failures_.end(),
                  [](const PromiseFailure &a, const PromiseFailure &b) {
                      return a.index < b.index;
                  });
        outcome_.failures = failures_;
        cb = std::move(onFinished_);
        onFinished_ = nullptr;
        snapshot = outcome_;
    }
    // Completed is published after the callback so wait() also covers it.
    if (cb)
        cb(snapshot);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        state_ = State::Completed;
    }
    doneCv_.notify_all();
}

void PromiseResolver::cancel() { canceled_.store(true); }

void PromiseResolver::wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    doneCv_.wait(lk, [this] { return state_ != State::AwaitingPromises; });
}

bool PromiseResolver::waitFor(int timeoutMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    return doneCv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), [this] {
        return state_ != State::AwaitingPromises;
    });
}

PromiseResolver::State PromiseResolver::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

std::size_t PromiseResolver::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_;
}

ResolutionOutcome PromiseResolver::outcome() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return outcome_;
}

} // namespace dropshelf
