#pragma once
#include "FilePromise.hpp"
#include <atomic>
#include <memory>
#include <utility>

namespace dropshelf {

// Scripted promise for tests and offline runs: writes `content` under
// `name` after `delayMs`, or fails with a fixed message. With Behavior::Hang
// it never finishes on its own and only returns once shouldCancel fires.
class MockFilePromise : public FilePromise {
public:
    enum class Behavior { Succeed, Fail, Hang };

    // Shared across promises of one test to observe parallelism.
    struct Counters {
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        std::atomic<int> started{0};
    };

    MockFilePromise(std::string name, Behavior behavior, int delayMs = 0,
                    std::shared_ptr<Counters> counters = {});

    std::string suggestedName() const override { return name_; }
    std::string describe() const override { return "mock:" + name_; }
    bool materialize(const std::string &destDir, std::string &outPath,
                     std::string &err, CancelCB shouldCancel = {}) override;

    void setContent(std::string c) { content_ = std::move(c); }

private:
    std::string name_;
    Behavior behavior_;
    int delayMs_ = 0;
    std::shared_ptr<Counters> counters_;
    std::string content_ = "mock";
};

} // namespace dropshelf
