#include "dropshelf/MockFilePromise.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace dropshelf {

MockFilePromise::MockFilePromise(std::string name, Behavior behavior,
                                 int delayMs, std::shared_ptr<Counters> counters)
    : name_(std::move(name)), behavior_(behavior), delayMs_(delayMs),
      counters_(std::move(counters)) {}

bool MockFilePromise::materialize(const std::string &destDir,
                                  std::string &outPath, std::string &err,
                                  CancelCB shouldCancel) {
    using namespace std::chrono_literals;
    struct ActiveGuard {
        Counters *p;
        explicit ActiveGuard(Counters *counters) : p(counters) {
            if (!p)
                return;
            p->started.fetch_add(1);
            const int now = p->active.fetch_add(1) + 1;
            int prev = p->peak.load();
            while (now > prev && !p->peak.compare_exchange_weak(prev, now)) {
            }
        }
        ~ActiveGuard() {
            if (p)
                p->active.fetch_sub(1);
        }
    } guard(counters_.get());

    const auto until =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs_);
    while (behavior_ == Behavior::Hang ||
           std::chrono::steady_clock::now() < until) {
        if (shouldCancel && shouldCancel()) {
            err = "Mock canceled";
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }

    if (behavior_ == Behavior::Fail) {
        err = "Mock promise failed: " + name_;
        return false;
    }
    return writeStagedFile(destDir, name_, content_, outPath, err);
}

} // namespace dropshelf
