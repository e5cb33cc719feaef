#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <utility>
#include <vector>

namespace sec_subledger {

// Runs one task per group index with at most max_concurrent tasks in flight.
// Results come back in index order whatever the completion order was.
class GroupTaskScheduler {
public:
    explicit GroupTaskScheduler(int max_concurrent);

    int max_concurrent() const { return max_concurrent_; }

    template <typename Result>
    std::vector<Result> RunOrdered(std::size_t task_count,
                                   const std::function<Result(std::size_t)>& task) const;

private:
    int max_concurrent_{1};
};

template <typename Result>
std::vector<Result> GroupTaskScheduler::RunOrdered(
    std::size_t task_count, const std::function<Result(std::size_t)>& task) const {
    std::vector<Result> results;
    results.reserve(task_count);
    if (max_concurrent_ <= 1) {
        for (std::size_t index = 0; index < task_count; ++index) {
            results.push_back(task(index));
        }
        return results;
    }

    const std::size_t limit = static_cast<std::size_t>(max_concurrent_);
    std::vector<std::future<Result>> active;
    active.reserve(task_count);
    std::size_t next_to_collect = 0;

    for (std::size_t index = 0; index < task_count; ++index) {
        if (active.size() - next_to_collect >= limit) {
            results.push_back(active[next_to_collect].get());
            ++next_to_collect;
        }
        active.push_back(std::async(std::launch::async, task, index));
    }
    for (; next_to_collect < active.size(); ++next_to_collect) {
        results.push_back(active[next_to_collect].get());
    }
    return results;
}

}  // namespace sec_subledger
