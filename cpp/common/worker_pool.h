// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Fixed-size pool of OpenMP threads working through a queue of
// independent tasks. Each task runs exactly once. A task that throws
// produces an empty result which is logged and does not affect any
// other task. run() returns only after every task has finished.
//
// Results are delivered in completion order, which depends on
// scheduling and is not the order of submission. Callers that need
// a deterministic order must sort the results themselves.

#pragma once

#include "io.h"

#include <functional>
#include <omp.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace seedtrack {

template <typename T>
class WorkerPool
{
public:
    struct Task
    {
        // Shown in error messages
        std::string name {};
        std::function<T()> work {};
    };

private:
    int n_workers {};
    std::vector<Task> queue {};
    // Text for the progress indicator. Empty means no progress output.
    std::string progress_text {};

public:
    explicit WorkerPool(const int n_workers,
                        const std::string& progress_text = "")
      : n_workers { n_workers }, progress_text { progress_text }
    {
        if (n_workers < 1) {
            throw std::invalid_argument {
                "number of workers must be at least 1, got "
                + std::to_string(n_workers)
            };
        }
    }
    [[nodiscard]] auto size() const -> int { return n_workers; }
    [[nodiscard]] auto pending() const -> size_t { return queue.size(); }
    auto submit(const std::string& name, std::function<T()> work) -> void
    {
        queue.push_back({ name, std::move(work) });
    }
    // Execute all submitted tasks and empty the queue. Threads pick
    // the next task from the queue as soon as they finish one
    // (dynamic schedule with chunk size 1).
    auto run() -> std::vector<std::optional<T>>
    {
        std::vector<Task> tasks { std::move(queue) };
        queue.clear();
        std::vector<std::optional<T>> results {};
        results.reserve(tasks.size());
        const int n_tasks { static_cast<int>(tasks.size()) };
        int n_done {};
#pragma omp parallel for schedule(dynamic, 1) num_threads(n_workers)
        for (int i_task = 0; i_task < n_tasks; ++i_task) {
            std::optional<T> result {};
            try {
                result = tasks[i_task].work();
            } catch (const std::exception& e) {
                spdlog::error("{}: {}", tasks[i_task].name, e.what());
            } catch (...) {
                spdlog::error("{}: unknown error", tasks[i_task].name);
            }
#pragma omp critical(worker_pool_results)
            {
                results.push_back(std::move(result));
                ++n_done;
                if (!progress_text.empty()) {
                    printPercentage(n_done, tasks.size(), progress_text);
                }
            }
        }
        return results;
    }
};

} // namespace seedtrack
