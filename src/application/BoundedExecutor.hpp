/**
 * @file BoundedExecutor.hpp
 * @brief Runs independent work items on a bounded number of threads.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace docingest::application {

/**
 * @class BoundedExecutor
 * @brief Fans work items out to at most maxWorkers threads and collects one result per item.
 *
 * Every item is isolated: an exception thrown by one item is converted into that
 * item's result through the error handler and never cancels siblings. Results keep
 * the input order.
 */
class BoundedExecutor {
public:
    explicit BoundedExecutor(size_t maxWorkers) : m_maxWorkers(std::max<size_t>(1, maxWorkers)) {}

    size_t maxWorkers() const { return m_maxWorkers; }

    template<typename Result>
    std::vector<Result> Run(size_t count,
                            const std::function<Result(size_t)>& work,
                            const std::function<Result(size_t, const std::string&)>& onError) const {
        std::vector<std::optional<Result>> slots(count);
        std::atomic<size_t> next{0};

        auto worker = [&]() {
            for (size_t i = next++; i < count; i = next++) {
                try {
                    slots[i].emplace(work(i));
                } catch (const std::exception& e) {
                    slots[i].emplace(onError(i, e.what()));
                } catch (...) {
                    slots[i].emplace(onError(i, "Unknown error during task execution."));
                }
            }
        };

        size_t threadCount = std::min(m_maxWorkers, count);
        if (threadCount <= 1) {
            worker();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(threadCount);
            for (size_t t = 0; t < threadCount; ++t) {
                threads.emplace_back(worker);
            }
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        }

        std::vector<Result> results;
        results.reserve(count);
        for (auto& slot : slots) {
            results.push_back(std::move(*slot));
        }
        return results;
    }

private:
    size_t m_maxWorkers;
};

} // namespace docingest::application
