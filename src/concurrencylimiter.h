#ifndef CONCURRENCYLIMITER_H
#define CONCURRENCYLIMITER_H

#include <algorithm>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

/**
 * Runs a list of zero-argument tasks with a bound on how many are in
 * flight at once.
 *
 * Tasks start in submission order. Each runner thread takes the next
 * unstarted task as soon as its previous one settles, so no more than
 * `limit` tasks are ever running. Every task settles before run() returns;
 * the first failure in submission order is then rethrown.
 */
class ConcurrencyLimiter
{
public:
    /**
     * Run tasks and collect their results
     * @param tasks Callables returning T (T must be default-constructible)
     * @param limit Maximum tasks in flight, clamped to [1, tasks.size()]
     * @return Results in the order of tasks
     */
    template<typename T>
    static std::vector<T> run(const std::vector<std::function<T()>>& tasks, int limit)
    {
        std::vector<T> results(tasks.size());
        std::vector<std::exception_ptr> errors(tasks.size());

        execute(tasks.size(), limit, [&](size_t index) {
            try {
                results[index] = tasks[index]();
            } catch (...) {
                errors[index] = std::current_exception();
            }
        });

        rethrowFirst(errors);
        return results;
    }

    /**
     * Run tasks that produce no value
     */
    static void runEach(const std::vector<std::function<void()>>& tasks, int limit)
    {
        std::vector<std::exception_ptr> errors(tasks.size());

        execute(tasks.size(), limit, [&](size_t index) {
            try {
                tasks[index]();
            } catch (...) {
                errors[index] = std::current_exception();
            }
        });

        rethrowFirst(errors);
    }

    /**
     * Default in-flight bound: min(hardwareConcurrency, taskCount, cap), at least 1
     */
    static int defaultLimit(int hardwareConcurrency, int taskCount, int cap = 8)
    {
        return std::max(1, std::min({ hardwareConcurrency, taskCount, cap }));
    }

private:
    static void execute(size_t count, int limit, const std::function<void(size_t)>& runOne)
    {
        if (count == 0) {
            return;
        }

        const size_t runners = static_cast<size_t>(std::max(1, std::min(limit, static_cast<int>(count))));
        std::mutex mutex;
        size_t next = 0;

        auto runner = [&]() {
            for (;;) {
                size_t index;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    if (next >= count) {
                        return;
                    }
                    index = next++;
                }
                runOne(index);
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(runners);
        for (size_t i = 0; i < runners; ++i) {
            threads.emplace_back(runner);
        }
        for (std::thread& thread : threads) {
            thread.join();
        }
    }

    static void rethrowFirst(const std::vector<std::exception_ptr>& errors)
    {
        for (const std::exception_ptr& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }
};

#endif // CONCURRENCYLIMITER_H
