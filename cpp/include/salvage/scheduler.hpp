// ==============================================================================
// salvage/scheduler.hpp - Пул рабочих потоков
// ==============================================================================
//
// Назначение:
// - CancellationToken: кооперативная отмена
// - WorkScheduler<Item>: N потоков забирают элементы из общего источника
//
// Каждый элемент обрабатывается ровно один раз. Свободный поток сам берёт
// следующий элемент (динамическое распределение), поэтому никто не ждёт
// после исчерпания источника. N=1 выполняет всё в вызывающем потоке.
// Исключение при обработке одного элемента уходит в on_failure и не
// останавливает остальные потоки.
//
// ==============================================================================

#ifndef SALVAGE_SCHEDULER_HPP
#define SALVAGE_SCHEDULER_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace salvage::scan {

// ----------------------------------------------------------------------------
// CancellationToken
// ----------------------------------------------------------------------------

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { flag_.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};

/// Разрешить число потоков: requested <= 0 -> аппаратный параллелизм
size_t resolve_worker_count(int requested);

// ----------------------------------------------------------------------------
// ScheduleStats
// ----------------------------------------------------------------------------

struct ScheduleStats {
    size_t workers = 0;
    size_t processed = 0;  // успешно обработано
    size_t failed = 0;     // обработка завершилась исключением
    bool cancelled = false;
};

// ----------------------------------------------------------------------------
// WorkScheduler
// ----------------------------------------------------------------------------

template <typename Item>
class WorkScheduler {
public:
    /// Источник: заполняет item, false = исчерпан. Вызывается под мьютексом.
    using Source = std::function<bool(Item&)>;

    /// Обработка элемента в потоке worker (0..workers-1)
    using Task = std::function<void(size_t worker, Item& item)>;

    using FailureHandler = std::function<void(const Item& item, const std::string& what)>;
    using WorkerDoneHandler = std::function<void(size_t worker)>;

    explicit WorkScheduler(size_t workers, const CancellationToken* cancel = nullptr)
        : workers_(workers == 0 ? 1 : workers), cancel_(cancel) {}

    void on_failure(FailureHandler handler) { on_failure_ = std::move(handler); }

    /// Вызывается один раз каждым потоком после выхода из цикла
    void on_worker_done(WorkerDoneHandler handler) { on_done_ = std::move(handler); }

    size_t workers() const { return workers_; }

    /// Выполнить весь источник
    ///
    /// @throws то, что бросил source (после остановки всех потоков)
    ScheduleStats run(Source source, Task task) {
        exhausted_ = false;
        source_error_ = nullptr;
        processed_.store(0);
        failed_.store(0);

        if (workers_ == 1) {
            worker_loop(0, source, task);
        } else {
            std::vector<std::thread> threads;
            threads.reserve(workers_);
            for (size_t i = 0; i < workers_; ++i) {
                threads.emplace_back([this, i, &source, &task] { worker_loop(i, source, task); });
            }
            for (auto& t : threads) {
                t.join();
            }
        }

        if (source_error_) {
            std::rethrow_exception(source_error_);
        }

        ScheduleStats stats;
        stats.workers = workers_;
        stats.processed = processed_.load();
        stats.failed = failed_.load();
        stats.cancelled = cancel_ != nullptr && cancel_->cancelled();
        return stats;
    }

private:
    bool pull(Source& source, Item& item) {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (exhausted_) {
            return false;
        }
        try {
            if (!source(item)) {
                exhausted_ = true;
                return false;
            }
        } catch (...) {
            // Ошибка источника останавливает выдачу и пробрасывается из run()
            source_error_ = std::current_exception();
            exhausted_ = true;
            return false;
        }
        return true;
    }

    void worker_loop(size_t id, Source& source, Task& task) {
        while (cancel_ == nullptr || !cancel_->cancelled()) {
            Item item{};
            if (!pull(source, item)) {
                break;
            }
            try {
                task(id, item);
                processed_.fetch_add(1, std::memory_order_relaxed);
            } catch (const std::exception& e) {
                failed_.fetch_add(1, std::memory_order_relaxed);
                if (on_failure_) {
                    on_failure_(item, e.what());
                }
            } catch (...) {
                failed_.fetch_add(1, std::memory_order_relaxed);
                if (on_failure_) {
                    on_failure_(item, "unknown error");
                }
            }
        }
        if (on_done_) {
            on_done_(id);
        }
    }

    size_t workers_;
    const CancellationToken* cancel_;
    FailureHandler on_failure_;
    WorkerDoneHandler on_done_;

    std::mutex source_mutex_;
    bool exhausted_ = false;
    std::exception_ptr source_error_;

    std::atomic<size_t> processed_{0};
    std::atomic<size_t> failed_{0};
};

}  // namespace salvage::scan

#endif  // SALVAGE_SCHEDULER_HPP
