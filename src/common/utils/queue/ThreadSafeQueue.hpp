// src/common/utils/queue/ThreadSafeQueue.hpp
#pragma once

#include <queue>
#include <vector>
#include <mutex>
#include <atomic>
#include <stdexcept>

namespace chainsig::utils
{
    enum class QueueResult
    {
        SUCCESS = 0,
        SHUTDOWN = 1,     // Queue가 shutdown 상태
        FULL = 2
    };

    inline const char* ToString(QueueResult result)
    {
        switch (result) {
            case QueueResult::SUCCESS: return "SUCCESS";
            case QueueResult::SHUTDOWN: return "SHUTDOWN";
            case QueueResult::FULL: return "FULL";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief bounded FIFO queue
     *
     * LocalHost 가 호출 커밋 시 Push 하고 ProcessResumptions 에서 Drain 으로 한 번에 비웁니다.
     * 가득 차면 대기하지 않고 FULL 을 돌려줍니다.
     */
    template<typename TElement>
    class ThreadSafeQueue
    {
    private:
        std::queue<TElement> queue;
        mutable std::mutex mutex;
        size_t max_size;
        std::atomic<bool> shutdown_flag{false};

    public:
        explicit ThreadSafeQueue(size_t max_size = 10000) : max_size(max_size)
        {
            if (max_size == 0) {
                throw std::invalid_argument("Queue max_size must be greater than 0");
            }
        }

        ~ThreadSafeQueue()
        {
            Shutdown();
        }

        ThreadSafeQueue(const ThreadSafeQueue&) = delete;
        ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

        QueueResult Push(TElement item)
        {
            std::lock_guard<std::mutex> lock(mutex);

            if (shutdown_flag) {
                return QueueResult::SHUTDOWN;
            }
            if (queue.size() >= max_size) {
                return QueueResult::FULL;
            }

            queue.push(std::move(item));
            return QueueResult::SUCCESS;
        }

        // 현재 쌓인 항목을 한 번에 꺼냄 (순서 유지)
        size_t Drain(std::vector<TElement>& out)
        {
            std::lock_guard<std::mutex> lock(mutex);
            size_t count = queue.size();
            while (!queue.empty()) {
                out.push_back(std::move(queue.front()));
                queue.pop();
            }
            return count;
        }

        void Shutdown()
        {
            std::lock_guard<std::mutex> lock(mutex);
            shutdown_flag = true;
        }

        size_t Size() const
        {
            std::lock_guard<std::mutex> lock(mutex);
            return queue.size();
        }

        size_t Capacity() const { return max_size; }
    };

} // namespace chainsig::utils
