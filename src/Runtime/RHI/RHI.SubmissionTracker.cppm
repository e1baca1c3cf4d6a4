module;
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include "RHI.Vulkan.hpp"

export module RHI:SubmissionTracker;

import :Device;

export namespace RHI
{
    // Observes submitted fences on a worker thread in submission order and
    // runs the attached continuation once each fence signals. Continuations
    // run on the worker thread and must only touch thread-safe state.
    class SubmissionTracker
    {
    public:
        using Continuation = std::function<void()>;

        explicit SubmissionTracker(std::shared_ptr<VulkanDevice> device);
        ~SubmissionTracker();

        SubmissionTracker(const SubmissionTracker&) = delete;
        SubmissionTracker& operator=(const SubmissionTracker&) = delete;

        void Track(VkFence fence, Continuation onComplete);

        // Blocks until every tracked submission has been observed.
        void WaitIdle();

        [[nodiscard]] size_t GetPendingCount() const;

    private:
        struct Pending
        {
            VkFence Fence = VK_NULL_HANDLE;
            Continuation OnComplete;
        };

        std::shared_ptr<VulkanDevice> m_Device;

        mutable std::mutex m_Mutex;
        std::condition_variable_any m_WorkAvailable;
        std::condition_variable m_Drained;
        std::deque<Pending> m_Queue;
        bool m_Busy = false;

        std::jthread m_Worker;

        void WorkerLoop(std::stop_token stopToken);
    };
}
