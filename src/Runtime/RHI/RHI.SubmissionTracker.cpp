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

module RHI:SubmissionTracker.Impl;
import :SubmissionTracker;
import :Device;
import Core;

namespace RHI
{
    namespace
    {
        // Bounded waits keep the worker responsive to shutdown requests.
        constexpr uint64_t kFenceWaitTimeoutNs = 100'000'000;
    }

    SubmissionTracker::SubmissionTracker(std::shared_ptr<VulkanDevice> device)
        : m_Device(std::move(device))
    {
        m_Worker = std::jthread([this](std::stop_token stopToken) { WorkerLoop(stopToken); });
    }

    SubmissionTracker::~SubmissionTracker()
    {
        WaitIdle();
        m_Worker.request_stop();
        m_WorkAvailable.notify_all();
    }

    void SubmissionTracker::Track(VkFence fence, Continuation onComplete)
    {
        {
            std::lock_guard lock(m_Mutex);
            m_Queue.push_back({fence, std::move(onComplete)});
        }
        m_WorkAvailable.notify_one();
    }

    void SubmissionTracker::WaitIdle()
    {
        std::unique_lock lock(m_Mutex);
        m_Drained.wait(lock, [this] { return m_Queue.empty() && !m_Busy; });
    }

    size_t SubmissionTracker::GetPendingCount() const
    {
        std::lock_guard lock(m_Mutex);
        return m_Queue.size() + (m_Busy ? 1u : 0u);
    }

    void SubmissionTracker::WorkerLoop(std::stop_token stopToken)
    {
        while (true)
        {
            Pending current;
            {
                std::unique_lock lock(m_Mutex);
                if (!m_WorkAvailable.wait(lock, stopToken, [this] { return !m_Queue.empty(); }))
                    return;

                current = std::move(m_Queue.front());
                m_Queue.pop_front();
                m_Busy = true;
            }

            VkResult res = VK_TIMEOUT;
            while (res == VK_TIMEOUT)
            {
                res = vkWaitForFences(m_Device->GetLogicalDevice(), 1, &current.Fence, VK_TRUE, kFenceWaitTimeoutNs);
            }

            if (res != VK_SUCCESS)
            {
                // The slot still has to be handed back or the producer stalls forever.
                Core::Log::Error("SubmissionTracker: fence wait failed ({}), releasing anyway", static_cast<int>(res));
            }

            if (current.OnComplete) current.OnComplete();

            {
                std::lock_guard lock(m_Mutex);
                m_Busy = false;
                if (m_Queue.empty()) m_Drained.notify_all();
            }
        }
    }
}
