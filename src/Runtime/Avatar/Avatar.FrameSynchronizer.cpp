module;
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

module Avatar:FrameSynchronizer.Impl;
import :FrameSynchronizer;
import :Model;
import :RenderItem;
import :Classifier;
import Core;

namespace Avatar
{
    namespace
    {
        uint32_t ClampFrames(uint32_t requested)
        {
            return std::clamp(requested, 1u, kMaxFramesInFlightLimit);
        }
    }

    FrameSynchronizer::FrameSynchronizer(uint32_t maxFramesInFlight)
        : m_MaxFramesInFlight(ClampFrames(maxFramesInFlight)),
          m_FreeSlots(static_cast<std::ptrdiff_t>(ClampFrames(maxFramesInFlight))),
          m_SlotFrames(ClampFrames(maxFramesInFlight))
    {
        if (maxFramesInFlight != m_MaxFramesInFlight)
        {
            Core::Log::Warn("FrameSynchronizer: {} frames in flight requested, using {}",
                            maxFramesInFlight, m_MaxFramesInFlight);
        }
    }

    FrameTicket FrameSynchronizer::Acquire()
    {
        m_FreeSlots.acquire();
        return ClaimSlot();
    }

    std::optional<FrameTicket> FrameSynchronizer::TryAcquireFor(std::chrono::milliseconds timeout)
    {
        if (!m_FreeSlots.try_acquire_for(timeout))
            return std::nullopt;
        return ClaimSlot();
    }

    FrameTicket FrameSynchronizer::ClaimSlot()
    {
        std::lock_guard lock(m_SlotMutex);

        // The semaphore guarantees a free slot. Cancelled frames can free slots
        // out of ring order, so search from the ring cursor.
        uint32_t slot = m_NextSlot;
        for (uint32_t i = 0; i < m_MaxFramesInFlight; ++i)
        {
            const uint32_t candidate = (m_NextSlot + i) % m_MaxFramesInFlight;
            if (!m_SlotFrames[candidate])
            {
                slot = candidate;
                break;
            }
        }

        FrameTicket ticket{slot, m_NextFrameNumber++};
        m_SlotFrames[slot] = ticket.FrameNumber;
        m_NextSlot = (slot + 1) % m_MaxFramesInFlight;
        return ticket;
    }

    Core::Result FrameSynchronizer::Release(const FrameTicket& ticket)
    {
        {
            std::lock_guard lock(m_SlotMutex);
            if (ticket.SlotIndex >= m_MaxFramesInFlight ||
                m_SlotFrames[ticket.SlotIndex] != ticket.FrameNumber)
            {
                Core::Log::Error("FrameSynchronizer: release of frame {} (slot {}) which is not in flight",
                                 ticket.FrameNumber, ticket.SlotIndex);
                return Core::Err(Core::ErrorCode::InvalidState);
            }
            m_SlotFrames[ticket.SlotIndex].reset();
        }

        m_FreeSlots.release();
        return Core::Ok();
    }

    Core::Result FrameSynchronizer::Cancel(const FrameTicket& ticket)
    {
        Core::Log::Debug("FrameSynchronizer: cancelling frame {} (slot {})", ticket.FrameNumber, ticket.SlotIndex);
        return Release(ticket);
    }

    uint32_t FrameSynchronizer::GetFramesInFlight() const
    {
        std::lock_guard lock(m_SlotMutex);
        return static_cast<uint32_t>(std::ranges::count_if(m_SlotFrames, [](const std::optional<uint64_t>& f)
        {
            return f.has_value();
        }));
    }

    const std::vector<RenderItem>& FrameSynchronizer::GetRenderItems(const Model& model)
    {
        if (m_CachedModel != &model)
        {
            m_CachedItems = BuildRenderItems(model);
            m_CachedModel = &model;
            ++m_BuildCount;
            LogClassification(model, m_CachedItems);
        }
        return m_CachedItems;
    }

    void FrameSynchronizer::InvalidateRenderItems()
    {
        m_CachedModel = nullptr;
        m_CachedItems.clear();
    }
}
