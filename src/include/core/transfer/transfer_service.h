#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <condition_variable>
#include <core/constant/transfer.h>
#include <core/transfer/identity_allocator.h>
#include <core/transfer/notification_surface.h>
#include <core/transfer/transfer.h>
#include <core/transfer/transfer_registry.h>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace shuttle::core {

// Queried every time a terminal notification is built
using SoundPreferenceFunc = std::function<bool()>;

/**
 * @brief Process wide owner of the transfer coordination state.
 *
 * @details Holds the identity allocator, the registry of active transfers and the threads
 * running them. Coordinators handle events on strands of the given io_context, which must
 * be run by the caller. Destroying the service requests a stop of every active transfer, joins
 * their threads and waits until the io_context has released every coordinator, so the
 * io_context must keep running until the service is gone.
 */
class TransferService {
public:
    TransferService(boost::asio::io_context& ioc,
                    NotificationSurface& surface,
                    SoundPreferenceFunc sound_preference = nullptr,
                    std::chrono::milliseconds progress_throttle_interval
                    = transfer::kProgressThrottleInterval);
    ~TransferService();
    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    // Returns the id of the started transfer, or kInvalidTransferId if it was rejected
    TransferId StartTransfer(std::unique_ptr<Transfer> transfer);

    // Fire and forget, unknown or finished ids are ignored
    void StopTransfer(TransferId id);

    void StopAll();

    // Waits for every transfer thread started so far. Must not be called from a transfer.
    void Join();

    // Joins the threads whose transfer has returned from Run(), returns how many are left.
    // StartTransfer does this on its own before adding a thread.
    std::size_t ReapFinishedWorkers();

    // Thread handles currently held, finished or not
    std::size_t WorkerCount() const;

    bool IsActive(TransferId id) const { return registry_.Contains(id); }
    std::size_t ActiveTransferCount() const { return registry_.size(); }

    boost::asio::io_context& io_context() { return ioc_; }
    IdentityAllocator& identities() { return identities_; }
    TransferRegistry& registry() { return registry_; }
    NotificationSurface& surface() { return surface_; }

    bool SoundEnabled() const;
    std::chrono::milliseconds progress_throttle_interval() const {
        return progress_throttle_interval_;
    }

private:
    friend class TransferCoordinator;

    void coordinatorAttached();
    void coordinatorReleased();
    void waitForCoordinators();

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> returned;
    };

    boost::asio::io_context& ioc_;
    NotificationSurface& surface_;
    SoundPreferenceFunc sound_preference_;
    const std::chrono::milliseconds progress_throttle_interval_;

    IdentityAllocator identities_;
    TransferRegistry registry_;

    mutable std::mutex workers_mutex_;
    std::unordered_map<TransferId, Worker> workers_;

    std::mutex coordinators_mutex_;
    std::condition_variable coordinators_released_;
    std::size_t live_coordinators_{0};
};

} // namespace shuttle::core
