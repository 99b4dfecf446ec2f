#pragma once

#include <core/model/transfer_direction.h>
#include <core/model/transfer_event.h>
#include <functional>
#include <string>

namespace shuttle::core {

/**
 * @brief Interface of a transfer engine instance driven by a TransferCoordinator.
 *
 * @details Run() is executed on a dedicated thread and blocks until the transfer is over.
 * Events are raised through the handler installed with SetEventHandler(), one at a time and
 * in lifecycle order, ending with event::Finish. Stop() may be called from any thread and
 * must not block; the transfer reports the outcome later through its events.
 */
class Transfer {
public:
    using EventHandler = std::function<void(TransferEvent&&)>;

    virtual ~Transfer() = default;

    virtual TransferDirection direction() const = 0;
    virtual std::string remote_device_name() const = 0;

    virtual void SetEventHandler(EventHandler handler) = 0;

    virtual void Run() = 0;
    virtual void Stop() = 0;
};

} // namespace shuttle::core
