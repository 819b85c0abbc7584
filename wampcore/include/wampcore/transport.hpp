/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_TRANSPORT_HPP
#define WAMPCORE_TRANSPORT_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the abstract transport interface consumed by sessions. */
//------------------------------------------------------------------------------

#include <functional>
#include <memory>
#include <system_error>
#include <boost/asio/post.hpp>
#include "api.hpp"
#include "asiodefs.hpp"
#include "messagebuffer.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
/** Enumerates the possible transport states. */
//------------------------------------------------------------------------------
enum class TransportState
{
    initial, ///< Not yet started
    running, ///< Sending and receiving of messages is enabled
    closed   ///< Closed locally; no further handlers will be invoked
};

//------------------------------------------------------------------------------
/** Base class for transports.

    A transport is an ordered, reliable message channel to a router that has
    already been established by a collaborator. The session layer uses it
    through this interface only; framing, compression, and security are the
    concern of derived classes.

    Derived classes must invoke the RxHandler once per received message, in
    arrival order, and the CloseHandler at most once when the channel is
    lost. Neither handler may be invoked after close() is called. */
//------------------------------------------------------------------------------
class WAMPCORE_API Transporting
    : public std::enable_shared_from_this<Transporting>
{
public:
    /// Enumerates the possible transport states
    using State = TransportState;

    /// Shared pointer to a Transporting object.
    using Ptr = std::shared_ptr<Transporting>;

    /// Handler type used for message received events.
    using RxHandler = std::function<void (MessageBuffer)>;

    /// Handler type used for channel loss events.
    using CloseHandler = std::function<void (std::error_code)>;

    /** @name Non-copyable and non-movable. */
    /// @{
    Transporting(const Transporting&) = delete;
    Transporting(Transporting&&) = delete;
    Transporting& operator=(const Transporting&) = delete;
    Transporting& operator=(Transporting&&) = delete;
    /// @}

    /** Destructor. */
    virtual ~Transporting() = default;

    /** Obtains the executor associated with this transport. */
    const AnyIoExecutor& executor() const {return executor_;}

    /** Obtains the current transport state. */
    State state() const {return state_;}

    /** Starts the transport's I/O operations.
        @pre this->state() == TransportState::initial
        @post this->state() == TransportState::running */
    void start(RxHandler rxHandler, CloseHandler closeHandler)
    {
        if (state_ != State::initial)
            return;
        state_ = State::running;
        onStart(std::move(rxHandler), std::move(closeHandler));
    }

    /** Sends the given serialized message via the transport.
        Has no effect unless the transport is running. */
    void send(MessageBuffer message)
    {
        if (state_ == State::running)
            onSend(std::move(message));
    }

    /** Stops I/O operations and abrubtly closes the channel.
        @post `this->state() == TransportState::closed` */
    void close()
    {
        if (state_ == State::closed)
            return;
        state_ = State::closed;
        onClose();
    }

protected:
    explicit Transporting(AnyIoExecutor exec) : executor_(std::move(exec)) {}

    /** Must be overridden to start the transport's I/O operations. */
    virtual void onStart(RxHandler rxHandler, CloseHandler closeHandler) = 0;

    /** Must be overridden to send the given serialized message. */
    virtual void onSend(MessageBuffer message) = 0;

    /** Must be overriden to stop I/O operations and disconnect. */
    virtual void onClose() = 0;

    /** Posts the given handler via the transport's executor. */
    template <typename F>
    void post(F&& handler)
    {
        boost::asio::post(executor_, std::forward<F>(handler));
    }

private:
    AnyIoExecutor executor_;
    State state_ = State::initial;
};

//------------------------------------------------------------------------------
/** Function type used to create a transport bound to the given executor.
    It may return a null pointer to indicate that no channel could be
    established. */
//------------------------------------------------------------------------------
using TransportFactory = std::function<Transporting::Ptr (AnyIoExecutor)>;

} // namespace wampcore

#endif // WAMPCORE_TRANSPORT_HPP
