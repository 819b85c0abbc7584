/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_CONNECTIONMANAGER_HPP
#define WAMPCORE_CONNECTIONMANAGER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ConnectionManager class. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <memory>
#include <system_error>
#include "api.hpp"
#include "asiodefs.hpp"
#include "connectionoptions.hpp"
#include "session.hpp"
#include "sessionconfig.hpp"
#include "sessioninfo.hpp"

namespace wampcore
{

// Forward declaration
namespace internal {class Reconnector;}

//------------------------------------------------------------------------------
/** Opens a Session, retrying with binary exponential backoff until it is
    established.

    If an established session is later dropped due to a transport failure,
    a protocol violation, or a router `ABORT`, the manager reconnects with
    its backoff reset. A session that is closed locally, that leaves the
    realm, or that is killed via a router `GOODBYE` is not reopened.

    @par Thread-safety
    ConnectionManager's member functions and handlers must be executed
    sequentially, for example by using a single-threaded I/O context or by
    passing a strand as the executor. */
//------------------------------------------------------------------------------
class WAMPCORE_API ConnectionManager
{
public:
    /** Executor type used for I/O operations. */
    using Executor = AnyIoExecutor;

    /** Handler type called each time the session is established. The
        session may be used within the handler to subscribe and enroll. */
    using EstablishedHandler = std::function<void (Session&, Welcome)>;

    /** Handler type called when the manager gives up, with the error
        code of the last attempt. */
    using FailureHandler = std::function<void (std::error_code)>;

    /** Constructor. */
    ConnectionManager(Executor exec, SessionConfig config,
                      ConnectionManagerOptions options = {});

    /** @name Non-copyable */
    /// @{
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    /// @}

    /** Destructor which stops the manager. */
    ~ConnectionManager();

    /** Starts opening the session. Has no effect if already running. */
    void start(EstablishedHandler onEstablished,
               FailureHandler onFailure = nullptr);

    /** Cancels any pending retry and closes the session. */
    void stop();

    /** Determines if the manager is still attempting or maintaining a
        session. */
    bool isRunning() const;

    /** Obtains the number of consecutive failed attempts. */
    std::size_t failureCount() const;

    /** Accesses the managed session. */
    Session& session();

private:
    std::shared_ptr<internal::Reconnector> impl_;
};

} // namespace wampcore

#ifndef WAMPCORE_COMPILED_LIB
#include "internal/connectionmanager.inl.hpp"
#endif

#endif // WAMPCORE_CONNECTIONMANAGER_HPP
