/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../connectionmanager.hpp"
#include "../api.hpp"
#include "reconnector.hpp"

namespace wampcore
{

//------------------------------------------------------------------------------
WAMPCORE_INLINE ConnectionManager::ConnectionManager(
    Executor exec, SessionConfig config, ConnectionManagerOptions options)
    : impl_(std::make_shared<internal::Reconnector>(
          std::move(exec), std::move(config), std::move(options)))
{}

//------------------------------------------------------------------------------
WAMPCORE_INLINE ConnectionManager::~ConnectionManager()
{
    if (impl_)
        impl_->stop();
}

//------------------------------------------------------------------------------
/** @details
    Each failed attempt is followed by a delay that starts at the backoff's
    min delay and doubles up to its max delay. When the number of
    consecutive failures reaches ConnectionManagerOptions::maxAttempts, the
    failure handler is called and the manager stops. */
//------------------------------------------------------------------------------
WAMPCORE_INLINE void ConnectionManager::start(EstablishedHandler onEstablished,
                                              FailureHandler onFailure)
{
    impl_->start(std::move(onEstablished), std::move(onFailure));
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE void ConnectionManager::stop() {impl_->stop();}

//------------------------------------------------------------------------------
WAMPCORE_INLINE bool ConnectionManager::isRunning() const
{
    return impl_->isRunning();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE std::size_t ConnectionManager::failureCount() const
{
    return impl_->failureCount();
}

//------------------------------------------------------------------------------
WAMPCORE_INLINE Session& ConnectionManager::session()
{
    return impl_->session();
}

} // namespace wampcore
