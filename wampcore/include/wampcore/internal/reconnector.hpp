/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_INTERNAL_RECONNECTOR_HPP
#define WAMPCORE_INTERNAL_RECONNECTOR_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include "../asiodefs.hpp"
#include "../connectionoptions.hpp"
#include "../errorcodes.hpp"
#include "../erroror.hpp"
#include "../logging.hpp"
#include "../session.hpp"
#include "../sessionconfig.hpp"
#include "../sessioninfo.hpp"
#include "backofftimer.hpp"

namespace wampcore
{

namespace internal
{

//------------------------------------------------------------------------------
// Implements ConnectionManager's retry loop. Shared with the session and
// timer handlers via weak pointers, so that outstanding handlers become
// no-ops once the manager is destroyed.
//------------------------------------------------------------------------------
class Reconnector : public std::enable_shared_from_this<Reconnector>
{
public:
    using Ptr                = std::shared_ptr<Reconnector>;
    using WeakPtr            = std::weak_ptr<Reconnector>;
    using EstablishedHandler = std::function<void (Session&, Welcome)>;
    using FailureHandler     = std::function<void (std::error_code)>;

    Reconnector(AnyIoExecutor exec, SessionConfig config,
                ConnectionManagerOptions options)
        : session_(exec),
          config_(std::move(config)),
          timer_(exec, options.backoff()),
          maxAttempts_(options.maxAttempts())
    {}

    Session& session() {return session_;}

    bool isRunning() const {return isRunning_;}

    std::size_t failureCount() const {return failures_;}

    void start(EstablishedHandler onEstablished, FailureHandler onFailure)
    {
        if (isRunning_)
            return;

        onEstablished_ = std::move(onEstablished);
        onFailure_ = std::move(onFailure);
        isRunning_ = true;
        failures_ = 0;
        timer_.reset();

        WeakPtr self = shared_from_this();
        session_.setDisconnectHandler(
            [self](std::error_code ec)
            {
                auto me = self.lock();
                if (me)
                    me->onDropped(ec);
            });

        attempt();
    }

    void stop()
    {
        if (!isRunning_)
            return;
        isRunning_ = false;
        timer_.cancel();
        session_.close();
    }

private:
    void attempt()
    {
        WeakPtr self = shared_from_this();
        session_.open(
            config_,
            [self](ErrorOr<Welcome> welcome)
            {
                auto me = self.lock();
                if (me)
                    me->onOpened(std::move(welcome));
            });
    }

    void onOpened(ErrorOr<Welcome> welcome)
    {
        if (!isRunning_)
            return;

        if (welcome.has_value())
        {
            failures_ = 0;
            timer_.reset();
            if (onEstablished_)
                onEstablished_(session_, std::move(*welcome));
            return;
        }

        ++failures_;
        auto ec = welcome.error();
        if (maxAttempts_ != 0 && failures_ >= maxAttempts_)
        {
            log(LogLevel::error,
                "Giving up after " + std::to_string(failures_) +
                " failed connection attempts", ec);
            isRunning_ = false;
            if (onFailure_)
                onFailure_(ec);
            return;
        }

        retry(ec);
    }

    void onDropped(std::error_code ec)
    {
        if (!isRunning_)
            return;
        timer_.reset();
        retry(ec);
    }

    void retry(std::error_code ec)
    {
        WeakPtr self = shared_from_this();
        timer_.wait(
            [self](boost::system::error_code timerEc)
            {
                auto me = self.lock();
                if (!me || timerEc == boost::asio::error::operation_aborted)
                    return;
                if (me->isRunning_)
                    me->attempt();
            });

        using std::chrono::duration_cast;
        using Ms = std::chrono::milliseconds;
        auto ms = duration_cast<Ms>(timer_.currentDelay()).count();
        log(LogLevel::warning,
            "Session could not be established; retrying in " +
            std::to_string(ms) + " ms", ec);
    }

    void log(LogLevel level, std::string message, std::error_code ec)
    {
        const auto& handler = config_.logHandler();
        if (handler && level >= config_.logLevel())
            handler(LogEntry(level, std::move(message), ec));
    }

    Session session_;
    SessionConfig config_;
    BinaryExponentialBackoffTimer timer_;
    EstablishedHandler onEstablished_;
    FailureHandler onFailure_;
    std::size_t maxAttempts_ = 0;
    std::size_t failures_ = 0;
    bool isRunning_ = false;
};

} // namespace internal

} // namespace wampcore

#endif // WAMPCORE_INTERNAL_RECONNECTOR_HPP
