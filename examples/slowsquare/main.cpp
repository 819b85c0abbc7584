/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

//******************************************************************************
// Example WAMP callee app providing a procedure that returns immediately and
// one whose result is deferred via a timer. A second session in the same
// process calls both.
//******************************************************************************

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio/steady_timer.hpp>
#include <wampcore/consolelogger.hpp>
#include <wampcore/session.hpp>
#include "../common/loopbackrouter.hpp"

using namespace wampcore;

namespace
{

//------------------------------------------------------------------------------
Outcome square(Invocation inv)
{
    Real x = 0;
    inv.convertTo(x);
    return Result{x * x};
}

//------------------------------------------------------------------------------
class SlowSquare
{
public:
    explicit SlowSquare(AnyIoExecutor exec) : executor_(std::move(exec)) {}

    Outcome operator()(Invocation inv) const
    {
        Real x = 0;
        inv.convertTo(x);

        auto timer = std::make_shared<boost::asio::steady_timer>(executor_);
        timer->expires_after(std::chrono::seconds(1));
        timer->async_wait(
            [timer, inv, x](boost::system::error_code ec)
            {
                if (ec)
                    inv.yield(Error(WampErrc::cancelled));
                else
                    inv.yield(Result{x * x});
            });

        return deferment;
    }

private:
    AnyIoExecutor executor_;
};

} // anonymous namespace

//------------------------------------------------------------------------------
// Usage: wampcore-example-slowsquare [realm]
//------------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    std::string realm = (argc >= 2) ? argv[1] : "realm1";

    ConsoleLogger logger("slowsquare");
    IoContext ioctx;
    auto router = LoopbackRouter::create(realm, logger);
    auto config = SessionConfig(realm, router->transportFactory())
                      .withLogHandler(logger)
                      .withLogLevel(LogLevel::info);

    Session callee(ioctx.get_executor());
    Session caller(ioctx.get_executor());
    int answered = 0;

    auto onResult = [&](const std::string& name, ErrorOr<Result> result)
    {
        if (result)
            std::cout << name << ": " << result->args().at(0) << std::endl;
        else
            std::cout << name << " failed: " << result.error().message()
                      << std::endl;

        if (++answered == 2)
        {
            caller.leave([](ErrorOr<Reason>) {});
            callee.leave([](ErrorOr<Reason>) {});
        }
    };

    auto callBoth = [&](ErrorOr<Welcome> welcome)
    {
        if (!welcome)
        {
            callee.close();
            return;
        }

        auto t0 = std::chrono::steady_clock::now();
        caller.call(
            Rpc("com.math.slowsquare").withArgs(3),
            [&onResult, t0](ErrorOr<Result> result)
            {
                auto elapsed = std::chrono::steady_clock::now() - t0;
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    elapsed).count();
                onResult("slowsquare(3) after " + std::to_string(ms) + " ms",
                         std::move(result));
            });
        caller.call(
            Rpc("com.math.square").withArgs(3),
            [&onResult](ErrorOr<Result> result)
            {
                onResult("square(3)", std::move(result));
            });
    };

    callee.open(
        config,
        [&](ErrorOr<Welcome> welcome)
        {
            if (!welcome)
            {
                std::cerr << "Failed to join: " << welcome.error().message()
                          << std::endl;
                return;
            }

            callee.enroll(
                "com.math.square", &square,
                [&](ErrorOr<Registration> reg)
                {
                    if (!reg)
                        return callee.close();
                    callee.enroll(
                        "com.math.slowsquare",
                        SlowSquare(ioctx.get_executor()),
                        [&](ErrorOr<Registration> slowReg)
                        {
                            if (!slowReg)
                                return callee.close();
                            caller.open(config, callBoth);
                        });
                });
        });

    ioctx.run();
    return (answered == 2) ? 0 : 1;
}
