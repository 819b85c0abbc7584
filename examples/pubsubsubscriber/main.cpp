/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

//******************************************************************************
// Example WAMP subscriber app that leaves the realm after receiving six
// events. A second session in the same process acts as the publisher.
//******************************************************************************

#include <iostream>
#include <string>
#include <wampcore/consolelogger.hpp>
#include <wampcore/session.hpp>
#include "../common/loopbackrouter.hpp"

using namespace wampcore;

//------------------------------------------------------------------------------
// Usage: wampcore-example-pubsubsubscriber [realm]
//------------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    std::string realm = (argc >= 2) ? argv[1] : "realm1";
    const std::string topic = "com.myapp.topic1";
    const int eventCount = 7;

    ConsoleLogger logger("pubsubsubscriber");
    IoContext ioctx;
    auto router = LoopbackRouter::create(realm, logger);
    auto config = SessionConfig(realm, router->transportFactory())
                      .withLogHandler(logger)
                      .withLogLevel(LogLevel::info);

    Session subscriber(ioctx.get_executor());
    Session publisher(ioctx.get_executor());
    int received = 0;

    auto onEvent = [&subscriber, &received](Event event)
    {
        std::cout << "Got event: " << event.args().at(0) << std::endl;
        if (++received > 5)
        {
            std::cout << "Closing .." << std::endl;
            subscriber.leave([](ErrorOr<Reason> reason)
            {
                if (reason)
                    std::cout << "Left with reason " << *reason << std::endl;
            });
        }
    };

    auto publishAll = [&publisher, &topic, eventCount](ErrorOr<Welcome> w)
    {
        if (!w)
            return;
        for (int i=0; i<eventCount; ++i)
            publisher.publish(Pub(topic).withArgs(i));
        publisher.leave([](ErrorOr<Reason>) {});
    };

    subscriber.open(
        config,
        [&](ErrorOr<Welcome> welcome)
        {
            if (!welcome)
            {
                std::cerr << "Failed to join: " << welcome.error().message()
                          << std::endl;
                return;
            }

            subscriber.subscribe(
                topic, onEvent,
                [&](ErrorOr<Subscription> sub)
                {
                    if (!sub)
                    {
                        subscriber.close();
                        return;
                    }
                    publisher.open(config, publishAll);
                });
        });

    ioctx.run();
    return (received == 6) ? 0 : 1;
}
