/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef WAMPCORE_TEST_CLIENTTESTING_HPP
#define WAMPCORE_TEST_CLIENTTESTING_HPP

#include <string>
#include <vector>
#include <catch2/catch.hpp>
#include <wampcore/logging.hpp>
#include <wampcore/session.hpp>
#include "mocktransport.hpp"

namespace wampcore
{

namespace test
{

using Kind = internal::MessageKind;

const std::string testRealm = "wampcore.test";

//------------------------------------------------------------------------------
// Runs all handlers until there is no more work.
//------------------------------------------------------------------------------
inline void drain(IoContext& ioctx)
{
    ioctx.restart();
    ioctx.run();
}

//------------------------------------------------------------------------------
// Captures the result emitted by an asynchronous operation.
//------------------------------------------------------------------------------
template <typename T>
struct Captured
{
    std::function<void (ErrorOr<T>)> handler()
    {
        return [this](ErrorOr<T> r)
        {
            result = std::move(r);
            ++count;
        };
    }

    bool done() const {return count != 0;}

    ErrorOr<T> result;
    int count = 0;
};

//------------------------------------------------------------------------------
// Session connected to a scripted MockTransport, with all log entries
// captured.
//------------------------------------------------------------------------------
struct ClientFixture
{
    ClientFixture()
        : transport(MockTransport::create(ioctx.get_executor())),
          session(ioctx.get_executor())
    {}

    // The factory hands out whichever transport the fixture currently holds,
    // so that a test may swap in a fresh one before reopening.
    SessionConfig config()
    {
        return SessionConfig(testRealm,
                             [this](AnyIoExecutor) -> Transporting::Ptr
                             {
                                 return transport;
                             })
            .withLogLevel(LogLevel::trace)
            .withLogHandler([this](const LogEntry& e) {logs.push_back(e);});
    }

    // Opens the session, with the router welcoming it with session ID 1234.
    void join()
    {
        transport->respondTo(Kind::hello,
                             {R"([2,1234,{"roles":{"broker":{}}}])"});
        Captured<Welcome> welcome;
        session.open(config(), welcome.handler());
        drain(ioctx);
        REQUIRE(welcome.done());
        REQUIRE(welcome.result.has_value());
        REQUIRE(session.state() == SessionState::established);
    }

    // Replaces the transport that the next open() will use.
    void renewTransport()
    {
        transport = MockTransport::create(ioctx.get_executor());
    }

    std::size_t countLogs(LogLevel level) const
    {
        std::size_t n = 0;
        for (const auto& e: logs)
            n += (e.severity() == level) ? 1 : 0;
        return n;
    }

    bool hasLogContaining(LogLevel level, const std::string& text) const
    {
        for (const auto& e: logs)
        {
            if (e.severity() == level &&
                e.message().find(text) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    IoContext ioctx;
    std::vector<LogEntry> logs;
    MockTransport::Ptr transport;
    Session session;
};

} // namespace test

} // namespace wampcore

#endif // WAMPCORE_TEST_CLIENTTESTING_HPP
