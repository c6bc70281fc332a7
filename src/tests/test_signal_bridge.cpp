#include <gtest/gtest.h>

#include <csignal>

#include "devrun/core/cancellation_token.h"
#include "devrun/session/signal_bridge.h"
#include "helpers/test_support.h"

using namespace devrun;
using test_support::pumpEvents;
using test_support::waitUntil;

#ifdef Q_OS_UNIX

TEST(SignalBridgeTest, FirstSignalCancelsToken) {
    CancellationToken token;
    SignalBridge bridge(&token);
    QString error;
    ASSERT_TRUE(bridge.install(error)) << qPrintable(error);

    std::raise(SIGINT);
    ASSERT_TRUE(waitUntil([&]() { return token.isCancelled(); }, 2000));
    EXPECT_EQ(token.reason(), "SIGINT");
    EXPECT_EQ(bridge.signalCount(), 1);
}

TEST(SignalBridgeTest, RepeatedSignalsDoNotReCancel) {
    CancellationToken token;
    int cancellations = 0;
    QObject::connect(&token, &CancellationToken::cancelled,
                     [&cancellations](const QString&) { ++cancellations; });
    SignalBridge bridge(&token);
    QString error;
    ASSERT_TRUE(bridge.install(error));

    std::raise(SIGTERM);
    ASSERT_TRUE(waitUntil([&]() { return bridge.signalCount() == 1; }, 2000));
    std::raise(SIGINT);
    ASSERT_TRUE(waitUntil([&]() { return bridge.signalCount() == 2; }, 2000));
    pumpEvents(50);

    EXPECT_EQ(cancellations, 1);
    EXPECT_EQ(token.reason(), "SIGTERM");
}

TEST(SignalBridgeTest, OnlyOneBridgePerProcess) {
    CancellationToken token;
    SignalBridge first(&token);
    SignalBridge second(&token);
    QString error;
    ASSERT_TRUE(first.install(error));
    EXPECT_FALSE(second.install(error));
    EXPECT_FALSE(error.isEmpty());

    first.uninstall();
    EXPECT_FALSE(first.isInstalled());
    EXPECT_TRUE(second.install(error)) << qPrintable(error);
}

#endif
