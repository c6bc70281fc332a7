#include <gtest/gtest.h>

#include <QJsonArray>

#include "devrun/core/cancellation_token.h"
#include "devrun/core/failure.h"

using namespace devrun;

TEST(FailureTest, ExitCodeTable) {
    EXPECT_EQ(exitCodeFor(FailureKind::None), 0);
    EXPECT_EQ(exitCodeFor(FailureKind::TestFailure), 1);
    EXPECT_EQ(exitCodeFor(FailureKind::ConfigError), 2);
    EXPECT_EQ(exitCodeFor(FailureKind::EnvironmentBlocker), 10);
    EXPECT_EQ(exitCodeFor(FailureKind::SessionBusy), 11);
    EXPECT_EQ(exitCodeFor(FailureKind::DependencyStartupFailure), 12);
    EXPECT_EQ(exitCodeFor(FailureKind::HealthTimeout), 13);
    EXPECT_EQ(exitCodeFor(FailureKind::AppCrash), 14);
    EXPECT_EQ(exitCodeFor(FailureKind::Cancelled), 130);
}

TEST(FailureTest, InfrastructureKindsMapIntoTenToNineteen) {
    for (FailureKind kind : {FailureKind::EnvironmentBlocker, FailureKind::SessionBusy,
                             FailureKind::DependencyStartupFailure, FailureKind::HealthTimeout,
                             FailureKind::AppCrash}) {
        const Failure f = Failure::make(kind, "x", "y");
        EXPECT_TRUE(f.isInfrastructure()) << qPrintable(failureKindName(kind));
        EXPECT_GE(exitCodeFor(kind), 10);
        EXPECT_LE(exitCodeFor(kind), 19);
    }
    EXPECT_FALSE(Failure::make(FailureKind::TestFailure, "tests", "x").isInfrastructure());
    EXPECT_FALSE(Failure::make(FailureKind::ShutdownError, "app", "x").isInfrastructure());
}

TEST(FailureTest, DescribeAndJson) {
    const Failure f = Failure::make(FailureKind::HealthTimeout, "app", "not healthy",
                                    {"line1", "line2"});
    EXPECT_EQ(f.describe(), "HealthTimeout [app]: not healthy");

    const QJsonObject obj = f.toJson();
    EXPECT_EQ(obj.value("kind").toString(), "HealthTimeout");
    EXPECT_EQ(obj.value("origin").toString(), "app");
    EXPECT_TRUE(obj.value("infrastructure").toBool());
    EXPECT_EQ(obj.value("logTail").toArray().size(), 2);

    EXPECT_TRUE(Failure().isNone());
    EXPECT_EQ(Failure().describe(), "ok");
}

TEST(CancellationTokenTest, CancelIsIdempotent) {
    CancellationToken token;
    int emitted = 0;
    QObject::connect(&token, &CancellationToken::cancelled, [&emitted](const QString&) {
        ++emitted;
    });

    EXPECT_FALSE(token.isCancelled());
    token.cancel("SIGINT");
    token.cancel("SIGTERM");

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), "SIGINT");
    EXPECT_EQ(emitted, 1);
}
