#include <gtest/gtest.h>

#include <QtCore/QJsonObject>

#include <stdexcept>

#include "client/event_channel.hpp"

using namespace fl::client;

TEST(HandlerRegistryTests, DispatchesToEveryHandlerInOrder) {
    HandlerRegistry registry;
    QStringList calls;
    registry.on(QStringLiteral("jsonData"), [&](const QJsonValue &) { calls << QStringLiteral("a"); });
    registry.on(QStringLiteral("jsonData"), [&](const QJsonValue &) { calls << QStringLiteral("b"); });

    EXPECT_EQ(registry.dispatch(QStringLiteral("jsonData"), QJsonObject()), 2);
    EXPECT_EQ(calls, (QStringList{QStringLiteral("a"), QStringLiteral("b")}));
}

TEST(HandlerRegistryTests, UnknownEventInvokesNothing) {
    HandlerRegistry registry;
    EXPECT_EQ(registry.dispatch(QStringLiteral("nothing"), QJsonValue()), 0);
}

TEST(HandlerRegistryTests, ThrowingHandlerDoesNotStopDelivery) {
    HandlerRegistry registry;
    int reached = 0;
    registry.on(QStringLiteral("error"), [](const QJsonValue &) { throw std::runtime_error("boom"); });
    registry.on(QStringLiteral("error"), [&](const QJsonValue &) { ++reached; });

    EXPECT_EQ(registry.dispatch(QStringLiteral("error"), QJsonValue(QStringLiteral("x"))), 2);
    EXPECT_EQ(reached, 1);
}

TEST(HandlerRegistryTests, OnceHandlerRunsOnce) {
    HandlerRegistry registry;
    int calls = 0;
    registry.once(QStringLiteral("connect"), [&](const QJsonValue &) { ++calls; });

    registry.dispatch(QStringLiteral("connect"), QJsonValue());
    registry.dispatch(QStringLiteral("connect"), QJsonValue());

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(registry.handlerCount(QStringLiteral("connect")), 0);
}

TEST(HandlerRegistryTests, OffRemovesHandler) {
    HandlerRegistry registry;
    int calls = 0;
    const HandlerId id = registry.on(QStringLiteral("disconnect"), [&](const QJsonValue &) { ++calls; });
    registry.off(id);

    EXPECT_EQ(registry.dispatch(QStringLiteral("disconnect"), QJsonValue()), 0);
    EXPECT_EQ(calls, 0);
}

TEST(HandlerRegistryTests, HandlerMayRegisterDuringDispatch) {
    HandlerRegistry registry;
    int late = 0;
    registry.on(QStringLiteral("connect"), [&](const QJsonValue &) {
        registry.on(QStringLiteral("connect"), [&](const QJsonValue &) { ++late; });
    });

    registry.dispatch(QStringLiteral("connect"), QJsonValue());
    EXPECT_EQ(late, 0);
    registry.dispatch(QStringLiteral("connect"), QJsonValue());
    EXPECT_EQ(late, 1);
}
