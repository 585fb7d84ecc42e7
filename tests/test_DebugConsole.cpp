#include <gtest/gtest.h>

#include "core/DebugConsole.h"

#include <QRegularExpression>

TEST(DebugConsoleTest, MessagesAreTimestampedWithLevel)
{
    DebugConsole console;

    console.addMessage("device attached");
    console.addMessage("port busy", "WARNING");

    QStringList messages = console.messages();
    ASSERT_EQ(messages.size(), 2);
    QRegularExpression format("^\\[\\d{2}:\\d{2}:\\d{2}\\.\\d{3}\\] INFO: device attached$");
    EXPECT_TRUE(format.match(messages.at(0)).hasMatch()) << messages.at(0).toStdString();
    EXPECT_TRUE(messages.at(1).endsWith("WARNING: port busy"));
}

TEST(DebugConsoleTest, BufferDropsOldestLines)
{
    DebugConsole console(3);

    for (int i = 1; i <= 5; ++i) {
        console.addLine(QString("line %1").arg(i));
    }

    EXPECT_EQ(console.messages(), QStringList({"line 3", "line 4", "line 5"}));
    EXPECT_EQ(console.maxMessages(), 3);
}

TEST(DebugConsoleTest, NewSinkReceivesBacklogThenLiveLines)
{
    DebugConsole console;
    console.addLine("early");

    QStringList received;
    console.registerSink("viewer", [&received](const QString &line) { received << line; });
    console.addLine("late");

    EXPECT_EQ(received, QStringList({"early", "late"}));
    EXPECT_EQ(console.sinkCount(), 1);

    console.unregisterSink("viewer");
    console.addLine("ignored");
    EXPECT_EQ(received.size(), 2);
    EXPECT_EQ(console.sinkCount(), 0);
}

TEST(DebugConsoleTest, ReplacingSinkSkipsBacklog)
{
    DebugConsole console;
    console.addLine("early");

    QStringList first;
    QStringList second;
    console.registerSink("viewer", [&first](const QString &line) { first << line; });
    console.registerSink("viewer", [&second](const QString &line) { second << line; });
    console.addLine("late");

    EXPECT_EQ(first, QStringList({"early"}));
    EXPECT_EQ(second, QStringList({"late"}));
    EXPECT_EQ(console.sinkCount(), 1);
}

TEST(DebugConsoleTest, ClearEmptiesBufferAndNotifies)
{
    DebugConsole console;
    console.addLine("one");

    int cleared = 0;
    QObject::connect(&console, &DebugConsole::cleared, [&cleared]() { ++cleared; });
    console.clear();

    EXPECT_TRUE(console.messages().isEmpty());
    EXPECT_EQ(cleared, 1);
}
