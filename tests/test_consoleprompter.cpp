#include "consoleprompter.h"
#include "interruptguard.h"
#include <QScopedPointer>
#include <QTextStream>
#include <gtest/gtest.h>

class ConsolePrompterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        InterruptGuard::reset();
    }

    // Ejecuta una pregunta con las respuestas indicadas, una por línea
    void feed(const QString &answers)
    {
        inputText = answers;
        input.reset(new QTextStream(&inputText, QIODevice::ReadOnly));
        output.reset(new QTextStream(&outputText, QIODevice::WriteOnly));
        prompter.reset(new ConsolePrompter(*input, *output));
    }

    QString inputText;
    QString outputText;
    QScopedPointer<QTextStream> input;
    QScopedPointer<QTextStream> output;
    QScopedPointer<ConsolePrompter> prompter;
};

TEST_F(ConsolePrompterTest, EmptyLineAcceptsDefaultDestination)
{
    feed("\n");
    EXPECT_EQ(prompter->chooseDestination("/home/me/Documents/AndroidBackup"),
              QString("/home/me/Documents/AndroidBackup"));
}

TEST_F(ConsolePrompterTest, CustomDestination)
{
    feed("2\n\n/data/phone\n");
    EXPECT_EQ(prompter->chooseDestination("/home/me/Documents/AndroidBackup"), QString("/data/phone"));
}

TEST_F(ConsolePrompterTest, EndOfInputCancelsDestination)
{
    feed("");
    EXPECT_TRUE(prompter->chooseDestination("/home/me/Documents/AndroidBackup").isNull());
}

TEST_F(ConsolePrompterTest, EstimateRejectsValuesThatCannotBeBytes)
{
    feed("inf\nnan\n1e30\n9000000000\n-1\nabc\n2,5\n");
    EXPECT_EQ(prompter->estimateSizeBytes(), Q_INT64_C(2684354560));
    EXPECT_EQ(outputText.count("realista"), 6);
}

TEST_F(ConsolePrompterTest, EstimateAcceptsLargeRealisticSize)
{
    feed("1024\n");
    EXPECT_EQ(prompter->estimateSizeBytes(), Q_INT64_C(1099511627776));
}

TEST_F(ConsolePrompterTest, EndOfInputCancelsEstimate)
{
    feed("");
    EXPECT_EQ(prompter->estimateSizeBytes(), -1);
}

TEST_F(ConsolePrompterTest, EmptyLineDoesNotPickConflictAction)
{
    feed("\n3\n");
    EXPECT_EQ(prompter->chooseConflictAction("/data/phone", 4), ConflictChoice::Cancel);
    EXPECT_TRUE(outputText.contains("Introduzca un número entre 1 y 3"));
}
