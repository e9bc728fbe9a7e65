#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/logging.hpp"
#include "ledger/balance_query.hpp"

class BalanceQueryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testParseHledgerOutput();
    void testParseLedgerOutput();
    void testParseNegativeAndEmpty();
    void testProviderRunsCommand();
    void testProviderFallsBackToNextCommand();
    void testProviderCachesBalances();
    void testProviderFailsWhenNothingStarts();
    void testProviderRejectsUnparseableOutput();
    void testProviderRejectsCrashedCommand();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeScript(const QString &name, const QString &body) const;
};

void BalanceQueryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    ptatemp::logging::LoggingOptions options;
    options.processName = QStringLiteral("ptatemp-test");
    options.logDir = m_tempDir.path() + "/logs";
    ptatemp::logging::initLogging(options);
}

void BalanceQueryTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString BalanceQueryTests::writeScript(const QString &name, const QString &body) const
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write("#!/bin/sh\n");
    file.write(body.toUtf8());
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner
                        | QFileDevice::ExeOwner);
    return path;
}

void BalanceQueryTests::testParseHledgerOutput()
{
    const QString output = QStringLiteral(
        "           $1,234.56  assets:checking\n"
        "--------------------\n"
        "           $1,234.56\n");
    QCOMPARE(ptatemp::parseBalanceOutput(output), std::optional<int64_t>(123456));
}

void BalanceQueryTests::testParseLedgerOutput()
{
    const QString output = QStringLiteral(
        "             $250.00  budget:food\n"
        "             $-50.00    groceries\n"
        "--------------------\n"
        "             $200.00\n"
        "\n");
    QCOMPARE(ptatemp::parseBalanceOutput(output), std::optional<int64_t>(20000));
}

void BalanceQueryTests::testParseNegativeAndEmpty()
{
    QCOMPARE(ptatemp::parseBalanceOutput(QStringLiteral("$-40.10\n")),
             std::optional<int64_t>(-4010));
    QCOMPARE(ptatemp::parseBalanceOutput(QStringLiteral("--------------------\n                   0\n")),
             std::optional<int64_t>(0));
    QVERIFY(!ptatemp::parseBalanceOutput(QString()).has_value());
    QVERIFY(!ptatemp::parseBalanceOutput(QStringLiteral("\n\n")).has_value());
    QVERIFY(!ptatemp::parseBalanceOutput(QStringLiteral("no balance\n")).has_value());
}

void BalanceQueryTests::testProviderRunsCommand()
{
    const QString script = writeScript(
        QStringLiteral("fake-hledger"),
        QStringLiteral("[ \"$1\" = \"-f\" ] || exit 2\n"
                       "[ \"$3\" = \"bal\" ] || exit 2\n"
                       "case \"$4\" in\n"
                       "  assets:checking) printf '   $1,234.56  assets:checking\\n====\\n   $1,234.56\\n' ;;\n"
                       "  *) printf '====\\n   0\\n' ;;\n"
                       "esac\n"));
    QVERIFY(!script.isEmpty());

    ptatemp::LedgerBalanceProvider provider(m_tempDir.path() + "/main.journal", {script});
    QCOMPARE(provider.balanceCents("assets:checking"), static_cast<int64_t>(123456));
    QCOMPARE(provider.balanceCents("budget:unknown"), static_cast<int64_t>(0));
}

void BalanceQueryTests::testProviderFallsBackToNextCommand()
{
    const QString script = writeScript(QStringLiteral("fake-ledger"),
                                       QStringLiteral("printf '   $-75.25\\n'\n"));
    QVERIFY(!script.isEmpty());

    ptatemp::LedgerBalanceProvider provider(
        m_tempDir.path() + "/main.journal",
        {m_tempDir.path() + "/does-not-exist", script});
    QCOMPARE(provider.balanceCents("liabilities:card"), static_cast<int64_t>(-7525));
}

void BalanceQueryTests::testProviderCachesBalances()
{
    const QString counter = m_tempDir.path() + "/calls.txt";
    const QString script = writeScript(
        QStringLiteral("counting-hledger"),
        QStringLiteral("echo call >> '%1'\nprintf '   $10.00\\n'\n").arg(counter));
    QVERIFY(!script.isEmpty());

    ptatemp::LedgerBalanceProvider provider(m_tempDir.path() + "/main.journal", {script});
    QCOMPARE(provider.balanceCents("assets:cash"), static_cast<int64_t>(1000));
    QCOMPARE(provider.balanceCents("assets:cash"), static_cast<int64_t>(1000));

    QFile file(counter);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(static_cast<int>(file.readAll().count("call")), 1);
}

void BalanceQueryTests::testProviderFailsWhenNothingStarts()
{
    ptatemp::LedgerBalanceProvider provider(
        m_tempDir.path() + "/main.journal",
        {m_tempDir.path() + "/missing-hledger", m_tempDir.path() + "/missing-ledger"});
    try {
        provider.balanceCents("assets:checking");
        QFAIL("expected BalanceQueryError");
    } catch (const ptatemp::BalanceQueryError &e) {
        const QString message = QString::fromUtf8(e.what());
        QVERIFY(message.startsWith(QStringLiteral("Failed to execute ")));
        QVERIFY(message.contains(QStringLiteral("missing-hledger and ")));
        QVERIFY(message.endsWith(QStringLiteral("Are they installed?")));
    }
}

void BalanceQueryTests::testProviderRejectsUnparseableOutput()
{
    const QString script = writeScript(QStringLiteral("broken-hledger"),
                                       QStringLiteral("echo 'journal not found' >&2\nexit 1\n"));
    QVERIFY(!script.isEmpty());

    ptatemp::LedgerBalanceProvider provider(m_tempDir.path() + "/main.journal", {script});
    QVERIFY_EXCEPTION_THROWN(provider.balanceCents("assets:checking"),
                             ptatemp::BalanceQueryError);
}

void BalanceQueryTests::testProviderRejectsCrashedCommand()
{
    const QString script = writeScript(QStringLiteral("crashing-hledger"),
                                       QStringLiteral("printf '   $12.00\\n'\nkill -KILL $$\n"));
    QVERIFY(!script.isEmpty());

    ptatemp::LedgerBalanceProvider provider(m_tempDir.path() + "/main.journal", {script});
    try {
        provider.balanceCents("assets:checking");
        QFAIL("expected BalanceQueryError");
    } catch (const ptatemp::BalanceQueryError &e) {
        QVERIFY(QString::fromUtf8(e.what()).contains(QStringLiteral("crashed")));
    }
}

QTEST_MAIN(BalanceQueryTests)
#include "test_balance_query.moc"
