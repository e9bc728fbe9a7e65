#include <QtTest/QtTest>

#include <algorithm>
#include <vector>

#include "ledger/line_item.hpp"

class LineItemTests : public QObject
{
    Q_OBJECT
private slots:
    void testParseRealPosting();
    void testParseVirtualPosting();
    void testParseAmountForms();
    void testParseUsesOuterSeparators();
    void testParseErrors();
    void testBuilderReportsFirstMissingField();
    void testFormatting();
    void testOrderingAndEquality();
};

namespace {

ptatemp::LineItemErrorKind parseErrorKind(const std::string &text)
{
    try {
        ptatemp::parseLineItem(text);
    } catch (const ptatemp::LineItemError &e) {
        return e.kind();
    }
    throw std::logic_error("expected parse failure for: " + text);
}

} // namespace

void LineItemTests::testParseRealPosting()
{
    const ptatemp::LineItem item = ptatemp::parseLineItem("assets:checking  $12.50");
    QCOMPARE(QString::fromStdString(item.account), QStringLiteral("assets:checking"));
    QCOMPARE(item.value, static_cast<int64_t>(1250));
    QVERIFY(item.isReal);
}

void LineItemTests::testParseVirtualPosting()
{
    const ptatemp::LineItem item = ptatemp::parseLineItem("    [budget:food]  \t-40");
    QCOMPARE(QString::fromStdString(item.account), QStringLiteral("budget:food"));
    QCOMPARE(item.value, static_cast<int64_t>(-4000));
    QVERIFY(!item.isReal);
}

void LineItemTests::testParseAmountForms()
{
    QCOMPARE(ptatemp::parseAmountCents("$1,234.56"), std::optional<int64_t>(123456));
    QCOMPARE(ptatemp::parseAmountCents("-0.05"), std::optional<int64_t>(-5));
    QCOMPARE(ptatemp::parseAmountCents("+7"), std::optional<int64_t>(700));
    QCOMPARE(ptatemp::parseAmountCents("1234.56"), std::optional<int64_t>(123456));
    QCOMPARE(ptatemp::parseAmountCents("0.1"), std::optional<int64_t>(10));
    QCOMPARE(ptatemp::parseAmountCents("1e2"), std::optional<int64_t>(10000));
    QVERIFY(!ptatemp::parseAmountCents("").has_value());
    QVERIFY(!ptatemp::parseAmountCents("$").has_value());
    QVERIFY(!ptatemp::parseAmountCents("twelve").has_value());
    QVERIFY(!ptatemp::parseAmountCents("inf").has_value());
    QVERIFY(!ptatemp::parseAmountCents("1.2.3").has_value());
    QCOMPARE(ptatemp::parseAmountCents("$90,000,000,000,000,000.00"),
             std::optional<int64_t>(9000000000000000000));
    QVERIFY(!ptatemp::parseAmountCents("$100000000000000000").has_value());
    QVERIFY(!ptatemp::parseAmountCents("-1e30").has_value());
}

void LineItemTests::testParseUsesOuterSeparators()
{
    const ptatemp::LineItem item
        = ptatemp::parseLineItem("expenses:eating out  memo text  -3.25");
    QCOMPARE(QString::fromStdString(item.account), QStringLiteral("expenses:eating out"));
    QCOMPARE(item.value, static_cast<int64_t>(-325));
}

void LineItemTests::testParseErrors()
{
    QCOMPARE(parseErrorKind("assets:checking 12.50"), ptatemp::LineItemErrorKind::MissingValue);
    QCOMPARE(parseErrorKind("assets:checking  abc"), ptatemp::LineItemErrorKind::MissingValue);
    QCOMPARE(parseErrorKind("    12.50"), ptatemp::LineItemErrorKind::MissingValue);
    QCOMPARE(parseErrorKind("a  $100000000000000000"), ptatemp::LineItemErrorKind::MissingValue);
    QCOMPARE(parseErrorKind("[  12.50"), ptatemp::LineItemErrorKind::MissingIsReal);
    QCOMPARE(parseErrorKind("[budget:food  12.50"), ptatemp::LineItemErrorKind::MissingIsReal);
    QCOMPARE(parseErrorKind("budget:food]  12.50"), ptatemp::LineItemErrorKind::MissingIsReal);
    QCOMPARE(parseErrorKind("[]  12.50"), ptatemp::LineItemErrorKind::MissingAccount);

    try {
        ptatemp::parseLineItem("oops");
        QFAIL("expected LineItemError");
    } catch (const ptatemp::LineItemError &e) {
        QCOMPARE(QString::fromUtf8(e.what()),
                 QStringLiteral("MissingValue in line item \"oops\""));
        QCOMPARE(QString::fromStdString(e.input()), QStringLiteral("oops"));
    }
}

void LineItemTests::testBuilderReportsFirstMissingField()
{
    try {
        ptatemp::LineItemBuilder().value(10).isReal(true).build();
        QFAIL("expected MissingAccount");
    } catch (const ptatemp::LineItemError &e) {
        QCOMPARE(e.kind(), ptatemp::LineItemErrorKind::MissingAccount);
    }

    try {
        ptatemp::LineItemBuilder().account("assets").build();
        QFAIL("expected MissingValue");
    } catch (const ptatemp::LineItemError &e) {
        QCOMPARE(e.kind(), ptatemp::LineItemErrorKind::MissingValue);
    }

    try {
        ptatemp::LineItemBuilder().account("assets").value(1).build();
        QFAIL("expected MissingIsReal");
    } catch (const ptatemp::LineItemError &e) {
        QCOMPARE(e.kind(), ptatemp::LineItemErrorKind::MissingIsReal);
    }

    const ptatemp::LineItem item
        = ptatemp::LineItemBuilder().account("assets").value(-99).isReal(false).build();
    QCOMPARE(item.value, static_cast<int64_t>(-99));
    QVERIFY(!item.isReal);
}

void LineItemTests::testFormatting()
{
    QCOMPARE(QString::fromStdString(ptatemp::formatCents(0)), QStringLiteral("0.00"));
    QCOMPARE(QString::fromStdString(ptatemp::formatCents(5)), QStringLiteral("0.05"));
    QCOMPARE(QString::fromStdString(ptatemp::formatCents(-5)), QStringLiteral("-0.05"));
    QCOMPARE(QString::fromStdString(ptatemp::formatCents(123456)), QStringLiteral("1234.56"));
    QCOMPARE(QString::fromStdString(ptatemp::formatCents(-100)), QStringLiteral("-1.00"));

    QCOMPARE(QString::fromStdString(
                 ptatemp::formatLineItem(ptatemp::LineItem{"assets:checking", 1250, true})),
             QStringLiteral("assets:checking  \t$12.50"));
    QCOMPARE(QString::fromStdString(
                 ptatemp::formatLineItem(ptatemp::LineItem{"budget:food", -4000, false})),
             QStringLiteral("[budget:food]  \t$-40.00"));
}

void LineItemTests::testOrderingAndEquality()
{
    std::vector<ptatemp::LineItem> items = {
        {"budget:food", 1, false},
        {"expenses:food", 2, true},
        {"assets:checking", 3, true},
        {"budget:available", 4, false},
    };
    std::stable_sort(items.begin(), items.end(), ptatemp::lineItemLess);

    QCOMPARE(QString::fromStdString(items[0].account), QStringLiteral("assets:checking"));
    QCOMPARE(QString::fromStdString(items[1].account), QStringLiteral("expenses:food"));
    QCOMPARE(QString::fromStdString(items[2].account), QStringLiteral("budget:available"));
    QCOMPARE(QString::fromStdString(items[3].account), QStringLiteral("budget:food"));

    const ptatemp::LineItem real{"food", 100, true};
    const ptatemp::LineItem virt{"food", 100, false};
    QVERIFY(real != virt);
    QVERIFY(!ptatemp::sameSlot(real, virt));
    QVERIFY(ptatemp::sameSlot(real, ptatemp::LineItem{"food", 5, true}));
    QVERIFY(real == (ptatemp::LineItem{"food", 100, true}));
}

QTEST_MAIN(LineItemTests)
#include "test_line_item.moc"
