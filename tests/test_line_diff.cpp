#include <QtTest/QtTest>

#include <QElapsedTimer>

#include "engine/line_diff.hpp"

class LineDiffTests : public QObject
{
    Q_OBJECT
private slots:
    void testSplitLines();
    void testIdenticalContent();
    void testInsertionShiftsLines();
    void testDeletionUnmapsLines();
    void testMiddleEdit();
    void testReorderedBlock();
    void testEmptySides();
    void testInterleavedInsertionsKeepEveryLine();
    void testScatteredEditsOnLargeFile();
    void testFullRewriteOfLargeFile();
};

namespace {

std::string numbered(int from, int to)
{
    std::string content;
    for (int i = from; i <= to; ++i) {
        content += "line " + std::to_string(i) + "\n";
    }
    return content;
}

// Mapped lines must carry equal text and keep their order.
int checkedMatches(const promptrail::LineAlignment &alignment,
                   const std::vector<std::string> &before,
                   const std::vector<std::string> &after)
{
    int mapped = 0;
    int previous = 0;
    for (int line = 1; line <= static_cast<int>(before.size()); ++line) {
        const int target = alignment.mapLine(line);
        if (target == 0) {
            continue;
        }
        if (target <= previous || after.at(target - 1) != before.at(line - 1)) {
            return -1;
        }
        previous = target;
        ++mapped;
    }
    return mapped;
}

} // namespace

void LineDiffTests::testSplitLines()
{
    QCOMPARE(promptrail::splitLines("a\nb\n").size(), static_cast<size_t>(2));
    QCOMPARE(promptrail::splitLines("a\nb").size(), static_cast<size_t>(2));
    QCOMPARE(promptrail::splitLines("a\n\nb\n").size(), static_cast<size_t>(3));
    QVERIFY(promptrail::splitLines("").empty());
}

void LineDiffTests::testIdenticalContent()
{
    const auto alignment = promptrail::alignContents(numbered(1, 10), numbered(1, 10));
    QCOMPARE(alignment.newLineCount, 10);
    for (int line = 1; line <= 10; ++line) {
        QCOMPARE(alignment.mapLine(line), line);
    }
    QCOMPARE(alignment.mapLine(0), 0);
    QCOMPARE(alignment.mapLine(11), 0);
}

void LineDiffTests::testInsertionShiftsLines()
{
    const std::string before = numbered(1, 10);
    const std::string after = "header a\nheader b\n" + before;
    const auto alignment = promptrail::alignContents(before, after);
    for (int line = 1; line <= 10; ++line) {
        QCOMPARE(alignment.mapLine(line), line + 2);
    }
}

void LineDiffTests::testDeletionUnmapsLines()
{
    const std::string before = numbered(1, 12);
    const std::string after = numbered(1, 3) + numbered(9, 12);
    const auto alignment = promptrail::alignContents(before, after);
    QCOMPARE(alignment.mapLine(3), 3);
    for (int line = 4; line <= 8; ++line) {
        QCOMPARE(alignment.mapLine(line), 0);
    }
    QCOMPARE(alignment.mapLine(9), 4);
    QCOMPARE(alignment.mapLine(12), 7);
}

void LineDiffTests::testMiddleEdit()
{
    const std::string before = numbered(1, 8);
    const std::string after = numbered(1, 3) + "changed\n" + numbered(5, 8);
    const auto alignment = promptrail::alignContents(before, after);
    QCOMPARE(alignment.mapLine(4), 0);
    QCOMPARE(alignment.mapLine(5), 5);
    QCOMPARE(alignment.mapLine(3), 3);
}

void LineDiffTests::testReorderedBlock()
{
    const std::vector<std::string> before{"a", "b", "c", "x", "y", "z"};
    const std::vector<std::string> after{"x", "y", "z", "a", "b", "c"};
    const auto alignment = promptrail::alignLines(before, after);

    int mapped = 0;
    int previous = 0;
    for (int line = 1; line <= 6; ++line) {
        const int target = alignment.mapLine(line);
        if (target != 0) {
            QVERIFY(target > previous);
            QCOMPARE(after.at(target - 1), before.at(line - 1));
            previous = target;
            ++mapped;
        }
    }
    QCOMPARE(mapped, 3);
}

void LineDiffTests::testEmptySides()
{
    const auto cleared = promptrail::alignContents(numbered(1, 3), "");
    QCOMPARE(cleared.newLineCount, 0);
    QCOMPARE(cleared.mapLine(2), 0);

    const auto created = promptrail::alignContents("", numbered(1, 3));
    QVERIFY(created.oldToNew.empty());
    QCOMPARE(created.newLineCount, 3);
}

void LineDiffTests::testInterleavedInsertionsKeepEveryLine()
{
    std::vector<std::string> before;
    std::vector<std::string> after;
    for (int i = 1; i <= 200; ++i) {
        before.push_back("line " + std::to_string(i));
        after.push_back("line " + std::to_string(i));
        if (i % 5 == 0) {
            after.push_back("added after " + std::to_string(i));
        }
    }
    const auto alignment = promptrail::alignLines(before, after);
    QCOMPARE(checkedMatches(alignment, before, after), 200);
    QCOMPARE(alignment.mapLine(5), 5);
    QCOMPARE(alignment.mapLine(6), 7);
    QCOMPARE(alignment.mapLine(200), 239);
}

void LineDiffTests::testScatteredEditsOnLargeFile()
{
    std::vector<std::string> before;
    std::vector<std::string> after;
    for (int i = 1; i <= 6000; ++i) {
        before.push_back("line " + std::to_string(i));
        after.push_back(i % 10 == 0 ? "edited " + std::to_string(i)
                                    : "line " + std::to_string(i));
    }
    const auto alignment = promptrail::alignLines(before, after);
    QCOMPARE(checkedMatches(alignment, before, after), 5400);
    QCOMPARE(alignment.mapLine(10), 0);
    QCOMPARE(alignment.mapLine(11), 11);
    QCOMPARE(alignment.mapLine(5999), 5999);
}

void LineDiffTests::testFullRewriteOfLargeFile()
{
    std::vector<std::string> before;
    std::vector<std::string> after;
    for (int i = 1; i <= 20000; ++i) {
        before.push_back("old " + std::to_string(i));
        after.push_back("new " + std::to_string(i));
    }
    // Keep one line in common so the search has something to find.
    after[10000] = before[10000];

    QElapsedTimer timer;
    timer.start();
    const auto alignment = promptrail::alignLines(before, after);
    QVERIFY(timer.elapsed() < 10000);

    QCOMPARE(alignment.newLineCount, 20000);
    QVERIFY(checkedMatches(alignment, before, after) >= 0);
    QCOMPARE(alignment.mapLine(1), 0);
    QCOMPARE(alignment.mapLine(20000), 0);
}

QTEST_MAIN(LineDiffTests)
#include "test_line_diff.moc"
