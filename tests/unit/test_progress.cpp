#include <QtTest>

#include <chroma_composite_engine/cce_progress.h>
#include <vector>

class TestProgress : public QObject
{
    Q_OBJECT

private slots:
    void test_reports_are_clamped_and_monotonic() {
        std::vector<int> seen;
        cce::ProgressReporter reporter([&seen](const cce::JobProgress& p) {
            seen.push_back(p.percent);
            return true;
        }, nullptr);

        QVERIFY(reporter.report(-10, "start"));
        QVERIFY(reporter.report(40, "half"));
        QVERIFY(reporter.report(30, "late"));
        QVERIFY(reporter.report(250, "done"));

        QCOMPARE(seen.size(), size_t(4));
        QCOMPARE(seen[0], 0);
        QCOMPARE(seen[1], 40);
        QCOMPARE(seen[2], 40);
        QCOMPARE(seen[3], 100);
        QCOMPARE(reporter.last_percent(), 100);
    }

    void test_status_is_forwarded() {
        std::string status;
        cce::ProgressReporter reporter([&status](const cce::JobProgress& p) {
            status = p.status;
            return true;
        }, nullptr);
        reporter.report(10, "Compositing frame 3/30");
        QCOMPARE(status, std::string("Compositing frame 3/30"));
    }

    void test_callback_can_cancel() {
        int calls = 0;
        cce::ProgressReporter reporter([&calls](const cce::JobProgress&) {
            ++calls;
            return calls < 2;
        }, nullptr);

        QVERIFY(reporter.report(10, "a"));
        QVERIFY(!reporter.cancel_requested());
        QVERIFY(!reporter.report(20, "b"));
        QVERIFY(reporter.cancel_requested());
        // Stays cancelled
        QVERIFY(!reporter.report(30, "c"));
    }

    void test_token_cancels() {
        cce::CancellationToken token;
        cce::ProgressReporter reporter(cce::ProgressCallback(), &token);
        QVERIFY(reporter.report(10, "a"));
        token.cancel();
        QVERIFY(token.is_cancelled());
        QVERIFY(reporter.cancel_requested());
        QVERIFY(!reporter.report(20, "b"));
    }

    void test_no_callback_no_token() {
        cce::ProgressReporter reporter(cce::ProgressCallback(), nullptr);
        QVERIFY(reporter.report(50, "x"));
        QCOMPARE(reporter.last_percent(), 50);
    }
};

QTEST_MAIN(TestProgress)
#include "test_progress.moc"
