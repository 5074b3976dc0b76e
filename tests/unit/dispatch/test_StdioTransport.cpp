#include <QJsonDocument>
#include <QtTest>
#include <unistd.h>
#include "dispatch/StdioTransport.hpp"

using namespace smu;

namespace {

// Owns both ends of a pipe
struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (::pipe(fds) != 0)
            fds[0] = fds[1] = -1;
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }

    bool valid() const {
        return fds[0] >= 0 && fds[1] >= 0;
    }
    int readEnd() const {
        return fds[0];
    }
    int writeEnd() const {
        return fds[1];
    }
    bool write(const QByteArray& data) const {
        return ::write(fds[1], data.constData(), static_cast<size_t>(data.size())) ==
               static_cast<ssize_t>(data.size());
    }
    void closeRead() {
        if (fds[0] >= 0)
            ::close(fds[0]);
        fds[0] = -1;
    }
    void closeWrite() {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }
};

struct Collector {
    explicit Collector(StdioTransport& transport) {
        transport.lineReceived.connect(
                [this](const QByteArray& line) { lines.push_back(line); });
        transport.closed.connect([this] { ++closedCount; });
    }

    std::vector<QByteArray> lines;
    int closedCount{0};
};

} // namespace

class TestStdioTransport : public QObject {
    Q_OBJECT

private slots:
    void testSplitsLines() {
        Pipe in, out;
        QVERIFY(in.valid() && out.valid());
        StdioTransport transport(in.readEnd(), out.writeEnd());
        Collector c(transport);

        QVERIFY(in.write("{\"type\":\"GET_STATUS\"}\nsecond\r\n\n"));
        QTRY_COMPARE_WITH_TIMEOUT(c.lines.size(), size_t(2), 2000);
        QCOMPARE(c.lines[0], QByteArray("{\"type\":\"GET_STATUS\"}"));
        // CR stripped, blank line skipped
        QCOMPARE(c.lines[1], QByteArray("second"));
        QVERIFY(transport.isOpen());
        QCOMPARE(c.closedCount, 0);
    }

    void testLineSplitAcrossReads() {
        Pipe in, out;
        QVERIFY(in.valid() && out.valid());
        StdioTransport transport(in.readEnd(), out.writeEnd());
        Collector c(transport);

        QVERIFY(in.write("hel"));
        QTest::qWait(50);
        QVERIFY(c.lines.empty());

        QVERIFY(in.write("lo\nwor"));
        QTRY_COMPARE_WITH_TIMEOUT(c.lines.size(), size_t(1), 2000);
        QCOMPARE(c.lines[0], QByteArray("hello"));

        QVERIFY(in.write("ld\n"));
        QTRY_COMPARE_WITH_TIMEOUT(c.lines.size(), size_t(2), 2000);
        QCOMPARE(c.lines[1], QByteArray("world"));
    }

    void testEofFlushesTrailingLineAndClosesOnce() {
        Pipe in, out;
        QVERIFY(in.valid() && out.valid());
        StdioTransport transport(in.readEnd(), out.writeEnd());
        Collector c(transport);

        QVERIFY(in.write("first\nlast"));
        QTRY_COMPARE_WITH_TIMEOUT(c.lines.size(), size_t(1), 2000);
        in.closeWrite();

        QTRY_COMPARE_WITH_TIMEOUT(c.closedCount, 1, 2000);
        QCOMPARE(c.lines.size(), size_t(2));
        QCOMPARE(c.lines[1], QByteArray("last"));
        QVERIFY(!transport.isOpen());

        QTest::qWait(50);
        QCOMPARE(c.closedCount, 1);
    }

    void testEofWithoutPendingData() {
        Pipe in, out;
        QVERIFY(in.valid() && out.valid());
        StdioTransport transport(in.readEnd(), out.writeEnd());
        Collector c(transport);

        in.closeWrite();
        QTRY_COMPARE_WITH_TIMEOUT(c.closedCount, 1, 2000);
        QVERIFY(c.lines.empty());
    }

    void testSendWritesOneJsonLine() {
        Pipe in, out;
        QVERIFY(in.valid() && out.valid());
        StdioTransport transport(in.readEnd(), out.writeEnd());

        transport.send(QJsonObject{{"type", "REPLY"}, {"success", true}});
        transport.send(QJsonObject{{"type", "SIGNAL_BATCH"}});

        char buf[512];
        QByteArray received;
        while (received.count('\n') < 2) {
            ssize_t n = ::read(out.readEnd(), buf, sizeof(buf));
            QVERIFY(n > 0);
            received.append(buf, static_cast<qsizetype>(n));
        }

        auto lines = received.split('\n');
        QCOMPARE(lines.size(), qsizetype(3));
        QVERIFY(lines[2].isEmpty());

        auto first = QJsonDocument::fromJson(lines[0]).object();
        QCOMPARE(first["type"].toString(), QString("REPLY"));
        QVERIFY(first["success"].toBool());
        auto second = QJsonDocument::fromJson(lines[1]).object();
        QCOMPARE(second["type"].toString(), QString("SIGNAL_BATCH"));
    }
};

int runTestStdioTransport(int argc, char** argv) {
    TestStdioTransport t;
    return QTest::qExec(&t, argc, argv);
}

#include "test_StdioTransport.moc"
