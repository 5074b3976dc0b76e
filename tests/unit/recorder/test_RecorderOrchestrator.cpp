#include <QtTest>
#include "fakes/FakeMediaBackend.hpp"
#include "recorder/RecorderOrchestrator.hpp"

using namespace smu;
using smu::test::FakeMediaBackend;
using smu::test::FakeRecorder;
using smu::test::FakeRecorderFactory;
using smu::test::OpenBehavior;

namespace {

struct Harness {
    FakeMediaBackend backend;
    FakeRecorderFactory factory;
    ChannelAcquirer acquirer{backend, {}};
    RecorderOrchestrator orchestrator;

    explicit Harness(OrchestratorSettings settings = {})
        : orchestrator(acquirer, factory, std::move(settings)) {
    }

    FakeRecorder* rec(ChannelKind kind) {
        return factory.recorder(kind);
    }
};

OrchestratorSettings withTimeout(int ms) {
    OrchestratorSettings s;
    s.stopTimeout = std::chrono::milliseconds(ms);
    return s;
}

const RecordingArtifact* find(const ArtifactList& list, ChannelKind kind) {
    for (const auto& a : list) {
        if (a.channelKind == kind)
            return &a;
    }
    return nullptr;
}

} // namespace

class TestRecorderOrchestrator : public QObject {
    Q_OBJECT

private slots:
    void testMicrophoneDeniedRecordsDisplayOnly() {
        Harness h;
        h.backend.microphone = OpenBehavior::Fail;

        auto started = h.orchestrator.start({true, false, DisplayIntent::Monitor});
        QVERIFY(started.isOk());
        QCOMPARE(h.orchestrator.state(), SessionState::Recording);
        QCOMPARE(h.orchestrator.activeChannels(),
                 std::vector<ChannelKind>{ChannelKind::Display});

        h.rec(ChannelKind::Display)->pushChunk(QByteArray(100, 'a'));
        h.rec(ChannelKind::Display)->pushChunk(QByteArray(60, 'b'));

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);

        auto artifacts = future.result();
        QCOMPARE(artifacts.size(), size_t(1));
        QVERIFY(artifacts[0].channelKind == ChannelKind::Display);
        QCOMPARE(artifacts[0].byteSize, qint64(160));
        QCOMPARE(h.orchestrator.state(), SessionState::Idle);
    }

    void testDisplayFailureRejectsStart() {
        Harness h;
        h.backend.display = OpenBehavior::Fail;

        auto started = h.orchestrator.start({true, true, DisplayIntent::Monitor});
        QVERIFY(started.isErr());
        QCOMPARE(started.error().code, ErrorCode::MandatoryAcquisitionFailed);
        QCOMPARE(h.orchestrator.state(), SessionState::Idle);
        QVERIFY(h.orchestrator.activeChannels().empty());
        QVERIFY(h.factory.created.empty());

        auto future = h.orchestrator.stop();
        QVERIFY(future.isFinished());
        QVERIFY(future.result().empty());
    }

    void testSecondStartRejected() {
        Harness h;
        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));

        auto again = h.orchestrator.start({false, false, DisplayIntent::Monitor});
        QVERIFY(again.isErr());
        QCOMPARE(again.error().code, ErrorCode::InvalidState);
        QCOMPARE(h.orchestrator.state(), SessionState::Recording);
    }

    void testAllRecordersShareTimeslice() {
        OrchestratorSettings s;
        s.chunkInterval = std::chrono::milliseconds(250);
        Harness h(s);

        auto before = Clock::now();
        QVERIFY(h.orchestrator.start({true, true, DisplayIntent::Monitor}));
        QVERIFY(h.orchestrator.startedAt().has_value());
        QVERIFY(*h.orchestrator.startedAt() >= before);

        for (auto kind : {ChannelKind::Display,
                          ChannelKind::Microphone,
                          ChannelKind::Camera}) {
            auto* rec = h.rec(kind);
            QVERIFY(rec != nullptr);
            QCOMPARE(rec->starts, 1);
            QCOMPARE(rec->timeslice(), std::chrono::milliseconds(250));
        }
    }

    void testStateTransitions() {
        Harness h;
        std::vector<SessionState> seen;
        h.orchestrator.stateChanged.connect(
                [&](SessionState s) { seen.push_back(s); });

        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));
        QVERIFY(h.orchestrator.pause());
        QVERIFY(h.orchestrator.resume());
        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);

        std::vector<SessionState> expected{SessionState::Starting,
                                           SessionState::Recording,
                                           SessionState::Paused,
                                           SessionState::Recording,
                                           SessionState::Stopping,
                                           SessionState::Stopped,
                                           SessionState::Idle};
        QCOMPARE(seen, expected);
    }

    void testPauseResumeKeepsMembership() {
        Harness h;
        QVERIFY(h.orchestrator.start({true, true, DisplayIntent::Monitor}));
        auto channels = h.orchestrator.activeChannels();
        QCOMPARE(channels.size(), size_t(3));

        for (int i = 0; i < 3; ++i) {
            QVERIFY(h.orchestrator.pause());
            QCOMPARE(h.orchestrator.activeChannels(), channels);
            QVERIFY(h.orchestrator.resume());
            QCOMPARE(h.orchestrator.activeChannels(), channels);
        }
        QCOMPARE(h.rec(ChannelKind::Microphone)->pauses, 3);
        QCOMPARE(h.rec(ChannelKind::Camera)->resumes, 3);
    }

    void testPauseResumeGuards() {
        Harness h;
        auto idlePause = h.orchestrator.pause();
        QVERIFY(idlePause.isErr());
        QCOMPARE(idlePause.error().code, ErrorCode::InvalidState);

        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));
        QVERIFY(h.orchestrator.resume().isErr());
        QVERIFY(h.orchestrator.pause());
        QVERIFY(h.orchestrator.pause().isErr());
    }

    void testPauseSkipsRecorderInUnexpectedState() {
        Harness h;
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));

        auto* mic = h.rec(ChannelKind::Microphone);
        mic->pause(); // already paused behind the orchestrator's back
        QCOMPARE(mic->pauses, 1);

        QVERIFY(h.orchestrator.pause());
        QCOMPARE(mic->pauses, 1);
        QCOMPARE(h.rec(ChannelKind::Display)->pauses, 1);
    }

    void testPausedTimeExcludedFromElapsed() {
        Harness h;
        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));
        QVERIFY(h.orchestrator.pause());
        auto atPause = h.orchestrator.elapsed();
        QTest::qWait(60);
        QCOMPARE(h.orchestrator.elapsed(), atPause);
        QVERIFY(h.orchestrator.resume());
        QVERIFY(h.orchestrator.elapsed() < atPause + std::chrono::milliseconds(50));
    }

    void testStopWaitsForEveryChannel() {
        Harness h;
        h.factory.stopMode = FakeRecorder::StopMode::Manual;
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));

        auto future = h.orchestrator.stop();
        QCOMPARE(h.orchestrator.state(), SessionState::Stopping);

        // Completion in reverse order
        h.rec(ChannelKind::Microphone)->completeStop();
        QTest::qWait(20);
        QVERIFY(!future.isFinished());
        QCOMPARE(h.orchestrator.state(), SessionState::Stopping);

        // Chunks delivered while stopping still count
        h.rec(ChannelKind::Display)->pushChunk("tail");
        h.rec(ChannelKind::Display)->completeStop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);

        auto artifacts = future.result();
        QCOMPARE(artifacts.size(), size_t(2));
        QCOMPARE(find(artifacts, ChannelKind::Display)->payload, QByteArray("tail"));
        QCOMPARE(find(artifacts, ChannelKind::Microphone)->byteSize, qint64(0));
    }

    void testFinalChunkIncluded() {
        Harness h;
        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));
        auto* display = h.rec(ChannelKind::Display);
        display->pushChunk("head-");
        display->finalChunk = "trailer";

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        QCOMPARE(future.result().front().payload, QByteArray("head-trailer"));
    }

    void testStopTimeoutForceFinalizes() {
        Harness h(withTimeout(100));
        h.factory.stopMode = FakeRecorder::StopMode::Hang;
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));
        h.rec(ChannelKind::Display)->pushChunk(QByteArray(10, 'x'));

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);

        auto artifacts = future.result();
        QCOMPARE(artifacts.size(), size_t(2));
        QCOMPARE(find(artifacts, ChannelKind::Display)->byteSize, qint64(10));
        QCOMPARE(h.orchestrator.state(), SessionState::Idle);
    }

    void testTimedOutRecorderOutlivesSession() {
        Harness h(withTimeout(100));
        h.factory.stopMode = FakeRecorder::StopMode::Hang;
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));
        QPointer<FakeRecorder> display = h.rec(ChannelKind::Display);

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        QCOMPARE(h.orchestrator.state(), SessionState::Idle);

        // Not destroyed on the event loop while it may still be encoding
        QVERIFY(!display.isNull());
        QCOMPARE(h.orchestrator.laggingChannelCount(), size_t(2));

        // Late output is not attributed to any session
        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));
        display->pushChunk("late");
        QVERIFY(h.orchestrator.session()->channel(ChannelKind::Display)
                        ->chunks()
                        .empty());

        display->completeStop();
        QTRY_VERIFY_WITH_TIMEOUT(display.isNull(), 2000);
        QCOMPARE(h.orchestrator.laggingChannelCount(), size_t(1));
    }

    void testFaultedChannelDoesNotAbortSession() {
        Harness h;
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));
        auto* mic = h.rec(ChannelKind::Microphone);
        auto* display = h.rec(ChannelKind::Display);

        mic->pushChunk("ok");
        mic->fail("device unplugged");
        mic->pushChunk("late");
        display->pushChunk("frames");

        QCOMPARE(h.orchestrator.state(), SessionState::Recording);
        QCOMPARE(h.orchestrator.activeChannels().size(), size_t(2));

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        auto artifacts = future.result();
        QCOMPARE(find(artifacts, ChannelKind::Microphone)->payload, QByteArray("ok"));
        QCOMPARE(find(artifacts, ChannelKind::Display)->payload, QByteArray("frames"));
    }

    void testRecorderCreationFailureYieldsEmptyArtifact() {
        Harness h;
        h.factory.failCreate = {ChannelKind::Camera};
        QVERIFY(h.orchestrator.start({false, true, DisplayIntent::Monitor}));
        QCOMPARE(h.orchestrator.activeChannels().size(), size_t(2));

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        auto artifacts = future.result();
        auto* camera = find(artifacts, ChannelKind::Camera);
        QVERIFY(camera != nullptr);
        QCOMPARE(camera->byteSize, qint64(0));
    }

    void testNoRecordersStopsImmediately() {
        Harness h;
        h.factory.failCreate = {ChannelKind::Display, ChannelKind::Microphone};
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        QCOMPARE(future.result().size(), size_t(2));
    }

    void testUnsupportedEncodingFallsBackToDefault() {
        Harness h;
        h.factory.supported.clear();
        QVERIFY(h.orchestrator.start({true, false, DisplayIntent::Monitor}));

        QCOMPARE(h.rec(ChannelKind::Display)->mimeType(), QString("video/webm"));
        QCOMPARE(h.rec(ChannelKind::Microphone)->mimeType(), QString("audio/webm"));

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        auto artifacts = future.result();
        QCOMPARE(find(artifacts, ChannelKind::Display)->mimeType,
                 QString("video/webm"));
    }

    void testByteSizeIsSumOfChunks() {
        Harness h;
        QVERIFY(h.orchestrator.start({false, true, DisplayIntent::Monitor}));
        qint64 expected = 0;
        for (int i = 1; i <= 20; ++i) {
            h.rec(ChannelKind::Camera)->pushChunk(QByteArray(i * 7, 'c'));
            expected += i * 7;
        }

        auto future = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);
        auto artifacts = future.result();
        QCOMPARE(find(artifacts, ChannelKind::Camera)->byteSize, expected);
    }

    void testStreamsReleasedExactlyOnce() {
        auto releases = std::make_shared<smu::test::ReleaseCounter>();
        {
            Harness h;
            h.backend.releases = releases;
            QVERIFY(h.orchestrator.start({true, true, DisplayIntent::Monitor}));
            QCOMPARE(releases->video, 0);

            auto future = h.orchestrator.stop();
            QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 2000);

            // display + camera video, display audio + microphone
            QCOMPARE(releases->video, 2);
            QCOMPARE(releases->audio, 2);
        }
        QCOMPARE(releases->video, 2);
        QCOMPARE(releases->audio, 2);
    }

    void testCanRecordAgainAfterStop() {
        Harness h;
        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Monitor}));
        auto first = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(first.isFinished(), 2000);

        QVERIFY(h.orchestrator.start({false, false, DisplayIntent::Window}));
        QCOMPARE(h.orchestrator.state(), SessionState::Recording);
        auto second = h.orchestrator.stop();
        QTRY_VERIFY_WITH_TIMEOUT(second.isFinished(), 2000);
        QCOMPARE(h.backend.displayOpens, 2);
    }
};

int runTestRecorderOrchestrator(int argc, char** argv) {
    TestRecorderOrchestrator tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_RecorderOrchestrator.moc"
