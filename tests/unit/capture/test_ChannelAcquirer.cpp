#include <QtTest>
#include "capture/ChannelAcquirer.hpp"
#include "fakes/FakeMediaBackend.hpp"

using namespace smu;
using smu::test::FakeMediaBackend;
using smu::test::OpenBehavior;

class TestChannelAcquirer : public QObject {
    Q_OBJECT

private slots:
    void testAllChannelsAcquired() {
        FakeMediaBackend backend;
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({true, true, DisplayIntent::Monitor});
        QVERIFY(res.isOk());
        QVERIFY(res->display != nullptr);
        QVERIFY(res->microphone != nullptr);
        QVERIFY(res->camera != nullptr);
        QCOMPARE(backend.profileCalls, 1);
    }

    void testDisplayFailureIsFatal() {
        FakeMediaBackend backend;
        backend.display = OpenBehavior::Fail;
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({true, true, DisplayIntent::Monitor});
        QVERIFY(res.isErr());
        QCOMPARE(res.error().code, ErrorCode::MandatoryAcquisitionFailed);
        // Optional channels are never attempted without a display
        QCOMPARE(backend.microphoneOpens, 0);
        QCOMPARE(backend.cameraOpens, 0);
    }

    void testDisplayExceptionIsFatal() {
        FakeMediaBackend backend;
        backend.display = OpenBehavior::Throw;
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({false, false, DisplayIntent::Window});
        QVERIFY(res.isErr());
        QCOMPARE(res.error().code, ErrorCode::MandatoryAcquisitionFailed);
    }

    void testOptionalFailuresAreIndependent() {
        FakeMediaBackend backend;
        backend.microphone = OpenBehavior::Fail;
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({true, true, DisplayIntent::Monitor});
        QVERIFY(res.isOk());
        QVERIFY(res->display != nullptr);
        QVERIFY(res->microphone == nullptr);
        QVERIFY(res->camera != nullptr);
    }

    void testOptionalExceptionLeavesChannelAbsent() {
        FakeMediaBackend backend;
        backend.camera = OpenBehavior::Throw;
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({true, true, DisplayIntent::Monitor});
        QVERIFY(res.isOk());
        QVERIFY(res->microphone != nullptr);
        QVERIFY(res->camera == nullptr);
    }

    void testUnrequestedChannelsAreNotOpened() {
        FakeMediaBackend backend;
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({false, false, DisplayIntent::Monitor});
        QVERIFY(res.isOk());
        QCOMPARE(backend.microphoneOpens, 0);
        QCOMPARE(backend.cameraOpens, 0);
        QVERIFY(res->microphone == nullptr);
        QVERIFY(res->camera == nullptr);
    }

    void testFineGrainedConstraints() {
        FakeMediaBackend backend;
        AcquirerSettings settings;
        settings.display.maxWidth = 1280;
        settings.display.maxHeight = 720;
        ChannelAcquirer acquirer(backend, settings);

        auto res = acquirer.acquire({false, false, DisplayIntent::Window});
        QVERIFY(res.isOk());
        QVERIFY(backend.lastDisplay.has_value());
        QVERIFY(backend.lastDisplay->surface == DisplayIntent::Window);
        QVERIFY(backend.lastDisplay->maxWidth == 1280u);
        QVERIFY(backend.lastDisplay->maxHeight == 720u);
        QVERIFY(backend.lastDisplay->captureAudio);
        QVERIFY(res->display->audioTrack() != nullptr);
    }

    void testCoarseProfileOmitsUnsupportedConstraints() {
        FakeMediaBackend backend;
        backend.profile = {false, false, "wayland"};
        ChannelAcquirer acquirer(backend, {});

        auto res = acquirer.acquire({false, false, DisplayIntent::Window});
        QVERIFY(res.isOk());
        QVERIFY(!backend.lastDisplay->surface.has_value());
        QVERIFY(!backend.lastDisplay->maxWidth.has_value());
        QVERIFY(!backend.lastDisplay->maxHeight.has_value());
        QVERIFY(!backend.lastDisplay->captureAudio);
        QVERIFY(res->display->audioTrack() == nullptr);
    }

    void testDisplayAudioFollowsConfig() {
        CapabilityProfile fine{true, true, "xcb"};
        DisplayConfig cfg;
        cfg.captureAudio = false;
        auto c = ChannelAcquirer::displayConstraintsFor(
                fine, DisplayIntent::Monitor, cfg);
        QVERIFY(!c.captureAudio);
        QCOMPARE(c.fps, cfg.fps);
    }

    void testMicrophoneProcessingDisabled() {
        MicrophoneConfig cfg;
        cfg.channels = 2;
        auto c = ChannelAcquirer::microphoneConstraintsFor(cfg);
        QCOMPARE(c.channels, 2u);
        QVERIFY(!c.echoCancellation);
        QVERIFY(!c.noiseSuppression);
        QVERIFY(!c.autoGainControl);
    }

    void testProbePermissionsReleasesDevices() {
        FakeMediaBackend backend;
        backend.camera = OpenBehavior::Fail;
        ChannelAcquirer acquirer(backend, {});

        auto result = acquirer.probePermissions();
        QVERIFY(result.hasMicrophone);
        QVERIFY(!result.hasCamera);
        QCOMPARE(backend.releases->audio, 1);
        QCOMPARE(backend.displayOpens, 0);
    }
};

int runTestChannelAcquirer(int argc, char** argv) {
    TestChannelAcquirer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ChannelAcquirer.moc"
