#include <toml++/toml.h>
#include <QtTest>
#include "core/ConfigParsers.hpp"

using namespace smu;

class TestConfigParsers : public QObject {
    Q_OBJECT

private slots:
    void testParseRecording() {
        auto tbl = toml::parse(R"(
            [recording]
            chunk_interval_ms = 250
            stop_timeout_ms = 2000
            want_camera = true
            video_mime_types = ["video/mp4", "video/webm"]
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.chunkIntervalMs, 250u);
        QCOMPARE(cfg.stopTimeoutMs, 2000u);
        QCOMPARE(cfg.wantMicrophone, true);
        QCOMPARE(cfg.wantCamera, true);
        QCOMPARE(cfg.videoMimeTypes.size(), size_t(2));
        QCOMPARE(cfg.videoMimeTypes[0], std::string("video/mp4"));
        // Untouched list keeps its defaults
        QCOMPARE(cfg.audioMimeTypes.front(), std::string("audio/webm;codecs=opus"));
    }

    void testRecordingClamps() {
        auto tbl = toml::parse(R"(
            [recording]
            chunk_interval_ms = 1
            stop_timeout_ms = -5
        )");

        RecordingConfig cfg;
        ConfigParsers::parseRecording(tbl, cfg);

        QCOMPARE(cfg.chunkIntervalMs, 10u);
        QCOMPARE(cfg.stopTimeoutMs, 100u);
    }

    void testParseDisplay() {
        auto tbl = toml::parse(R"(
            [display]
            intent = "window"
            max_width = 1281
            max_height = 721
            fps = 500
            capture_audio = false
        )");

        DisplayConfig cfg;
        ConfigParsers::parseDisplay(tbl, cfg);

        QCOMPARE(cfg.intent, std::string("window"));
        QCOMPARE(cfg.maxWidth, 1282u);
        QCOMPARE(cfg.maxHeight, 722u);
        QCOMPARE(cfg.fps, 120u);
        QCOMPARE(cfg.captureAudio, false);
    }

    void testInvalidIntentFallsBackToMonitor() {
        auto tbl = toml::parse(R"(
            [display]
            intent = "tab"
        )");

        DisplayConfig cfg;
        cfg.intent = "window";
        ConfigParsers::parseDisplay(tbl, cfg);
        QCOMPARE(cfg.intent, std::string("monitor"));
    }

    void testParseInteraction() {
        auto tbl = toml::parse(R"(
            [interaction]
            flush_interval_ms = 50
            move_throttle_ms = 16
            velocity_smoothing = 1.5
            reset_velocity_on_resume = true
        )");

        InteractionConfig cfg;
        ConfigParsers::parseInteraction(tbl, cfg);

        QCOMPARE(cfg.flushIntervalMs, 50u);
        QCOMPARE(cfg.moveThrottleMs, 16u);
        QCOMPARE(cfg.velocitySmoothing, 1.0f);
        QCOMPARE(cfg.velocityOutlierMs, 100u);
        QCOMPARE(cfg.resetVelocityOnResume, true);
    }

    void testMissingSectionKeepsDefaults() {
        auto tbl = toml::parse("");

        MicrophoneConfig mic;
        CameraConfig cam;
        ConfigParsers::parseMicrophone(tbl, mic);
        ConfigParsers::parseCamera(tbl, cam);

        QCOMPARE(mic.device, std::string("default"));
        QCOMPARE(mic.sampleRate, 48000u);
        QCOMPARE(cam.width, 1280u);
        QCOMPARE(cam.height, 720u);
    }

    void testSerialize() {
        RecordingConfig recording;
        recording.chunkIntervalMs = 200;
        DisplayConfig display;
        display.intent = "window";
        MicrophoneConfig microphone;
        microphone.device = "test_device";
        CameraConfig camera;
        InteractionConfig interaction;
        OutputConfig output;
        output.directory = "/tmp/screenmu";

        auto tbl = ConfigParsers::serialize(recording,
                                            display,
                                            microphone,
                                            camera,
                                            interaction,
                                            output,
                                            true);

        auto micTbl = tbl["microphone"].as_table();
        QVERIFY(micTbl != nullptr);
        QCOMPARE((*micTbl)["device"].as_string()->get(),
                 std::string("test_device"));
        QCOMPARE(tbl["general"]["debug"].value_or(false), true);

        // Serialized tables parse back into the same values
        RecordingConfig recording2;
        DisplayConfig display2;
        ConfigParsers::parseRecording(tbl, recording2);
        ConfigParsers::parseDisplay(tbl, display2);
        QCOMPARE(recording2.chunkIntervalMs, 200u);
        QCOMPARE(display2.intent, std::string("window"));
    }
};

int runTestConfigParsers(int argc, char** argv) {
    TestConfigParsers tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ConfigParsers.moc"
