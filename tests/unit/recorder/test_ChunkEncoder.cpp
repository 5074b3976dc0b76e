#include <QtTest>
#include "recorder/ChunkEncoder.hpp"
#include "recorder/FFmpegChannelRecorder.hpp"

using namespace smu;
using namespace std::chrono_literals;

namespace {

const QByteArray kEbmlMagic("\x1A\x45\xDF\xA3", 4);

class SyntheticVideoTrack : public VideoTrack {
public:
    SyntheticVideoTrack() : VideoTrack("synthetic", 64, 48, 10) {
    }
    ~SyntheticVideoTrack() override {
        stop();
    }

    void push(u8 shade, TimePoint captured) {
        VideoFrame frame;
        frame.width = width_;
        frame.height = height_;
        frame.data.assign(static_cast<usize>(width_) * height_ * 4, shade);
        frame.captured = captured;
        frameCaptured.emitSignal(frame);
    }

protected:
    void onStop() override {
    }
};

// First WebM encoding this FFmpeg build can produce, empty if none
std::string webmMime() {
    for (const char* mime : {"video/webm;codecs=vp9", "video/webm;codecs=vp8"}) {
        if (EncodingProfile::isSupportedByFFmpeg(mime))
            return mime;
    }
    return {};
}

VideoFrame grey(u32 width, u32 height) {
    VideoFrame frame;
    frame.width = width;
    frame.height = height;
    frame.data.assign(static_cast<usize>(width) * height * 4, 128);
    return frame;
}

// Collects a recorder's output on the test thread in arrival order
struct Capture {
    QObject context;
    QByteArray bytes;
    std::vector<std::string> sequence;
    QString fault;

    explicit Capture(RecorderPrimitive& recorder) {
        QObject::connect(&recorder,
                         &RecorderPrimitive::dataAvailable,
                         &context,
                         [this](const QByteArray& chunk) {
                             bytes.append(chunk);
                             sequence.push_back("chunk");
                         });
        QObject::connect(&recorder,
                         &RecorderPrimitive::faulted,
                         &context,
                         [this](const QString& message) {
                             fault = message;
                             sequence.push_back("faulted");
                         });
        QObject::connect(&recorder,
                         &RecorderPrimitive::stopped,
                         &context,
                         [this] { sequence.push_back("stopped"); });
    }

    bool isStopped() const {
        return !sequence.empty() && sequence.back() == "stopped";
    }
};

} // namespace

class TestChunkEncoder : public QObject {
    Q_OBJECT

private slots:
    void testFinishBeforeInit() {
        ChunkEncoder encoder;
        auto res = encoder.finish();
        QVERIFY(res.isErr());
        QCOMPARE(res.error().code, ErrorCode::InvalidState);
        QVERIFY(encoder.takeOutput().isEmpty());
    }

    void testUnknownEncoderRejected() {
        ChunkEncoderSettings s;
        s.profile = {"video/webm", "webm", "no-such-encoder", ""};
        s.video = true;
        s.width = 64;
        s.height = 48;

        ChunkEncoder encoder;
        auto res = encoder.init(s);
        QVERIFY(res.isErr());
        QCOMPARE(res.error().code, ErrorCode::EncodingUnsupported);
    }

    void testEncodesWebmVideo() {
        const auto mime = webmMime();
        if (mime.empty())
            QSKIP("No WebM video encoder in this FFmpeg build");

        ChunkEncoderSettings s;
        s.profile = *EncodingProfile::fromMimeType(mime);
        s.video = true;
        s.width = 64;
        s.height = 48;
        s.fps = 10;
        s.videoBitrate = 200000;

        ChunkEncoder encoder;
        QVERIFY(encoder.init(s).isOk());
        QVERIFY(encoder.takeOutput().startsWith(kEbmlMagic));

        const auto frame = grey(64, 48);
        for (i64 i = 0; i < 10; ++i)
            QVERIFY(encoder.encodeVideo(frame, i * 100000).isOk());
        // Same timestamp again is skipped, not an error
        QVERIFY(encoder.encodeVideo(frame, 900000).isOk());

        QVERIFY(encoder.finish().isOk());
        QVERIFY(!encoder.takeOutput().isEmpty());
        QVERIFY(encoder.takeOutput().isEmpty());
    }

    void testEncodesOggAudio() {
        if (!EncodingProfile::isSupportedByFFmpeg("audio/ogg;codecs=opus"))
            QSKIP("No Opus encoder in this FFmpeg build");

        ChunkEncoderSettings s;
        s.profile = *EncodingProfile::fromMimeType("audio/ogg;codecs=opus");
        s.audio = true;
        s.sampleRate = 48000;
        s.channels = 2;

        ChunkEncoder encoder;
        QVERIFY(encoder.init(s).isOk());

        // Half a second of a quiet stereo ramp
        std::vector<f32> samples(48000);
        for (usize i = 0; i < samples.size(); ++i)
            samples[i] = static_cast<f32>(i % 200) / 2000.0f;
        QVERIFY(encoder.encodeAudio(samples.data(), samples.size() / 2).isOk());
        QVERIFY(encoder.finish().isOk());

        const auto out = encoder.takeOutput();
        QVERIFY(out.startsWith("OggS"));
    }

    void testRecorderProducesPlayableStream() {
        const auto mime = webmMime();
        if (mime.empty())
            QSKIP("No WebM video encoder in this FFmpeg build");

        MediaStream stream;
        auto track = std::make_unique<SyntheticVideoTrack>();
        auto* video = track.get();
        stream.addTrack(std::move(track));

        FFmpegRecorderFactory factory;
        QVERIFY(factory.isEncodingSupported(mime));
        auto created = factory.create(ChannelKind::Display,
                                      stream,
                                      *EncodingProfile::fromMimeType(mime),
                                      {200000, 64000});
        QVERIFY(created.isOk());
        auto recorder = std::move(*created);
        Capture capture(*recorder);

        recorder->start(50ms);
        QCOMPARE(recorder->state(), RecorderState::Recording);
        QCOMPARE(recorder->mimeType(), QString::fromStdString(mime));

        const auto base = Clock::now();
        for (int i = 0; i < 10; ++i)
            video->push(static_cast<u8>(i * 20), base + i * 100ms);

        recorder->stop();
        QCOMPARE(recorder->state(), RecorderState::Inactive);
        QTRY_VERIFY_WITH_TIMEOUT(capture.isStopped(), 10000);

        QVERIFY(capture.fault.isEmpty());
        QVERIFY(capture.bytes.startsWith(kEbmlMagic));
        QVERIFY(capture.sequence.size() >= 2);
        QCOMPARE(capture.sequence[capture.sequence.size() - 2],
                 std::string("chunk"));
    }

    void testPausedFramesNotEncoded() {
        const auto mime = webmMime();
        if (mime.empty())
            QSKIP("No WebM video encoder in this FFmpeg build");

        auto record = [&](bool paused) {
            MediaStream stream;
            auto track = std::make_unique<SyntheticVideoTrack>();
            auto* video = track.get();
            stream.addTrack(std::move(track));

            FFmpegRecorderFactory factory;
            auto created = factory.create(ChannelKind::Display,
                                          stream,
                                          *EncodingProfile::fromMimeType(mime),
                                          {200000, 64000});
            if (!created)
                return QByteArray();
            auto recorder = std::move(*created);
            Capture capture(*recorder);

            recorder->start(50ms);
            if (paused)
                recorder->pause();
            const auto base = Clock::now();
            for (int i = 0; i < 10; ++i)
                video->push(static_cast<u8>(i * 20), base + i * 100ms);
            recorder->stop();

            if (!QTest::qWaitFor([&] { return capture.isStopped(); }, 10000))
                return QByteArray();
            return capture.bytes;
        };

        const auto active = record(false);
        const auto paused = record(true);
        QVERIFY(active.startsWith(kEbmlMagic));
        QVERIFY(paused.startsWith(kEbmlMagic));
        QVERIFY(paused.size() < active.size());
    }

    void testNoChunksAfterFault() {
        MediaStream stream;
        auto track = std::make_unique<SyntheticVideoTrack>();
        auto* video = track.get();
        stream.addTrack(std::move(track));

        FFmpegRecorderFactory factory;
        auto created = factory.create(ChannelKind::Display,
                                      stream,
                                      {"video/webm", "webm", "no-such-encoder", ""},
                                      {});
        QVERIFY(created.isOk());
        auto recorder = std::move(*created);
        Capture capture(*recorder);

        recorder->start(20ms);
        QTRY_VERIFY_WITH_TIMEOUT(!capture.fault.isEmpty(), 5000);

        video->push(10, Clock::now());
        QTest::qWait(60);
        recorder->stop();
        QTRY_VERIFY_WITH_TIMEOUT(capture.isStopped(), 5000);

        QVERIFY(capture.bytes.isEmpty());
        QVERIFY(capture.sequence ==
                (std::vector<std::string>{"faulted", "stopped"}));
    }
};

int runTestChunkEncoder(int argc, char** argv) {
    TestChunkEncoder tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ChunkEncoder.moc"
