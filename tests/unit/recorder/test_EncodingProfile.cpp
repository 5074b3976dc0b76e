#include <QtTest>
#include "recorder/EncodingProfile.hpp"

using namespace smu;

class TestEncodingProfile : public QObject {
    Q_OBJECT

private slots:
    void testVideoWithCodec() {
        auto p = EncodingProfile::fromMimeType("video/webm;codecs=vp9");
        QVERIFY(p.isOk());
        QCOMPARE(p->container, std::string("webm"));
        QCOMPARE(p->videoEncoder, std::string("libvpx-vp9"));
        QCOMPARE(p->audioEncoder, std::string("libopus"));
        QCOMPARE(p->mimeType, std::string("video/webm;codecs=vp9"));
        QVERIFY(p->hasVideo());
    }

    void testCodecListWithQuotesAndSpaces() {
        auto p = EncodingProfile::fromMimeType(
                "video/webm; codecs=\"vp8, opus\"");
        QVERIFY(p.isOk());
        QCOMPARE(p->videoEncoder, std::string("libvpx"));
        QCOMPARE(p->audioEncoder, std::string("libopus"));
    }

    void testContainerDefaults() {
        auto mp4 = EncodingProfile::fromMimeType("video/mp4");
        QVERIFY(mp4.isOk());
        QCOMPARE(mp4->videoEncoder, std::string("libx264"));
        QCOMPARE(mp4->audioEncoder, std::string("aac"));

        auto ogg = EncodingProfile::fromMimeType("audio/ogg;codecs=opus");
        QVERIFY(ogg.isOk());
        QCOMPARE(ogg->container, std::string("ogg"));
        QVERIFY(!ogg->hasVideo());

        auto mkv = EncodingProfile::fromMimeType("video/x-matroska");
        QVERIFY(mkv.isOk());
        QCOMPARE(mkv->container, std::string("matroska"));
    }

    void testRejectsUnknownAndMismatched() {
        QVERIFY(EncodingProfile::fromMimeType("").isErr());
        QVERIFY(EncodingProfile::fromMimeType("webm").isErr());
        QVERIFY(EncodingProfile::fromMimeType("image/png").isErr());
        QVERIFY(EncodingProfile::fromMimeType("video/avi").isErr());
        QVERIFY(EncodingProfile::fromMimeType("video/webm;codecs=av2").isErr());

        auto mismatched = EncodingProfile::fromMimeType("audio/webm;codecs=vp9");
        QVERIFY(mismatched.isErr());
        QCOMPARE(mismatched.error().code, ErrorCode::EncodingUnsupported);
    }

    void testPlatformDefault() {
        auto video = EncodingProfile::resolve("", ChannelKind::Camera);
        QVERIFY(video.isOk());
        QCOMPARE(video->mimeType, std::string("video/webm"));
        QVERIFY(video->hasVideo());

        auto audio = EncodingProfile::resolve("", ChannelKind::Microphone);
        QVERIFY(audio.isOk());
        QCOMPARE(audio->mimeType, std::string("audio/webm"));
        QVERIFY(!audio->hasVideo());
    }

    void testFileExtension() {
        QCOMPARE(fileExtensionFor("video/webm;codecs=vp9"), std::string("webm"));
        QCOMPARE(fileExtensionFor("audio/mp4"), std::string("mp4"));
        QCOMPARE(fileExtensionFor("audio/ogg;codecs=opus"), std::string("ogg"));
        QCOMPARE(fileExtensionFor("video/x-matroska"), std::string("mkv"));
        QCOMPARE(fileExtensionFor("application/octet-stream"), std::string("bin"));
    }
};

int runTestEncodingProfile(int argc, char** argv) {
    TestEncodingProfile tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_EncodingProfile.moc"
