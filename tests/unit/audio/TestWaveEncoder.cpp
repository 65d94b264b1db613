#include <QtTest/QtTest>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QtEndian>

#include "../../../src/core/audio/AudioDecoder.hpp"
#include "../../../src/core/audio/WaveEncoder.hpp"
#include "../../utils/TestUtils.hpp"

using namespace Scribe;
using namespace Scribe::Test;

class TestWaveEncoder : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    void testHeaderLayout();
    void testEncodeWritesHeaderAndSamples();
    void testEncodeEmptyRecording();
    void testEncodedFileDecodesBack();
    void testRejectsInvalidSampleRate();
    void testUnwritablePath();

private:
    static quint32 u32(const QByteArray& bytes, int offset) {
        return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(bytes.constData() + offset));
    }
    static quint16 u16(const QByteArray& bytes, int offset) {
        return qFromLittleEndian<quint16>(reinterpret_cast<const uchar*>(bytes.constData() + offset));
    }

    QString tempDir_;
};

void TestWaveEncoder::initTestCase() {
    tempDir_ = TestUtils::createTempDirectory("wave");
    QVERIFY(!tempDir_.isEmpty());
}

void TestWaveEncoder::testHeaderLayout() {
    const QByteArray header = WaveEncoder::header(3200, 16000);

    QCOMPARE(header.size(), qsizetype(WaveEncoder::kHeaderSize));
    QCOMPARE(header.mid(0, 4), QByteArray("RIFF"));
    QCOMPARE(u32(header, 4), quint32(3200 + 36));
    QCOMPARE(header.mid(8, 4), QByteArray("WAVE"));
    QCOMPARE(header.mid(12, 4), QByteArray("fmt "));
    QCOMPARE(u32(header, 16), quint32(16));
    QCOMPARE(u16(header, 20), quint16(1));      // PCM
    QCOMPARE(u16(header, 22), quint16(1));      // mono
    QCOMPARE(u32(header, 24), quint32(16000));
    QCOMPARE(u32(header, 28), quint32(32000));  // byte rate
    QCOMPARE(u16(header, 32), quint16(2));
    QCOMPARE(u16(header, 34), quint16(16));
    QCOMPARE(header.mid(36, 4), QByteArray("data"));
    QCOMPARE(u32(header, 40), quint32(3200));
}

void TestWaveEncoder::testEncodeWritesHeaderAndSamples() {
    const QString path = tempDir_ + "/samples.wav";
    const std::vector<qint16> samples = {0, 1, -1, 32767, -32768};

    auto result = WaveEncoder::encode(path, samples);
    ASSERT_EXPECTED_VALUE(result);

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray bytes = file.readAll();
    QCOMPARE(bytes.size(), qsizetype(WaveEncoder::kHeaderSize + 10));
    QCOMPARE(u32(bytes, 40), quint32(10));
    QCOMPARE(static_cast<qint16>(u16(bytes, 44 + 6)), qint16(32767));
    QCOMPARE(static_cast<qint16>(u16(bytes, 44 + 8)), qint16(-32768));
}

void TestWaveEncoder::testEncodeEmptyRecording() {
    const QString path = tempDir_ + "/empty.wav";
    auto result = WaveEncoder::encode(path, {});
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(QFileInfo(path).size(), qint64(WaveEncoder::kHeaderSize));
}

void TestWaveEncoder::testEncodedFileDecodesBack() {
    const QString path = tempDir_ + "/tone.wav";
    const std::vector<qint16> samples = TestUtils::generateTone(1600);
    ASSERT_EXPECTED_VALUE(WaveEncoder::encode(path, samples));

    DefaultAudioDecoder decoder;
    auto decoded = decoder.decode(path);
    ASSERT_EXPECTED_VALUE(decoded);
    QCOMPARE(decoded.value().size(), samples.size());
    QCOMPARE(decoded.value()[1], samples[1] / 32768.0f);
}

void TestWaveEncoder::testRejectsInvalidSampleRate() {
    const QString path = tempDir_ + "/rate.wav";
    auto result = WaveEncoder::encode(path, {1, 2, 3}, 0);
    ASSERT_EXPECTED_ERROR(result, WaveError::InvalidSampleRate);
    ASSERT_FILE_NOT_EXISTS(path);
}

void TestWaveEncoder::testUnwritablePath() {
    auto result = WaveEncoder::encode(tempDir_ + "/no/such/dir/out.wav", {1, 2, 3});
    ASSERT_EXPECTED_ERROR(result, WaveError::CannotOpenFile);
}

int runTestWaveEncoder(int argc, char** argv) {
    TestWaveEncoder test;
    return QTest::qExec(&test, argc, argv);
}

#include "TestWaveEncoder.moc"
