#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "errors.h"
#include "mocks.h"
#include "modelrunner.h"
#include "wavreader.h"

#include <QDir>
#include <QFile>
#include <QImage>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <stdexcept>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

static QJsonValue json(const char *text)
{
    const QJsonDocument document = QJsonDocument::fromJson(text);
    if (document.isArray()) {
        return document.array();
    }
    return document.object();
}

class ModelRunnerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        ON_CALL(m_captioner, model()).WillByDefault(Return(QStringLiteral("Salesforce/blip-image-captioning-base")));
        ON_CALL(m_speaker, model()).WillByDefault(Return(QStringLiteral("suno/bark")));

        m_imagePath = m_dir.filePath(QStringLiteral("cat.png"));
        QImage image(8, 8, QImage::Format_RGB32);
        image.fill(Qt::darkGray);
        ASSERT_TRUE(image.save(m_imagePath, "PNG"));

        m_audioDir = m_dir.filePath(QStringLiteral("audio"));
        ASSERT_TRUE(QDir().mkpath(m_audioDir));
        m_runner.setAudioDirectory(m_audioDir);
    }

    QStringList audioFiles() const
    {
        return QDir(m_audioDir).entryList(QDir::Files);
    }

    QTemporaryDir m_dir;
    QString m_imagePath;
    QString m_audioDir;
    NiceMock<MockImageToText> m_captioner;
    NiceMock<MockTextToAudio> m_speaker;
    MockFileLauncher m_launcher;
    ModelRunner m_runner{m_captioner, m_speaker, m_launcher};
};

TEST_F(ModelRunnerTest, CaptionIsFirstRecordVerbatim)
{
    EXPECT_CALL(m_captioner, run(_))
        .WillOnce(Return(json(R"([{"generated_text": "a grey square"}, {"generated_text": "a wall"}])")));

    EXPECT_EQ(m_runner.generateCaption(m_imagePath), QStringLiteral("a grey square"));
}

TEST_F(ModelRunnerTest, CaptionIsStableAcrossCalls)
{
    EXPECT_CALL(m_captioner, run(_))
        .Times(2)
        .WillRepeatedly(Return(json(R"([{"generated_text": "a grey square"}])")));

    const QString first = m_runner.generateCaption(m_imagePath);
    EXPECT_EQ(m_runner.generateCaption(m_imagePath), first);
}

TEST_F(ModelRunnerTest, MissingImageIsResourceError)
{
    EXPECT_CALL(m_captioner, run(_)).Times(0);

    EXPECT_THROW(m_runner.generateCaption(m_dir.filePath(QStringLiteral("missing.png"))), ResourceError);
}

TEST_F(ModelRunnerTest, UnreadableImageIsResourceError)
{
    const QString path = m_dir.filePath(QStringLiteral("notes.png"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("this is not an image");
    file.close();

    EXPECT_CALL(m_captioner, run(_)).Times(0);
    EXPECT_THROW(m_runner.generateCaption(path), ResourceError);
}

TEST_F(ModelRunnerTest, CaptionBackendFailureIsInferenceError)
{
    EXPECT_CALL(m_captioner, run(_)).WillOnce(Throw(std::runtime_error("out of memory")));

    try {
        m_runner.generateCaption(m_imagePath);
        FAIL() << "expected InferenceError";
    } catch (const InferenceError &e) {
        EXPECT_TRUE(e.message().contains(QStringLiteral("out of memory")));
    }
}

TEST_F(ModelRunnerTest, CaptionBackendErrorsPassThrough)
{
    EXPECT_CALL(m_captioner, run(_)).WillOnce(Throw(InferenceError(QStringLiteral("HTTP 500"))));

    EXPECT_THROW(m_runner.generateCaption(m_imagePath), InferenceError);
}

TEST_F(ModelRunnerTest, EmptyCaptionListIsFormatError)
{
    EXPECT_CALL(m_captioner, run(_)).WillOnce(Return(json("[]")));

    EXPECT_THROW(m_runner.generateCaption(m_imagePath), FormatError);
}

TEST_F(ModelRunnerTest, EmptyGeneratedTextIsFormatError)
{
    EXPECT_CALL(m_captioner, run(_))
        .WillOnce(Return(json(R"([{"generated_text": ""}])")))
        .WillOnce(Return(json(R"([{"generated_text": "  "}])")));

    EXPECT_THROW(m_runner.generateCaption(m_imagePath), FormatError);
    EXPECT_THROW(m_runner.generateCaption(m_imagePath), FormatError);
}

TEST_F(ModelRunnerTest, SpeechWithoutSamplingRateIsNeverPlayed)
{
    EXPECT_CALL(m_speaker, run(QStringLiteral("hello world"))).WillOnce(Return(json(R"({"audio": [[0.1, 0.2]]})")));
    EXPECT_CALL(m_launcher, open(_)).Times(0);

    EXPECT_THROW(m_runner.speak(QStringLiteral("hello world")), FormatError);
    EXPECT_TRUE(audioFiles().isEmpty());
}

TEST_F(ModelRunnerTest, SpeechWithoutAudioIsFormatError)
{
    EXPECT_CALL(m_speaker, run(_)).WillOnce(Return(json(R"({"sampling_rate": 24000})")));

    EXPECT_THROW(m_runner.synthesizeSpeech(QStringLiteral("hello")), FormatError);
}

TEST_F(ModelRunnerTest, SpeechThatIsNotARecordIsFormatError)
{
    EXPECT_CALL(m_speaker, run(_)).WillOnce(Return(json(R"([0.1, 0.2])")));

    EXPECT_THROW(m_runner.synthesizeSpeech(QStringLiteral("hello")), FormatError);
}

TEST_F(ModelRunnerTest, InvalidSamplingRateIsFormatError)
{
    EXPECT_CALL(m_speaker, run(_))
        .WillOnce(Return(json(R"({"audio": [0.1], "sampling_rate": -5})")))
        .WillOnce(Return(json(R"({"audio": [0.1], "sampling_rate": 1e10})")))
        .WillOnce(Return(json(R"({"audio": [0.1], "sampling_rate": 22050.5})")));

    EXPECT_THROW(m_runner.synthesizeSpeech(QStringLiteral("hello")), FormatError);
    EXPECT_THROW(m_runner.synthesizeSpeech(QStringLiteral("hello")), FormatError);
    EXPECT_THROW(m_runner.synthesizeSpeech(QStringLiteral("hello")), FormatError);
}

TEST_F(ModelRunnerTest, EmptyTextIsRejectedBeforeInference)
{
    EXPECT_CALL(m_speaker, run(_)).Times(0);

    EXPECT_THROW(m_runner.synthesizeSpeech(QStringLiteral("   ")), ResourceError);
}

TEST_F(ModelRunnerTest, SpeechBackendFailureIsInferenceError)
{
    EXPECT_CALL(m_speaker, run(_)).WillOnce(Throw(std::runtime_error("model download failed")));
    EXPECT_CALL(m_launcher, open(_)).Times(0);

    EXPECT_THROW(m_runner.speak(QStringLiteral("hello")), InferenceError);
}

TEST_F(ModelRunnerTest, SynthesizedSpeechKeepsShapeAndRate)
{
    EXPECT_CALL(m_speaker, run(_)).WillOnce(Return(json(R"({"audio": [[0.1, -0.1, 0.0]], "sampling_rate": 24000})")));

    const AudioResult audio = m_runner.synthesizeSpeech(QStringLiteral("hello world"));
    EXPECT_EQ(audio.sampleRate, 24000);
    EXPECT_EQ(audio.waveform.shape(), QVector<int>({1, 3}));
}

TEST_F(ModelRunnerTest, SpeakWritesWavAndOpensItOnce)
{
    EXPECT_CALL(m_speaker, run(QStringLiteral("hello world")))
        .WillOnce(Return(json(R"({"audio": [[0.1, -0.1, 0.0]], "sampling_rate": 24000})")));
    QString openedPath;
    EXPECT_CALL(m_launcher, open(_)).WillOnce([&openedPath](const QString &path) {
        openedPath = path;
    });

    const QString path = m_runner.speak(QStringLiteral("hello world"));

    EXPECT_EQ(openedPath, path);
    EXPECT_TRUE(path.endsWith(QStringLiteral(".wav")));
    EXPECT_TRUE(QFile::exists(path));

    const WavData wav = WavReader::readFile(path);
    EXPECT_EQ(wav.sampleRate, 24000);
    EXPECT_EQ(wav.channels, 1);
    ASSERT_EQ(wav.samples.size(), 3);
    EXPECT_NEAR(wav.samples[0], 0.1f, 1e-6);
    EXPECT_NEAR(wav.samples[1], -0.1f, 1e-6);
    EXPECT_NEAR(wav.samples[2], 0.0f, 1e-6);
}

TEST_F(ModelRunnerTest, PlayPassesOneDimensionalAudioThrough)
{
    EXPECT_CALL(m_launcher, open(_)).Times(1);

    AudioResult audio;
    audio.waveform = Waveform(QVector<float>{0.5f, -0.5f});
    audio.sampleRate = 22050;

    const WavData wav = WavReader::readFile(m_runner.play(audio));
    EXPECT_EQ(wav.sampleRate, 22050);
    EXPECT_EQ(wav.samples, QVector<float>({0.5f, -0.5f}));
}

TEST_F(ModelRunnerTest, PlayRejectsStereoWithoutWriting)
{
    EXPECT_CALL(m_launcher, open(_)).Times(0);

    AudioResult audio;
    audio.waveform = Waveform({2, 3}, {0.1f, 0.2f, 0.3f, 0.4f, 0.5f, 0.6f});
    audio.sampleRate = 24000;

    EXPECT_THROW(m_runner.play(audio), FormatError);
    EXPECT_TRUE(audioFiles().isEmpty());
}

TEST_F(ModelRunnerTest, PlayRejectsEmptyAudio)
{
    EXPECT_CALL(m_launcher, open(_)).Times(0);

    AudioResult audio;
    audio.sampleRate = 24000;

    EXPECT_THROW(m_runner.play(audio), FormatError);
    EXPECT_TRUE(audioFiles().isEmpty());
}

TEST_F(ModelRunnerTest, MissingAudioDirectoryIsIOError)
{
    EXPECT_CALL(m_launcher, open(_)).Times(0);
    m_runner.setAudioDirectory(m_dir.filePath(QStringLiteral("does/not/exist")));

    AudioResult audio;
    audio.waveform = Waveform(QVector<float>{0.1f});
    audio.sampleRate = 24000;

    EXPECT_THROW(m_runner.play(audio), IOError);
}

TEST_F(ModelRunnerTest, LauncherFailureIsReportedAndFileKept)
{
    EXPECT_CALL(m_launcher, open(_)).WillOnce(Throw(PlaybackDispatchError(QStringLiteral("no player"))));

    AudioResult audio;
    audio.waveform = Waveform(QVector<float>{0.1f});
    audio.sampleRate = 24000;

    EXPECT_THROW(m_runner.play(audio), PlaybackDispatchError);
    EXPECT_EQ(audioFiles().size(), 1);
}

TEST_F(ModelRunnerTest, FailedRequestDoesNotAffectTheNextOne)
{
    EXPECT_CALL(m_speaker, run(_))
        .WillOnce(Return(json(R"({"audio": [0.1]})")))
        .WillOnce(Return(json(R"({"audio": [0.1], "sampling_rate": 24000})")));
    EXPECT_CALL(m_launcher, open(_)).Times(1);

    EXPECT_THROW(m_runner.speak(QStringLiteral("first")), FormatError);
    EXPECT_NO_THROW(m_runner.speak(QStringLiteral("second")));
}

TEST_F(ModelRunnerTest, ProducedFilesAreRemovedOnRequest)
{
    EXPECT_CALL(m_launcher, open(_)).Times(2);

    AudioResult audio;
    audio.waveform = Waveform(QVector<float>{0.1f});
    audio.sampleRate = 24000;
    const QString first = m_runner.play(audio);
    const QString second = m_runner.play(audio);

    EXPECT_NE(first, second);
    EXPECT_EQ(m_runner.producedFiles(), QStringList({first, second}));

    m_runner.removeProducedFiles();
    EXPECT_FALSE(QFile::exists(first));
    EXPECT_FALSE(QFile::exists(second));
    EXPECT_TRUE(m_runner.producedFiles().isEmpty());
}

TEST(ModelRunnerLifetimeTest, FilesAreRemovedOnDestructionUnlessKept)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    NiceMock<MockImageToText> captioner;
    NiceMock<MockTextToAudio> speaker;
    NiceMock<MockFileLauncher> launcher;

    AudioResult audio;
    audio.waveform = Waveform(QVector<float>{0.1f});
    audio.sampleRate = 24000;

    QString removed;
    {
        ModelRunner runner(captioner, speaker, launcher);
        runner.setAudioDirectory(dir.path());
        removed = runner.play(audio);
    }
    EXPECT_FALSE(QFile::exists(removed));

    QString kept;
    {
        ModelRunner runner(captioner, speaker, launcher);
        runner.setAudioDirectory(dir.path());
        runner.setKeepAudioFiles(true);
        kept = runner.play(audio);
    }
    EXPECT_TRUE(QFile::exists(kept));
}
