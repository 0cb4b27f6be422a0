#include <QtTest/QtTest>
#include "core/extraction/onnx_vision_backend.h"
#include "core/models/model_manifest.h"

using ild::OnnxVisionBackend;
using ild::VisionPreprocess;

class TestOnnxVisionPreprocess : public QObject {
    Q_OBJECT

private slots:
    // ── Donut-style resize + normalize ───────────────────────────
    void testPixelValuesShape();
    void testWhitePaddingNormalizesToOne();
    void testBlackPixelsNormalizeToMinusOne();

    // ── Pix2Struct-style flattened patches ───────────────────────
    void testFlattenedPatchesShapeAndMask();
    void testPatchIdsAreOneBased();

    // ── Piece decoding ───────────────────────────────────────────
    void testDecodePiecesJoinsSentencePiece();
    void testDecodePiecesStopsAtEos();
    void testDecodePiecesIgnoresOutOfRange();
};

void TestOnnxVisionPreprocess::testPixelValuesShape()
{
    VisionPreprocess config;
    config.imageWidth = 32;
    config.imageHeight = 48;
    QImage image(100, 50, QImage::Format_RGB32);
    image.fill(Qt::gray);

    const std::vector<float> values = OnnxVisionBackend::pixelValues(image, config);
    QCOMPARE(values.size(), static_cast<size_t>(3 * 32 * 48));
}

void TestOnnxVisionPreprocess::testWhitePaddingNormalizesToOne()
{
    VisionPreprocess config;
    config.imageWidth = 20;
    config.imageHeight = 40;
    QImage image(20, 10, QImage::Format_RGB32);
    image.fill(Qt::black);

    const std::vector<float> values = OnnxVisionBackend::pixelValues(image, config);
    // Bottom-right pixel lies in the white canvas below the scaled image.
    const size_t lastIndex = static_cast<size_t>(20 * 40 - 1);
    QCOMPARE(values[lastIndex], 1.0f);
    QCOMPARE(values[static_cast<size_t>(20 * 40) + lastIndex], 1.0f);
}

void TestOnnxVisionPreprocess::testBlackPixelsNormalizeToMinusOne()
{
    VisionPreprocess config;
    config.imageWidth = 8;
    config.imageHeight = 8;
    QImage image(8, 8, QImage::Format_RGB32);
    image.fill(Qt::black);

    const std::vector<float> values = OnnxVisionBackend::pixelValues(image, config);
    QCOMPARE(values.front(), -1.0f);
}

void TestOnnxVisionPreprocess::testFlattenedPatchesShapeAndMask()
{
    VisionPreprocess config;
    config.mode = QStringLiteral("flattened_patches");
    config.patchSize = 4;
    config.maxPatches = 16;
    QImage image(32, 32, QImage::Format_RGB32);
    image.fill(Qt::white);

    std::vector<float> mask;
    const std::vector<float> patches = OnnxVisionBackend::flattenedPatches(image, config, &mask);

    const int rowWidth = 2 + 3 * 4 * 4;
    QCOMPARE(patches.size(), static_cast<size_t>(16 * rowWidth));
    QCOMPARE(mask.size(), static_cast<size_t>(16));

    int realPatches = 0;
    for (float m : mask) {
        QVERIFY(m == 0.0f || m == 1.0f);
        realPatches += m > 0.0f ? 1 : 0;
    }
    QVERIFY(realPatches > 0);
    QVERIFY(realPatches <= 16);
}

void TestOnnxVisionPreprocess::testPatchIdsAreOneBased()
{
    VisionPreprocess config;
    config.patchSize = 2;
    config.maxPatches = 4;
    QImage image(8, 8, QImage::Format_RGB32);
    image.fill(Qt::white);

    const std::vector<float> patches = OnnxVisionBackend::flattenedPatches(image, config, nullptr);
    const size_t rowWidth = 2 + 3 * 2 * 2;
    // Square image and four patches: a 2x2 grid.
    QCOMPARE(patches[0], 1.0f);
    QCOMPARE(patches[1], 1.0f);
    QCOMPARE(patches[rowWidth], 1.0f);
    QCOMPARE(patches[rowWidth + 1], 2.0f);
    QCOMPARE(patches[3 * rowWidth], 2.0f);
    QCOMPARE(patches[3 * rowWidth + 1], 2.0f);
}

void TestOnnxVisionPreprocess::testDecodePiecesJoinsSentencePiece()
{
    const QStringList vocab = {
        QStringLiteral("<pad>"),
        QStringLiteral("<s_answer>"),
        QStringLiteral("▁Section"),
        QStringLiteral("▁302"),
        QStringLiteral("▁धारा"),
        QStringLiteral("</s>"),
    };
    const QString text = OnnxVisionBackend::decodePieces({1, 2, 3, 4}, vocab);
    QCOMPARE(text, QStringLiteral("Section 302 धारा"));
}

void TestOnnxVisionPreprocess::testDecodePiecesStopsAtEos()
{
    const QStringList vocab = {
        QStringLiteral("▁bail"),
        QStringLiteral("</s>"),
        QStringLiteral("▁junk"),
    };
    QCOMPARE(OnnxVisionBackend::decodePieces({0, 1, 2}, vocab), QStringLiteral("bail"));
}

void TestOnnxVisionPreprocess::testDecodePiecesIgnoresOutOfRange()
{
    const QStringList vocab = {QStringLiteral("▁ok")};
    QCOMPARE(OnnxVisionBackend::decodePieces({-1, 0, 7}, vocab), QStringLiteral("ok"));
}

QTEST_MAIN(TestOnnxVisionPreprocess)
#include "test_onnx_vision_preprocess.moc"
