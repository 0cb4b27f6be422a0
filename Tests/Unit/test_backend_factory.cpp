#include <QtTest/QtTest>
#include "core/extraction/backend_factory.h"

using ild::BackendFactory;
using ild::BackendKind;
using ild::ExtractionSettings;

class TestBackendFactory : public QObject {
    Q_OBJECT

private slots:
    // ── Order resolution ─────────────────────────────────────────
    void testDefaultOrder();
    void testPresetOverridesOrder();
    void testPresetNamesCaseInsensitive();
    void testUnknownPresetFallsBackToOrder();
    void testAliasesCanonicalizedAndDeduplicated();
    void testUnknownBackendDropped();
    void testOcrFallbackAppended();
    void testOcrFallbackDisabled();

    // ── Construction ─────────────────────────────────────────────
    void testCreateBuildsBackendsInOrder();
    void testVisionBackendsUnreadyWithoutRegistry();
};

void TestBackendFactory::testDefaultOrder()
{
    ExtractionSettings settings;
    QCOMPARE(BackendFactory::resolveOrder(settings),
             (QStringList{QStringLiteral("donut"), QStringLiteral("pix2struct"),
                          QStringLiteral("openai"), QStringLiteral("tesseract")}));
}

void TestBackendFactory::testPresetOverridesOrder()
{
    ExtractionSettings settings;
    settings.preset = QStringLiteral("fast");
    QCOMPARE(BackendFactory::resolveOrder(settings),
             (QStringList{QStringLiteral("tesseract"), QStringLiteral("openai")}));

    settings.preset = QStringLiteral("offline");
    QCOMPARE(BackendFactory::resolveOrder(settings),
             (QStringList{QStringLiteral("donut"), QStringLiteral("pix2struct"),
                          QStringLiteral("tesseract")}));
}

void TestBackendFactory::testPresetNamesCaseInsensitive()
{
    QCOMPARE(BackendFactory::presetOrder(QStringLiteral(" Premium ")),
             (QStringList{QStringLiteral("openai"), QStringLiteral("tesseract")}));
    QVERIFY(BackendFactory::presetOrder(QStringLiteral("turbo")).isEmpty());
}

void TestBackendFactory::testUnknownPresetFallsBackToOrder()
{
    ExtractionSettings settings;
    settings.preset = QStringLiteral("turbo");
    settings.backendOrder = {QStringLiteral("openai")};
    QCOMPARE(BackendFactory::resolveOrder(settings),
             (QStringList{QStringLiteral("openai"), QStringLiteral("tesseract")}));
}

void TestBackendFactory::testAliasesCanonicalizedAndDeduplicated()
{
    ExtractionSettings settings;
    settings.backendOrder = {QStringLiteral("openai_vision"), QStringLiteral("OCR"),
                             QStringLiteral("openai"), QStringLiteral("tesseract_fallback")};
    QCOMPARE(BackendFactory::resolveOrder(settings),
             (QStringList{QStringLiteral("openai"), QStringLiteral("tesseract")}));
}

void TestBackendFactory::testUnknownBackendDropped()
{
    ExtractionSettings settings;
    settings.backendOrder = {QStringLiteral("easyocr"), QStringLiteral("donut")};
    settings.ocrFallbackEnabled = false;
    QCOMPARE(BackendFactory::resolveOrder(settings), QStringList{QStringLiteral("donut")});
    QVERIFY(BackendFactory::canonicalName(QStringLiteral("easyocr")).isEmpty());
}

void TestBackendFactory::testOcrFallbackAppended()
{
    ExtractionSettings settings;
    settings.backendOrder = {QStringLiteral("donut")};
    QCOMPARE(BackendFactory::resolveOrder(settings),
             (QStringList{QStringLiteral("donut"), QStringLiteral("tesseract")}));
}

void TestBackendFactory::testOcrFallbackDisabled()
{
    ExtractionSettings settings;
    settings.preset = QStringLiteral("high");
    settings.ocrFallbackEnabled = false;
    // A preset that lists tesseract keeps it.
    QVERIFY(BackendFactory::resolveOrder(settings).contains(QStringLiteral("tesseract")));

    settings.preset.clear();
    settings.backendOrder = {QStringLiteral("openai")};
    QCOMPARE(BackendFactory::resolveOrder(settings), QStringList{QStringLiteral("openai")});
}

void TestBackendFactory::testCreateBuildsBackendsInOrder()
{
    ExtractionSettings settings;
    settings.preset = QStringLiteral("balanced");
    const auto backends = BackendFactory::create(settings, nullptr);

    QCOMPARE(static_cast<int>(backends.size()), 4);
    QCOMPARE(backends[0]->name(), QStringLiteral("donut"));
    QCOMPARE(backends[1]->name(), QStringLiteral("openai"));
    QCOMPARE(backends[1]->kind(), BackendKind::RemoteVision);
    QCOMPARE(backends[2]->name(), QStringLiteral("pix2struct"));
    QCOMPARE(backends[3]->name(), QStringLiteral("tesseract"));
    QCOMPARE(backends[3]->kind(), BackendKind::Ocr);
    for (const auto& backend : backends) {
        QVERIFY(!backend->isReady());
    }
}

void TestBackendFactory::testVisionBackendsUnreadyWithoutRegistry()
{
    ExtractionSettings settings;
    settings.backendOrder = {QStringLiteral("donut")};
    settings.ocrFallbackEnabled = false;
    const auto backends = BackendFactory::create(settings, nullptr);

    QCOMPARE(static_cast<int>(backends.size()), 1);
    QCOMPARE(backends[0]->kind(), BackendKind::DocumentTransformer);
    QVERIFY(!backends[0]->ensureReady());
    // The failed attempt is cached.
    QVERIFY(!backends[0]->ensureReady());
}

QTEST_MAIN(TestBackendFactory)
#include "test_backend_factory.moc"
