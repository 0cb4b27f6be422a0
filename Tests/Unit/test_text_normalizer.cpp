#include <QtTest/QtTest>
#include "core/text/text_normalizer.h"

using ild::TextNormalizer;

class TestTextNormalizer : public QObject {
    Q_OBJECT

private slots:
    // ── normalize ────────────────────────────────────────────────
    void testEmptyStaysEmpty();
    void testCollapsesWhitespaceRuns();
    void testUnicodeSpacesCollapse();
    void testStripsZeroWidthCharacters();
    void testStripsControlCharacters();
    void testComposesToNfc();
    void testDevanagariPreserved();
    void testIdempotent();
    void testIdempotent_data();

    // ── Script helpers ───────────────────────────────────────────
    void testContainsDevanagari();
    void testSplitMixedScript();
    void testSplitPureEnglish();
};

void TestTextNormalizer::testEmptyStaysEmpty()
{
    QVERIFY(TextNormalizer::normalize(QString()).isEmpty());
    QVERIFY(TextNormalizer::normalize(QStringLiteral(" \t\n ")).isEmpty());
}

void TestTextNormalizer::testCollapsesWhitespaceRuns()
{
    QCOMPARE(TextNormalizer::normalize(QStringLiteral("  Section\t\t302 \n\n IPC  ")),
             QStringLiteral("Section 302 IPC"));
}

void TestTextNormalizer::testUnicodeSpacesCollapse()
{
    const QString input = QStringLiteral("Indian") + QChar(0x00A0) + QChar(0x2003)
                          + QStringLiteral("Penal") + QChar(0x3000) + QStringLiteral("Code")
                          + QChar(0x2029);
    QCOMPARE(TextNormalizer::normalize(input), QStringLiteral("Indian Penal Code"));
}

void TestTextNormalizer::testStripsZeroWidthCharacters()
{
    const QString input = QStringLiteral("mur") + QChar(0x200B) + QStringLiteral("der")
                          + QChar(0xFEFF) + QChar(0x00AD);
    QCOMPARE(TextNormalizer::normalize(input), QStringLiteral("murder"));
}

void TestTextNormalizer::testStripsControlCharacters()
{
    const QString input = QStringLiteral("Bail") + QChar(0x0007) + QStringLiteral(" granted")
                          + QChar(0x000C) + QStringLiteral("today");
    QCOMPARE(TextNormalizer::normalize(input), QStringLiteral("Bail granted today"));
}

void TestTextNormalizer::testComposesToNfc()
{
    const QString decomposed = QStringLiteral("e") + QChar(0x0301);
    QCOMPARE(TextNormalizer::normalize(decomposed), QString(QChar(0x00E9)));

    // U+0958 is a composition exclusion: NFC keeps क + nukta decomposed.
    const QString nukta = QString(QChar(0x0915)) + QChar(0x093C);
    QCOMPARE(TextNormalizer::normalize(nukta), nukta);
}

void TestTextNormalizer::testDevanagariPreserved()
{
    const QString input = QStringLiteral("धारा 302 के अंतर्गत हत्या");
    QCOMPARE(TextNormalizer::normalize(input), input);
}

void TestTextNormalizer::testIdempotent_data()
{
    QTest::addColumn<QString>("input");
    QTest::newRow("english") << QStringLiteral("  The   appellant\twas\nconvicted. ");
    QTest::newRow("hindi") << QStringLiteral("अभियुक्त ‍को  जमानत दी गई");
    QTest::newRow("mixed") << QStringLiteral("Section 498A  भारतीय दंड संहिता IPC");
    QTest::newRow("decomposed") << (QStringLiteral("cafe") + QChar(0x0301));
}

void TestTextNormalizer::testIdempotent()
{
    QFETCH(QString, input);
    const QString once = TextNormalizer::normalize(input);
    QCOMPARE(TextNormalizer::normalize(once), once);
}

void TestTextNormalizer::testContainsDevanagari()
{
    QVERIFY(TextNormalizer::containsDevanagari(QStringLiteral("IPC धारा")));
    QVERIFY(!TextNormalizer::containsDevanagari(QStringLiteral("IPC section 302")));
    QVERIFY(TextNormalizer::isDevanagari(QChar(0x0966)));
    QVERIFY(!TextNormalizer::isDevanagari(QLatin1Char('3')));
}

void TestTextNormalizer::testSplitMixedScript()
{
    const auto split = TextNormalizer::splitMixedScript(
        QStringLiteral("धारा 302 भारतीय दंड संहिता IPC"));
    QCOMPARE(split.devanagari, QStringLiteral("धारा भारतीय दंड संहिता"));
    QCOMPARE(split.other, QStringLiteral("302 IPC"));
}

void TestTextNormalizer::testSplitPureEnglish()
{
    const auto split = TextNormalizer::splitMixedScript(QStringLiteral("anticipatory bail"));
    QVERIFY(split.devanagari.isEmpty());
    QCOMPARE(split.other, QStringLiteral("anticipatory bail"));
}

QTEST_MAIN(TestTextNormalizer)
#include "test_text_normalizer.moc"
