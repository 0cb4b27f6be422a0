#pragma once

#include <QString>
#include <QStringList>

namespace ild {

struct RemoteVisionSettings {
    QString endpoint = QStringLiteral("https://api.openai.com/v1/chat/completions");
    QString model = QStringLiteral("gpt-4-vision-preview");
    // Name of the environment variable holding the API key. The key itself
    // is never written to the settings file.
    QString apiKeyEnv = QStringLiteral("OPENAI_API_KEY");
    int maxTokens = 4096;
    double temperature = 0.1;
};

struct ExtractionSettings {
    // Backend names in priority order. Ignored when preset is non-empty.
    QStringList backendOrder = {
        QStringLiteral("donut"),
        QStringLiteral("pix2struct"),
        QStringLiteral("openai"),
        QStringLiteral("tesseract"),
    };
    QString preset;
    bool ocrFallbackEnabled = true;
    double acceptanceThreshold = 0.0;
    int concurrency = 0;              // 0 = QThread::idealThreadCount()
    int backendTimeoutMs = 120000;
    int renderDpi = 300;
    QString tesseractLanguages = QStringLiteral("hin+eng");
    RemoteVisionSettings remote;
};

struct ChunkingSettings {
    int windowTokens = 200;
    int overlapTokens = 40;
};

struct RetrievalSettings {
    double denseWeight = 0.5;
    double sparseWeight = 0.5;
    int defaultTopK = 10;
    int candidateMultiplier = 2;
    int minCandidates = 20;
};

struct Bm25Settings {
    double k1 = 1.5;
    double b = 0.75;
};

struct Settings {
    QString dataDir;
    QString modelsDir;
    QString embeddingRole = QStringLiteral("bi-encoder");
    int embeddingBatchSize = 16;

    ExtractionSettings extraction;
    ChunkingSettings chunking;
    RetrievalSettings retrieval;
    Bm25Settings bm25;
};

} // namespace ild
