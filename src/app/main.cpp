#include "core/engine/engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include <cstdio>

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

void printJson(const QJsonObject& object)
{
    QTextStream out(stdout);
    out << QJsonDocument(object).toJson(QJsonDocument::Indented);
    out.flush();
}

QJsonObject documentToJson(const ild::Document& doc)
{
    QJsonArray confidences;
    for (double confidence : doc.pageConfidences) {
        confidences.append(confidence);
    }
    QJsonObject json;
    json[QStringLiteral("id")] = doc.id;
    json[QStringLiteral("filename")] = doc.filename;
    json[QStringLiteral("page_count")] = doc.pageCount;
    json[QStringLiteral("ingested_at")] = doc.ingestedAt.toString(Qt::ISODate);
    json[QStringLiteral("content_hash")] = doc.contentHash;
    json[QStringLiteral("chunk_count")] = doc.chunkCount;
    json[QStringLiteral("embedded_chunk_count")] = doc.embeddedChunkCount;
    json[QStringLiteral("page_confidences")] = confidences;
    json[QStringLiteral("page_backends")] = QJsonArray::fromStringList(doc.pageBackends);
    return json;
}

QJsonObject pageToJson(const ild::PageResult& page)
{
    QJsonObject json;
    json[QStringLiteral("page")] = page.pageIndex + 1;
    json[QStringLiteral("backend")] = page.backendName;
    json[QStringLiteral("confidence")] = page.confidence;
    json[QStringLiteral("outcome")] = ild::pageOutcomeToString(page.outcome);
    json[QStringLiteral("attempted")] = QJsonArray::fromStringList(page.attemptedBackends);
    json[QStringLiteral("duration_ms")] = page.durationMs;
    return json;
}

QJsonObject indexErrorToJson(const ild::IndexError& error)
{
    QJsonObject json;
    json[QStringLiteral("kind")] = ild::indexErrorKindToString(error.kind);
    json[QStringLiteral("message")] = error.message;
    return json;
}

int runIngest(ild::Engine& engine, const QStringList& paths)
{
    QJsonArray results;
    bool allOk = true;
    for (const QString& path : paths) {
        const ild::IngestOutcome outcome = engine.ingestFile(path);
        QJsonObject entry;
        entry[QStringLiteral("path")] = path;
        QJsonArray pages;
        for (const ild::PageResult& page : outcome.pages) {
            pages.append(pageToJson(page));
        }
        entry[QStringLiteral("pages")] = pages;
        if (outcome.ok()) {
            entry[QStringLiteral("document")] = documentToJson(*outcome.document);
            entry[QStringLiteral("dropped_dense_chunks")] = outcome.droppedDenseChunks;
        } else {
            allOk = false;
            QJsonObject error;
            error[QStringLiteral("reason")] = ild::ingestionReasonToString(outcome.error->reason);
            error[QStringLiteral("message")] = outcome.error->message;
            entry[QStringLiteral("error")] = error;
        }
        entry[QStringLiteral("duration_ms")] = outcome.durationMs;
        results.append(entry);
    }

    QJsonObject out;
    out[QStringLiteral("results")] = results;
    printJson(out);
    return allOk ? kExitOk : kExitFailure;
}

int runQuery(const ild::Engine& engine, const QString& query, int k, bool withContext)
{
    const ild::AnswerContext context = engine.answerContext(query, k);

    QJsonObject out;
    out[QStringLiteral("query")] = query;
    out[QStringLiteral("mode")] = ild::retrievalModeToString(context.mode);
    out[QStringLiteral("degraded")] = context.degraded;
    if (context.degraded) {
        out[QStringLiteral("degraded_reason")] = context.degradedReason;
    }

    QJsonArray passages;
    for (const ild::ContextPassage& passage : context.passages) {
        QJsonObject entry;
        entry[QStringLiteral("citation")] = passage.citationLabel();
        entry[QStringLiteral("chunk_id")] = passage.chunk.chunkId;
        entry[QStringLiteral("document_id")] = passage.chunk.documentId;
        entry[QStringLiteral("filename")] = passage.filename;
        entry[QStringLiteral("first_page")] = passage.firstPage;
        entry[QStringLiteral("last_page")] = passage.lastPage;
        entry[QStringLiteral("score")] = passage.combinedScore;
        entry[QStringLiteral("text")] = passage.chunk.text;
        passages.append(entry);
    }
    out[QStringLiteral("passages")] = passages;
    if (withContext) {
        out[QStringLiteral("context")] = context.formatted();
    }
    printJson(out);
    return context.noSources() ? kExitFailure : kExitOk;
}

int runList(const ild::Engine& engine)
{
    QJsonArray documents;
    for (const ild::Document& doc : engine.listDocuments()) {
        documents.append(documentToJson(doc));
    }
    QJsonObject out;
    out[QStringLiteral("count")] = engine.documentCount();
    out[QStringLiteral("documents")] = documents;
    printJson(out);
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("inlegaldesk"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Hindi/English legal PDF ingestion and hybrid retrieval"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("ingest | query | list | delete | rebuild"));
    parser.addPositionalArgument(QStringLiteral("args"),
                                 QStringLiteral("PDF paths, query text or document id"),
                                 QStringLiteral("[args...]"));

    const QCommandLineOption settingsOption(
        QStringLiteral("settings"), QStringLiteral("Settings JSON file."), QStringLiteral("path"));
    const QCommandLineOption dataDirOption(
        QStringLiteral("data-dir"), QStringLiteral("Directory for the database and indexes."),
        QStringLiteral("dir"));
    const QCommandLineOption modelsDirOption(
        QStringLiteral("models-dir"), QStringLiteral("Directory holding manifest.json."),
        QStringLiteral("dir"));
    const QCommandLineOption presetOption(
        QStringLiteral("preset"),
        QStringLiteral("Extraction preset: premium, high, balanced, fast, offline, basic."),
        QStringLiteral("name"));
    const QCommandLineOption topKOption(
        QStringLiteral("k"), QStringLiteral("Number of passages to return."),
        QStringLiteral("count"));
    const QCommandLineOption contextOption(
        QStringLiteral("context"), QStringLiteral("Include the numbered context block."));
    parser.addOptions({settingsOption, dataDirOption, modelsDirOption, presetOption,
                       topKOption, contextOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(kExitUsage);
    }
    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : ild::SettingsManager::defaultSettingsPath();
    ild::Settings settings = ild::SettingsManager::load(settingsPath).value_or(ild::Settings{});
    if (parser.isSet(dataDirOption)) {
        settings.dataDir = parser.value(dataDirOption);
    }
    if (parser.isSet(modelsDirOption)) {
        settings.modelsDir = parser.value(modelsDirOption);
    }
    if (parser.isSet(presetOption)) {
        settings.extraction.preset = parser.value(presetOption);
    }

    auto engine = ild::Engine::createDefault(settings);
    const std::optional<ild::IndexError> openError = engine->open();
    if (openError && openError->kind == ild::IndexError::Kind::StorageUnavailable) {
        QJsonObject out;
        out[QStringLiteral("error")] = indexErrorToJson(*openError);
        printJson(out);
        return kExitFailure;
    }

    if (command == QLatin1String("ingest")) {
        if (args.isEmpty()) {
            std::fprintf(stderr, "ingest: at least one PDF path is required\n");
            return kExitUsage;
        }
        return runIngest(*engine, args);
    }
    if (command == QLatin1String("query")) {
        if (args.isEmpty()) {
            std::fprintf(stderr, "query: query text is required\n");
            return kExitUsage;
        }
        bool kOk = true;
        const int k = parser.isSet(topKOption) ? parser.value(topKOption).toInt(&kOk) : 0;
        if (!kOk || k < 0) {
            std::fprintf(stderr, "query: --k must be a non-negative integer\n");
            return kExitUsage;
        }
        if (openError) {
            LOG_WARN(ildCore, "Querying with index error: %s",
                     qUtf8Printable(openError->message));
        }
        return runQuery(*engine, args.join(QLatin1Char(' ')), k, parser.isSet(contextOption));
    }
    if (command == QLatin1String("list")) {
        return runList(*engine);
    }
    if (command == QLatin1String("delete")) {
        if (args.size() != 1) {
            std::fprintf(stderr, "delete: exactly one document id is required\n");
            return kExitUsage;
        }
        QJsonObject out;
        out[QStringLiteral("document_id")] = args.first();
        out[QStringLiteral("deleted")] = engine->deleteDocument(args.first());
        printJson(out);
        return out[QStringLiteral("deleted")].toBool() ? kExitOk : kExitFailure;
    }
    if (command == QLatin1String("rebuild")) {
        const std::optional<ild::IndexError> error = engine->rebuildIndexes();
        QJsonObject out;
        out[QStringLiteral("rebuilt")] = !error.has_value();
        if (error) {
            out[QStringLiteral("error")] = indexErrorToJson(*error);
        }
        out[QStringLiteral("documents")] = engine->documentCount();
        printJson(out);
        return error ? kExitFailure : kExitOk;
    }

    std::fprintf(stderr, "unknown command: %s\n", qUtf8Printable(command));
    return kExitUsage;
}
