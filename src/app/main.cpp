#include "core/engine/engine.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QStringConverter>
#include <QTextStream>

#include <csignal>
#include <cstdio>
#include <memory>
#include <optional>

namespace {

sx::CancellationToken g_interrupt;

void onInterrupt(int)
{
    g_interrupt.cancel();
}

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const QString& message)
{
    err() << "sextant: " << message << Qt::endl;
    return 1;
}

void printJson(const QJsonObject& object)
{
    out() << QJsonDocument(object).toJson(QJsonDocument::Indented);
    out().flush();
}

QString defaultDbPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/sextant/sextant.db");
}

// Source type from a file extension; nullopt for files the CLI does not read.
std::optional<sx::SourceType> sourceTypeForFile(const QFileInfo& info)
{
    const QString suffix = info.suffix().toLower();
    if (suffix == QLatin1String("md") || suffix == QLatin1String("markdown")) {
        return sx::SourceType::Markdown;
    }
    if (suffix == QLatin1String("org")) {
        return sx::SourceType::Org;
    }
    if (suffix == QLatin1String("txt") || suffix == QLatin1String("text")) {
        return sx::SourceType::PlainText;
    }
    return std::nullopt;
}

void appendUnit(const QFileInfo& info, sx::SourceType type, std::vector<sx::ContentUnit>& units)
{
    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(sxCore, "Cannot read %s", qUtf8Printable(info.absoluteFilePath()));
        return;
    }
    sx::ContentUnit unit;
    unit.filePath = info.absoluteFilePath();
    unit.rawText = QString::fromUtf8(file.readAll());
    unit.metadata.sourceType = type;
    unit.metadata.title = info.completeBaseName();
    units.push_back(std::move(unit));
}

std::vector<sx::ContentUnit> collectUnits(const QStringList& paths)
{
    std::vector<sx::ContentUnit> units;
    for (const QString& path : paths) {
        const QFileInfo info(path);
        if (info.isDir()) {
            QDirIterator it(info.absoluteFilePath(), QDir::Files | QDir::NoDotAndDotDot,
                            QDirIterator::Subdirectories);
            while (it.hasNext()) {
                const QFileInfo child(it.next());
                if (const auto type = sourceTypeForFile(child)) {
                    appendUnit(child, *type, units);
                }
            }
        } else if (info.isFile()) {
            appendUnit(info, sourceTypeForFile(info).value_or(sx::SourceType::PlainText), units);
        } else {
            LOG_WARN(sxCore, "No such file or directory: %s", qUtf8Printable(path));
        }
    }
    return units;
}

// ── Commands ────────────────────────────────────────────────

int runIndex(sx::Engine& engine, const QStringList& args, bool regenerate, bool json)
{
    if (args.size() < 2) {
        return fail(QStringLiteral("usage: sextant index <corpus> <path>..."));
    }
    const QString corpusId = args.at(0);
    const std::vector<sx::ContentUnit> units = collectUnits(args.mid(1));

    const sx::IndexRunResult result = engine.index(
        corpusId, units, regenerate ? sx::IndexMode::Regenerate : sx::IndexMode::Sync,
        g_interrupt);

    if (json) {
        QJsonArray files;
        for (const sx::FileOutcome& outcome : result.files) {
            QJsonObject file;
            file[QStringLiteral("path")] = outcome.filePath;
            file[QStringLiteral("status")] = sx::fileOutcomeStatusToString(outcome.status);
            file[QStringLiteral("inserted")] = outcome.inserted;
            file[QStringLiteral("updated")] = outcome.updated;
            file[QStringLiteral("deleted")] = outcome.deleted;
            file[QStringLiteral("reused")] = outcome.reused;
            if (outcome.error != sx::ErrorCode::None) {
                file[QStringLiteral("error")] = sx::errorCodeToString(outcome.error);
                file[QStringLiteral("message")] = outcome.message;
            }
            files.append(file);
        }
        QJsonObject root;
        root[QStringLiteral("status")] = sx::errorCodeToString(result.code);
        root[QStringLiteral("message")] = result.message;
        root[QStringLiteral("entriesInserted")] = result.entriesInserted;
        root[QStringLiteral("entriesUpdated")] = result.entriesUpdated;
        root[QStringLiteral("entriesDeleted")] = result.entriesDeleted;
        root[QStringLiteral("entriesReused")] = result.entriesReused;
        root[QStringLiteral("files")] = files;
        printJson(root);
    } else {
        out() << QStringLiteral("%1 indexed, %2 unchanged, %3 deleted, %4 failed, %5 not reached\n")
                     .arg(result.filesIndexed)
                     .arg(result.filesUnchanged)
                     .arg(result.filesDeleted)
                     .arg(result.filesFailed)
                     .arg(result.filesNotReached);
        out() << QStringLiteral("entries: +%1 ~%2 -%3, %4 reused\n")
                     .arg(result.entriesInserted)
                     .arg(result.entriesUpdated)
                     .arg(result.entriesDeleted)
                     .arg(result.entriesReused);
        out().flush();
    }

    if (!result.ok()) {
        return fail(QStringLiteral("%1: %2").arg(sx::errorCodeToString(result.code),
                                                  result.message));
    }
    return 0;
}

int runSearch(sx::Engine& engine, const QStringList& args, int topK, bool rerank, bool filters,
              bool json)
{
    if (args.size() < 2) {
        return fail(QStringLiteral("usage: sextant search <corpus[,corpus]> <query>..."));
    }
    const QStringList corpusIds = args.at(0).split(QLatin1Char(','), Qt::SkipEmptyParts);
    const QString query = args.mid(1).join(QLatin1Char(' '));

    const sx::SearchResponse response =
        engine.search(query, corpusIds, filters, topK, rerank, g_interrupt);
    if (!response.ok()) {
        return fail(QStringLiteral("%1: %2").arg(sx::errorCodeToString(response.code),
                                                  response.message));
    }

    if (json) {
        QJsonArray hits;
        for (const sx::SearchHit& hit : response.hits) {
            QJsonObject object;
            object[QStringLiteral("id")] = static_cast<qint64>(hit.entry.id);
            object[QStringLiteral("corpus")] = hit.entry.corpusId;
            object[QStringLiteral("file")] = hit.entry.filePath;
            object[QStringLiteral("heading")] = hit.entry.heading;
            object[QStringLiteral("text")] = hit.entry.text;
            object[QStringLiteral("score")] = static_cast<double>(hit.score());
            object[QStringLiteral("similarity")] = static_cast<double>(hit.similarity);
            if (hit.crossScore) {
                object[QStringLiteral("crossScore")] = static_cast<double>(*hit.crossScore);
            }
            hits.append(object);
        }
        QJsonObject root;
        root[QStringLiteral("query")] = response.semanticQuery;
        root[QStringLiteral("filters")] = QJsonArray::fromStringList(response.appliedFilters);
        root[QStringLiteral("degraded")] = response.degraded;
        root[QStringLiteral("hits")] = hits;
        printJson(root);
        return 0;
    }

    if (response.degraded) {
        err() << "sextant: " << response.message << Qt::endl;
    }
    int rank = 1;
    for (const sx::SearchHit& hit : response.hits) {
        out() << QStringLiteral("%1. [%2] %3").arg(rank++).arg(hit.score(), 0, 'f', 4)
                     .arg(hit.entry.filePath);
        if (!hit.entry.heading.isEmpty()) {
            out() << QStringLiteral(" > ") << hit.entry.heading;
        }
        out() << '\n' << QStringLiteral("   ")
              << hit.entry.text.simplified().left(200) << '\n';
    }
    out().flush();
    return 0;
}

int runFiles(sx::Engine& engine, const QStringList& args, bool json)
{
    if (args.size() != 1) {
        return fail(QStringLiteral("usage: sextant files <corpus>"));
    }
    const auto files = engine.listFiles(args.at(0));
    if (!files.has_value()) {
        return fail(QStringLiteral("cannot list files of %1").arg(args.at(0)));
    }

    QJsonArray array;
    for (const sx::FileState& file : *files) {
        if (json) {
            QJsonObject object;
            object[QStringLiteral("path")] = file.filePath;
            object[QStringLiteral("type")] = sx::sourceTypeToString(file.sourceType);
            object[QStringLiteral("entries")] = file.entryCount;
            object[QStringLiteral("hash")] = file.contentHash;
            object[QStringLiteral("indexedAt")] =
                QDateTime::fromSecsSinceEpoch(file.indexedAt).toString(Qt::ISODate);
            array.append(object);
        } else {
            out() << QStringLiteral("%1\t%2\t%3\n")
                         .arg(sx::sourceTypeToString(file.sourceType))
                         .arg(file.entryCount)
                         .arg(file.filePath);
        }
    }
    if (json) {
        QJsonObject root;
        root[QStringLiteral("files")] = array;
        printJson(root);
    }
    out().flush();
    return 0;
}

int runShow(sx::Engine& engine, const QStringList& args)
{
    if (args.size() != 2) {
        return fail(QStringLiteral("usage: sextant show <corpus> <path>"));
    }
    const auto content = engine.fileContent(args.at(0), args.at(1));
    if (!content.has_value()) {
        return fail(QStringLiteral("%1 is not indexed in %2").arg(args.at(1), args.at(0)));
    }
    out() << *content << '\n';
    out().flush();
    return 0;
}

int runDelete(sx::Engine& engine, const QStringList& args, const QString& filePath,
              const QString& type)
{
    if (args.size() != 1) {
        return fail(QStringLiteral("usage: sextant delete <corpus> [--file <path> | --type <type>]"));
    }
    const QString corpusId = args.at(0);

    if (!filePath.isEmpty()) {
        const sx::StoreWriteResult result = engine.deleteFile(corpusId, filePath);
        if (!result.ok()) {
            return fail(result.message);
        }
        out() << QStringLiteral("deleted %1 entries\n").arg(result.deleted);
    } else if (!type.isEmpty()) {
        if (!sx::supportedSourceTypes().contains(type)) {
            return fail(QStringLiteral("unknown type %1 (one of: %2)")
                            .arg(type, sx::supportedSourceTypes().join(QStringLiteral(", "))));
        }
        const sx::StoreWriteResult result =
            engine.deleteSourceType(corpusId, sx::sourceTypeFromString(type));
        if (!result.ok()) {
            return fail(result.message);
        }
        out() << QStringLiteral("deleted %1 entries\n").arg(result.deleted);
    } else {
        const sx::StoreResult result = engine.deleteCorpus(corpusId);
        if (!result.ok()) {
            return fail(result.message);
        }
        out() << QStringLiteral("deleted corpus %1\n").arg(corpusId);
    }
    out().flush();
    return 0;
}

int runStats(sx::Engine& engine, const QStringList& args, bool json)
{
    QJsonArray array;
    for (const sx::CorpusInfo& corpus : engine.corpora()) {
        if (!args.isEmpty() && !args.contains(corpus.corpusId)) {
            continue;
        }
        const auto stats = engine.stats(corpus.corpusId);
        if (!stats.has_value()) {
            return fail(QStringLiteral("cannot read stats of %1").arg(corpus.corpusId));
        }
        if (json) {
            QJsonObject object;
            object[QStringLiteral("corpus")] = corpus.corpusId;
            object[QStringLiteral("model")] = corpus.modelId;
            object[QStringLiteral("dimensions")] = corpus.dimensions;
            object[QStringLiteral("entries")] = stats->entryCount;
            object[QStringLiteral("files")] = stats->fileCount;
            object[QStringLiteral("indexedBytes")] = static_cast<qint64>(stats->indexedBytes);
            array.append(object);
        } else {
            out() << QStringLiteral("%1\t%2 (%3d)\t%4 files\t%5 entries\t%6 bytes\n")
                         .arg(corpus.corpusId, corpus.modelId)
                         .arg(corpus.dimensions)
                         .arg(stats->fileCount)
                         .arg(stats->entryCount)
                         .arg(stats->indexedBytes);
        }
    }
    if (json) {
        QJsonObject root;
        root[QStringLiteral("corpora")] = array;
        printJson(root);
    }
    out().flush();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("sextant"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    out().setEncoding(QStringConverter::Utf8);
    err().setEncoding(QStringConverter::Utf8);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Semantic search over local notes.\n\n"
        "Commands:\n"
        "  index <corpus> <path>...         index files (.md, .org, .txt) as one snapshot\n"
        "  search <corpus[,corpus]> <query>  search one or more corpora\n"
        "  files <corpus>                   list indexed files\n"
        "  show <corpus> <path>             print the indexed text of a file\n"
        "  delete <corpus>                  delete a corpus, a file or a source type\n"
        "  stats [corpus]...                corpus statistics\n"
        "  types                            supported source types"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Settings file."),
                                            QStringLiteral("file"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("Database file, overrides the settings."),
                                      QStringLiteral("file"));
    const QCommandLineOption jsonOption(QStringLiteral("json"),
                                        QStringLiteral("Print JSON."));
    const QCommandLineOption regenerateOption(QStringLiteral("regenerate"),
                                              QStringLiteral("index: rebuild the corpus from scratch."));
    const QCommandLineOption topKOption(QStringList{QStringLiteral("k"), QStringLiteral("top-k")},
                                        QStringLiteral("search: number of results."),
                                        QStringLiteral("n"), QStringLiteral("10"));
    const QCommandLineOption noRerankOption(QStringLiteral("no-rerank"),
                                            QStringLiteral("search: skip the cross-encoder."));
    const QCommandLineOption noFiltersOption(QStringLiteral("no-filters"),
                                             QStringLiteral("search: treat filter syntax as text."));
    const QCommandLineOption fileOption(QStringLiteral("file"),
                                        QStringLiteral("delete: only this file."),
                                        QStringLiteral("path"));
    const QCommandLineOption typeOption(QStringLiteral("type"),
                                        QStringLiteral("delete: only this source type."),
                                        QStringLiteral("type"));
    parser.addOptions({settingsOption, dbOption, jsonOption, regenerateOption, topKOption,
                       noRerankOption, noFiltersOption, fileOption, typeOption});
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.takeFirst();
    const bool json = parser.isSet(jsonOption);

    if (command == QLatin1String("types")) {
        for (const QString& type : sx::Engine::contentTypes()) {
            out() << type << '\n';
        }
        out().flush();
        return 0;
    }

    const QString settingsPath = parser.isSet(settingsOption)
        ? parser.value(settingsOption)
        : sx::SettingsManager::settingsFilePath();
    sx::Settings settings = sx::SettingsManager::load(settingsPath).value_or(sx::Settings{});
    if (parser.isSet(dbOption)) {
        settings.dbPath = parser.value(dbOption);
    }
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDbPath();
    }

    bool topKOk = false;
    const int topK = parser.value(topKOption).toInt(&topKOk);
    if (!topKOk || topK <= 0) {
        return fail(QStringLiteral("--top-k must be a positive integer"));
    }

    QString error;
    std::unique_ptr<sx::Engine> engine = sx::Engine::open(settings, &error);
    if (!engine) {
        return fail(error);
    }

    std::signal(SIGINT, onInterrupt);

    if (command == QLatin1String("index")) {
        return runIndex(*engine, args, parser.isSet(regenerateOption), json);
    }
    if (command == QLatin1String("search")) {
        return runSearch(*engine, args, topK, !parser.isSet(noRerankOption),
                         !parser.isSet(noFiltersOption), json);
    }
    if (command == QLatin1String("files")) {
        return runFiles(*engine, args, json);
    }
    if (command == QLatin1String("show")) {
        return runShow(*engine, args);
    }
    if (command == QLatin1String("delete")) {
        return runDelete(*engine, args, parser.value(fileOption), parser.value(typeOption));
    }
    if (command == QLatin1String("stats")) {
        return runStats(*engine, args, json);
    }

    return fail(QStringLiteral("unknown command '%1'").arg(command));
}
