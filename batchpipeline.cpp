#include "batchpipeline.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <stdexcept>

Q_LOGGING_CATEGORY(lcBatch, "coverage.batch", QtInfoMsg)

const QString BatchPipeline::NULL_TOKEN = QStringLiteral("Null");
const QString BatchPipeline::OUTPUT_SUFFIX = QStringLiteral("_coverage_prediction.csv");

BatchPipeline::BatchPipeline(const CoverageResolver &resolver, int batchSize)
    : m_resolver(resolver),
      m_batchSize(batchSize > 0 ? batchSize : DEFAULT_BATCH_SIZE)
{
}

BatchRow BatchPipeline::processRow(const QStringList &row) const
{
    BatchRow out;
    out.lat = row.value(0).trimmed();
    out.lon = row.value(1).trimmed();

    QStringList coords;
    for (const QString &f : {out.lat, out.lon}) {
        if (!f.isEmpty())
            coords << f;
    }
    if (coords.size() != 2) {
        qCWarning(lcBatch).noquote() << CoverageResult::statusName(CoverageResult::InvalidCoordinate)
                                     << "in row:" << row.mid(0, 2).join(',');
        out.result = CoverageResult::failure(CoverageResult::InvalidCoordinate);
        return out;
    }

    try {
        out.result = m_resolver.resolve(coords.join(','));
    } catch (const std::invalid_argument &) {
        throw;   // 插值方法错误：整批失效
    } catch (const std::exception &e) {
        qCWarning(lcBatch).noquote() << "Error processing coordinates" << coords.join(',')
                                     << ":" << e.what();
        out.result = CoverageResult::failure(CoverageResult::ReadError);
    }

    if (!out.result.hasValue())
        qCDebug(lcBatch).noquote() << "Row" << coords.join(',') << "->" << NULL_TOKEN
                                   << "(" + CoverageResult::statusName(out.result.status) + ")";
    return out;
}

void BatchPipeline::advance(qint64 total)
{
    ++m_processed;
    if (m_progress)
        m_progress(m_processed, total);
}

QVector<BatchRow> BatchPipeline::processChunk(const QVector<QStringList> &chunk, qint64 total)
{
    QVector<BatchRow> results;
    results.reserve(chunk.size());
    for (const QStringList &row : chunk) {
        results.append(processRow(row));
        advance(total);
    }
    return results;
}

QVector<BatchRow> BatchPipeline::process(const QVector<QStringList> &rows)
{
    m_processed = 0;
    const qint64 total = rows.size();

    QVector<BatchRow> results;
    results.reserve(rows.size());
    for (int start = 0; start < rows.size(); start += m_batchSize)
        results += processChunk(rows.mid(start, m_batchSize), total);
    return results;
}

BatchSummary BatchPipeline::run(CsvReader &reader, CsvWriter &writer, qint64 totalRows)
{
    m_processed = 0;
    BatchSummary summary;

    auto flush = [&](const QVector<QStringList> &chunk) {
        for (const BatchRow &r : processChunk(chunk, totalRows)) {
            writer.writeRow(formatRow(r));
            ++summary.total;
            if (r.result.hasValue())
                ++summary.resolved;
            else
                ++summary.nulls;
        }
    };

    QVector<QStringList> chunk;
    chunk.reserve(m_batchSize);
    QStringList row;
    while (reader.readRow(row)) {
        chunk.append(row);
        if (chunk.size() >= m_batchSize) {
            flush(chunk);
            chunk.clear();
        }
    }
    if (!chunk.isEmpty())
        flush(chunk);

    qCInfo(lcBatch) << "Processed" << summary.total << "rows:"
                    << summary.resolved << "resolved," << summary.nulls << "Null";
    return summary;
}

bool BatchPipeline::processFile(const QString &csvPath, QString *outputPath,
                                QString *errorMessage, BatchSummary *summary)
{
    auto setError = [errorMessage](const QString &msg) {
        if (errorMessage) *errorMessage = msg;
        return false;
    };

    CsvReader reader;
    if (!reader.open(csvPath))
        return setError(reader.errorString());

    QStringList header;
    if (!reader.readRow(header) || !isValidHeader(header))
        return setError("The first row of the CSV does not contain 'Latitude' and 'Longitude' headers.");

    // === 统计行数（用于进度） ===
    qint64 total = 0;
    QStringList row;
    while (reader.readRow(row))
        ++total;
    if (!reader.rewind() || !reader.readRow(header))
        return setError(QString("Failed to rewind CSV file '%1'").arg(csvPath));

    const QString outPath = outputPathFor(csvPath);
    CsvWriter writer;
    if (!writer.open(outPath))
        return setError(writer.errorString());
    writer.writeRow(outputHeader());

    qCDebug(lcBatch) << "Processing" << total << "rows from" << csvPath
                     << "in chunks of" << m_batchSize;
    BatchSummary s;
    try {
        s = run(reader, writer, total);
    } catch (const std::invalid_argument &) {
        // 致命错误不留半成品输出
        if (!writer.close())
            qCWarning(lcBatch).noquote() << writer.errorString();
        if (!QFile::remove(outPath))
            qCWarning(lcBatch).noquote() << "Failed to remove partial output" << outPath;
        throw;
    }

    if (!writer.close())
        return setError(writer.errorString());

    if (outputPath) *outputPath = outPath;
    if (summary) *summary = s;
    return true;
}

bool BatchPipeline::isValidHeader(const QStringList &header)
{
    if (header.size() < 2)
        return false;
    return header[0].trimmed().compare("latitude", Qt::CaseInsensitive) == 0
        && header[1].trimmed().compare("longitude", Qt::CaseInsensitive) == 0;
}

QString BatchPipeline::outputPathFor(const QString &csvPath)
{
    const QFileInfo fi(csvPath);
    return QDir(fi.path()).filePath(fi.completeBaseName() + OUTPUT_SUFFIX);
}

QStringList BatchPipeline::outputHeader()
{
    return {"Latitude", "Longitude", "RSRP"};
}

QStringList BatchPipeline::formatRow(const BatchRow &row)
{
    // 数值向零截断为整数 dBm
    const QString rsrp = row.result.hasValue()
        ? QString::number(static_cast<qint64>(row.result.value))
        : NULL_TOKEN;
    return {row.lat, row.lon, rsrp};
}
