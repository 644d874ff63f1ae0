#ifndef BATCHPIPELINE_H
#define BATCHPIPELINE_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QLoggingCategory>
#include <functional>
#include <utility>
#include "coverageresolver.h"
#include "csvio.h"

Q_DECLARE_LOGGING_CATEGORY(lcBatch)

/**
 * @brief 一行输出：原始经纬度文本（已去空白）+ 解析结果
 */
struct BatchRow
{
    QString lat;
    QString lon;
    CoverageResult result;
};

struct BatchSummary
{
    qint64 total = 0;
    qint64 resolved = 0;
    qint64 nulls = 0;
};

/**
 * @class BatchPipeline
 * @brief 分块读取坐标 → 逐行解析 → 按原顺序写出
 *
 * 每个输入行恰好产生一个输出行；单行失败写 "Null"，不中断整批。
 * 分块只用于限制内存和进度汇报，不影响结果。
 */
class BatchPipeline
{
public:
    using ProgressCallback = std::function<void(qint64 processed, qint64 total)>;

    static constexpr int DEFAULT_BATCH_SIZE = 20;
    static const QString NULL_TOKEN;
    static const QString OUTPUT_SUFFIX;

    explicit BatchPipeline(const CoverageResolver &resolver,
                           int batchSize = DEFAULT_BATCH_SIZE);

    void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

    /** 单行：前两列去空白后必须恰好两个非空字段 */
    BatchRow processRow(const QStringList &row) const;

    /** 内存中的整批处理（保持顺序） */
    QVector<BatchRow> process(const QVector<QStringList> &rows);

    /** 流式处理：reader 已越过表头，writer 已写表头 */
    BatchSummary run(CsvReader &reader, CsvWriter &writer, qint64 totalRows);

    /**
     * @brief 处理整个 CSV 文件并写出 <basename>_coverage_prediction.csv
     * @return 配置错误（无法打开、表头不符）返回 false，且不产生输出文件
     */
    bool processFile(const QString &csvPath, QString *outputPath,
                     QString *errorMessage, BatchSummary *summary = nullptr);

    static bool isValidHeader(const QStringList &header);
    static QString outputPathFor(const QString &csvPath);
    static QStringList outputHeader();
    static QStringList formatRow(const BatchRow &row);

private:
    QVector<BatchRow> processChunk(const QVector<QStringList> &chunk, qint64 total);
    void advance(qint64 total);

private:
    const CoverageResolver &m_resolver;
    int m_batchSize;
    ProgressCallback m_progress;
    qint64 m_processed = 0;
};

#endif // BATCHPIPELINE_H
