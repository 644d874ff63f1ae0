#ifndef COVERAGEAPP_H
#define COVERAGEAPP_H

#include <QTextStream>
#include <QLoggingCategory>
#include "appoptions.h"

Q_DECLARE_LOGGING_CATEGORY(lcApp)

class RasterSource;

/**
 * @brief 命令行前端：单坐标查询 / CSV 批处理
 *
 * 结果写入 out（单坐标结果行），进度条写入 err；诊断信息走 Qt 日志。
 */
class CoverageApp
{
public:
    enum ExitCode {
        Success = 0,
        ConfigurationError = 1
    };

    CoverageApp(QTextStream &out, QTextStream &err);

    /** arguments[0] 为程序名 */
    int run(const QStringList &arguments);
    int run(const AppOptions &options);

    int runSingle(const RasterSource &raster, const AppOptions &options);
    int runBatch(const RasterSource &raster, const AppOptions &options);

private:
    void printProgress(qint64 processed, qint64 total);

private:
    QTextStream &m_out;
    QTextStream &m_err;
};

#endif // COVERAGEAPP_H
