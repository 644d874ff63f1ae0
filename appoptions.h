#ifndef APPOPTIONS_H
#define APPOPTIONS_H

#include <QString>
#include <QStringList>
#include "geoutils.h"

/**
 * @brief 命令行配置
 *
 * --geotiff 必选；--coordinates 与 --csv 二选一。
 * 所有检查在打开栅格之前完成。
 */
struct AppOptions
{
    enum Mode { SingleCoordinate, BatchFile };

    QString geotiffPath;
    QString coordinates;
    QString csvPath;
    Mode mode = SingleCoordinate;
    Interpolator::Method interpolation = Interpolator::None;
    int batchSize = 20;
    bool quiet = false;
    bool verbose = false;

    bool helpRequested = false;
    bool versionRequested = false;
    QString helpText;

    /**
     * @brief 解析参数（arguments[0] 为程序名）
     * @return 配置错误时返回 false，errorMessage 给出原因
     */
    static bool parse(const QStringList &arguments, AppOptions &out, QString *errorMessage);

    /** 文件存在且可读 */
    static bool checkReadable(const QString &path, const QString &what, QString *errorMessage);
};

#endif // APPOPTIONS_H
