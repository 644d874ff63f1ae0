#ifndef COVERAGERESOLVER_H
#define COVERAGERESOLVER_H

#include <QString>
#include <QLoggingCategory>
#include "geoutils.h"
#include "coordinatetransformer.h"

Q_DECLARE_LOGGING_CATEGORY(lcResolver)

/**
 * @brief 单个坐标的解析结果
 *
 * 除 Resolved 以外的状态在 CSV 中都写作 "Null"，日志里保留区分。
 */
struct CoverageResult
{
    enum Status {
        Resolved,
        NoCoverage,          ///< 哨兵色（白色）
        OutOfBounds,         ///< 落在栅格外或重投影失败
        InvalidCoordinate,   ///< 坐标文本无法解析
        ReadError            ///< 像素读取/分类失败
    };

    Status status = NoCoverage;
    double value = 0.0;   ///< dBm，仅 Resolved 有效

    bool hasValue() const { return status == Resolved; }

    static CoverageResult resolved(double dbm) { return {Resolved, dbm}; }
    static CoverageResult failure(Status s) { return {s, 0.0}; }

    static QString statusName(Status s);
};

/**
 * @class CoverageResolver
 * @brief 坐标 → RSRP：变换 → 越界检查 → 读像素 → 分类 → （可选）插值
 *
 * 不抛出逐坐标错误；唯一例外是无效插值方法（配置错误，std::invalid_argument）。
 */
class CoverageResolver
{
public:
    CoverageResolver(const RasterSource &raster,
                     const CoverageLegend &legend = CoverageLegend::reference(),
                     Interpolator::Method method = Interpolator::None);

    CoverageResult resolve(const QString &coordText) const;
    CoverageResult resolve(const GeoCoordinate &coord) const;

private:
    double levelFor(int level) const;

private:
    const RasterSource &m_raster;
    const CoverageLegend m_legend;
    CoordinateTransformer m_transformer;
    ColorClassifier m_classifier;
    Interpolator::Method m_method;
};

#endif // COVERAGERESOLVER_H
