#include "coverageresolver.h"
#include <QDebug>

Q_LOGGING_CATEGORY(lcResolver, "coverage.resolver", QtInfoMsg)

QString CoverageResult::statusName(Status s)
{
    switch (s) {
    case Resolved:          return "resolved";
    case NoCoverage:        return "no coverage";
    case OutOfBounds:       return "out of bounds";
    case InvalidCoordinate: return "invalid coordinate";
    case ReadError:         return "read error";
    }
    return "unknown";
}

CoverageResolver::CoverageResolver(const RasterSource &raster,
                                   const CoverageLegend &legend,
                                   Interpolator::Method method)
    : m_raster(raster),
      m_legend(legend),
      m_transformer(raster),
      m_classifier(m_legend),
      m_method(method)
{
}

CoverageResult CoverageResolver::resolve(const QString &coordText) const
{
    GeoCoordinate coord;
    if (!GeoCoordinate::parse(coordText, coord)) {
        qCWarning(lcResolver).noquote() << CoverageResult::statusName(CoverageResult::InvalidCoordinate) + ":" << coordText;
        return CoverageResult::failure(CoverageResult::InvalidCoordinate);
    }
    return resolve(coord);
}

CoverageResult CoverageResolver::resolve(const GeoCoordinate &coord) const
{
    // 1. 经纬度 → 像素
    PixelLocation pixel;
    if (!m_transformer.toPixel(coord, pixel)) {
        qCWarning(lcResolver) << "Coordinates" << coord.lat << coord.lon
                              << "cannot be transformed to the raster SRS";
        return CoverageResult::failure(CoverageResult::OutOfBounds);
    }

    // 2. 越界检查（行对应高度，列对应宽度）
    if (!m_raster.contains(pixel)) {
        qCWarning(lcResolver) << "Coordinates" << coord.lat << coord.lon
                              << "are out of bounds: pixel" << pixel.row << pixel.col
                              << "raster" << m_raster.height() << "x" << m_raster.width();
        return CoverageResult::failure(CoverageResult::OutOfBounds);
    }

    // 3. 读像素
    QColor rgb;
    if (!m_raster.readPixel(pixel, rgb)) {
        qCWarning(lcResolver) << "Error occurred while reading pixel" << pixel.row << pixel.col
                              << "for coordinates" << coord.lat << coord.lon;
        return CoverageResult::failure(CoverageResult::ReadError);
    }

    // 4. 分类
    const std::optional<QColor> closest = m_classifier.classify(rgb);
    if (!closest)
        return CoverageResult::failure(CoverageResult::NoCoverage);

    bool ok = false;
    const int level = m_legend.levelOf(*closest, &ok);
    if (!ok) {
        qCWarning(lcResolver) << "Classified color" << closest->name() << "is not in the legend";
        return CoverageResult::failure(CoverageResult::ReadError);
    }

    qCDebug(lcResolver) << "pixel" << pixel.row << pixel.col << rgb.name()
                        << "->" << closest->name() << level << "dBm";

    return CoverageResult::resolved(levelFor(level));
}

/**
 * @brief 最高档直接返回；否则在当前档与上一档之间插值
 */
double CoverageResolver::levelFor(int level) const
{
    if (level == m_legend.maxLevel())
        return level;

    const int next = m_legend.nextLevelAbove(level);
    return Interpolator::interpolate(level, next, level, next, level, m_method);
}
