#include "coordinatetransformer.h"
#include <QStringList>
#include <cmath>

bool GeoCoordinate::parse(const QString &text, GeoCoordinate &out)
{
    const QStringList parts = text.split(',');
    if (parts.size() != 2)
        return false;

    bool okLat = false, okLon = false;
    double lat = parts[0].trimmed().toDouble(&okLat);
    double lon = parts[1].trimmed().toDouble(&okLon);
    if (!okLat || !okLon || !std::isfinite(lat) || !std::isfinite(lon))
        return false;

    out.lat = lat;
    out.lon = lon;
    return true;
}

CoordinateTransformer::CoordinateTransformer(const RasterSource &raster)
    : m_raster(raster)
{
}

bool CoordinateTransformer::toPixel(const GeoCoordinate &coord, PixelLocation &pixel) const
{
    double x = 0.0, y = 0.0;
    if (!toNative(coord, x, y))
        return false;

    // 行列由栅格自身索引函数决定（非北向上栅格也适用）
    pixel = m_raster.index(x, y);
    return true;
}
