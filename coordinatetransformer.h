#ifndef COORDINATETRANSFORMER_H
#define COORDINATETRANSFORMER_H

#include <QString>
#include "rastersource.h"

/**
 * @brief WGS84 经纬度（度）
 */
struct GeoCoordinate
{
    double lat = 0.0;
    double lon = 0.0;

    /** 解析 "lat,lon"：逗号分隔、恰好两个数值（允许两侧空白） */
    static bool parse(const QString &text, GeoCoordinate &out);
};

class CoordinateTransformer
{
public:
    explicit CoordinateTransformer(const RasterSource &raster);

    // === 坐标变换 ===
    // 经纬度 → 栅格原生 (x, y) → 像素行列；不做越界检查
    bool toPixel(const GeoCoordinate &coord, PixelLocation &pixel) const;

    inline bool toNative(const GeoCoordinate &coord, double &x, double &y) const {
        return m_raster.fromWgs84(coord.lon, coord.lat, x, y);
    }

private:
    const RasterSource &m_raster;
};

#endif // COORDINATETRANSFORMER_H
