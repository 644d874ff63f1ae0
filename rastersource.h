#ifndef RASTERSOURCE_H
#define RASTERSOURCE_H

#include <QColor>

/**
 * @brief 像素索引（行、列）；可能为负，越界由调用方判断
 */
struct PixelLocation
{
    int row = 0;
    int col = 0;
};

/**
 * @class RasterSource
 * @brief 栅格访问接口（三波段 RGB 覆盖图）
 *
 * 解析器只依赖此接口：
 *  1. 尺寸（width × height）
 *  2. WGS84 → 栅格原生坐标系的重投影
 *  3. 原生坐标 → 像素行列
 *  4. 按行列读取 RGB
 */
class RasterSource
{
public:
    virtual ~RasterSource() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;

    /** (lon, lat) → 原生 (x, y)，失败返回 false */
    virtual bool fromWgs84(double lon, double lat, double &x, double &y) const = 0;

    /** 原生 (x, y) → 像素索引（向下取整，不做越界检查） */
    virtual PixelLocation index(double x, double y) const = 0;

    /** 读取波段 1/2/3 的像素值，失败返回 false */
    virtual bool readPixel(const PixelLocation &pixel, QColor &out) const = 0;

    bool contains(const PixelLocation &pixel) const
    {
        return pixel.row >= 0 && pixel.row < height()
            && pixel.col >= 0 && pixel.col < width();
    }
};

#endif // RASTERSOURCE_H
