#ifndef RASTERDATA_H
#define RASTERDATA_H

#include <QString>
#include <QLoggingCategory>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include "rastersource.h"

Q_DECLARE_LOGGING_CATEGORY(lcRaster)

/**
 * @class RasterData
 * @brief 封装三波段 GDAL 覆盖图栅格（GeoTIFF 等）
 *
 * 主要职责：
 *  1. 以只读方式打开文件，校验波段数与地理参考
 *  2. 建立 EPSG:4326 → 栅格坐标系的 OGR 变换
 *  3. 通过逆 GeoTransform 计算像素索引，逐像素读取 RGB
 */
class RasterData : public RasterSource
{
public:
    RasterData();
    ~RasterData() override;

    RasterData(const RasterData &) = delete;
    RasterData &operator=(const RasterData &) = delete;

    /** 打开栅格文件，返回是否成功；失败原因见 errorString() */
    bool open(const QString &filePath);
    void close();

    bool isOpen() const { return m_dataset != nullptr; }
    QString errorString() const { return m_error; }

    int width() const override { return m_width; }
    int height() const override { return m_height; }

    bool fromWgs84(double lon, double lat, double &x, double &y) const override;
    PixelLocation index(double x, double y) const override;
    bool readPixel(const PixelLocation &pixel, QColor &out) const override;

private:
    bool fail(const QString &message);

private:
    GDALDataset *m_dataset = nullptr;
    OGRCoordinateTransformation *m_fromWgs84 = nullptr;

    QString m_error;

    int m_width = 0;
    int m_height = 0;

    // === GeoTransform 与逆变换 ===
    double m_geoTransform[6] = {0, 1, 0, 0, 0, -1};
    double m_invGeoTransform[6] = {0, 1, 0, 0, 0, -1};
};

#endif // RASTERDATA_H
