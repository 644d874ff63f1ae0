#include "rasterdata.h"
#include <cpl_conv.h>
#include <QDebug>
#include <cmath>
#include <limits>
#include <algorithm>

Q_LOGGING_CATEGORY(lcRaster, "coverage.raster", QtInfoMsg)

static bool g_gdalInitialized = false;

// RGB 三波段
static constexpr int RGB_BAND_COUNT = 3;

namespace {

int toIndex(double v)
{
    if (!std::isfinite(v))
        return -1;
    const double f = std::floor(v);
    if (f < std::numeric_limits<int>::min() || f > std::numeric_limits<int>::max())
        return -1;
    return static_cast<int>(f);
}

} // namespace

RasterData::RasterData() {
    if (!g_gdalInitialized) {
        GDALAllRegister();
        g_gdalInitialized = true;
    }
}

RasterData::~RasterData()
{
    close();
}

void RasterData::close()
{
    if (m_fromWgs84) {
        OGRCoordinateTransformation::DestroyCT(m_fromWgs84);
        m_fromWgs84 = nullptr;
    }
    if (m_dataset) {
        GDALClose(m_dataset);
        m_dataset = nullptr;
    }
    m_width = 0;
    m_height = 0;
}

bool RasterData::fail(const QString &message)
{
    m_error = message;
    qCWarning(lcRaster).noquote() << "RasterData:" << message;
    close();
    return false;
}

/**
 * @brief 打开覆盖图栅格（只读），建立 WGS84 → 栅格坐标系变换
 */
bool RasterData::open(const QString &filePath)
{
    close();
    m_error.clear();

    m_dataset = static_cast<GDALDataset *>(
        GDALOpenEx(filePath.toUtf8().constData(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                   nullptr, nullptr, nullptr));
    if (!m_dataset)
        return fail(QString("cannot open dataset '%1': %2").arg(filePath, CPLGetLastErrorMsg()));

    if (m_dataset->GetRasterCount() < RGB_BAND_COUNT)
        return fail(QString("'%1' has %2 band(s), expected RGB")
                        .arg(filePath).arg(m_dataset->GetRasterCount()));

    m_width = m_dataset->GetRasterXSize();
    m_height = m_dataset->GetRasterYSize();

    // === GeoTransform ===
    if (m_dataset->GetGeoTransform(m_geoTransform) != CE_None)
        return fail(QString("'%1' has no geotransform").arg(filePath));
    if (!GDALInvGeoTransform(m_geoTransform, m_invGeoTransform))
        return fail(QString("'%1' geotransform is not invertible").arg(filePath));

    // === 坐标系 ===
    const OGRSpatialReference *rasterSrs = m_dataset->GetSpatialRef();
    if (!rasterSrs || rasterSrs->IsEmpty())
        return fail(QString("'%1' has no spatial reference").arg(filePath));

    OGRSpatialReference target(*rasterSrs);
    target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRSpatialReference wgs84;
    if (wgs84.importFromEPSG(4326) != OGRERR_NONE)
        return fail(QString("cannot build EPSG:4326: %1").arg(CPLGetLastErrorMsg()));
    wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    m_fromWgs84 = OGRCreateCoordinateTransformation(&wgs84, &target);
    if (!m_fromWgs84)
        return fail(QString("cannot transform EPSG:4326 to raster SRS: %1").arg(CPLGetLastErrorMsg()));

    qCDebug(lcRaster) << "[RasterData] Opened" << filePath
                      << "size:" << m_width << "x" << m_height
                      << "origin:" << m_geoTransform[0] << m_geoTransform[3];
    return true;
}

bool RasterData::fromWgs84(double lon, double lat, double &x, double &y) const
{
    if (!m_fromWgs84)
        return false;

    x = lon;
    y = lat;
    if (!m_fromWgs84->Transform(1, &x, &y))
        return false;
    return std::isfinite(x) && std::isfinite(y);
}

/**
 * @brief 原生坐标 → 像素行列（逆 GeoTransform，向下取整）
 */
PixelLocation RasterData::index(double x, double y) const
{
    const double *inv = m_invGeoTransform;
    PixelLocation p;
    p.col = toIndex(inv[0] + inv[1] * x + inv[2] * y);
    p.row = toIndex(inv[3] + inv[4] * x + inv[5] * y);
    return p;
}

bool RasterData::readPixel(const PixelLocation &pixel, QColor &out) const
{
    if (!m_dataset || !contains(pixel))
        return false;

    int rgb[RGB_BAND_COUNT] = {0, 0, 0};
    for (int b = 0; b < RGB_BAND_COUNT; ++b) {
        GDALRasterBand *band = m_dataset->GetRasterBand(b + 1);
        if (!band) {
            qCWarning(lcRaster) << "RasterData: cannot get raster band" << b + 1;
            return false;
        }

        GByte value = 0;
        if (band->RasterIO(GF_Read, pixel.col, pixel.row, 1, 1,
                           &value, 1, 1, GDT_Byte, 0, 0) != CE_None) {
            qCWarning(lcRaster) << "RasterData: RasterIO read failed at"
                                << pixel.row << pixel.col << CPLGetLastErrorMsg();
            return false;
        }
        rgb[b] = value;
    }

    out = QColor(rgb[0], rgb[1], rgb[2]);
    return true;
}
