#include <QtTest>
#include "coverageresolver.h"
#include "memoryraster.h"

namespace {

const QColor MAX_RED(207, 99, 103);     // -80
const QColor ORANGE_RED(234, 104, 102); // -90
const QColor ORANGE(243, 172, 103);     // -100
const QColor PALE_PINK(248, 209, 191);  // -108
const QColor WHITE(255, 255, 255);

// 像素中心的 "lat,lon"
QString centerOf(int row, int col)
{
    return QString("%1,%2").arg(54.0 - (row + 0.5) * 0.1, 0, 'f', 6)
                           .arg(-7.0 + (col + 0.5) * 0.1, 0, 'f', 6);
}

} // namespace

class TestCoverageResolver : public QObject
{
    Q_OBJECT

private slots:
    void parseCoordinate_data();
    void parseCoordinate();

    void transformerMapsToPixel();
    void maxCoverageNeverInterpolated_data();
    void maxCoverageNeverInterpolated();
    void resolvesLevels_data();
    void resolvesLevels();
    void sentinelIsNoCoverage();
    void outOfBounds_data();
    void outOfBounds();
    void transformFailureIsOutOfBounds();
    void readFailureIsReadError();
    void invalidCoordinateText();
    void statusNames();
    void ownsInjectedLegend();
};

void TestCoverageResolver::parseCoordinate_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<double>("lat");
    QTest::addColumn<double>("lon");

    QTest::newRow("plain") << "53.27,-6.20" << true << 53.27 << -6.20;
    QTest::newRow("spaces") << "  53.27 ,  -6.20 " << true << 53.27 << -6.20;
    QTest::newRow("integers") << "53,-6" << true << 53.0 << -6.0;
    QTest::newRow("one token") << "53.27" << false << 0.0 << 0.0;
    QTest::newRow("three tokens") << "53.27,-6.20,1" << false << 0.0 << 0.0;
    QTest::newRow("empty lon") << "53.27," << false << 0.0 << 0.0;
    QTest::newRow("text") << "north,west" << false << 0.0 << 0.0;
    QTest::newRow("empty") << "" << false << 0.0 << 0.0;
}

void TestCoverageResolver::parseCoordinate()
{
    QFETCH(QString, text);
    QFETCH(bool, valid);
    QFETCH(double, lat);
    QFETCH(double, lon);

    GeoCoordinate c;
    QCOMPARE(GeoCoordinate::parse(text, c), valid);
    if (valid) {
        QCOMPARE(c.lat, lat);
        QCOMPARE(c.lon, lon);
    }
}

void TestCoverageResolver::transformerMapsToPixel()
{
    MemoryRaster raster(20, 10, WHITE);
    CoordinateTransformer transformer(raster);

    GeoCoordinate c;
    QVERIFY(GeoCoordinate::parse(centerOf(3, 7), c));
    PixelLocation p;
    QVERIFY(transformer.toPixel(c, p));
    QCOMPARE(p.row, 3);
    QCOMPARE(p.col, 7);

    // 不做越界检查
    QVERIFY(GeoCoordinate::parse(centerOf(25, -2), c));
    QVERIFY(transformer.toPixel(c, p));
    QCOMPARE(p.row, 25);
    QCOMPARE(p.col, -2);
    QVERIFY(!raster.contains(p));
}

void TestCoverageResolver::maxCoverageNeverInterpolated_data()
{
    QTest::addColumn<int>("method");
    QTest::newRow("none") << int(Interpolator::None);
    QTest::newRow("linear") << int(Interpolator::Linear);
    QTest::newRow("average") << int(Interpolator::Average);
}

void TestCoverageResolver::maxCoverageNeverInterpolated()
{
    QFETCH(int, method);

    MemoryRaster raster(20, 20, MAX_RED);
    CoverageResolver resolver(raster, CoverageLegend::reference(),
                              static_cast<Interpolator::Method>(method));
    const CoverageResult r = resolver.resolve(QString("53.27,-6.20"));
    QCOMPARE(r.status, CoverageResult::Resolved);
    QCOMPARE(r.value, -80.0);
}

void TestCoverageResolver::resolvesLevels_data()
{
    QTest::addColumn<QColor>("pixel");
    QTest::addColumn<int>("method");
    QTest::addColumn<double>("expected");

    QTest::newRow("-90 none") << ORANGE_RED << int(Interpolator::None) << -90.0;
    QTest::newRow("-100 none") << ORANGE << int(Interpolator::None) << -100.0;
    QTest::newRow("-108 none") << PALE_PINK << int(Interpolator::None) << -108.0;

    // 线性插值在当前档上取值，结果不变
    QTest::newRow("-100 linear") << ORANGE << int(Interpolator::Linear) << -100.0;
    QTest::newRow("-108 linear") << PALE_PINK << int(Interpolator::Linear) << -108.0;

    QTest::newRow("-90 average") << ORANGE_RED << int(Interpolator::Average) << -85.0;
    QTest::newRow("-100 average") << ORANGE << int(Interpolator::Average) << -95.0;
    QTest::newRow("-108 average") << PALE_PINK << int(Interpolator::Average) << -104.0;

    QTest::newRow("near orange") << QColor(240, 170, 100) << int(Interpolator::None) << -100.0;
}

void TestCoverageResolver::resolvesLevels()
{
    QFETCH(QColor, pixel);
    QFETCH(int, method);
    QFETCH(double, expected);

    MemoryRaster raster(20, 20, WHITE);
    raster.setPixel(5, 6, pixel);
    CoverageResolver resolver(raster, CoverageLegend::reference(),
                              static_cast<Interpolator::Method>(method));

    const CoverageResult r = resolver.resolve(centerOf(5, 6));
    QCOMPARE(r.status, CoverageResult::Resolved);
    QCOMPARE(r.value, expected);
}

void TestCoverageResolver::sentinelIsNoCoverage()
{
    MemoryRaster raster(20, 20, WHITE);
    CoverageResolver resolver(raster);
    const CoverageResult r = resolver.resolve(centerOf(0, 0));
    QCOMPARE(r.status, CoverageResult::NoCoverage);
    QVERIFY(!r.hasValue());
}

void TestCoverageResolver::outOfBounds_data()
{
    QTest::addColumn<QString>("coord");

    QTest::newRow("east") << centerOf(5, 20);
    QTest::newRow("south") << centerOf(20, 5);
    QTest::newRow("west") << centerOf(5, -1);
    QTest::newRow("north") << centerOf(-1, 5);
    QTest::newRow("far away") << QString("0,0");
}

void TestCoverageResolver::outOfBounds()
{
    QFETCH(QString, coord);

    MemoryRaster raster(20, 20, MAX_RED);
    CoverageResolver resolver(raster);
    CoverageResult r;
    try {
        r = resolver.resolve(coord);
    } catch (const std::exception &e) {
        QFAIL(e.what());
    }
    QCOMPARE(r.status, CoverageResult::OutOfBounds);
    QCOMPARE(raster.reads, 0);
}

void TestCoverageResolver::transformFailureIsOutOfBounds()
{
    MemoryRaster raster(20, 20, MAX_RED);
    raster.failTransform = true;
    CoverageResolver resolver(raster);
    QCOMPARE(resolver.resolve(QString("53.27,-6.20")).status, CoverageResult::OutOfBounds);
}

void TestCoverageResolver::readFailureIsReadError()
{
    MemoryRaster raster(20, 20, MAX_RED);
    raster.failRead = true;
    CoverageResolver resolver(raster);
    QCOMPARE(resolver.resolve(QString("53.27,-6.20")).status, CoverageResult::ReadError);
}

void TestCoverageResolver::invalidCoordinateText()
{
    MemoryRaster raster(20, 20, MAX_RED);
    CoverageResolver resolver(raster);
    QCOMPARE(resolver.resolve(QString("53.27")).status, CoverageResult::InvalidCoordinate);
    QCOMPARE(resolver.resolve(QString("a,b")).status, CoverageResult::InvalidCoordinate);
    QCOMPARE(raster.reads, 0);
}

void TestCoverageResolver::statusNames()
{
    QCOMPARE(CoverageResult::statusName(CoverageResult::Resolved), QString("resolved"));
    QCOMPARE(CoverageResult::statusName(CoverageResult::NoCoverage), QString("no coverage"));
    QCOMPARE(CoverageResult::statusName(CoverageResult::OutOfBounds), QString("out of bounds"));
    QCOMPARE(CoverageResult::statusName(CoverageResult::InvalidCoordinate), QString("invalid coordinate"));
    QCOMPARE(CoverageResult::statusName(CoverageResult::ReadError), QString("read error"));
}

void TestCoverageResolver::ownsInjectedLegend()
{
    MemoryRaster raster(20, 20, WHITE);
    raster.setPixel(1, 1, QColor(10, 10, 10));

    // 图例以临时对象传入，解析器自行保存副本
    const CoverageResolver resolver(raster,
        CoverageLegend({{QColor(0, 0, 0), -100}, {QColor(200, 200, 200), -90}}, -100, -90),
        Interpolator::Average);

    const CoverageResult r = resolver.resolve(centerOf(1, 1));
    QCOMPARE(r.status, CoverageResult::Resolved);
    QCOMPARE(r.value, -95.0);
}

QTEST_GUILESS_MAIN(TestCoverageResolver)
#include "tst_coverageresolver.moc"
