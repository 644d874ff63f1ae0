#include "coverageapp.h"
#include "batchpipeline.h"
#include "coverageresolver.h"
#include "rasterdata.h"
#include <QCoreApplication>
#include <QDebug>
#include <stdexcept>

Q_LOGGING_CATEGORY(lcApp, "coverage.app", QtInfoMsg)

CoverageApp::CoverageApp(QTextStream &out, QTextStream &err)
    : m_out(out), m_err(err)
{
}

int CoverageApp::run(const QStringList &arguments)
{
    AppOptions options;
    QString error;
    if (!AppOptions::parse(arguments, options, &error)) {
        qCCritical(lcApp).noquote() << error;
        m_err << "Try '--help' for more information." << Qt::endl;
        return ConfigurationError;
    }

    if (options.helpRequested) {
        m_out << options.helpText << Qt::flush;
        return Success;
    }
    if (options.versionRequested) {
        m_out << QCoreApplication::applicationName() << " "
              << QCoreApplication::applicationVersion() << Qt::endl;
        return Success;
    }
    return run(options);
}

int CoverageApp::run(const AppOptions &options)
{
    if (options.verbose)
        QLoggingCategory::setFilterRules("coverage.*.debug=true");

    RasterData raster;
    if (!raster.open(options.geotiffPath)) {
        qCCritical(lcApp).noquote() << "Failed to open GeoTIFF file" << options.geotiffPath
                                    << ":" << raster.errorString();
        return ConfigurationError;
    }

    qCDebug(lcApp) << "Interpolation:" << Interpolator::methodName(options.interpolation);

    try {
        return options.mode == AppOptions::BatchFile ? runBatch(raster, options)
                                                     : runSingle(raster, options);
    } catch (const std::invalid_argument &e) {
        qCCritical(lcApp).noquote() << e.what();
        return ConfigurationError;
    }
}

/**
 * @brief 单坐标：打印 dBm 或“无覆盖”，不写文件
 */
int CoverageApp::runSingle(const RasterSource &raster, const AppOptions &options)
{
    const CoverageResolver resolver(raster, CoverageLegend::reference(), options.interpolation);
    const CoverageResult result = resolver.resolve(options.coordinates);
    qCDebug(lcApp).noquote() << "Coordinates" << options.coordinates << "->"
                             << CoverageResult::statusName(result.status);

    switch (result.status) {
    case CoverageResult::Resolved:
        m_out << "Coverage level at coordinates " << options.coordinates << ": "
              << static_cast<qint64>(result.value) << " dBm" << Qt::endl;
        return Success;
    case CoverageResult::InvalidCoordinate:
        qCCritical(lcApp).noquote() << "Coordinates not valid:" << options.coordinates;
        return ConfigurationError;
    case CoverageResult::OutOfBounds:
        m_out << "Error: Coordinates '" << options.coordinates << "' are out of bounds." << Qt::endl;
        break;
    case CoverageResult::NoCoverage:
    case CoverageResult::ReadError:
        break;
    }

    m_out << "No coverage at coordinates " << options.coordinates << Qt::endl;
    return Success;
}

int CoverageApp::runBatch(const RasterSource &raster, const AppOptions &options)
{
    const CoverageResolver resolver(raster, CoverageLegend::reference(), options.interpolation);
    BatchPipeline pipeline(resolver, options.batchSize);
    if (!options.quiet) {
        pipeline.setProgressCallback([this](qint64 processed, qint64 total) {
            printProgress(processed, total);
        });
    }

    QString outputPath, error;
    BatchSummary summary;
    if (!pipeline.processFile(options.csvPath, &outputPath, &error, &summary)) {
        qCCritical(lcApp).noquote() << error << "Exiting...";
        return ConfigurationError;
    }

    qCInfo(lcApp).noquote() << "Wrote" << summary.total << "rows to" << outputPath;
    return Success;
}

/* ====================== 进度条 ====================== */

void CoverageApp::printProgress(qint64 processed, qint64 total)
{
    const int barWidth = 30;
    const double ratio = total > 0 ? double(processed) / double(total) : 1.0;
    const int filled = qBound(0, int(ratio * barWidth), barWidth);

    m_err << "\rProcessing Rows: " << qSetFieldWidth(3) << int(ratio * 100) << qSetFieldWidth(0)
          << "%|" << QString(filled, '#') << QString(barWidth - filled, ' ') << "| "
          << processed << "/" << total << " [row]";
    if (processed >= total)
        m_err << Qt::endl;
    else
        m_err << Qt::flush;
}
