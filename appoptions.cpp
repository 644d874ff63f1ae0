#include "appoptions.h"
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QFileInfo>
#include <stdexcept>

bool AppOptions::checkReadable(const QString &path, const QString &what, QString *errorMessage)
{
    const QFileInfo fi(path);
    QString msg;
    if (!fi.exists())
        msg = QString("%1 file '%2' does not exist.").arg(what, path);
    else if (!fi.isFile())
        msg = QString("%1 file '%2' is not a regular file.").arg(what, path);
    else if (!fi.isReadable())
        msg = QString("%1 file '%2' is inaccessible due to permission issues.").arg(what, path);

    if (msg.isEmpty())
        return true;
    if (errorMessage) *errorMessage = msg;
    return false;
}

bool AppOptions::parse(const QStringList &arguments, AppOptions &out, QString *errorMessage)
{
    auto setError = [errorMessage](const QString &msg) {
        if (errorMessage) *errorMessage = msg;
        return false;
    };

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Get coverage level at specified coordinates in a GeoTIFF file.");
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption geotiffOption(QStringList{"g", "geotiff"},
        "Path to the GeoTIFF file.", "path");
    const QCommandLineOption coordOption(QStringList{"c", "coordinates"},
        "Latitude and longitude separated by comma (e.g. '53.2716088,-6.2073869').", "lat,lon");
    const QCommandLineOption csvOption(QStringList{"f", "csv"},
        "Path to the CSV file (header: Latitude,Longitude).", "path");
    const QCommandLineOption interpOption(QStringList{"i", "interpolation"},
        "Interpolation method for RSRP values: 'linear' or 'average'. "
        "If not provided, no interpolation is performed.", "method");
    const QCommandLineOption batchOption(QStringList{"b", "batch-size"},
        "Rows per processing chunk.", "n", QString::number(out.batchSize));
    const QCommandLineOption quietOption(QStringList{"q", "quiet"}, "Do not show the progress bar.");
    // -v 已由 addVersionOption() 占用
    const QCommandLineOption verboseOption(QStringList{"verbose"}, "Enable debug logging.");

    parser.addOptions({geotiffOption, coordOption, csvOption, interpOption,
                       batchOption, quietOption, verboseOption});

    if (!parser.parse(arguments))
        return setError(parser.errorText());

    if (parser.isSet(helpOption)) {
        out.helpRequested = true;
        out.helpText = parser.helpText();
        return true;
    }
    if (parser.isSet(versionOption)) {
        out.versionRequested = true;
        return true;
    }
    if (!parser.positionalArguments().isEmpty())
        return setError(QString("Unexpected argument '%1'.").arg(parser.positionalArguments().first()));

    // === 互斥参数 ===
    const bool hasCoord = parser.isSet(coordOption);
    const bool hasCsv = parser.isSet(csvOption);
    if (hasCoord && hasCsv)
        return setError("Arguments --coordinates and --csv are mutually exclusive.");
    if (!hasCoord && !hasCsv)
        return setError("Either coordinates or a CSV file must be provided.");
    if (!parser.isSet(geotiffOption))
        return setError("The --geotiff argument is required.");

    out.geotiffPath = parser.value(geotiffOption);
    out.coordinates = parser.value(coordOption);
    out.csvPath = parser.value(csvOption);
    out.mode = hasCsv ? BatchFile : SingleCoordinate;
    out.quiet = parser.isSet(quietOption);
    out.verbose = parser.isSet(verboseOption);

    try {
        out.interpolation = Interpolator::methodFromName(parser.value(interpOption));
    } catch (const std::invalid_argument &e) {
        return setError(QString::fromStdString(e.what()));
    }

    bool ok = false;
    const int batchSize = parser.value(batchOption).toInt(&ok);
    if (!ok || batchSize <= 0)
        return setError(QString("Invalid batch size '%1'.").arg(parser.value(batchOption)));
    out.batchSize = batchSize;

    // === 文件可访问性 ===
    if (!checkReadable(out.geotiffPath, "GeoTIFF", errorMessage))
        return false;
    if (out.mode == BatchFile && !checkReadable(out.csvPath, "CSV", errorMessage))
        return false;

    return true;
}
