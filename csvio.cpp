#include "csvio.h"
#include <QtGlobal>

namespace {

void setUtf8(QTextStream &stream)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    stream.setEncoding(QStringConverter::Utf8);
#else
    stream.setCodec("UTF-8");
#endif
}

} // namespace

/* ====================== CsvReader ====================== */

bool CsvReader::open(const QString &filePath)
{
    close();
    m_file.setFileName(filePath);
    if (!m_file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        m_error = QString("Failed to open CSV file '%1': %2").arg(filePath, m_file.errorString());
        return false;
    }
    m_stream.setDevice(&m_file);
    setUtf8(m_stream);
    return true;
}

void CsvReader::close()
{
    m_stream.setDevice(nullptr);
    if (m_file.isOpen())
        m_file.close();
}

bool CsvReader::rewind()
{
    if (!m_file.isOpen())
        return false;
    return m_stream.seek(0);
}

bool CsvReader::readRow(QStringList &row)
{
    if (!m_file.isOpen() || m_stream.atEnd())
        return false;

    QString line = m_stream.readLine();

    // 引号内换行：引号数为奇数时继续拼接下一行
    while (line.count('"') % 2 != 0 && !m_stream.atEnd())
        line += '\n' + m_stream.readLine();

    row = parseLine(line);
    return true;
}

QStringList CsvReader::parseLine(const QString &line)
{
    QStringList fields;
    if (line.isEmpty())
        return fields;

    QString field;
    bool inQuotes = false;
    for (int i = 0; i < line.size(); ++i) {
        const QChar c = line.at(i);
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line.at(i + 1) == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields << field;
            field.clear();
        } else {
            field += c;
        }
    }
    fields << field;
    return fields;
}

/* ====================== CsvWriter ====================== */

bool CsvWriter::open(const QString &filePath)
{
    m_file.setFileName(filePath);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        m_error = QString("Failed to create CSV file '%1': %2").arg(filePath, m_file.errorString());
        return false;
    }
    m_stream.setDevice(&m_file);
    setUtf8(m_stream);
    return true;
}

bool CsvWriter::close()
{
    if (!m_file.isOpen())
        return true;

    m_stream.flush();
    const bool ok = m_stream.status() == QTextStream::Ok;
    if (!ok)
        m_error = QString("Failed to write CSV file '%1'").arg(m_file.fileName());
    m_stream.setDevice(nullptr);
    m_file.close();
    return ok;
}

void CsvWriter::writeRow(const QStringList &row)
{
    QStringList escaped;
    escaped.reserve(row.size());
    for (const QString &f : row)
        escaped << escape(f);
    m_stream << escaped.join(',') << '\n';
}

QString CsvWriter::escape(const QString &field)
{
    if (!field.contains(',') && !field.contains('"') && !field.contains('\n') && !field.contains('\r'))
        return field;

    QString quoted = field;
    quoted.replace('"', "\"\"");
    return '"' + quoted + '"';
}
