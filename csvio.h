#ifndef CSVIO_H
#define CSVIO_H

#include <QFile>
#include <QString>
#include <QStringList>
#include <QTextStream>

/**
 * @brief 逗号分隔文件读取（支持双引号转义，首行为表头）
 */
class CsvReader
{
public:
    CsvReader() = default;

    bool open(const QString &filePath);
    void close();
    QString errorString() const { return m_error; }

    /** 读取下一行；文件结束返回 false */
    bool readRow(QStringList &row);

    /** 回到文件开头 */
    bool rewind();

    static QStringList parseLine(const QString &line);

private:
    QFile m_file;
    QTextStream m_stream;
    QString m_error;
};

class CsvWriter
{
public:
    CsvWriter() = default;

    bool open(const QString &filePath);
    bool close();
    QString errorString() const { return m_error; }

    void writeRow(const QStringList &row);

    static QString escape(const QString &field);

private:
    QFile m_file;
    QTextStream m_stream;
    QString m_error;
};

#endif // CSVIO_H
