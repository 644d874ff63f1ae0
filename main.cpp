#include "coverageapp.h"
#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("coverageprobe");
    QCoreApplication::setApplicationVersion("1.3.0");

    // 诊断信息统一输出到 stderr
    qSetMessagePattern("[%{type}] %{category}: %{message}");

    QTextStream out(stdout);
    QTextStream err(stderr);
    CoverageApp app(out, err);
    return app.run(a.arguments());
}
