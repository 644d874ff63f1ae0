#include "geoutils.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

CoverageLegend::CoverageLegend(const QVector<Entry> &entries, int minLevel, int maxLevel,
                               const QColor &sentinel)
    : m_entries(entries),
      m_sentinel(sentinel),
      m_minLevel(minLevel),
      m_maxLevel(maxLevel)
{
    if (m_entries.isEmpty())
        throw std::invalid_argument("CoverageLegend: legend has no entries");
    if (m_minLevel > m_maxLevel)
        throw std::invalid_argument("CoverageLegend: minimum level above maximum level");

    for (int i = 0; i < m_entries.size(); ++i) {
        const Entry &e = m_entries[i];
        if (e.color.rgb() == m_sentinel.rgb())
            throw std::invalid_argument("CoverageLegend: sentinel color used as a legend key");
        if (e.level < m_minLevel || e.level > m_maxLevel)
            throw std::invalid_argument("CoverageLegend: level outside the coverage range");
        for (int j = 0; j < i; ++j) {
            if (m_entries[j].color.rgb() == e.color.rgb())
                throw std::invalid_argument("CoverageLegend: duplicate legend color");
        }
    }
}

// 强 → 弱：红 → 橙红 → 橙 → 浅粉
const CoverageLegend &CoverageLegend::reference()
{
    static const CoverageLegend legend({
        {QColor(207, 99,  103), -80},
        {QColor(234, 104, 102), -90},
        {QColor(243, 172, 103), -100},
        {QColor(248, 209, 191), -108}
    }, -108, -80);
    return legend;
}

int CoverageLegend::levelOf(const QColor &color, bool *ok) const
{
    for (const Entry &e : m_entries) {
        if (e.color.rgb() == color.rgb()) {
            if (ok) *ok = true;
            return e.level;
        }
    }
    if (ok) *ok = false;
    return m_minLevel;
}

QVector<int> CoverageLegend::levels() const
{
    QVector<int> out;
    out.reserve(m_entries.size());
    for (const Entry &e : m_entries)
        out.append(e.level);
    std::sort(out.begin(), out.end());
    return out;
}

int CoverageLegend::nextLevelAbove(int level) const
{
    const QVector<int> sorted = levels();
    for (int l : sorted) {
        if (level < l && l < m_maxLevel)
            return l;
    }
    return m_maxLevel;
}

/* ====================== ColorClassifier ====================== */

ColorClassifier::ColorClassifier(const CoverageLegend &legend)
    : m_legend(legend)
{
}

int ColorClassifier::squaredDistance(const QColor &a, const QColor &b)
{
    const int dr = a.red()   - b.red();
    const int dg = a.green() - b.green();
    const int db = a.blue()  - b.blue();
    return dr * dr + dg * dg + db * db;
}

std::optional<QColor> ColorClassifier::classify(const QColor &observed) const
{
    if (observed.rgb() == m_legend.sentinel().rgb())
        return std::nullopt;

    const auto &entries = m_legend.entries();
    int best = 0;
    int bestDist = std::numeric_limits<int>::max();
    for (int i = 0; i < entries.size(); ++i) {
        int d = squaredDistance(entries[i].color, observed);
        if (d < bestDist) {   // 严格小于：并列时保留靠前的
            bestDist = d;
            best = i;
        }
    }
    return entries[best].color;
}

/* ====================== Interpolator ====================== */

double Interpolator::interpolate(double minLevel, double maxLevel,
                                 double minVal, double maxVal,
                                 double currentVal, Method method)
{
    switch (method) {
    case None:
        return minLevel;
    case Linear:
        if (minVal == maxVal) return minLevel;
        return minLevel + (maxLevel - minLevel) * ((currentVal - minVal) / (maxVal - minVal));
    case Average:
        if (minVal == maxVal) return minLevel;
        return (minLevel + maxLevel) / 2.0;
    }
    throw std::invalid_argument(
        "Invalid interpolation method. Supported methods are 'linear' and 'average'.");
}

Interpolator::Method Interpolator::methodFromName(const QString &name)
{
    const QString n = name.trimmed().toLower();
    if (n.isEmpty() || n == "none") return None;
    if (n == "linear") return Linear;
    if (n == "average") return Average;
    throw std::invalid_argument(
        QString("Invalid interpolation method '%1'. Supported methods are 'linear' and 'average'.")
            .arg(name).toStdString());
}

QString Interpolator::methodName(Method method)
{
    switch (method) {
    case None:    return "none";
    case Linear:  return "linear";
    case Average: return "average";
    }
    return "unknown";
}
