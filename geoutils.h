#pragma once
#include <QColor>
#include <QVector>
#include <QString>
#include <optional>

/**
 * @brief CoverageLegend - 覆盖图图例（颜色 → RSRP dBm）
 *
 * 只读表，按枚举顺序保存；白色为哨兵色（无覆盖），不能作为图例键。
 * 所有电平必须落在 [minLevel, maxLevel] 闭区间内。
 */
class CoverageLegend
{
public:
    struct Entry {
        QColor color;
        int level;   ///< dBm
    };

    /** 构造时校验：非空、颜色唯一、不含哨兵色、电平在区间内；否则抛 std::invalid_argument */
    CoverageLegend(const QVector<Entry> &entries, int minLevel, int maxLevel,
                   const QColor &sentinel = QColor(255, 255, 255));

    /** 参考图例（4 档，-108 ~ -80 dBm） */
    static const CoverageLegend &reference();

    const QVector<Entry> &entries() const { return m_entries; }
    const QColor &sentinel() const { return m_sentinel; }
    int minLevel() const { return m_minLevel; }
    int maxLevel() const { return m_maxLevel; }

    int levelOf(const QColor &color, bool *ok = nullptr) const;

    /** 升序电平列表 */
    QVector<int> levels() const;

    /**
     * @brief 严格大于 level 且严格小于 maxLevel 的第一个电平（升序扫描），
     *        找不到时返回 maxLevel
     */
    int nextLevelAbove(int level) const;

private:
    QVector<Entry> m_entries;
    QColor m_sentinel;
    int m_minLevel;
    int m_maxLevel;
};

/**
 * @brief ColorClassifier - 像素颜色 → 最近图例颜色（RGB 欧氏距离平方）
 */
class ColorClassifier
{
public:
    explicit ColorClassifier(const CoverageLegend &legend);

    /** 哨兵色返回 std::nullopt；距离相同时取图例中靠前的颜色 */
    std::optional<QColor> classify(const QColor &observed) const;

    static int squaredDistance(const QColor &a, const QColor &b);

private:
    CoverageLegend m_legend;
};

/**
 * @brief Interpolator - 在两个相邻图例电平之间细化取值
 */
class Interpolator
{
public:
    enum Method {
        None,      ///< 不插值（默认）
        Linear,    ///< 线性
        Average    ///< 取两档平均
    };

    static double interpolate(double minLevel, double maxLevel,
                              double minVal, double maxVal,
                              double currentVal, Method method);

    /** "", "none", "linear", "average"（不区分大小写）；其它名称抛 std::invalid_argument */
    static Method methodFromName(const QString &name);
    static QString methodName(Method method);
};
