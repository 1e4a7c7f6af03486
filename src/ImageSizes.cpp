#include "DocxFill/ImageSizes.hpp"

namespace DocxFill {

const ImageSizeTable & ImageSizeTable::defaults() {
    static const ImageSizeTable table(QMap<QString, double>{
        {QStringLiteral("IMAGE_SOURCES_USES"), 6.5},
        {QStringLiteral("IMAGE_CAPITAL_STACK_CLOSING"), 6.5},
        {QStringLiteral("IMAGE_LOAN_TO_COST"), 6.0},
        {QStringLiteral("IMAGE_LTV_LTC"), 6.0},
        {QStringLiteral("IMAGE_AERIAL_MAP"), 5.0},
        {QStringLiteral("IMAGE_LOCATION_MAP"), 5.0},
        {QStringLiteral("IMAGE_REGIONAL_MAP"), 5.0},
        {QStringLiteral("IMAGE_SITE_PLAN"), 5.5},
        {QStringLiteral("IMAGE_PILOT_SCHEDULE"), 6.0},
        {QStringLiteral("IMAGE_TAKEOUT_SIZING"), 6.0},
    });
    return table;
}

std::optional<double> ImageSizeTable::widthInches(const QString &name) const {
    auto it = m_widths.constFind(name);
    if(it == m_widths.constEnd()) return std::nullopt;
    return *it;
}

ImageSizeTable ImageSizeTable::with(const QString &name, double widthInches) const {
    QMap<QString, double> widths = m_widths;
    widths.insert(name, widthInches);
    return ImageSizeTable(std::move(widths));
}

} // namespace DocxFill
