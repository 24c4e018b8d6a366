module;
#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <cmath>

module kite.utils.progress_utils;

import kite.core.downloadtypes;

namespace kite::utils {

namespace {
constexpr double kPartEndThreshold = 90.0;
constexpr double kPartStartThreshold = 10.0;
}

double clampPercent(double value)
{
    if (!std::isfinite(value)) return 0.0;
    return qBound(0.0, value, 100.0);
}

int estimateProgressParts(const DownloadRequest& request)
{
    if (request.kind == MediaKind::Audio) return 1;

    int audioIds = 0;
    for (const QString& id : request.audioFormatIds) {
        if (!id.trimmed().isEmpty()) ++audioIds;
    }
    if (audioIds > 0) return 1 + audioIds;

    const QString selector = request.format.trimmed();
    if (selector.isEmpty()) return 2;

    const QString primary = selector.section('/', 0, 0).trimmed();
    if (primary.isEmpty()) return 2;

    QStringList parts;
    for (const QString& part : primary.split('+')) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) parts.append(trimmed);
    }
    if (parts.size() <= 1) return 1;
    if (parts.contains(QStringLiteral("none"))) return 1;
    return static_cast<int>(parts.size());
}

ProgressBlender::ProgressBlender(int totalParts)
    : m_totalParts(qMax(1, totalParts))
{
}

double ProgressBlender::update(double percent)
{
    const double p = clampPercent(percent);
    if (m_totalParts > 1
        && m_lastPercent >= kPartEndThreshold
        && p <= kPartStartThreshold
        && m_completedParts < m_totalParts - 1) {
        ++m_completedParts;
    }
    m_lastPercent = p;

    if (m_totalParts <= 1) return p;
    const double blended = ((m_completedParts + p / 100.0) / m_totalParts) * 100.0;
    return qMin(100.0, blended);
}

void ProgressBlender::setTotalParts(int totalParts)
{
    m_totalParts = qMax(1, totalParts);
    if (m_completedParts > m_totalParts - 1) {
        m_completedParts = m_totalParts - 1;
    }
}

} // namespace kite::utils
