module;
#include <QObject>
#include <QTimer>

#include <functional>
#include <utility>

module kite.utils.coalescing_timer;

namespace kite::utils {

CoalescingTimer::CoalescingTimer(int intervalMs, std::function<void()> action, QObject* parent)
    : QObject(parent)
    , m_action(std::move(action))
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(intervalMs);
    connect(&m_timer, &QTimer::timeout, this, &CoalescingTimer::fire);
}

CoalescingTimer::~CoalescingTimer()
{
    flush();
}

void CoalescingTimer::schedule()
{
    if (!m_timer.isActive()) m_timer.start();
}

bool CoalescingTimer::flush()
{
    if (!m_timer.isActive()) return false;
    m_timer.stop();
    fire();
    return true;
}

void CoalescingTimer::cancel()
{
    m_timer.stop();
}

void CoalescingTimer::fire()
{
    if (m_action) m_action();
}

} // namespace kite::utils
