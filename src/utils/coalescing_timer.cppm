/*!
 * @file        coalescing_timer.cppm
 * @brief       Schedule-if-absent debounce timer.
 * @details     Wraps a single-shot QTimer around an action. Repeated schedule()
 *              calls while a run is pending do not postpone it, flush() runs a
 *              pending action immediately, and destruction flushes so that a
 *              debounced write is never lost on teardown.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kite/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QTimer>

#include <functional>

#ifndef Q_MOC_RUN
export module kite.utils.coalescing_timer;
#endif

#ifdef Q_MOC_RUN
#define KITE_MODULE_EXPORT
#else
#define KITE_MODULE_EXPORT export
#endif

KITE_MODULE_EXPORT namespace kite::utils {

class CoalescingTimer : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a coalescing timer.
     * @param intervalMs Delay between the first schedule() and the run.
     * @param action Work to run.
     * @param parent Optional parent QObject.
     */
    CoalescingTimer(int intervalMs, std::function<void()> action, QObject* parent = nullptr);

    /**
     * @brief Flushes a pending run.
     */
    ~CoalescingTimer() override;

    /**
     * @brief Arms the timer unless a run is already pending.
     */
    void schedule();

    /**
     * @brief Runs the action now if a run is pending.
     * @return True when the action ran.
     */
    bool flush();

    /**
     * @brief Drops a pending run without executing it.
     */
    void cancel();

    bool isPending() const { return m_timer.isActive(); }

    int interval() const { return m_timer.interval(); }

private:
    void fire();

    QTimer m_timer;                     //!< Single-shot timer.
    std::function<void()> m_action;     //!< Debounced work.
};

} // namespace kite::utils

#include "coalescing_timer.moc"
