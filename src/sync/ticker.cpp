#include "ticker.h"

#include <QThread>

namespace LedgerSync {

SteadyTicker::SteadyTicker()
{
    m_timer.start();
}

void SteadyTicker::restart()
{
    m_timer.restart();
}

qint64 SteadyTicker::elapsedMs() const
{
    return m_timer.elapsed();
}

void SteadyTicker::sleepMs(int ms)
{
    if (ms > 0) {
        QThread::msleep(static_cast<unsigned long>(ms));
    }
}

} // namespace LedgerSync
