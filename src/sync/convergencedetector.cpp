#include "convergencedetector.h"
#include "ticker.h"

#include <QDebug>

namespace LedgerSync {

ConvergenceDetector::ConvergenceDetector(Ticker *ticker, Sampler sampler)
    : m_ticker(ticker)
    , m_sampler(std::move(sampler))
{
}

void ConvergenceDetector::setInterval(int intervalMs)
{
    m_intervalMs = intervalMs > 0 ? intervalMs : 1000;
}

void ConvergenceDetector::setRequiredStableSamples(int samples)
{
    m_requiredStable = qMax(2, samples);
}

bool ConvergenceDetector::awaitConvergence(int timeoutMs)
{
    m_state = State::Polling;
    m_samplesTaken = 0;
    m_ticker->restart();

    m_last = m_sampler();
    m_samplesTaken = 1;
    int unchanged = 1;

    while (true) {
        if (m_cancelled && m_cancelled()) {
            qDebug() << "[ConvergenceDetector] Cancelled after" << m_samplesTaken << "samples";
            m_state = State::TimedOut;
            return false;
        }

        const qint64 remaining = timeoutMs - m_ticker->elapsedMs();
        if (remaining <= 0) {
            qDebug() << "[ConvergenceDetector] Timed out after" << m_samplesTaken << "samples";
            m_state = State::TimedOut;
            return false;
        }

        m_ticker->sleepMs(static_cast<int>(qMin<qint64>(m_intervalMs, remaining)));

        StoreSummary sample = m_sampler();
        m_samplesTaken++;

        if (sample == m_last) {
            unchanged++;
            if (unchanged >= m_requiredStable) {
                qDebug() << "[ConvergenceDetector] Stable after" << m_samplesTaken << "samples,"
                         << m_ticker->elapsedMs() << "ms";
                m_state = State::Stable;
                return true;
            }
        } else {
            unchanged = 1;
            m_last = sample;
            if (m_onChange) {
                m_onChange();
            }
        }
    }
}

} // namespace LedgerSync
