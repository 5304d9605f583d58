#ifndef CONVERGENCEDETECTOR_H
#define CONVERGENCEDETECTOR_H

#include <functional>

#include "synctypes.h"

namespace LedgerSync {

class Ticker;

/**
 * @brief Decides when a replication round has quiesced
 *
 * Samples a store summary at a fixed interval. Once a number of
 * consecutive samples are equal the round is considered settled. If the
 * timeout arrives first the round is reported as timed out, which is
 * not an error: the data may still arrive on a later run.
 *
 * Runs synchronously on the caller's thread; the ticker does the
 * sleeping.
 */
class ConvergenceDetector
{
public:
    enum class State {
        Idle,
        Polling,
        Stable,
        TimedOut
    };

    using Sampler = std::function<StoreSummary()>;

    ConvergenceDetector(Ticker *ticker, Sampler sampler);

    /**
     * @brief Poll interval in milliseconds (default 1000)
     */
    void setInterval(int intervalMs);
    int interval() const { return m_intervalMs; }

    /**
     * @brief Consecutive equal samples needed (default 3, minimum 2)
     */
    void setRequiredStableSamples(int samples);
    int requiredStableSamples() const { return m_requiredStable; }

    /**
     * @brief Called whenever a sample differs from the previous one
     */
    void setOnChange(std::function<void()> onChange) { m_onChange = std::move(onChange); }

    /**
     * @brief Polled before every sleep; true ends polling as TimedOut
     */
    void setCancelCheck(std::function<bool()> cancelled) { m_cancelled = std::move(cancelled); }

    /**
     * @brief Block until stable or until timeoutMs has elapsed
     * @return true if stable
     */
    bool awaitConvergence(int timeoutMs);

    State state() const { return m_state; }
    int samplesTaken() const { return m_samplesTaken; }
    StoreSummary lastSample() const { return m_last; }

private:
    Ticker *m_ticker;
    Sampler m_sampler;
    std::function<void()> m_onChange;
    std::function<bool()> m_cancelled;

    int m_intervalMs = 1000;
    int m_requiredStable = 3;

    State m_state = State::Idle;
    int m_samplesTaken = 0;
    StoreSummary m_last;
};

} // namespace LedgerSync

#endif // CONVERGENCEDETECTOR_H
