#ifndef TICKER_H
#define TICKER_H

#include <QElapsedTimer>

namespace LedgerSync {

/**
 * @brief Clock used for polling loops
 *
 * The convergence detector only measures elapsed time and sleeps
 * through this interface, so tests can drive it with a fake clock.
 */
class Ticker
{
public:
    virtual ~Ticker() = default;

    /**
     * @brief Restart the elapsed-time measurement
     */
    virtual void restart() = 0;

    virtual qint64 elapsedMs() const = 0;

    virtual void sleepMs(int ms) = 0;
};

/**
 * @brief Real clock: monotonic timer and a blocking sleep
 *
 * Only for use on a worker thread.
 */
class SteadyTicker : public Ticker
{
public:
    SteadyTicker();

    void restart() override;
    qint64 elapsedMs() const override;
    void sleepMs(int ms) override;

private:
    QElapsedTimer m_timer;
};

} // namespace LedgerSync

#endif // TICKER_H
