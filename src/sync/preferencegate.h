#ifndef PREFERENCEGATE_H
#define PREFERENCEGATE_H

#include <QObject>

class Settings;

namespace LedgerSync {

class AvailabilityProbe;

/**
 * @brief The user's replication opt-in, combined with availability
 *
 * shouldReplicate() is isEnabled() && probe.isAvailable(). The store's
 * replication mode is fixed when it is built, so once the application
 * root reports that mode with setActiveStoreMode(), any later toggle
 * that disagrees with it raises restartRequired() instead of taking
 * effect silently.
 */
class PreferenceGate : public QObject
{
    Q_OBJECT

public:
    PreferenceGate(Settings *settings,
                   const AvailabilityProbe *probe,
                   QObject *parent = nullptr);

    bool isEnabled() const;

    /**
     * @brief Persist the preference immediately
     * @return true if a restart is needed for the store to follow
     */
    bool setEnabled(bool enabled);

    bool shouldReplicate() const;

    bool isAvailable() const;

    // ========== Store Mode ==========

    /**
     * @brief Record the mode the running store was built in
     */
    void setActiveStoreMode(bool replicating);
    bool hasActiveStoreMode() const { return m_storeModeKnown; }
    bool activeStoreReplicating() const { return m_storeReplicating; }

    bool restartRequired() const;

    // ========== Opt-in Offer ==========

    /**
     * @brief Offer replication: available, onboarded, not enabled, not dismissed
     */
    bool shouldOfferReplication() const;
    void dismissOffer();
    void setOnboardingCompleted(bool completed);

signals:
    void enabledChanged(bool enabled);
    void restartRequiredChanged(bool required);

private:
    Settings *m_settings;
    const AvailabilityProbe *m_probe;

    bool m_storeModeKnown = false;
    bool m_storeReplicating = false;
    bool m_lastRestartRequired = false;
};

} // namespace LedgerSync

#endif // PREFERENCEGATE_H
