#include "preferencegate.h"
#include "availabilityprobe.h"
#include "settings.h"

#include <QDebug>

namespace LedgerSync {

PreferenceGate::PreferenceGate(Settings *settings,
                               const AvailabilityProbe *probe,
                               QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_probe(probe)
{
}

bool PreferenceGate::isEnabled() const
{
    return m_settings && m_settings->replicationEnabled();
}

bool PreferenceGate::setEnabled(bool enabled)
{
    if (!m_settings) {
        return false;
    }

    bool changed = enabled != isEnabled() || !m_settings->hasReplicationPreference();
    m_settings->setReplicationEnabled(enabled);
    m_settings->sync();

    qDebug() << "[PreferenceGate] Replication preference updated:"
             << (enabled ? "Enabled" : "Disabled");

    if (changed) {
        emit enabledChanged(enabled);
    }

    bool required = restartRequired();
    if (required != m_lastRestartRequired) {
        m_lastRestartRequired = required;
        emit restartRequiredChanged(required);
    }
    return required;
}

bool PreferenceGate::shouldReplicate() const
{
    return isEnabled() && isAvailable();
}

bool PreferenceGate::isAvailable() const
{
    return m_probe && m_probe->isAvailable();
}

// ========== Store Mode ==========

void PreferenceGate::setActiveStoreMode(bool replicating)
{
    m_storeModeKnown = true;
    m_storeReplicating = replicating;
    m_lastRestartRequired = restartRequired();
}

bool PreferenceGate::restartRequired() const
{
    if (!m_storeModeKnown) {
        return false;
    }
    return shouldReplicate() != m_storeReplicating;
}

// ========== Opt-in Offer ==========

bool PreferenceGate::shouldOfferReplication() const
{
    if (!m_settings) {
        return false;
    }
    return isAvailable()
        && m_settings->onboardingCompleted()
        && !isEnabled()
        && !m_settings->replicationOfferDismissed();
}

void PreferenceGate::dismissOffer()
{
    if (m_settings) {
        m_settings->setReplicationOfferDismissed(true);
        m_settings->sync();
    }
}

void PreferenceGate::setOnboardingCompleted(bool completed)
{
    if (m_settings) {
        m_settings->setOnboardingCompleted(completed);
        m_settings->sync();
    }
}

} // namespace LedgerSync
