/**
 * @file HostEngineViewModel.hpp
 * @brief Qt adapter between the host engine and a presentation layer.
 */

#pragma once

#include "core/types/CommandResult.hpp"
#include "core/types/Criticality.hpp"
#include "core/types/EngineEvent.hpp"
#include "core/types/InputSpec.hpp"
#include "core/types/MonitorDataPoint.hpp"
#include "engine/HostEngine.hpp"

#include <QObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <vector>

namespace hostkeeper::viewmodels {

/**
 * @brief Re-emits engine events as Qt signals on the thread owning the view model.
 *
 * Engine events arrive on the event bus delivery thread and are queued to the
 * view model's thread before any signal is emitted, so slots never run
 * concurrently with the UI. Operations forward to the HostEngine.
 */
class HostEngineViewModel : public QObject {
    Q_OBJECT

public:
    /**
     * @param engine Engine to adapt. Must outlive the view model.
     * @param parent Optional parent QObject for Qt ownership.
     */
    explicit HostEngineViewModel(engine::HostEngine& engine, QObject* parent = nullptr);
    ~HostEngineViewModel() override;

    QStringList hostIds() const;
    QString hostStatus(const QString& hostId) const;
    core::Criticality hostCriticality(const QString& hostId) const;

    void initializeHost(const QString& hostId);
    void forceInitializeHosts();
    void refreshMonitorsOfCategory(const QString& hostId, const QString& category);
    void cachedRefreshMonitorsOfCategory(const QString& hostId, const QString& category);

    core::InvocationId execute(const QString& hostId, const QString& commandId, const QStringList& params = {});
    core::InvocationId executeConfirmed(const QString& hostId, const QString& commandId,
                                        const QStringList& params = {});
    bool confirmExecution(core::InvocationId invocationId);
    bool cancel(core::InvocationId invocationId);

    QStringList getCommands(const QString& hostId) const;

    /**
     * @brief Child commands offered for one row of a multivalue monitor.
     * @param tags Tags of the row; commands whose tag conditions reject them are left out.
     */
    QStringList getChildCommands(const QString& hostId, const QString& category, const QString& monitorId,
                                 int level, const std::vector<std::string>& tags = {}) const;

    bool reconfigure();

    /**
     * @brief Number of events turned into signals so far.
     */
    uint64_t eventsHandled() const { return eventsHandled_; }

signals:
    void updateReceived(const QString& hostId);
    void hostInitialized(const QString& hostId);
    void hostInitializedFromCache(const QString& hostId);
    void monitorStateChanged(const QString& hostId, const QString& monitorId, core::Criticality criticality);
    void monitoringDataReceived(const QString& hostId, const QString& monitorId, core::InvocationId invocationId,
                                const core::MonitorDataPoint& data);
    void commandResultReceived(const QString& hostId, const core::CommandResult& result);
    void errorReceived(core::Criticality criticality, const QString& message);
    void confirmationDialogOpened(const QString& hostId, const QString& commandId, core::InvocationId invocationId,
                                  const QString& text);
    void detailsDialogOpened(core::InvocationId invocationId);
    void textDialogOpened(core::InvocationId invocationId);
    void inputDialogOpened(const std::vector<core::InputSpec>& inputSpecs, const QString& hostId,
                           const QString& commandId, const QStringList& params);
    void configurationChanged(const QStringList& hostIds);

private:
    void onEvent(const core::EngineEvent& event);

    static QStringList toStringList(const std::vector<std::string>& values);
    static std::vector<std::string> toStdVector(const QStringList& values);

    engine::HostEngine& engine_;
    int64_t subscriptionId_{0};
    uint64_t eventsHandled_{0};
};

} // namespace hostkeeper::viewmodels
