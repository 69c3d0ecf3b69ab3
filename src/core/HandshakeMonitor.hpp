#pragma once
#include <usb-handshake/Constants.hpp>
#include <usb-handshake/Types.hpp>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usb_handshake {

class DeviceEnumerator;
class HandshakeLog;

enum class BackendFailurePolicy {
    Retry,
    Abort
};

// "retry" or "abort"
std::optional<BackendFailurePolicy> backendFailurePolicyFromString(const std::string& name);

struct MonitorSettings {
    std::chrono::milliseconds interval{POLLING_INTERVAL};
    BackendFailurePolicy backendFailurePolicy{BackendFailurePolicy::Retry};
    // Consecutive failed polls tolerated under Retry, 0 for no limit.
    int maxBackendFailures{0};
};

// Polls the enumerator on a fixed interval and appends every device with an
// unseen identity to the handshake log. Ticks are chained through a
// single-shot timer, so a poll never overlaps the previous one.
class HandshakeMonitor : public QObject {
    Q_OBJECT

public:
    HandshakeMonitor(DeviceEnumerator& enumerator,
                     HandshakeLog& log,
                     const MonitorSettings& settings,
                     QObject* parent = nullptr);
    ~HandshakeMonitor();

    // Seeds the known set from the log and schedules the first poll.
    void start();
    void stop(int exitCode = ExitCodes::SUCCESS);
    bool isRunning() const;

    const KnownDeviceSet& knownKeys() const;
    int consecutiveBackendFailures() const;

public slots:
    void tick();

signals:
    void devicesCaptured(const std::vector<DeviceDescriptor>& descriptors);
    void backendFailed(const std::string& message);
    void finished(int exitCode);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
