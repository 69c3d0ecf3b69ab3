#include "HandshakeMonitor.hpp"
#include "DeviceEnumerator.hpp"
#include "DeviceReport.hpp"
#include "DeviceSnapshotDiffer.hpp"
#include "HandshakeLog.hpp"
#include "Logger.hpp"
#include <usb-handshake/Errors.hpp>
#include <QTimer>

namespace usb_handshake {

std::optional<BackendFailurePolicy> backendFailurePolicyFromString(const std::string& name) {
    if (name == "retry") return BackendFailurePolicy::Retry;
    if (name == "abort") return BackendFailurePolicy::Abort;
    return std::nullopt;
}

class HandshakeMonitor::Private {
public:
    Private(DeviceEnumerator& enumerator, HandshakeLog& log, const MonitorSettings& settings)
        : enumerator(enumerator)
        , log(log)
        , settings(settings) {}

    DeviceEnumerator& enumerator;
    HandshakeLog& log;
    MonitorSettings settings;
    KnownDeviceSet knownKeys;
    QTimer* pollTimer{nullptr};
    int consecutiveFailures{0};
    bool running{false};

    bool shouldAbort() const {
        if (settings.backendFailurePolicy == BackendFailurePolicy::Abort) {
            return true;
        }
        return settings.maxBackendFailures > 0 &&
               consecutiveFailures >= settings.maxBackendFailures;
    }
};

HandshakeMonitor::HandshakeMonitor(DeviceEnumerator& enumerator,
                                   HandshakeLog& log,
                                   const MonitorSettings& settings,
                                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>(enumerator, log, settings)) {

    d->pollTimer = new QTimer(this);
    d->pollTimer->setSingleShot(true);
    connect(d->pollTimer, &QTimer::timeout, this, &HandshakeMonitor::tick);
}

HandshakeMonitor::~HandshakeMonitor() = default;

void HandshakeMonitor::start() {
    if (d->running) return;

    d->knownKeys = d->log.knownKeys();
    d->consecutiveFailures = 0;
    d->running = true;

    LOG_INFO("Monitoring USB ports every " +
             std::to_string(d->settings.interval.count()) + " ms, " +
             std::to_string(d->knownKeys.size()) + " device(s) already in " +
             d->log.path());

    d->pollTimer->start(0);
}

void HandshakeMonitor::stop(int exitCode) {
    if (!d->running) return;

    d->running = false;
    d->pollTimer->stop();
    LOG_INFO("Stopped monitoring USB ports");
    emit finished(exitCode);
}

bool HandshakeMonitor::isRunning() const {
    return d->running;
}

const KnownDeviceSet& HandshakeMonitor::knownKeys() const {
    return d->knownKeys;
}

int HandshakeMonitor::consecutiveBackendFailures() const {
    return d->consecutiveFailures;
}

void HandshakeMonitor::tick() {
    try {
        PollResult result = pollOnce(d->enumerator, d->knownKeys);
        d->consecutiveFailures = 0;
        d->knownKeys = std::move(result.knownKeys);

        if (!result.newlyDetected.empty()) {
            LOG_INFO("New USB device(s) detected: " +
                     std::to_string(result.newlyDetected.size()));
            for (const auto& descriptor : result.newlyDetected) {
                LOG_INFO("  " + deviceSummary(descriptor));
            }

            // The devices stay known for this run even if the write fails.
            try {
                d->log.append(result.newlyDetected);
                LOG_INFO("Saved device info to " + d->log.path());
            } catch (const PersistenceWriteError& e) {
                LOG_ERROR(e.what());
            }

            emit devicesCaptured(result.newlyDetected);
        }
    } catch (const BackendUnavailable& e) {
        ++d->consecutiveFailures;
        emit backendFailed(e.what());

        if (d->shouldAbort()) {
            LOG_ERROR(std::string("USB backend unavailable, giving up: ") + e.what());
            stop(ExitCodes::BACKEND_ABORT);
            return;
        }
        LOG_WARNING(std::string("USB backend unavailable, retrying: ") + e.what());
    }

    if (d->running) {
        d->pollTimer->start(static_cast<int>(d->settings.interval.count()));
    }
}

} // namespace usb_handshake
