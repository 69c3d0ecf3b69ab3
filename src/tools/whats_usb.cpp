#include "core/LibusbEnumerator.hpp"
#include "core/Logger.hpp"
#include "core/UsbDevice.hpp"
#include "utils/CommandLine.hpp"
#include "utils/DeviceReport.hpp"
#include <usb-handshake/Constants.hpp>
#include <usb-handshake/Errors.hpp>
#include <QCoreApplication>
#include <QDateTime>
#include <QSysInfo>
#include <QTextStream>
#include <iostream>

using namespace usb_handshake;

namespace {

const char* kRule = "---------------------------------------------------";

std::string operatingSystem() {
    return (QSysInfo::kernelType() + " " + QSysInfo::kernelVersion() +
            " (" + QSysInfo::prettyProductName() + ")").toStdString();
}

int inspect() {
    LibusbEnumerator enumerator;
    auto devices = enumerator.devices();
    if (devices.empty()) {
        std::cout << "No USB devices found." << std::endl;
        return ExitCodes::FAILURE;
    }

    std::vector<DeviceDescriptor> descriptors;
    descriptors.reserve(devices.size());
    for (const auto& device : devices) {
        descriptors.push_back(device->descriptor());
    }

    std::cout << "\nConnected USB Devices:\n";
    for (size_t i = 0; i < descriptors.size(); ++i) {
        std::cout << deviceListLine(i + 1, descriptors[i]) << "\n";
    }

    std::cout << "\nSelect a device number to view details (or 0 to exit): " << std::flush;

    QTextStream input(stdin);
    const QString line = input.readLine().trimmed();
    bool ok = false;
    const int choice = line.toInt(&ok);
    if (!ok) {
        std::cout << "Please enter a valid number." << std::endl;
        return ExitCodes::FAILURE;
    }
    if (choice == 0) {
        std::cout << "Exiting..." << std::endl;
        return ExitCodes::SUCCESS;
    }
    if (choice < 1 || static_cast<size_t>(choice) > devices.size()) {
        std::cout << "Invalid selection." << std::endl;
        return ExitCodes::FAILURE;
    }

    const size_t index = static_cast<size_t>(choice - 1);
    const DeviceDescriptor& selected = descriptors[index];

    std::cout << "\nDetailed Information for "
              << selected.product.value_or("Unknown Device") << ":\n"
              << kRule << "\n"
              << formatDeviceReport(selected, devices[index]->configurations(),
                                    operatingSystem())
              << std::endl;
    return ExitCodes::SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("whats-usb");
    app.setApplicationVersion(APPLICATION_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("WhatsUSB - USB Device Information Tool");
    parser.addHelpOption();
    parser.addVersionOption();
    addLoggingOptions(parser);
    parser.process(app);

    initializeLogger(parser, 2);

    std::cout << "WhatsUSB - USB Device Information Tool (v" << APPLICATION_VERSION << ", "
              << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss").toStdString()
              << ")\n" << kRule << std::endl;

    try {
        return inspect();
    } catch (const BackendUnavailable& e) {
        std::cout << "Error: " << e.what() << std::endl;
        LOG_ERROR(std::string(e.what()) + " (try running with elevated privileges)");
        return ExitCodes::FAILURE;
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return ExitCodes::FAILURE;
    }
}
