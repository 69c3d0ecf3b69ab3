#include "core/LibusbEnumerator.hpp"
#include "core/UsbDevice.hpp"
#include "core/Logger.hpp"
#include "utils/CommandLine.hpp"
#include "utils/DeviceReport.hpp"
#include <usb-handshake/Constants.hpp>
#include <usb-handshake/Errors.hpp>
#include <QCoreApplication>
#include <iostream>

using namespace usb_handshake;

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("usb-check");
    app.setApplicationVersion(APPLICATION_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Checks that the USB backend is reachable and lists attached devices.");
    parser.addHelpOption();
    parser.addVersionOption();
    addLoggingOptions(parser);
    parser.process(app);

    initializeLogger(parser, 2);

    try {
        LibusbEnumerator enumerator;
        std::vector<SkippedDevice> skipped;
        auto devices = enumerator.devices(&skipped);

        for (const auto& device : devices) {
            std::cout << checkDeviceLine(device->descriptor()) << "\n";
        }
        // Unreadable devices are reported but do not fail the check.
        for (const auto& device : skipped) {
            std::cout << accessErrorLine(device.reason) << "\n";
        }

        std::cout << "PASS: " << devices.size() << " device(s) found" << std::endl;
        return ExitCodes::SUCCESS;

    } catch (const BackendUnavailable& e) {
        std::cout << "FAIL: " << e.what() << std::endl;
        LOG_ERROR("No USB devices found or backend issue: " + std::string(e.what()));
        return ExitCodes::FAILURE;
    } catch (const std::exception& e) {
        std::cout << "FAIL: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return ExitCodes::FAILURE;
    }
}
