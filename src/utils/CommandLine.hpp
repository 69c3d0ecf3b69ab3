#pragma once
#include <QCommandLineParser>

namespace usb_handshake {

// Adds -v/--verbosity and -l/--log-file.
void addLoggingOptions(QCommandLineParser& parser);

// Applies the logging options. defaultVerbosity is used when -v is absent.
void initializeLogger(const QCommandLineParser& parser, int defaultVerbosity);

}
