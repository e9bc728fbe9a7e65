#pragma once

#include <optional>

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace ptatemp {

struct ProcessOutput {
    int exitCode = 0;
    bool crashed = false;
    QByteArray standardOutput;
    QByteArray standardError;
};

// Runs a program to completion and captures its output.
// Returns std::nullopt when the program cannot be started (not installed, not
// executable) or does not finish within timeoutMs.
std::optional<ProcessOutput> runProcess(const QString &program,
                                        const QStringList &args,
                                        int timeoutMs = 30000);

} // namespace ptatemp
