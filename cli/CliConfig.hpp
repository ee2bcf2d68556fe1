// Configuración del CLI: argumentos de línea de comandos + QSettings.
#pragma once
#include "scplite/ScpTypes.hpp"

#include <QString>
#include <QStringList>
#include <string>

class QSettings;

struct CliRequest {
    enum class Command { Get, Put } command = Command::Get;
    // get: ruta remota, archivo local. put: archivo local, directorio remoto.
    std::string source;
    std::string destination;
    scplite::SessionOptions session;
    scplite::TransferOptions transfer;
};

enum class CliParseResult { Ok, Help, Version, Error };

bool parseKnownHostsPolicy(const QString& text, scplite::KnownHostsPolicy& out);

// Los valores por defecto salen de `settings`; las opciones explícitas mandan.
CliParseResult parseCommandLine(const QStringList& args, QSettings& settings,
                                CliRequest& out, QString& message);
