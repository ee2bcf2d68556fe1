// Comandos get/put del cliente, sobre cualquier RemoteSession ya conectada.
#pragma once
#include "CliConfig.hpp"
#include "scplite/RemoteSession.hpp"

#include <QString>
#include <cstdint>
#include <string>

class QTextStream;

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Un nombre recibido del remoto solo se acepta como componente simple:
// no vacío, sin '/', distinto de "." y "..". Si no, `why` explica el motivo.
bool isSafeLocalName(const std::string& name, QString& why);

// Permisos que recibe el archivo local: solo rwx (sin setuid/setgid/sticky)
// y recortados por la umask del proceso.
std::uint32_t localFileMode(std::uint32_t remoteMode, std::uint32_t umask);

// Devuelven el código de salida del proceso; los errores van a `err`.
int runGet(scplite::RemoteSession& session, const CliRequest& req, QTextStream& err);
int runPut(scplite::RemoteSession& session, const CliRequest& req, QTextStream& err);
