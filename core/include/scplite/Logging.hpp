// Logging categories of the core library. Filter with QT_LOGGING_RULES,
// e.g. "scplite.ssh.debug=true".
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(scpProto)
Q_DECLARE_LOGGING_CATEGORY(scpSsh)
