#include "scplite/Logging.hpp"

Q_LOGGING_CATEGORY(scpProto, "scplite.protocol")
Q_LOGGING_CATEGORY(scpSsh, "scplite.ssh")
