#include "Error.hpp"

namespace WhisperGui {

QString errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownModel:   return QStringLiteral("UnknownModel");
        case ErrorCode::NetworkError:   return QStringLiteral("NetworkError");
        case ErrorCode::RemoteError:    return QStringLiteral("RemoteError");
        case ErrorCode::StorageError:   return QStringLiteral("StorageError");
        case ErrorCode::SpawnError:     return QStringLiteral("SpawnError");
        case ErrorCode::ProcessFailure: return QStringLiteral("ProcessFailure");
        case ErrorCode::NotDownloaded:  return QStringLiteral("NotDownloaded");
        case ErrorCode::InvalidInput:   return QStringLiteral("InvalidInput");
    }
    return QStringLiteral("Unknown");
}

QString Error::toString() const {
    return QStringLiteral("%1: %2").arg(errorCodeName(code), message);
}

} // namespace WhisperGui
