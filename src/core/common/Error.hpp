#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include "Expected.hpp"

namespace WhisperGui {

enum class ErrorCode {
    UnknownModel,     // identifier not present in the catalog
    NetworkError,     // remote host unreachable or the transfer broke off
    RemoteError,      // server answered with a non-success status
    StorageError,     // directory/file create, write, flush, rename or delete failed
    SpawnError,       // child process could not be launched
    ProcessFailure,   // child exited non-zero or was terminated abnormally
    NotDownloaded,    // operation needs an artifact that is absent
    InvalidInput      // caller supplied a path that does not exist
};

struct Error {
    ErrorCode code = ErrorCode::StorageError;
    QString message;

    QString toString() const;
};

QString errorCodeName(ErrorCode code);

inline Unexpected<Error> makeError(ErrorCode code, const QString& message) {
    return Unexpected<Error>(Error{code, message});
}

template<typename T>
using Result = Expected<T, Error>;

} // namespace WhisperGui

Q_DECLARE_METATYPE(WhisperGui::Error)
