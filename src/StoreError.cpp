#include "StoreError.hpp"
#include <sqlite3.h>

const char *toString(StoreErrorKind kind)
{
    switch (kind)
    {
    case StoreErrorKind::Unavailable:
        return "unavailable";
    case StoreErrorKind::ReadOnly:
        return "read-only";
    case StoreErrorKind::Busy:
        return "busy";
    case StoreErrorKind::Constraint:
        return "constraint";
    case StoreErrorKind::Aborted:
        return "aborted";
    case StoreErrorKind::Other:
        break;
    }
    return "other";
}

StoreError StoreError::fromResultCode(int resultCode, const std::string &context)
{
    StoreErrorKind kind = StoreErrorKind::Other;
    switch (resultCode & 0xff)
    {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        kind = StoreErrorKind::Busy;
        break;
    case SQLITE_READONLY:
        kind = StoreErrorKind::ReadOnly;
        break;
    case SQLITE_CONSTRAINT:
        // only key conflicts are resolvable by falling back to an update
        kind = (resultCode == SQLITE_CONSTRAINT_PRIMARYKEY || resultCode == SQLITE_CONSTRAINT_UNIQUE)
                   ? StoreErrorKind::Constraint
                   : StoreErrorKind::Aborted;
        break;
    case SQLITE_CANTOPEN:
    case SQLITE_IOERR:
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
    case SQLITE_FULL:
    case SQLITE_PERM:
        kind = StoreErrorKind::Unavailable;
        break;
    case SQLITE_ABORT:
    case SQLITE_INTERRUPT:
        kind = StoreErrorKind::Aborted;
        break;
    default:
        break;
    }
    return StoreError(kind, resultCode, context + " (" + sqlite3_errstr(resultCode) + ")");
}
