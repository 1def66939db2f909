#ifndef STORE_ERROR_HPP
#define STORE_ERROR_HPP

#include <stdexcept>
#include <string>

enum class StoreErrorKind
{
    Unavailable, // cannot open or talk to the database
    ReadOnly,
    Busy,       // lock not obtained within the busy timeout
    Constraint, // uniqueness conflict on the counter key
    Aborted,    // statement aborted by a trigger, check or interrupt
    Other
};

const char *toString(StoreErrorKind kind);

class StoreError : public std::runtime_error
{
public:
    StoreError(StoreErrorKind kind, int resultCode, const std::string &message)
        : std::runtime_error(message), m_kind(kind), m_resultCode(resultCode) {}

    StoreErrorKind kind() const { return m_kind; }
    int resultCode() const { return m_resultCode; }

    // Errors worth retrying the whole transaction for
    bool isTransient() const { return m_kind == StoreErrorKind::Busy; }

    static StoreError fromResultCode(int resultCode, const std::string &context);

private:
    StoreErrorKind m_kind;
    int m_resultCode;
};

#endif
