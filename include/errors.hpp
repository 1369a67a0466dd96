#ifndef KOSTORE_ERRORS_HPP
#define KOSTORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace KoStore {

/**
 * @class Error
 * @brief Base class of every error KOStore reports.
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Transport-level failure raised by an HttpClient.
 *
 * transient is true for failures worth retrying: connection problems,
 * timeouts, HTTP 5xx and 429.
 */
class NetworkError : public Error
{
public:
    NetworkError(const std::string& message, bool transient, long httpStatus = 0)
        : Error(message), transient(transient), httpStatus(httpStatus) {}

    bool isTransient() const { return transient; }
    long status() const { return httpStatus; }

private:
    bool transient;
    long httpStatus;
};

/**
 * @brief Remote metadata could not be fetched and no cached copy exists.
 */
class FetchError : public Error
{
public:
    explicit FetchError(const std::string& cause)
        : Error("Fetch failed: " + cause), cause(cause) {}

    const std::string& getCause() const { return cause; }

private:
    std::string cause;
};

/**
 * @brief A device path failed validation.
 */
class InvalidDeviceError : public Error
{
public:
    enum class Reason { NotFound, NotWritable, WrongLayout };

    InvalidDeviceError(Reason reason, const std::string& message)
        : Error(message), reason(reason) {}

    Reason getReason() const { return reason; }

private:
    Reason reason;
};

/**
 * @brief Returns "NotFound", "NotWritable" or "WrongLayout".
 */
inline const char* toString(InvalidDeviceError::Reason reason)
{
    switch (reason) {
    case InvalidDeviceError::Reason::NotFound:    return "NotFound";
    case InvalidDeviceError::Reason::NotWritable: return "NotWritable";
    case InvalidDeviceError::Reason::WrongLayout: return "WrongLayout";
    }
    return "Unknown";
}

/** Downloaded asset size or checksum does not match the release metadata. */
class IntegrityError : public Error
{
public:
    explicit IntegrityError(const std::string& message) : Error(message) {}
};

/** An install or uninstall for the same package id is already running. */
class JobConflictError : public Error
{
public:
    explicit JobConflictError(const std::string& packageId)
        : Error("A job for '" + packageId + "' is already in progress"),
          packageId(packageId) {}

    const std::string& getPackageId() const { return packageId; }

private:
    std::string packageId;
};

/** The caller canceled the job. */
class CancellationError : public Error
{
public:
    CancellationError() : Error("Operation canceled") {}
};

/** Filesystem failure during extraction, copying or uninstall. */
class IOError : public Error
{
public:
    explicit IOError(const std::string& message) : Error(message) {}
};

/** The configuration file exists but cannot be parsed. */
class ConfigError : public Error
{
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

} // namespace KoStore

#endif // KOSTORE_ERRORS_HPP
