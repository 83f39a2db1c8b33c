#ifndef DDSLEDGER_UTIL_ERRORS_HPP
#define DDSLEDGER_UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception taxonomy for ddsledger.
 *
 * All errors raised by the library derive from DdsLedgerError (itself a std::runtime_error),
 * so callers can catch the whole family or a single class:
 *
 *   - NotFoundError           chunk/manifest/block/transaction absent from a source
 *   - ContentUnavailableError no source at all could supply the requested content
 *   - InvalidSignatureError   a transaction signature failed verification
 *   - ChainLinkageError       index/hash/merkle mismatch between blocks
 *   - TransportError          a peer request failed (timeout, unhandled, malformed response)
 *   - MalformedInputError     rejected at the API boundary before any processing
 *   - IntegrityError          bytes do not hash to the identifier that names them
 *   - StorageError            the persistence layer failed
 *
 * NotFound, Transport and (remote) Integrity errors are recoverable by trying another source.
 * InvalidSignature and ChainLinkage errors are never recovered.
 */

namespace ddsledger {
namespace util {

class DdsLedgerError : public std::runtime_error
{
public:
    explicit DdsLedgerError(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

class NotFoundError : public DdsLedgerError
{
public:
    explicit NotFoundError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

class ContentUnavailableError : public NotFoundError
{
public:
    explicit ContentUnavailableError(const std::string &msg)
        : NotFoundError(msg)
    {
    }
};

class InvalidSignatureError : public DdsLedgerError
{
public:
    explicit InvalidSignatureError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

class ChainLinkageError : public DdsLedgerError
{
public:
    explicit ChainLinkageError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

class TransportError : public DdsLedgerError
{
public:
    explicit TransportError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

class MalformedInputError : public DdsLedgerError
{
public:
    explicit MalformedInputError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

class IntegrityError : public DdsLedgerError
{
public:
    explicit IntegrityError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

class StorageError : public DdsLedgerError
{
public:
    explicit StorageError(const std::string &msg)
        : DdsLedgerError(msg)
    {
    }
};

} // namespace util
} // namespace ddsledger

#endif // DDSLEDGER_UTIL_ERRORS_HPP
