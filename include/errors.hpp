#pragma once
#include <stdexcept>
#include <string>

// base of every error raised by the archiver
class ChunkvaultError : public std::runtime_error
{
public:
    explicit ChunkvaultError(const std::string &message) : std::runtime_error(message) {}
};

// source/destination read or write failure
class IoError : public ChunkvaultError
{
public:
    explicit IoError(const std::string &message) : ChunkvaultError(message) {}
};

// corrupt compressed chunk
class CodecError : public ChunkvaultError
{
public:
    explicit CodecError(const std::string &message) : ChunkvaultError(message) {}
};

// dictionary or archive header breaks a structural invariant
class DictionaryInvalidError : public ChunkvaultError
{
public:
    explicit DictionaryInvalidError(const std::string &message) : ChunkvaultError(message) {}
};

// referenced chunk file or byte range is missing
class StoreNotFoundError : public ChunkvaultError
{
public:
    explicit StoreNotFoundError(const std::string &message) : ChunkvaultError(message) {}
};

// reconstructed file does not match the source checksum
class VerificationError : public ChunkvaultError
{
public:
    explicit VerificationError(const std::string &message) : ChunkvaultError(message) {}
};

class CancelledError : public ChunkvaultError
{
public:
    CancelledError() : ChunkvaultError("operation cancelled") {}
};

// invalid user options or chunker parameters
class ConfigError : public ChunkvaultError
{
public:
    explicit ConfigError(const std::string &message) : ChunkvaultError(message) {}
};
