#pragma once

#include <stdexcept>
#include <string>

// File vanished or is held open mid-check; the next tick deals with it
class TransientFileError : public std::runtime_error
{
public:
    explicit TransientFileError(const std::string &what) : std::runtime_error(what) {}
};

// Inspector returned no usable video stream or resolution
class UnclassifiableMediaError : public std::runtime_error
{
public:
    explicit UnclassifiableMediaError(const std::string &what) : std::runtime_error(what) {}
};

// External transcoder exited non-zero
class EncodeError : public std::runtime_error
{
public:
    EncodeError(const std::string &what, int exitCode)
        : std::runtime_error(what), m_exitCode(exitCode) {}

    int exitCode() const { return m_exitCode; }

private:
    int m_exitCode;
};

// Permission, ownership, rename or directory failures
class FilesystemError : public std::runtime_error
{
public:
    explicit FilesystemError(const std::string &what) : std::runtime_error(what) {}
};
