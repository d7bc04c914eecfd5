#pragma once

#include <string>

// Answers whether another process currently holds a file open
class IOpenHandleChecker
{
public:
    virtual ~IOpenHandleChecker() = default;
    virtual bool isOpenElsewhere(const std::string &path) = 0;
};

// Walks /proc/<pid>/fd links; processes it may not inspect are ignored
class ProcOpenHandleChecker : public IOpenHandleChecker
{
public:
    ProcOpenHandleChecker();

    bool isOpenElsewhere(const std::string &path) override;

private:
    std::string m_selfPid;
};
