#include "open_handles.h"
#include "logger.h"

#include <cctype>
#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    bool is_pid_name(const std::string &name)
    {
        if (name.empty())
            return false;
        for (char c : name)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return false;
        }
        return true;
    }
}

ProcOpenHandleChecker::ProcOpenHandleChecker()
    : m_selfPid(std::to_string(static_cast<long>(getpid())))
{
}

bool ProcOpenHandleChecker::isOpenElsewhere(const std::string &path)
{
    std::error_code ec;
    const fs::path target = fs::weakly_canonical(path, ec);
    if (ec)
        return false;

    fs::directory_iterator procs("/proc", ec);
    if (ec)
    {
        LOG_DEBUG("Cannot list /proc: %s", ec.message().c_str());
        return false;
    }

    for (const fs::directory_iterator end{}; procs != end; procs.increment(ec))
    {
        if (ec)
            break;
        const std::string pid = procs->path().filename().string();
        if (!is_pid_name(pid) || pid == m_selfPid)
            continue;

        std::error_code fd_ec;
        fs::directory_iterator fds(procs->path() / "fd", fd_ec);
        if (fd_ec)
            continue; // exited, or owned by another user
        for (const fs::directory_iterator fd_end{}; fds != fd_end; fds.increment(fd_ec))
        {
            if (fd_ec)
                break;
            std::error_code link_ec;
            const fs::path linked = fs::read_symlink(fds->path(), link_ec);
            if (!link_ec && linked == target)
            {
                LOG_DEBUG("%s is open in pid %s", path.c_str(), pid.c_str());
                return true;
            }
        }
    }
    return false;
}
