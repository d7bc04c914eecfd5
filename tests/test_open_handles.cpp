#include <gtest/gtest.h>

#include <csignal>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "open_handles.h"
#include "test_support.h"

using namespace testing_support;

namespace
{
    // Child process holding a file open until killed
    class FileHolder
    {
    public:
        explicit FileHolder(const std::string &path)
        {
            int ready[2];
            if (pipe(ready) != 0)
                return;
            m_pid = fork();
            if (m_pid == 0)
            {
                close(ready[0]);
                int fd = open(path.c_str(), O_RDONLY);
                char ok = fd >= 0 ? '1' : '0';
                if (write(ready[1], &ok, 1) != 1)
                    _exit(1);
                for (;;)
                    pause();
            }
            close(ready[1]);
            char ok = '0';
            m_holding = m_pid > 0 && read(ready[0], &ok, 1) == 1 && ok == '1';
            close(ready[0]);
        }

        ~FileHolder()
        {
            if (m_pid > 0)
            {
                kill(m_pid, SIGKILL);
                waitpid(m_pid, nullptr, 0);
            }
        }

        bool holding() const { return m_holding; }

    private:
        pid_t m_pid = -1;
        bool m_holding = false;
    };
}

TEST(ProcOpenHandles, fileHeldByAnotherProcess)
{
    TempDir dir;
    const std::string path = dir / "downloading.mkv";
    write_file(path, "partial");

    ProcOpenHandleChecker checker;
    EXPECT_FALSE(checker.isOpenElsewhere(path));

    {
        FileHolder holder(path);
        ASSERT_TRUE(holder.holding());
        EXPECT_TRUE(checker.isOpenElsewhere(path));
        EXPECT_FALSE(checker.isOpenElsewhere(dir / "other.mkv"));
    }

    EXPECT_FALSE(checker.isOpenElsewhere(path));
}

TEST(ProcOpenHandles, ownDescriptorsAreIgnored)
{
    TempDir dir;
    const std::string path = dir / "mine.mkv";
    write_file(path, "x");

    const int fd = open(path.c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    ProcOpenHandleChecker checker;
    EXPECT_FALSE(checker.isOpenElsewhere(path));
    close(fd);
}

TEST(ProcOpenHandles, missingFileIsNotOpen)
{
    TempDir dir;
    ProcOpenHandleChecker checker;
    EXPECT_FALSE(checker.isOpenElsewhere(dir / "nothing.mkv"));
}
