#ifndef DOKUWIKI_SUBPROCESS_PROCESS_HPP
#define DOKUWIKI_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dokuwiki
{
namespace subprocess
{

struct ProcessHandle;
struct PipeHandle;

// Read end of a pipe connected to a child
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Returns 0 on EOF, throws on error
    size_t read(char* buffer, size_t size);

    // Read a line including its newline (empty string on EOF)
    std::string read_line(size_t max_size = 4096);

    // Read until EOF
    std::string read_all();

    void close();
    bool is_open() const;
    int fd() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Write end of a pipe connected to a child
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    // Write everything, retrying short writes
    void write_all(const std::string& data);

    void close();
    bool is_open() const;
    int fd() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Only valid if redirected
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;
    std::optional<int> try_wait();
    int wait();
    void terminate();

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Outcome of a run-to-completion invocation
struct ProcessResult
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Spawn, feed input on stdin, collect stdout (and stderr if redirected) and
// wait. Reading and writing are multiplexed so large outputs cannot deadlock.
ProcessResult run(const std::string& executable, const std::vector<std::string>& args,
                  const std::string& input = {}, const ProcessOptions& options = {});

std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace dokuwiki

#endif // DOKUWIKI_SUBPROCESS_PROCESS_HPP
