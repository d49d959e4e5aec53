#ifndef MCPDISPATCH_TEST_SUPPORT_HPP
#define MCPDISPATCH_TEST_SUPPORT_HPP

// Scratch directories and throwaway provider scripts for the test suites.

#include <functional>
#include <string>

namespace test_support {

// Creates a fresh directory under the system temp dir; removed on destruction.
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(const std::string &prefix);
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory &) = delete;
    TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;

    const std::string &path() const { return path_; }
    std::string file(const std::string &relative_path) const { return path_ + "/" + relative_path; }

private:
    std::string path_;
};

// Writes contents, creating parent directories. Returns false on failure.
bool write_file(const std::string &path, const std::string &contents);

// Writes a /bin/sh script and makes it executable.
bool write_script(const std::string &path, const std::string &body);

// Polls condition every 10ms until it holds or timeout_milliseconds pass.
bool wait_until(const std::function<bool()> &condition, int timeout_milliseconds);

// Prints "  OK: message" or "  FAIL: message" and returns passed.
bool check(bool passed, const std::string &message);

} // namespace test_support

#endif // MCPDISPATCH_TEST_SUPPORT_HPP
