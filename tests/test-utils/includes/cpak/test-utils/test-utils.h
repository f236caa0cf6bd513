#pragma once

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <string>
#include <vector>

// Helper class to manage file paths relative to the tests directory
class TestDataPath
{
public:
    static std::string
    get_path(const std::string& relative_path);
};

/**
 * Scratch directory under the system temp directory, removed again when
 * the object goes out of scope.
 */
class TempDir
{
public:
    explicit TempDir(const std::string& prefix = "cpak-test");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir&
    operator=(const TempDir&) = delete;

    const boost::filesystem::path&
    path() const
    {
        return path_;
    }

    boost::filesystem::path
    operator/(const std::string& relative) const
    {
        return path_ / relative;
    }

private:
    boost::filesystem::path path_;
};

// Write a file, creating parent directories
void
write_text_file(const boost::filesystem::path& path, const std::string& text);

std::string
read_text_file(const boost::filesystem::path& path);

// JSON loading helper
boost::json::value
load_json_from_file(const std::string& file_path);

// Relative paths (generic form) of all regular files below `root`, sorted
std::vector<std::string>
list_files(const boost::filesystem::path& root);
