#ifndef BUILDCACHES3_TESTS_TEMP_DIRECTORY_HPP_
#define BUILDCACHES3_TESTS_TEMP_DIRECTORY_HPP_

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace BuildCacheS3::Testing
{

// Fresh directory under the system temp dir, removed with everything in it.
class TempDirectory
{
    public:
    TempDirectory()
    {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "buildcache-s3-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error(std::string("mkdtemp failed: ") + std::strerror(errno));
        }
        path_ = pattern;
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&)            = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    private:
    std::filesystem::path path_;
};

}  // namespace BuildCacheS3::Testing

#endif  // BUILDCACHES3_TESTS_TEMP_DIRECTORY_HPP_
