#include "remote/not_found_classifier.hpp"

namespace BuildCacheS3::Remote
{

bool IsObjectNotFound(std::string_view error_code, std::string_view message)
{
    if (error_code == "NoSuchKey") {
        return true;
    }
    if (error_code == "AccessDenied") {
        return message.find("SignatureDoesNotMatch") == std::string_view::npos;
    }
    return false;
}

}  // namespace BuildCacheS3::Remote
